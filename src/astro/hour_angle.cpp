/// @file hour_angle.cpp
/// @brief Implementation of the hour-angle solver.

#include "astro/hour_angle.hpp"

#include "core/types.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace miqat::astro
{

std::optional<f64> HourAngleSolver::hour_angle_for_altitude(
    f64 latitude_deg,
    f64 declination_deg,
    f64 altitude_deg)
{
    const f64 lat = glm::radians(latitude_deg);
    const f64 dec = glm::radians(declination_deg);
    const f64 alt = glm::radians(altitude_deg);

    const f64 denominator = std::cos(lat) * std::cos(dec);
    if (std::abs(denominator) < kDegenerateDenominator)
    {
        return std::nullopt;
    }

    const f64 cos_h = (std::sin(alt) - std::sin(lat) * std::sin(dec)) / denominator;
    if (!std::isfinite(cos_h) || std::abs(cos_h) > 1.0 + kCosineTolerance)
    {
        return std::nullopt;
    }

    return glm::degrees(std::acos(std::clamp(cos_h, -1.0, 1.0)));
}

std::optional<f64> HourAngleSolver::asr_altitude(
    f64 latitude_deg,
    f64 declination_deg,
    f64 shadow_factor)
{
    // Zenith distance of the sun at transit
    const f64 noon_zenith_deg = std::abs(latitude_deg - declination_deg);
    if (noon_zenith_deg >= 90.0)
    {
        return std::nullopt;
    }

    const f64 noon_shadow = std::tan(glm::radians(noon_zenith_deg));
    return glm::degrees(std::atan(1.0 / (shadow_factor + noon_shadow)));
}

std::optional<f64> HourAngleSolver::hour_angle_for_asr_shadow(
    f64 latitude_deg,
    f64 declination_deg,
    f64 shadow_factor)
{
    const auto altitude = asr_altitude(latitude_deg, declination_deg, shadow_factor);
    if (!altitude)
    {
        return std::nullopt;
    }
    return hour_angle_for_altitude(latitude_deg, declination_deg, *altitude);
}

} // namespace miqat::astro
