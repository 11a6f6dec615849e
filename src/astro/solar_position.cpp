/// @file solar_position.cpp
/// @brief Implementation of the low-precision solar ephemeris.

#include "astro/solar_position.hpp"

#include "astro/julian_date.hpp"
#include "core/types.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace miqat::astro
{

// -----------------------------------------------------------------
// Sun position (Meeus, Ch. 25 "low accuracy")
//
// T   = Julian centuries since J2000.0
// L0  = 280.46646 + 36000.76983 T + 0.0003032 T²        mean longitude
// M   = 357.52911 + 35999.05029 T − 0.0001537 T²        mean anomaly
// C   = (1.914602 − 0.004817 T − 0.000014 T²) sin M
//     + (0.019993 − 0.000101 T) sin 2M
//     + 0.000289 sin 3M                                 equation of centre
// Ω   = 125.04 − 1934.136 T
// λ   = L0 + C − 0.00569 − 0.00478 sin Ω                apparent longitude
// ε   = ε0 + 0.00256 cos Ω                              apparent obliquity
//
// δ   = asin(sin ε · sin λ)
// α   = atan2(cos ε · sin λ, cos λ)
// E   = 4 × (L0 − 0.0057183° − α)   minutes (Meeus, Ch. 28)
// -----------------------------------------------------------------

SolarPosition SolarPositionCalculator::solar_position(f64 jd)
{
    const f64 t = JulianDateConverter::julian_centuries(jd);

    const f64 mean_longitude = normalize_degrees(
        280.46646 + t * (36000.76983 + 0.0003032 * t));
    const f64 mean_anomaly = glm::radians(
        357.52911 + t * (35999.05029 - 0.0001537 * t));

    const f64 equation_of_centre =
          (1.914602 - t * (0.004817 + 0.000014 * t)) * std::sin(mean_anomaly)
        + (0.019993 - 0.000101 * t) * std::sin(2.0 * mean_anomaly)
        + 0.000289 * std::sin(3.0 * mean_anomaly);

    const f64 omega = glm::radians(125.04 - 1934.136 * t);

    const f64 apparent_longitude = glm::radians(
        mean_longitude + equation_of_centre - 0.00569 - 0.00478 * std::sin(omega));

    // Mean obliquity (IAU), arcseconds folded into degrees
    const f64 seconds = 21.448 - t * (46.815 + t * (0.00059 - t * 0.001813));
    const f64 mean_obliquity = 23.0 + (26.0 + seconds / 60.0) / 60.0;
    const f64 obliquity = glm::radians(mean_obliquity + 0.00256 * std::cos(omega));

    const f64 sin_lambda = std::sin(apparent_longitude);

    const f64 declination = std::asin(std::sin(obliquity) * sin_lambda);

    const f64 right_ascension = normalize_degrees(glm::degrees(
        std::atan2(std::cos(obliquity) * sin_lambda, std::cos(apparent_longitude))));

    // Fold the longitude difference into (-180, 180] before scaling to minutes
    f64 difference = normalize_degrees(mean_longitude - 0.0057183 - right_ascension);
    if (difference > 180.0)
    {
        difference -= 360.0;
    }

    return SolarPosition{
        .declination_deg          = glm::degrees(declination),
        .equation_of_time_minutes = difference * time_constants::kMinutesPerDegree,
    };
}

// -----------------------------------------------------------------
// Normalize angle to [0, 360)
// -----------------------------------------------------------------

f64 SolarPositionCalculator::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, 360.0);
    if (angle < 0.0)
    {
        angle += 360.0;
    }
    return angle;
}

} // namespace miqat::astro
