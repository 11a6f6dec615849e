#pragma once

/// @file hour_angle.hpp
/// @brief Hour angle at which the sun reaches a given altitude.

#include "core/types.hpp"

#include <optional>

namespace miqat::astro
{
    /// @brief Static utility class solving the spherical triangle
    /// pole–zenith–sun for the hour angle.
    ///
    /// All angles are in degrees. A result of std::nullopt means the sun does
    /// not reach the requested altitude on that day (polar day or night).
    class HourAngleSolver
    {
    public:
        HourAngleSolver() = delete;

        /// @brief Hour angle (degrees, [0, 180]) at which the sun's altitude equals @p altitude_deg.
        ///
        /// cos(H) = (sin(a) − sin(φ)·sin(δ)) / (cos(φ)·cos(δ))
        ///
        /// @param latitude_deg Observer latitude (north positive).
        /// @param declination_deg Solar declination.
        /// @param altitude_deg Target altitude; negative values lie below the horizon.
        [[nodiscard]] static std::optional<f64> hour_angle_for_altitude(
            f64 latitude_deg,
            f64 declination_deg,
            f64 altitude_deg
        );

        /// @brief Sun altitude at which a gnomon's shadow equals
        /// shadow_factor × its height plus the noon shadow.
        ///
        /// a = atan(1 / (factor + tan|φ − δ|)).
        /// std::nullopt when the sun stays below the horizon at noon.
        [[nodiscard]] static std::optional<f64> asr_altitude(
            f64 latitude_deg,
            f64 declination_deg,
            f64 shadow_factor
        );

        /// @brief Afternoon hour angle for the Asr shadow condition.
        [[nodiscard]] static std::optional<f64> hour_angle_for_asr_shadow(
            f64 latitude_deg,
            f64 declination_deg,
            f64 shadow_factor
        );

    private:
        /// Slack allowed on |cos H| before declaring no solution; the excess is clamped.
        static constexpr f64 kCosineTolerance = 1e-9;

        /// Below this |cos φ · cos δ| the observer is at a pole.
        static constexpr f64 kDegenerateDenominator = 1e-12;
    };

} // namespace miqat::astro
