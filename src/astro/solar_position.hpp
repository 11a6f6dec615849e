#pragma once

/// @file solar_position.hpp
/// @brief Low-precision solar ephemeris: declination and equation of time.

#include "core/types.hpp"

namespace miqat::astro
{
    /// @brief Sun's position as needed for daily event times.
    struct SolarPosition
    {
        f64 declination_deg;            ///< Solar declination (degrees, about ±23.45)
        f64 equation_of_time_minutes;   ///< Apparent minus mean solar time (minutes, about ±16)
    };

    /// @brief Static utility class computing the sun's declination and the
    /// equation of time from a Julian Date.
    ///
    /// Uses truncated series for the sun's mean longitude, mean anomaly,
    /// equation of centre and obliquity (Meeus, Astronomical Algorithms,
    /// Ch. 25 and 28). Accuracy is about a minute of time, well within the
    /// ±2 minute target for prayer times.
    class SolarPositionCalculator
    {
    public:
        SolarPositionCalculator() = delete;

        /// @brief Solar declination and equation of time at a Julian Date.
        /// @param jd Julian Date (UT).
        [[nodiscard]] static SolarPosition solar_position(f64 jd);

    private:
        /// @brief Normalize an angle to the range [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);
    };

} // namespace miqat::astro
