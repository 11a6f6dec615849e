#pragma once

/// @file julian_date.hpp
/// @brief Gregorian calendar → Julian Date conversion and calendar validity checks.

#include "core/types.hpp"

namespace miqat::astro
{
    /// @brief Static utility class for Julian Date computations.
    ///
    /// Implements the Meeus algorithm (Astronomical Algorithms, Ch. 7) on the
    /// proleptic Gregorian calendar. One Julian Date unit is one mean solar day.
    class JulianDateConverter
    {
    public:
        JulianDateConverter() = delete;

        /// @brief Convert a Gregorian date plus a UTC hour of day to a Julian Date.
        /// @param year Gregorian year (>= 1).
        /// @param month Month in [1,12].
        /// @param day Day of month, valid for the given month and year.
        /// @param utc_hour Fractional hour (UTC). Values outside [0, 24) are
        ///        accepted and simply move the instant into the adjacent day.
        /// @return Julian Date. The function is total over its domain; date
        ///         validity is the caller's responsibility (see is_valid_date()).
        [[nodiscard]] static f64 to_julian_date(i32 year, i32 month, i32 day, f64 utc_hour);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Gregorian leap-year rule.
        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Number of days in a month, or 0 for a month outside [1,12].
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

        /// @brief True for a proleptic Gregorian date with year >= 1.
        [[nodiscard]] static bool is_valid_date(i32 year, i32 month, i32 day);
    };

} // namespace miqat::astro
