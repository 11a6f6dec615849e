#pragma once

#include <cstdint>

namespace miqat
{
    // Precision aliases
    using f64 = double;
    using u8  = uint8_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kJ2000          = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerCentury = 36525.0;
    }

    // Clock constants (minutes)
    namespace time_constants
    {
        constexpr f64 kMinutesPerHour   = 60.0;
        constexpr f64 kMinutesPerDay    = 1440.0;
        constexpr f64 kMinutesAtNoon    = 720.0;
        constexpr f64 kMinutesPerDegree = 4.0;   // 360° of hour angle per 1440 minutes
    }
}
