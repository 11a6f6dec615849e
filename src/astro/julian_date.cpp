/// @file julian_date.cpp
/// @brief Implementation of Julian Date conversion.

#include "astro/julian_date.hpp"

#include "core/types.hpp"

#include <cmath>

namespace miqat::astro
{

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 JulianDateConverter::to_julian_date(i32 year, i32 month, i32 day, f64 utc_hour)
{
    i32 y = year;
    i32 m = month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(day)
                 + utc_hour / 24.0
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

// -----------------------------------------------------------------
// Julian centuries since J2000.0
// -----------------------------------------------------------------

f64 JulianDateConverter::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

// -----------------------------------------------------------------
// Calendar validity
// -----------------------------------------------------------------

bool JulianDateConverter::is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

i32 JulianDateConverter::days_in_month(i32 year, i32 month)
{
    static constexpr i32 kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12)
    {
        return 0;
    }
    if (month == 2 && is_leap_year(year))
    {
        return 29;
    }
    return kDays[month - 1];
}

bool JulianDateConverter::is_valid_date(i32 year, i32 month, i32 day)
{
    if (year < 1)
    {
        return false;
    }
    const i32 days = days_in_month(year, month);
    return days > 0 && day >= 1 && day <= days;
}

} // namespace miqat::astro
