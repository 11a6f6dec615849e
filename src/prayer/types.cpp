/// @file types.cpp
/// @brief Validation and naming for the prayer value types.

#include "prayer/types.hpp"

#include "astro/julian_date.hpp"

#include <cmath>

namespace miqat::prayer
{

bool GeoCoordinate::is_valid() const
{
    return std::isfinite(latitude_deg) && std::isfinite(longitude_deg)
        && latitude_deg >= -90.0 && latitude_deg <= 90.0
        && longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

bool CalculationDate::is_valid() const
{
    return astro::JulianDateConverter::is_valid_date(year, month, day)
        && utc_offset_minutes >= kMinUtcOffsetMinutes
        && utc_offset_minutes <= kMaxUtcOffsetMinutes;
}

std::string_view prayer_name(Prayer prayer)
{
    switch (prayer)
    {
        case Prayer::Fajr:    return "Fajr";
        case Prayer::Sunrise: return "Sunrise";
        case Prayer::Dhuhr:   return "Dhuhr";
        case Prayer::Asr:     return "Asr";
        case Prayer::Maghrib: return "Maghrib";
        case Prayer::Isha:    return "Isha";
    }
    return "Unknown";
}

std::string_view to_string(CalculationError error)
{
    switch (error)
    {
        case CalculationError::InvalidCoordinate: return "invalid coordinate";
        case CalculationError::InvalidDate:       return "invalid date";
        case CalculationError::UnknownMethod:     return "unknown calculation method";
    }
    return "unknown error";
}

} // namespace miqat::prayer
