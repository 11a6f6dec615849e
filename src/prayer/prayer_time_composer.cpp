/// @file prayer_time_composer.cpp
/// @brief Implementation of the prayer-time composition.

#include "prayer/prayer_time_composer.hpp"

#include "astro/hour_angle.hpp"
#include "astro/julian_date.hpp"
#include "astro/solar_position.hpp"
#include "core/types.hpp"

#include <optional>
#include <variant>

namespace miqat::prayer
{

namespace
{

using astro::HourAngleSolver;

/// Event time before (sign −1) or after (sign +1) transit, in minutes.
std::optional<f64> offset_from_noon(f64 noon, std::optional<f64> hour_angle_deg, f64 sign)
{
    if (!hour_angle_deg)
    {
        return std::nullopt;
    }
    return noon + sign * *hour_angle_deg * time_constants::kMinutesPerDegree;
}

/// Local clock time of transit given the day's equation of time.
f64 noon_for(const GeoCoordinate& coordinate, const CalculationDate& date, f64 equation_of_time)
{
    return time_constants::kMinutesAtNoon
         - coordinate.longitude_deg * time_constants::kMinutesPerDegree
         - equation_of_time
         + static_cast<f64>(date.utc_offset_minutes);
}

} // anonymous namespace

f64 PrayerTimeComposer::reference_julian_date(const CalculationDate& date)
{
    // Local midnight expressed in UT, then half a day forward
    const f64 utc_hour_at_local_midnight =
        -static_cast<f64>(date.utc_offset_minutes) / time_constants::kMinutesPerHour;

    return astro::JulianDateConverter::to_julian_date(
               date.year, date.month, date.day, utc_hour_at_local_midnight)
         + 0.5;
}

f64 PrayerTimeComposer::solar_noon_minutes(const GeoCoordinate& coordinate, const CalculationDate& date)
{
    const auto sun = astro::SolarPositionCalculator::solar_position(reference_julian_date(date));
    return noon_for(coordinate, date, sun.equation_of_time_minutes);
}

PrayerTimes PrayerTimeComposer::compose(
    const GeoCoordinate& coordinate,
    const CalculationDate& date,
    const MethodParameters& parameters)
{
    const auto sun = astro::SolarPositionCalculator::solar_position(reference_julian_date(date));
    const f64 lat  = coordinate.latitude_deg;
    const f64 dec  = sun.declination_deg;
    const f64 noon = noon_for(coordinate, date, sun.equation_of_time_minutes);

    const auto horizon_angle = HourAngleSolver::hour_angle_for_altitude(lat, dec, kSunriseAltitudeDeg);

    PrayerTimes::Entries entries{};
    auto slot = [&entries](Prayer prayer) -> std::optional<f64>& {
        return entries[static_cast<std::size_t>(prayer)];
    };

    slot(Prayer::Fajr) = offset_from_noon(
        noon, HourAngleSolver::hour_angle_for_altitude(lat, dec, -parameters.fajr_angle_deg), -1.0);

    slot(Prayer::Sunrise) = offset_from_noon(noon, horizon_angle, -1.0);

    slot(Prayer::Dhuhr) = noon + parameters.dhuhr_adjust_minutes;

    slot(Prayer::Asr) = offset_from_noon(
        noon, HourAngleSolver::hour_angle_for_asr_shadow(lat, dec, parameters.asr_factor), 1.0);

    const auto maghrib = offset_from_noon(noon, horizon_angle, 1.0);
    if (maghrib)
    {
        slot(Prayer::Maghrib) = *maghrib + parameters.maghrib_adjust_minutes;
    }

    if (const auto* angle = std::get_if<IshaAngle>(&parameters.isha))
    {
        slot(Prayer::Isha) = offset_from_noon(
            noon, HourAngleSolver::hour_angle_for_altitude(lat, dec, -angle->degrees), 1.0);
    }
    else if (const auto& sunset = slot(Prayer::Maghrib))
    {
        slot(Prayer::Isha) = *sunset + static_cast<f64>(std::get<IshaInterval>(parameters.isha).minutes);
    }

    return PrayerTimes(entries);
}

} // namespace miqat::prayer
