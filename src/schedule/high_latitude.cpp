/// @file high_latitude.cpp
/// @brief Implementation of the high-latitude display policies.

#include "schedule/high_latitude.hpp"

#include <initializer_list>
#include <variant>

namespace miqat::schedule
{

using prayer::Prayer;
using prayer::PrayerTimes;

namespace
{

/// Fraction of the night allowed between the base event and the estimate.
f64 night_fraction(HighLatitudePolicy policy, f64 twilight_angle_deg)
{
    switch (policy)
    {
        case HighLatitudePolicy::MiddleOfNight: return 0.5;
        case HighLatitudePolicy::OneSeventh:    return 1.0 / 7.0;
        case HighLatitudePolicy::AngleBased:    return twilight_angle_deg / 60.0;
        case HighLatitudePolicy::None:          break;
    }
    return 0.0;
}

} // anonymous namespace

AdjustedTimes apply_high_latitude_policy(
    const PrayerTimes& times,
    const prayer::MethodParameters& parameters,
    HighLatitudePolicy policy)
{
    AdjustedTimes result{.times = times};

    const auto sunrise = times.at(Prayer::Sunrise);
    const auto maghrib = times.at(Prayer::Maghrib);
    if (policy == HighLatitudePolicy::None || !sunrise || !maghrib)
    {
        return result;
    }

    const f64 night = *sunrise + time_constants::kMinutesPerDay - *maghrib;
    PrayerTimes::Entries entries = times.entries();

    // Fajr, measured back from sunrise
    {
        const f64 portion = night * night_fraction(policy, parameters.fajr_angle_deg);
        auto& fajr = entries[static_cast<std::size_t>(Prayer::Fajr)];
        if (!fajr || *sunrise - *fajr > portion)
        {
            fajr = *sunrise - portion;
            result.estimated[static_cast<std::size_t>(Prayer::Fajr)] = true;
        }
    }

    // Isha, measured forward from sunset
    if (const auto* angle = std::get_if<prayer::IshaAngle>(&parameters.isha))
    {
        const f64 portion = night * night_fraction(policy, angle->degrees);
        auto& isha = entries[static_cast<std::size_t>(Prayer::Isha)];
        if (!isha || *isha - *maghrib > portion)
        {
            isha = *maghrib + portion;
            result.estimated[static_cast<std::size_t>(Prayer::Isha)] = true;
        }
    }

    result.times = PrayerTimes(entries);
    return result;
}

std::string_view to_string(HighLatitudePolicy policy)
{
    switch (policy)
    {
        case HighLatitudePolicy::None:          return "none";
        case HighLatitudePolicy::MiddleOfNight: return "middle_of_night";
        case HighLatitudePolicy::OneSeventh:    return "one_seventh";
        case HighLatitudePolicy::AngleBased:    return "angle_based";
    }
    return "none";
}

std::optional<HighLatitudePolicy> high_latitude_policy_from_name(std::string_view name)
{
    for (const auto policy : {HighLatitudePolicy::None, HighLatitudePolicy::MiddleOfNight,
                              HighLatitudePolicy::OneSeventh, HighLatitudePolicy::AngleBased})
    {
        if (name == to_string(policy))
        {
            return policy;
        }
    }
    return std::nullopt;
}

} // namespace miqat::schedule
