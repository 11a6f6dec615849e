#pragma once

/// @file high_latitude.hpp
/// @brief Display-side estimates for Fajr and Isha where twilight never ends or never begins.

#include "core/types.hpp"
#include "prayer/method_registry.hpp"
#include "prayer/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace miqat::schedule
{
    /// @brief How the display estimates Fajr/Isha at high latitudes.
    enum class HighLatitudePolicy : u8
    {
        None,           ///< Show the computed values, "--:--" where there are none
        MiddleOfNight,  ///< At most half the night away from sunrise/sunset
        OneSeventh,     ///< At most a seventh of the night away
        AngleBased,     ///< At most (twilight angle / 60) of the night away
    };

    /// @brief Times after the policy ran, with the entries it replaced flagged.
    struct AdjustedTimes
    {
        prayer::PrayerTimes times;
        std::array<bool, prayer::kPrayerCount> estimated{};

        [[nodiscard]] bool is_estimated(prayer::Prayer p) const
        {
            return estimated[static_cast<std::size_t>(p)];
        }
    };

    /// @brief Apply @p policy to a computed day.
    ///
    /// Night = Sunrise + 1440 − Maghrib. Fajr becomes Sunrise − portion·night
    /// and angle-based Isha becomes Maghrib + portion·night when missing or
    /// farther than that from their base. Interval-based Isha is left alone.
    /// Without both Sunrise and Maghrib nothing can be estimated and the input
    /// is returned unchanged.
    [[nodiscard]] AdjustedTimes apply_high_latitude_policy(
        const prayer::PrayerTimes& times,
        const prayer::MethodParameters& parameters,
        HighLatitudePolicy policy);

    /// @brief Settings key ("none", "middle_of_night", "one_seventh", "angle_based").
    [[nodiscard]] std::string_view to_string(HighLatitudePolicy policy);

    [[nodiscard]] std::optional<HighLatitudePolicy> high_latitude_policy_from_name(std::string_view name);

} // namespace miqat::schedule
