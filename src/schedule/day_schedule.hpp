#pragma once

/// @file day_schedule.hpp
/// @brief Presentation-side post-processing of PrayerTimes: iqama, next prayer, formatting.

#include "core/types.hpp"
#include "prayer/types.hpp"

#include <array>
#include <optional>
#include <string>

namespace miqat::schedule
{
    /// @brief Minutes between the adhan and the iqama, per marker.
    struct IqamaOffsets
    {
        std::array<i32, prayer::kPrayerCount> minutes{};

        [[nodiscard]] i32 at(prayer::Prayer p) const
        {
            return minutes[static_cast<std::size_t>(p)];
        }

        void set(prayer::Prayer p, i32 value)
        {
            minutes[static_cast<std::size_t>(p)] = value;
        }

        bool operator==(const IqamaOffsets&) const = default;
    };

    /// @brief The marker a countdown should point at.
    struct UpcomingPrayer
    {
        prayer::Prayer prayer;
        f64 minutes;          ///< Minutes since today's local midnight; 1440 and above is after tonight's midnight
        bool tomorrow;        ///< True when it falls after tonight's midnight
        f64 minutes_until;    ///< Time remaining from "now"
    };

    /// @brief Shift every solvable entry by its iqama offset. Empty entries stay empty.
    [[nodiscard]] prayer::PrayerTimes apply_iqama_offsets(
        const prayer::PrayerTimes& times,
        const IqamaOffsets& offsets);

    /// @brief Next marker strictly after @p now_minutes.
    ///
    /// The three days are laid on one timeline (yesterday's entries shifted
    /// by −1440, tomorrow's by +1440) so an Isha computed past midnight, or a
    /// Fajr computed before it, is found on the evening or morning it falls.
    /// std::nullopt only if no solvable entry lies ahead.
    [[nodiscard]] std::optional<UpcomingPrayer> next_prayer(
        const prayer::PrayerTimes& yesterday,
        const prayer::PrayerTimes& today,
        const prayer::PrayerTimes& tomorrow,
        f64 now_minutes);

    /// @brief "HH:MM" wrapped into the day and rounded to the minute, "--:--" when empty.
    [[nodiscard]] std::string format_time(std::optional<f64> minutes);

    /// @brief Remaining time as "Hh MMm", rounded up to the minute.
    [[nodiscard]] std::string format_countdown(f64 minutes);

} // namespace miqat::schedule
