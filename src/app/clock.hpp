#pragma once

/// @file clock.hpp
/// @brief System clock adapter: current local day, local time, and date parsing.

#include "core/types.hpp"
#include "prayer/types.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace miqat::app
{
    /// @brief A local calendar day and the time of day on it, taken from one instant.
    struct LocalTime
    {
        prayer::CalculationDate date;
        f64 minutes_since_midnight;   ///< [0, 1440), fractional
    };

    /// @brief Static utility class supplying CalculationDate values from the system clock.
    class Clock
    {
    public:
        Clock() = delete;

        /// @brief UTC offset of the system's local timezone right now (minutes).
        [[nodiscard]] static i32 system_utc_offset_minutes();

        /// @brief UTC offset of the system's local timezone at local noon of @p date.
        ///
        /// Differs from the current offset when daylight saving time starts or
        /// ends between today and @p date.
        [[nodiscard]] static i32 system_utc_offset_minutes(const prayer::CalculationDate& date);

        /// @brief Local day and time of @p instant on a clock running @p utc_offset_minutes ahead of UTC.
        [[nodiscard]] static LocalTime local_time(std::chrono::system_clock::time_point instant,
                                                  i32 utc_offset_minutes);

        /// @brief local_time() of the current instant.
        [[nodiscard]] static LocalTime now(i32 utc_offset_minutes);

        /// @brief The calendar day after @p date (same offset).
        [[nodiscard]] static prayer::CalculationDate next_day(const prayer::CalculationDate& date);

        /// @brief The calendar day before @p date (same offset).
        [[nodiscard]] static prayer::CalculationDate previous_day(const prayer::CalculationDate& date);

        /// @brief Parse "YYYY-MM-DD".
        /// @return std::nullopt on malformed text or an impossible date.
        [[nodiscard]] static std::optional<prayer::CalculationDate> parse_iso_date(
            std::string_view text,
            i32 utc_offset_minutes);
    };

} // namespace miqat::app
