#pragma once

/// @file types.hpp
/// @brief Value types shared by the prayer-time calculation: inputs, markers, results, errors.

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace miqat::prayer
{
    /// @brief Observer position on the Earth.
    struct GeoCoordinate
    {
        f64 latitude_deg;   ///< Geographic latitude (degrees, north positive, [-90, 90])
        f64 longitude_deg;  ///< Geographic longitude (degrees, east positive, [-180, 180])

        /// @brief True when both components are finite and within range.
        [[nodiscard]] bool is_valid() const;
    };

    /// @brief Local calendar day on the proleptic Gregorian calendar.
    struct CalculationDate
    {
        i32 year;
        i32 month;                  ///< [1, 12]
        i32 day;                    ///< [1, days in month]
        i32 utc_offset_minutes = 0; ///< Local clock minus UTC (e.g. +180 for UTC+3)

        static constexpr i32 kMinUtcOffsetMinutes = -12 * 60;
        static constexpr i32 kMaxUtcOffsetMinutes = 14 * 60;

        /// @brief True for a real calendar date with an offset in UTC−12 … UTC+14.
        [[nodiscard]] bool is_valid() const;

        bool operator==(const CalculationDate&) const = default;
    };

    /// @brief The six daily markers, in chronological order for non-polar latitudes.
    enum class Prayer : u8
    {
        Fajr,
        Sunrise,
        Dhuhr,
        Asr,
        Maghrib,
        Isha,
    };

    inline constexpr std::size_t kPrayerCount = 6;

    inline constexpr std::array<Prayer, kPrayerCount> kAllPrayers = {
        Prayer::Fajr, Prayer::Sunrise, Prayer::Dhuhr,
        Prayer::Asr,  Prayer::Maghrib, Prayer::Isha,
    };

    /// @brief Display name of a marker ("Fajr", "Sunrise", ...).
    [[nodiscard]] std::string_view prayer_name(Prayer prayer);

    /// @brief Asr juristic convention, selecting the shadow-length factor.
    enum class AsrJuristic : u8
    {
        Shafii = 1,   ///< Shadow = 1 × object height (also Maliki, Hanbali)
        Hanafi = 2,   ///< Shadow = 2 × object height
    };

    /// @brief Shadow factor for a juristic convention.
    [[nodiscard]] constexpr f64 asr_factor(AsrJuristic juristic)
    {
        return static_cast<f64>(static_cast<u8>(juristic));
    }

    /// @brief Call-level failures of calculate_prayer_times().
    enum class CalculationError : u8
    {
        InvalidCoordinate,  ///< Latitude or longitude out of range (or not finite)
        InvalidDate,        ///< Impossible calendar date or UTC offset out of range
        UnknownMethod,      ///< Method identifier not in the registry
    };

    [[nodiscard]] std::string_view to_string(CalculationError error);

    /// @brief One day's prayer times in minutes since local midnight.
    ///
    /// Immutable once built. An empty entry means the sun does not reach the
    /// marker's altitude on that day (polar day or night). Values are not
    /// wrapped into [0, 1440): a timezone far from the longitude may push
    /// them past either end of the day.
    class PrayerTimes
    {
    public:
        using Entries = std::array<std::optional<f64>, kPrayerCount>;

        PrayerTimes() = default;
        explicit PrayerTimes(const Entries& entries) : m_entries(entries) {}

        /// @brief Minutes since local midnight, or std::nullopt for no solution.
        [[nodiscard]] std::optional<f64> at(Prayer prayer) const
        {
            return m_entries[static_cast<std::size_t>(prayer)];
        }

        [[nodiscard]] bool has_solution(Prayer prayer) const
        {
            return at(prayer).has_value();
        }

        [[nodiscard]] const Entries& entries() const { return m_entries; }

        bool operator==(const PrayerTimes&) const = default;

    private:
        Entries m_entries{};
    };

} // namespace miqat::prayer
