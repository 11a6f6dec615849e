#pragma once

/// @file prayer_time_composer.hpp
/// @brief Composes solar position and hour angles into the day's prayer times.

#include "core/types.hpp"
#include "prayer/method_registry.hpp"
#include "prayer/types.hpp"

namespace miqat::prayer
{
    /// @brief Static utility class turning (coordinate, date, method) into PrayerTimes.
    ///
    /// Pure function of its inputs: no validation, no logging, no state.
    /// Callers wanting boundary checks go through calculate_prayer_times().
    class PrayerTimeComposer
    {
    public:
        PrayerTimeComposer() = delete;

        /// Altitude of the sun's upper limb at sunrise/sunset, including refraction.
        static constexpr f64 kSunriseAltitudeDeg = -0.833;

        /// @brief Compute the six markers for one local day.
        ///
        /// Fajr = noon − 4·H(−fajr angle), Sunrise = noon − 4·H(−0.833°),
        /// Dhuhr = noon, Asr = noon + 4·H(shadow), Maghrib = noon + 4·H(−0.833°),
        /// Isha = noon + 4·H(−isha angle) or Maghrib + interval.
        [[nodiscard]] static PrayerTimes compose(
            const GeoCoordinate& coordinate,
            const CalculationDate& date,
            const MethodParameters& parameters
        );

        /// @brief Local clock time of solar transit (minutes since local midnight).
        ///
        /// noon = 720 − 4·longitude − equation of time + UTC offset
        [[nodiscard]] static f64 solar_noon_minutes(
            const GeoCoordinate& coordinate,
            const CalculationDate& date
        );

        /// @brief Julian Date at which the sun is sampled for @p date: local noon in UT.
        [[nodiscard]] static f64 reference_julian_date(const CalculationDate& date);
    };

} // namespace miqat::prayer
