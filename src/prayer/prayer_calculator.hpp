#pragma once

/// @file prayer_calculator.hpp
/// @brief Boundary entry point: validate inputs, resolve the method, compose.

#include "prayer/method_registry.hpp"
#include "prayer/types.hpp"

#include <variant>

namespace miqat::prayer
{
    /// @brief PrayerTimes on success, or the reason the call was rejected.
    using CalculationResult = std::variant<PrayerTimes, CalculationError>;

    /// @brief Compute one local day's prayer times.
    ///
    /// Rejects out-of-range coordinates (InvalidCoordinate), impossible dates or
    /// UTC offsets (InvalidDate) and unregistered methods (UnknownMethod) before
    /// any astronomy is done. Markers with no geometric solution are returned
    /// as empty entries, never as a call-level error.
    [[nodiscard]] CalculationResult calculate_prayer_times(
        const GeoCoordinate& coordinate,
        const CalculationDate& date,
        MethodId method,
        AsrJuristic juristic = AsrJuristic::Shafii
    );

} // namespace miqat::prayer
