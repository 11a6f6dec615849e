#pragma once

/// @file method_registry.hpp
/// @brief Calculation methods as data: twilight angles, Isha rule, Asr factor.

#include "core/types.hpp"
#include "prayer/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <variant>

namespace miqat::prayer
{
    /// @brief Supported calculation methodologies.
    enum class MethodId : u8
    {
        MuslimWorldLeague,
        Isna,           ///< Islamic Society of North America
        Egypt,          ///< Egyptian General Authority of Survey
        UmmAlQura,      ///< Umm al-Qura University, Makkah
        Karachi,        ///< University of Islamic Sciences, Karachi
    };

    /// @brief Isha when the sun is this many degrees below the horizon.
    struct IshaAngle
    {
        f64 degrees;

        bool operator==(const IshaAngle&) const = default;
    };

    /// @brief Isha a fixed number of minutes after Maghrib.
    struct IshaInterval
    {
        i32 minutes;

        bool operator==(const IshaInterval&) const = default;
    };

    /// @brief Exactly one Isha rule is active per method.
    using IshaRule = std::variant<IshaAngle, IshaInterval>;

    /// @brief Parameters consumed by PrayerTimeComposer.
    struct MethodParameters
    {
        f64 fajr_angle_deg;                 ///< Twilight depression angle (positive)
        IshaRule isha;
        f64 asr_factor = 1.0;               ///< 1 = Shafi'i, 2 = Hanafi
        f64 dhuhr_adjust_minutes = 0.0;     ///< Reserved per-method adjustment
        f64 maghrib_adjust_minutes = 0.0;   ///< Reserved per-method adjustment

        bool operator==(const MethodParameters&) const = default;
    };

    /// @brief One row of the registry table.
    struct MethodEntry
    {
        MethodId id;
        std::string_view key;       ///< Settings key, e.g. "umm_al_qura"
        std::string_view name;      ///< Human-readable name
        MethodParameters parameters;
    };

    /// @brief Read-only lookup table of the five calculation methods.
    ///
    /// The table is a compile-time constant shared by the whole process; it is
    /// never mutated and needs no synchronization.
    class MethodRegistry
    {
    public:
        MethodRegistry() = delete;

        /// @brief Parameters for a method with its default (Shafi'i) Asr factor.
        /// @return std::nullopt if @p id is not a registered method.
        [[nodiscard]] static std::optional<MethodParameters> parameters_for(MethodId id);

        /// @brief Parameters for a method with the Asr factor overridden by @p juristic.
        [[nodiscard]] static std::optional<MethodParameters> parameters_for(MethodId id, AsrJuristic juristic);

        /// @brief Human-readable method name, or "Unknown".
        [[nodiscard]] static std::string_view name_of(MethodId id);

        /// @brief Resolve a settings key ("mwl", "isna", "egypt", "umm_al_qura",
        /// "karachi") or a full method name, ignoring case.
        [[nodiscard]] static std::optional<MethodId> method_from_name(std::string_view name);

        /// @brief All registry rows, in MethodId order.
        [[nodiscard]] static std::span<const MethodEntry> entries();

    private:
        [[nodiscard]] static const MethodEntry* find(MethodId id);
    };

} // namespace miqat::prayer
