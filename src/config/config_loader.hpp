#pragma once

/// @file config_loader.hpp
/// @brief Loads the user's location, method and display settings from YAML.

#include "core/logger.hpp"
#include "core/types.hpp"
#include "prayer/method_registry.hpp"
#include "prayer/types.hpp"
#include "schedule/day_schedule.hpp"
#include "schedule/high_latitude.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace YAML
{
    class Node;
}

namespace miqat::config
{
    /// @brief Everything the command-line tool needs besides the clock.
    ///
    /// Defaults describe Makkah with the Umm al-Qura method, so a missing
    /// configuration file still produces a meaningful table.
    struct AppConfig
    {
        prayer::GeoCoordinate location{.latitude_deg = 21.4225, .longitude_deg = 39.8262};
        bool location_cached = false;   ///< Last-known fix rather than a fresh one

        prayer::MethodId method = prayer::MethodId::UmmAlQura;
        prayer::AsrJuristic asr = prayer::AsrJuristic::Shafii;
        std::optional<i32> utc_offset_minutes;   ///< System offset when absent
        schedule::HighLatitudePolicy high_latitude = schedule::HighLatitudePolicy::None;

        schedule::IqamaOffsets iqama;
        core::LoggerConfig logging;
    };

    /// @brief Static utility class for reading AppConfig from YAML.
    ///
    /// Expected layout (every key optional):
    ///
    ///     location:    { latitude: 21.4225, longitude: 39.8262, cached: false }
    ///     calculation: { method: umm_al_qura, asr: shafii,
    ///                    utc_offset_minutes: 180, high_latitude: none }
    ///     iqama:       { fajr: 20, dhuhr: 15, asr: 15, maghrib: 5, isha: 15 }
    ///     logging:     { level: info, file: miqat.log, console: true }
    ///
    /// Problems are reported through the core logger, which must be initialized.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load and validate a YAML configuration file.
        /// @return The configuration, or std::nullopt if the file cannot be read or is invalid.
        [[nodiscard]] static std::optional<AppConfig> load(const std::filesystem::path& path);

        /// @brief Parse configuration from YAML text.
        [[nodiscard]] static std::optional<AppConfig> load_from_string(std::string_view yaml);

    private:
        [[nodiscard]] static std::optional<AppConfig> from_node(const YAML::Node& root);

        [[nodiscard]] static bool read_location(const YAML::Node& node, AppConfig& config);
        [[nodiscard]] static bool read_calculation(const YAML::Node& node, AppConfig& config);
        [[nodiscard]] static bool read_iqama(const YAML::Node& node, AppConfig& config);
        [[nodiscard]] static bool read_logging(const YAML::Node& node, AppConfig& config);
    };

} // namespace miqat::config
