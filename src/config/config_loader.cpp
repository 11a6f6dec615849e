/// @file config_loader.cpp
/// @brief Implementation of the YAML configuration loader.

#include "config/config_loader.hpp"

#include "core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace miqat::config
{

namespace
{

/// Iqama keys, in Prayer order ("sunrise" accepted for symmetry).
constexpr std::string_view kIqamaKeys[prayer::kPrayerCount] = {
    "fajr", "sunrise", "dhuhr", "asr", "maghrib", "isha",
};

} // anonymous namespace

// -----------------------------------------------------------------
// Entry points
// -----------------------------------------------------------------

std::optional<AppConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        MQT_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception& e)
    {
        MQT_CORE_ERROR("ConfigLoader: Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    auto config = from_node(root);
    if (config)
    {
        MQT_CORE_INFO("ConfigLoader: Loaded configuration from {}", path.string());
    }
    return config;
}

std::optional<AppConfig> ConfigLoader::load_from_string(std::string_view yaml)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(std::string(yaml));
    }
    catch (const YAML::Exception& e)
    {
        MQT_CORE_ERROR("ConfigLoader: Failed to parse configuration: {}", e.what());
        return std::nullopt;
    }

    return from_node(root);
}

std::optional<AppConfig> ConfigLoader::from_node(const YAML::Node& root)
{
    AppConfig config;

    // An empty document keeps every default
    if (root.IsNull())
    {
        return config;
    }

    if (!root.IsMap())
    {
        MQT_CORE_ERROR("ConfigLoader: Top level must be a mapping");
        return std::nullopt;
    }

    // yaml-cpp reports type mismatches in as<T>() by throwing
    try
    {
        if (!read_location(root["location"], config) ||
            !read_calculation(root["calculation"], config) ||
            !read_iqama(root["iqama"], config) ||
            !read_logging(root["logging"], config))
        {
            return std::nullopt;
        }
    }
    catch (const YAML::Exception& e)
    {
        MQT_CORE_ERROR("ConfigLoader: Invalid value (line {}): {}", e.mark.line + 1, e.msg);
        return std::nullopt;
    }

    return config;
}

// -----------------------------------------------------------------
// Sections
// -----------------------------------------------------------------

bool ConfigLoader::read_location(const YAML::Node& node, AppConfig& config)
{
    if (!node)
    {
        MQT_CORE_WARN("ConfigLoader: No location given, using {:.4f}, {:.4f}",
                      config.location.latitude_deg, config.location.longitude_deg);
        return true;
    }

    if (node["latitude"])
    {
        config.location.latitude_deg = node["latitude"].as<f64>();
    }
    if (node["longitude"])
    {
        config.location.longitude_deg = node["longitude"].as<f64>();
    }
    if (node["cached"])
    {
        config.location_cached = node["cached"].as<bool>();
    }

    if (!config.location.is_valid())
    {
        MQT_CORE_ERROR("ConfigLoader: Location out of range: latitude {}, longitude {}",
                       config.location.latitude_deg, config.location.longitude_deg);
        return false;
    }
    return true;
}

bool ConfigLoader::read_calculation(const YAML::Node& node, AppConfig& config)
{
    if (!node)
    {
        return true;
    }

    if (node["method"])
    {
        const auto name = node["method"].as<std::string>();
        const auto method = prayer::MethodRegistry::method_from_name(name);
        if (!method)
        {
            MQT_CORE_ERROR("ConfigLoader: Unknown calculation method '{}'", name);
            return false;
        }
        config.method = *method;
    }

    if (node["asr"])
    {
        const auto name = node["asr"].as<std::string>();
        if (name == "shafii")
        {
            config.asr = prayer::AsrJuristic::Shafii;
        }
        else if (name == "hanafi")
        {
            config.asr = prayer::AsrJuristic::Hanafi;
        }
        else
        {
            MQT_CORE_ERROR("ConfigLoader: Unknown Asr convention '{}' (expected shafii or hanafi)", name);
            return false;
        }
    }

    if (node["utc_offset_minutes"])
    {
        const auto offset = node["utc_offset_minutes"].as<i32>();
        if (offset < prayer::CalculationDate::kMinUtcOffsetMinutes ||
            offset > prayer::CalculationDate::kMaxUtcOffsetMinutes)
        {
            MQT_CORE_ERROR("ConfigLoader: UTC offset {} minutes out of range", offset);
            return false;
        }
        config.utc_offset_minutes = offset;
    }

    if (node["high_latitude"])
    {
        const auto name = node["high_latitude"].as<std::string>();
        const auto policy = schedule::high_latitude_policy_from_name(name);
        if (!policy)
        {
            MQT_CORE_ERROR("ConfigLoader: Unknown high-latitude policy '{}'", name);
            return false;
        }
        config.high_latitude = *policy;
    }

    return true;
}

bool ConfigLoader::read_iqama(const YAML::Node& node, AppConfig& config)
{
    if (!node)
    {
        return true;
    }

    for (const prayer::Prayer p : prayer::kAllPrayers)
    {
        const std::string key(kIqamaKeys[static_cast<std::size_t>(p)]);
        if (!node[key])
        {
            continue;
        }

        const auto minutes = node[key].as<i32>();
        if (minutes < 0)
        {
            MQT_CORE_ERROR("ConfigLoader: Negative iqama offset for {}: {}", key, minutes);
            return false;
        }
        config.iqama.set(p, minutes);
    }
    return true;
}

bool ConfigLoader::read_logging(const YAML::Node& node, AppConfig& config)
{
    if (!node)
    {
        return true;
    }

    if (node["level"])
    {
        const auto name = node["level"].as<std::string>();
        const auto level = spdlog::level::from_str(name);
        // from_str maps anything unrecognized to "off"
        if (level == spdlog::level::off && name != "off")
        {
            MQT_CORE_ERROR("ConfigLoader: Unknown log level '{}'", name);
            return false;
        }
        config.logging.level = level;
    }
    if (node["file"])
    {
        config.logging.file_path = node["file"].as<std::string>();
    }
    if (node["console"])
    {
        config.logging.console = node["console"].as<bool>();
    }
    return true;
}

} // namespace miqat::config
