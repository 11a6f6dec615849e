/// @file test_config_loader.cpp
/// @brief Unit tests for miqat::config::ConfigLoader.
///
/// Verifies YAML parsing, defaults for absent sections, and rejection of
/// out-of-range or unrecognized values.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "config/config_loader.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "prayer/method_registry.hpp"
#include "schedule/high_latitude.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace miqat;
using namespace miqat::config;
using prayer::Prayer;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    if (!core::Logger::init({.file_path = "", .level = spdlog::level::warn}))
    {
        return 1;
    }
    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: create a temporary YAML file for testing
// =================================================================

class TempYamlFile
{
public:
    explicit TempYamlFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempYamlFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempYamlFile(const TempYamlFile&) = delete;
    TempYamlFile& operator=(const TempYamlFile&) = delete;

private:
    std::filesystem::path m_path;
};

// =================================================================
// Valid documents
// =================================================================

TEST_CASE("Full document")
{
    const auto config = ConfigLoader::load_from_string(R"(
location:
  latitude: 51.5074
  longitude: -0.1278
  cached: true
calculation:
  method: mwl
  asr: hanafi
  utc_offset_minutes: 60
  high_latitude: angle_based
iqama:
  fajr: 20
  dhuhr: 15
  asr: 10
  maghrib: 5
  isha: 15
logging:
  level: debug
  file: ""
  console: false
)");
    REQUIRE(config.has_value());

    CHECK(config->location.latitude_deg == doctest::Approx(51.5074));
    CHECK(config->location.longitude_deg == doctest::Approx(-0.1278));
    CHECK(config->location_cached);

    CHECK(config->method == prayer::MethodId::MuslimWorldLeague);
    CHECK(config->asr == prayer::AsrJuristic::Hanafi);
    REQUIRE(config->utc_offset_minutes.has_value());
    CHECK(*config->utc_offset_minutes == 60);
    CHECK(config->high_latitude == schedule::HighLatitudePolicy::AngleBased);

    CHECK(config->iqama.at(Prayer::Fajr) == 20);
    CHECK(config->iqama.at(Prayer::Sunrise) == 0);
    CHECK(config->iqama.at(Prayer::Dhuhr) == 15);
    CHECK(config->iqama.at(Prayer::Asr) == 10);
    CHECK(config->iqama.at(Prayer::Maghrib) == 5);
    CHECK(config->iqama.at(Prayer::Isha) == 15);

    CHECK(config->logging.level == spdlog::level::debug);
    CHECK(config->logging.file_path.empty());
    CHECK_FALSE(config->logging.console);
}

TEST_CASE("Empty document keeps the defaults")
{
    const auto config = ConfigLoader::load_from_string("");
    REQUIRE(config.has_value());

    const AppConfig defaults;
    CHECK(config->location.latitude_deg == defaults.location.latitude_deg);
    CHECK(config->location.longitude_deg == defaults.location.longitude_deg);
    CHECK(config->method == prayer::MethodId::UmmAlQura);
    CHECK(config->asr == prayer::AsrJuristic::Shafii);
    CHECK_FALSE(config->utc_offset_minutes.has_value());
    CHECK(config->high_latitude == schedule::HighLatitudePolicy::None);
    CHECK(config->iqama == schedule::IqamaOffsets{});
}

TEST_CASE("Partial sections keep the remaining defaults")
{
    const auto config = ConfigLoader::load_from_string(R"(
calculation:
  method: Egyptian General Authority of Survey
)");
    REQUIRE(config.has_value());
    CHECK(config->method == prayer::MethodId::Egypt);

    const auto keyed = ConfigLoader::load_from_string("calculation: { method: karachi }");
    REQUIRE(keyed.has_value());
    CHECK(keyed->method == prayer::MethodId::Karachi);
    CHECK(keyed->asr == prayer::AsrJuristic::Shafii);
    CHECK(keyed->location.latitude_deg == doctest::Approx(21.4225));
}

// =================================================================
// Rejected documents
// =================================================================

TEST_CASE("Unknown method is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("calculation: { method: jafari }").has_value());
}

TEST_CASE("Unknown Asr convention is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("calculation: { asr: maliki }").has_value());
}

TEST_CASE("Out-of-range location is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("location: { latitude: 95.0 }").has_value());
    CHECK_FALSE(ConfigLoader::load_from_string("location: { longitude: -181 }").has_value());
}

TEST_CASE("Non-numeric latitude is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("location: { latitude: north }").has_value());
}

TEST_CASE("Out-of-range UTC offset is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("calculation: { utc_offset_minutes: 900 }").has_value());
}

TEST_CASE("Unknown high-latitude policy is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("calculation: { high_latitude: nearest }").has_value());
}

TEST_CASE("Negative iqama offset is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("iqama: { fajr: -5 }").has_value());
}

TEST_CASE("Unknown log level is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("logging: { level: verbose }").has_value());

    const auto off = ConfigLoader::load_from_string("logging: { level: off }");
    REQUIRE(off.has_value());
    CHECK(off->logging.level == spdlog::level::off);
}

TEST_CASE("Malformed YAML is rejected")
{
    CHECK_FALSE(ConfigLoader::load_from_string("location: { latitude: [1, 2").has_value());
}

TEST_CASE("Top level must be a mapping")
{
    CHECK_FALSE(ConfigLoader::load_from_string("- 21.4\n- 39.8\n").has_value());
}

// =================================================================
// Files
// =================================================================

TEST_CASE("Load from file")
{
    const TempYamlFile file("miqat_test_config.yaml", R"(
location:
  latitude: -33.8688
  longitude: 151.2093
calculation:
  method: isna
  utc_offset_minutes: 600
)");

    const auto config = ConfigLoader::load(file.path());
    REQUIRE(config.has_value());
    CHECK(config->location.latitude_deg == doctest::Approx(-33.8688));
    CHECK(config->method == prayer::MethodId::Isna);
    CHECK(*config->utc_offset_minutes == 600);
}

TEST_CASE("Missing file returns nullopt")
{
    CHECK_FALSE(ConfigLoader::load("/nonexistent/path/miqat.yaml").has_value());
}

TEST_CASE("Invalid file content returns nullopt")
{
    const TempYamlFile file("miqat_test_bad.yaml", "calculation: { method: jafari }\n");
    CHECK_FALSE(ConfigLoader::load(file.path()).has_value());
}
