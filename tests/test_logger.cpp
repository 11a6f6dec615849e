/// @file test_logger.cpp
/// @brief Unit tests for miqat::core::Logger sink setup.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace miqat;

namespace
{

/// Removes the given path (file or directory tree) when the test ends.
class TempPath
{
public:
    explicit TempPath(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
    }

    ~TempPath()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

private:
    std::filesystem::path m_path;
};

} // anonymous namespace

TEST_CASE("Console-only logging needs no file")
{
    CHECK(core::Logger::init({.file_path = "", .level = spdlog::level::warn}));
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    REQUIRE(core::Logger::get_app_logger() != nullptr);
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::warn);
    core::Logger::shutdown();
}

TEST_CASE("Log file is created and written")
{
    const TempPath dir("miqat_logger_test");
    const auto file = dir.path() / "miqat.log";

    REQUIRE(core::Logger::init({.file_path = file.string(), .level = spdlog::level::info, .console = false}));
    MQT_CORE_WARN("written to {}", "file");
    core::Logger::shutdown();

    CHECK(std::filesystem::exists(file));
    CHECK(std::filesystem::file_size(file) > 0);
}

TEST_CASE("Unopenable log file falls back to the console and reports failure")
{
    // A regular file where the log directory should be
    const TempPath blocker("miqat_logger_blocker");
    {
        std::ofstream out(blocker.path());
        out << "not a directory";
    }
    const auto file = blocker.path() / "miqat.log";

    bool opened = true;
    CHECK_NOTHROW(opened = core::Logger::init({.file_path = file.string(), .level = spdlog::level::warn}));
    CHECK_FALSE(opened);

    // Loggers remain usable
    REQUIRE(core::Logger::get_core_logger() != nullptr);
    REQUIRE(core::Logger::get_app_logger() != nullptr);
    CHECK_NOTHROW(MQT_WARN("still logging after a failed file sink"));
    CHECK(core::Logger::get_app_logger()->sinks().size() == 1);
    core::Logger::shutdown();
}

TEST_CASE("Re-initialization replaces the loggers")
{
    REQUIRE(core::Logger::init({.file_path = "", .level = spdlog::level::info}));
    const auto first = core::Logger::get_core_logger();

    REQUIRE(core::Logger::init({.file_path = "", .level = spdlog::level::err}));
    CHECK(core::Logger::get_core_logger() != first);
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::err);
    core::Logger::shutdown();
}
