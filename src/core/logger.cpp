/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace miqat::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

bool Logger::init(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;

    if (config.console)
    {
        // Console sink with color output, on stderr so the prayer table
        // written to stdout stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        try
        {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, kMaxFileSize, kMaxFiles);
            file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
            sinks.push_back(file_sink);
        }
        catch (const spdlog::spdlog_ex& e)
        {
            // Keep the console sink; report once the loggers exist
            file_error = e.what();
        }
    }

    // Re-initialization replaces the previous loggers
    spdlog::drop("MIQAT");
    spdlog::drop("APP");

    // -----------------------------------------------------------------
    // Core logger ("MIQAT"): configuration and infrastructure
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("MIQAT", sinks.begin(), sinks.end());
    s_core_logger->set_level(config.level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line output
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(config.level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);

    if (!file_error.empty())
    {
        s_core_logger->error("Logger: Cannot open log file {}: {}", config.file_path, file_error);
        return false;
    }
    return true;
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace miqat::core
