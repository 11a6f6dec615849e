#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace miqat::core
{
    /// @brief Sink and verbosity settings for Logger::init().
    /// Use designated initializers: Logger::init({.file_path = "", .level = spdlog::level::debug});
    struct LoggerConfig
    {
        std::string file_path = "miqat.log";   ///< Rotating log file; empty disables the file sink
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
    };

    /// @brief Centralized logging facility for Miqat.
    ///
    /// Provides two separate loggers:
    /// - **MIQAT** (core): configuration, loaders, infrastructure
    /// - **APP**: command-line output and user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. The calculation
    /// core never logs, so it remains usable without a logger.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any MQT_ macros are used.
        /// @return false if the log file could not be opened; the loggers
        ///         then write to the console sink only.
        [[nodiscard]] static bool init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("MIQAT").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace miqat::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define MQT_CORE_TRACE(...)    ::miqat::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define MQT_CORE_DEBUG(...)    ::miqat::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define MQT_CORE_INFO(...)     ::miqat::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define MQT_CORE_WARN(...)     ::miqat::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define MQT_CORE_ERROR(...)    ::miqat::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define MQT_CORE_CRITICAL(...) ::miqat::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define MQT_TRACE(...)         ::miqat::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define MQT_DEBUG(...)         ::miqat::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define MQT_INFO(...)          ::miqat::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define MQT_WARN(...)          ::miqat::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define MQT_ERROR(...)         ::miqat::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define MQT_CRITICAL(...)      ::miqat::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
