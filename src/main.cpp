// src/main.cpp - Miqat prayer-time table entry point
//
// Usage: miqat [config.yaml] [YYYY-MM-DD]
//
//  1. Initialize logging
//  2. Load configuration (location, method, display settings)
//  3. Resolve the local day from the clock or the command line
//  4. Compute the day's times
//  5. Apply the display policies and print the table and countdown,
//     looking back to yesterday for an Isha that falls after midnight

#include "app/clock.hpp"
#include "config/config_loader.hpp"
#include "core/logger.hpp"
#include "prayer/method_registry.hpp"
#include "prayer/prayer_calculator.hpp"
#include "schedule/day_schedule.hpp"
#include "schedule/high_latitude.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

using namespace miqat;

namespace
{

constexpr const char* kDefaultConfigPath = "miqat.yaml";

/// Unwrap a calculation result, logging the error on failure.
std::optional<prayer::PrayerTimes> unwrap(const prayer::CalculationResult& result,
                                          const prayer::CalculationDate& date)
{
    if (const auto* error = std::get_if<prayer::CalculationError>(&result))
    {
        MQT_ERROR("Cannot compute {:04d}-{:02d}-{:02d}: {}",
                  date.year, date.month, date.day, prayer::to_string(*error));
        return std::nullopt;
    }
    return std::get<prayer::PrayerTimes>(result);
}

} // anonymous namespace

int main(int argc, char** argv) {
    // Console only until the configuration names a log file
    if (!core::Logger::init({.file_path = ""})) {
        return 1;
    }

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    const std::filesystem::path config_path = (argc > 1) ? argv[1] : kDefaultConfigPath;

    config::AppConfig cfg;
    if (std::filesystem::exists(config_path)) {
        auto loaded = config::ConfigLoader::load(config_path);
        if (!loaded) {
            MQT_CRITICAL("Configuration {} is invalid", config_path.string());
            core::Logger::shutdown();
            return 1;
        }
        cfg = std::move(*loaded);
    } else {
        MQT_WARN("No configuration at {}, using defaults", config_path.string());
    }

    if (!core::Logger::init(cfg.logging)) {
        MQT_CRITICAL("Logging configuration is invalid");
        core::Logger::shutdown();
        return 1;
    }

    // -----------------------------------------------------------------------
    // 2. Local day
    // -----------------------------------------------------------------------
    prayer::CalculationDate date{};
    f64 now_minutes = 0.0;
    const bool explicit_date = argc > 2;
    if (explicit_date) {
        const auto parsed = app::Clock::parse_iso_date(argv[2], 0);
        if (!parsed) {
            MQT_CRITICAL("Invalid date '{}' (expected YYYY-MM-DD)", argv[2]);
            core::Logger::shutdown();
            return 1;
        }
        date = *parsed;
        date.utc_offset_minutes =
            cfg.utc_offset_minutes.value_or(app::Clock::system_utc_offset_minutes(date));
    } else {
        const auto local = app::Clock::now(
            cfg.utc_offset_minutes.value_or(app::Clock::system_utc_offset_minutes()));
        date = local.date;
        now_minutes = local.minutes_since_midnight;
    }

    // -----------------------------------------------------------------------
    // 3. Calculation
    // -----------------------------------------------------------------------
    const auto parameters = prayer::MethodRegistry::parameters_for(cfg.method, cfg.asr);
    const auto today = unwrap(
        prayer::calculate_prayer_times(cfg.location, date, cfg.method, cfg.asr), date);

    if (!parameters || !today) {
        core::Logger::shutdown();
        return 1;
    }

    const auto adjusted = schedule::apply_high_latitude_policy(*today, *parameters, cfg.high_latitude);
    const auto iqama = schedule::apply_iqama_offsets(adjusted.times, cfg.iqama);

    MQT_DEBUG("Computed {:04d}-{:02d}-{:02d} at {:.4f}, {:.4f} ({})",
              date.year, date.month, date.day,
              cfg.location.latitude_deg, cfg.location.longitude_deg,
              prayer::MethodRegistry::name_of(cfg.method));

    // -----------------------------------------------------------------------
    // 4. Output
    // -----------------------------------------------------------------------
    std::cout << "Prayer times for " << std::setfill('0')
              << std::setw(4) << date.year << '-'
              << std::setw(2) << date.month << '-'
              << std::setw(2) << date.day << std::setfill(' ') << "\n"
              << "  Location: " << std::fixed << std::setprecision(4)
              << cfg.location.latitude_deg << ", " << cfg.location.longitude_deg
              << (cfg.location_cached ? "  (last known position)" : "") << "\n"
              << "  Method:   " << prayer::MethodRegistry::name_of(cfg.method)
              << (cfg.asr == prayer::AsrJuristic::Hanafi ? ", Hanafi Asr" : "") << "\n\n";

    std::cout << "  " << std::left << std::setw(10) << "" << std::setw(8) << "Adhan" << "Iqama\n";
    for (const prayer::Prayer p : prayer::kAllPrayers) {
        std::cout << "  " << std::left << std::setw(10) << prayer::prayer_name(p)
                  << std::setw(8) << schedule::format_time(adjusted.times.at(p));
        if (p != prayer::Prayer::Sunrise) {
            std::cout << schedule::format_time(iqama.at(p));
        }
        if (adjusted.is_estimated(p)) {
            std::cout << "  (est.)";
        }
        std::cout << "\n";
    }

    // -----------------------------------------------------------------------
    // 5. Countdown, across midnight in both directions
    // -----------------------------------------------------------------------
    if (!explicit_date) {
        auto adjusted_for = [&](const prayer::CalculationDate& day) -> std::optional<prayer::PrayerTimes> {
            const auto times = unwrap(
                prayer::calculate_prayer_times(cfg.location, day, cfg.method, cfg.asr), day);
            if (!times) {
                return std::nullopt;
            }
            return schedule::apply_high_latitude_policy(*times, *parameters, cfg.high_latitude).times;
        };

        const auto yesterday = adjusted_for(app::Clock::previous_day(date));
        const auto tomorrow = adjusted_for(app::Clock::next_day(date));
        if (!yesterday || !tomorrow) {
            core::Logger::shutdown();
            return 1;
        }

        const auto upcoming = schedule::next_prayer(*yesterday, adjusted.times, *tomorrow, now_minutes);
        if (upcoming) {
            std::cout << "\n  Next: " << prayer::prayer_name(upcoming->prayer)
                      << (upcoming->tomorrow ? " (tomorrow)" : "")
                      << " at " << schedule::format_time(upcoming->minutes)
                      << ", in " << schedule::format_countdown(upcoming->minutes_until) << "\n";
        }
    }

    core::Logger::shutdown();
    return 0;
}
