/// @file test_clock.cpp
/// @brief Unit tests for miqat::app::Clock.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "app/clock.hpp"
#include "astro/julian_date.hpp"
#include "prayer/types.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>

using namespace miqat;
using namespace miqat::app;
using prayer::CalculationDate;

namespace
{

/// 2024-06-15 21:30:00 UTC
std::chrono::system_clock::time_point june15_2130_utc()
{
    using namespace std::chrono;
    return sys_days{year{2024} / June / 15} + hours{21} + minutes{30};
}

/// Switches the process timezone for the duration of a test.
class ScopedTimezone
{
public:
    explicit ScopedTimezone(const char* tz)
    {
        if (const char* previous = std::getenv("TZ"))
        {
            m_previous = previous;
        }
        ::setenv("TZ", tz, 1);
        ::tzset();
    }

    ~ScopedTimezone()
    {
        if (m_previous)
        {
            ::setenv("TZ", m_previous->c_str(), 1);
        }
        else
        {
            ::unsetenv("TZ");
        }
        ::tzset();
    }

    ScopedTimezone(const ScopedTimezone&) = delete;
    ScopedTimezone& operator=(const ScopedTimezone&) = delete;

private:
    std::optional<std::string> m_previous;
};

} // anonymous namespace

TEST_CASE("Local time of a fixed instant")
{
    const auto utc = Clock::local_time(june15_2130_utc(), 0);
    CHECK(utc.date == CalculationDate{.year = 2024, .month = 6, .day = 15, .utc_offset_minutes = 0});
    CHECK(utc.minutes_since_midnight == doctest::Approx(21.0 * 60.0 + 30.0));
}

TEST_CASE("Date and time of day come from the same instant across midnight")
{
    // UTC+3: 00:30 on the next day
    const auto east = Clock::local_time(june15_2130_utc(), 180);
    CHECK(east.date == CalculationDate{.year = 2024, .month = 6, .day = 16, .utc_offset_minutes = 180});
    CHECK(east.minutes_since_midnight == doctest::Approx(30.0));

    // UTC-12: 09:30 on the same day
    const auto west = Clock::local_time(june15_2130_utc(), -720);
    CHECK(west.date.day == 15);
    CHECK(west.minutes_since_midnight == doctest::Approx(570.0));

    // New Year in UTC+14
    using namespace std::chrono;
    const auto new_year = Clock::local_time(sys_days{year{2024} / December / 31} + hours{10} + seconds{30}, 840);
    CHECK(new_year.date == CalculationDate{.year = 2025, .month = 1, .day = 1, .utc_offset_minutes = 840});
    CHECK(new_year.minutes_since_midnight == doctest::Approx(0.5));
}

TEST_CASE("Current local time is a valid date within one day")
{
    for (const i32 offset : {-720, -300, 0, 180, 345, 840})
    {
        CAPTURE(offset);
        const auto now = Clock::now(offset);
        CHECK(now.date.is_valid());
        CHECK(now.date.utc_offset_minutes == offset);
        CHECK(now.date.year >= 2024);
        CHECK(now.minutes_since_midnight >= 0.0);
        CHECK(now.minutes_since_midnight < 1440.0);
    }
}

TEST_CASE("System offset lies within the range of real timezones")
{
    const i32 offset = Clock::system_utc_offset_minutes();
    CHECK(offset >= CalculationDate::kMinUtcOffsetMinutes);
    CHECK(offset <= CalculationDate::kMaxUtcOffsetMinutes);
}

TEST_CASE("Offset on a given date follows daylight saving time")
{
    const ScopedTimezone central_europe("CET-1CEST,M3.5.0,M10.5.0/3");

    CHECK(Clock::system_utc_offset_minutes(CalculationDate{.year = 2024, .month = 1, .day = 15}) == 60);
    CHECK(Clock::system_utc_offset_minutes(CalculationDate{.year = 2024, .month = 7, .day = 15}) == 120);

    // Days of the changes: 2024-03-31 and 2024-10-27, switched by noon
    CHECK(Clock::system_utc_offset_minutes(CalculationDate{.year = 2024, .month = 3, .day = 30}) == 60);
    CHECK(Clock::system_utc_offset_minutes(CalculationDate{.year = 2024, .month = 3, .day = 31}) == 120);
    CHECK(Clock::system_utc_offset_minutes(CalculationDate{.year = 2024, .month = 10, .day = 27}) == 60);
}

TEST_CASE("Next day crosses month and year ends")
{
    auto next = [](i32 y, i32 m, i32 d) {
        return Clock::next_day(CalculationDate{.year = y, .month = m, .day = d, .utc_offset_minutes = 60});
    };

    CHECK(next(2024, 6, 15) == CalculationDate{.year = 2024, .month = 6, .day = 16, .utc_offset_minutes = 60});
    CHECK(next(2024, 2, 28) == CalculationDate{.year = 2024, .month = 2, .day = 29, .utc_offset_minutes = 60});
    CHECK(next(2024, 2, 29) == CalculationDate{.year = 2024, .month = 3, .day = 1, .utc_offset_minutes = 60});
    CHECK(next(2023, 2, 28) == CalculationDate{.year = 2023, .month = 3, .day = 1, .utc_offset_minutes = 60});
    CHECK(next(2024, 4, 30) == CalculationDate{.year = 2024, .month = 5, .day = 1, .utc_offset_minutes = 60});
    CHECK(next(2024, 12, 31) == CalculationDate{.year = 2025, .month = 1, .day = 1, .utc_offset_minutes = 60});
}

TEST_CASE("Previous day crosses month and year starts")
{
    auto previous = [](i32 y, i32 m, i32 d) {
        return Clock::previous_day(CalculationDate{.year = y, .month = m, .day = d, .utc_offset_minutes = 60});
    };

    CHECK(previous(2024, 6, 16) == CalculationDate{.year = 2024, .month = 6, .day = 15, .utc_offset_minutes = 60});
    CHECK(previous(2024, 3, 1) == CalculationDate{.year = 2024, .month = 2, .day = 29, .utc_offset_minutes = 60});
    CHECK(previous(2023, 3, 1) == CalculationDate{.year = 2023, .month = 2, .day = 28, .utc_offset_minutes = 60});
    CHECK(previous(2024, 5, 1) == CalculationDate{.year = 2024, .month = 4, .day = 30, .utc_offset_minutes = 60});
    CHECK(previous(2025, 1, 1) == CalculationDate{.year = 2024, .month = 12, .day = 31, .utc_offset_minutes = 60});
}

TEST_CASE("Previous day undoes next day")
{
    CalculationDate date{.year = 2023, .month = 12, .day = 25};
    for (int i = 0; i < 400; ++i)
    {
        const auto next = Clock::next_day(date);
        CHECK(Clock::previous_day(next) == date);
        date = next;
    }
}

TEST_CASE("Next day advances the Julian date by exactly one")
{
    CalculationDate date{.year = 2023, .month = 12, .day = 25};
    for (int i = 0; i < 100; ++i)
    {
        const auto next = Clock::next_day(date);
        CHECK(astro::JulianDateConverter::to_julian_date(next.year, next.month, next.day, 0.0)
              == doctest::Approx(astro::JulianDateConverter::to_julian_date(date.year, date.month, date.day, 0.0) + 1.0));
        date = next;
    }
}

TEST_CASE("ISO dates parse")
{
    const auto date = Clock::parse_iso_date("2024-06-15", 180);
    REQUIRE(date.has_value());
    CHECK(date->year == 2024);
    CHECK(date->month == 6);
    CHECK(date->day == 15);
    CHECK(date->utc_offset_minutes == 180);

    const auto leap = Clock::parse_iso_date("2024-02-29", 0);
    CHECK(leap.has_value());
}

TEST_CASE("Malformed or impossible ISO dates are rejected")
{
    CHECK_FALSE(Clock::parse_iso_date("2024-02-30", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("2023-02-29", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("2024/06/15", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("2024-6-15", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("2024-06-1x", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("abc", 0).has_value());
    CHECK_FALSE(Clock::parse_iso_date("", 0).has_value());
}
