/// @file clock.cpp
/// @brief Implementation of the system clock adapter.

#include "app/clock.hpp"

#include "astro/julian_date.hpp"

#include <charconv>
#include <chrono>
#include <ctime>

namespace miqat::app
{

// -----------------------------------------------------------------
// System timezone offset (tm_gmtoff of the current local time)
// -----------------------------------------------------------------

i32 Clock::system_utc_offset_minutes()
{
    const std::time_t tt = std::time(nullptr);

    std::tm local{};
    if (localtime_r(&tt, &local) == nullptr)
    {
        return 0;
    }
    return static_cast<i32>(local.tm_gmtoff / 60);
}

i32 Clock::system_utc_offset_minutes(const prayer::CalculationDate& date)
{
    // Noon keeps clear of the hour skipped or repeated at a DST change
    std::tm local{};
    local.tm_year  = date.year - 1900;
    local.tm_mon   = date.month - 1;
    local.tm_mday  = date.day;
    local.tm_hour  = 12;
    local.tm_isdst = -1;

    if (std::mktime(&local) == static_cast<std::time_t>(-1))
    {
        return system_utc_offset_minutes();
    }
    return static_cast<i32>(local.tm_gmtoff / 60);
}

// -----------------------------------------------------------------
// Local day and time: shift the instant by the offset, then read it as UTC
// -----------------------------------------------------------------

LocalTime Clock::local_time(std::chrono::system_clock::time_point instant, i32 utc_offset_minutes)
{
    using namespace std::chrono;

    const auto shifted  = instant + minutes(utc_offset_minutes);
    const auto midnight = floor<days>(shifted);
    const year_month_day ymd{midnight};

    return LocalTime{
        .date = prayer::CalculationDate{
            .year               = static_cast<i32>(ymd.year()),
            .month              = static_cast<i32>(static_cast<unsigned>(ymd.month())),
            .day                = static_cast<i32>(static_cast<unsigned>(ymd.day())),
            .utc_offset_minutes = utc_offset_minutes,
        },
        .minutes_since_midnight = duration<f64, std::ratio<60>>(shifted - midnight).count(),
    };
}

LocalTime Clock::now(i32 utc_offset_minutes)
{
    return local_time(std::chrono::system_clock::now(), utc_offset_minutes);
}

prayer::CalculationDate Clock::next_day(const prayer::CalculationDate& date)
{
    prayer::CalculationDate next = date;
    ++next.day;

    if (next.day > astro::JulianDateConverter::days_in_month(next.year, next.month))
    {
        next.day = 1;
        if (++next.month > 12)
        {
            next.month = 1;
            ++next.year;
        }
    }
    return next;
}

prayer::CalculationDate Clock::previous_day(const prayer::CalculationDate& date)
{
    prayer::CalculationDate previous = date;
    if (--previous.day < 1)
    {
        if (--previous.month < 1)
        {
            previous.month = 12;
            --previous.year;
        }
        previous.day = astro::JulianDateConverter::days_in_month(previous.year, previous.month);
    }
    return previous;
}

// -----------------------------------------------------------------
// "YYYY-MM-DD"
// -----------------------------------------------------------------

std::optional<prayer::CalculationDate> Clock::parse_iso_date(std::string_view text, i32 utc_offset_minutes)
{
    if (text.size() < 10 || text[text.size() - 3] != '-' || text[text.size() - 6] != '-')
    {
        return std::nullopt;
    }

    auto parse_field = [](std::string_view field) -> std::optional<i32> {
        i32 value = 0;
        const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
        if (ec != std::errc{} || ptr != field.data() + field.size())
        {
            return std::nullopt;
        }
        return value;
    };

    const std::size_t year_len = text.size() - 6;
    const auto year  = parse_field(text.substr(0, year_len));
    const auto month = parse_field(text.substr(year_len + 1, 2));
    const auto day   = parse_field(text.substr(year_len + 4, 2));

    if (!year || !month || !day
        || !astro::JulianDateConverter::is_valid_date(*year, *month, *day))
    {
        return std::nullopt;
    }

    return prayer::CalculationDate{
        .year               = *year,
        .month              = *month,
        .day                = *day,
        .utc_offset_minutes = utc_offset_minutes,
    };
}

} // namespace miqat::app
