/// @file day_schedule.cpp
/// @brief Implementation of the PrayerTimes post-processing helpers.

#include "schedule/day_schedule.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace miqat::schedule
{

using prayer::Prayer;
using prayer::PrayerTimes;

PrayerTimes apply_iqama_offsets(const PrayerTimes& times, const IqamaOffsets& offsets)
{
    PrayerTimes::Entries shifted = times.entries();
    for (const Prayer p : prayer::kAllPrayers)
    {
        auto& entry = shifted[static_cast<std::size_t>(p)];
        if (entry)
        {
            *entry += static_cast<f64>(offsets.at(p));
        }
    }
    return PrayerTimes(shifted);
}

std::optional<UpcomingPrayer> next_prayer(
    const PrayerTimes& yesterday,
    const PrayerTimes& today,
    const PrayerTimes& tomorrow,
    f64 now_minutes)
{
    const f64 day = time_constants::kMinutesPerDay;
    const std::array<std::pair<const PrayerTimes*, f64>, 3> timeline = {{
        {&yesterday, -day},
        {&today,     0.0},
        {&tomorrow,  day},
    }};

    std::optional<UpcomingPrayer> best;
    for (const auto& [times, shift] : timeline)
    {
        for (const Prayer p : prayer::kAllPrayers)
        {
            const auto entry = times->at(p);
            if (!entry)
            {
                continue;
            }

            const f64 t = *entry + shift;
            if (t > now_minutes && (!best || t < best->minutes))
            {
                best = UpcomingPrayer{
                    .prayer        = p,
                    .minutes       = t,
                    .tomorrow      = t >= day,
                    .minutes_until = t - now_minutes,
                };
            }
        }
    }
    return best;
}

std::string format_time(std::optional<f64> minutes)
{
    if (!minutes || !std::isfinite(*minutes))
    {
        return "--:--";
    }

    const auto day = static_cast<i64>(time_constants::kMinutesPerDay);
    i64 rounded = static_cast<i64>(std::llround(*minutes)) % day;
    if (rounded < 0)
    {
        rounded += day;
    }

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << rounded / 60
       << ':' << std::setw(2) << rounded % 60;
    return ss.str();
}

std::string format_countdown(f64 minutes)
{
    const i64 total = std::max<i64>(0, static_cast<i64>(std::ceil(minutes)));

    std::ostringstream ss;
    ss << total / 60 << "h " << std::setfill('0') << std::setw(2) << total % 60 << 'm';
    return ss.str();
}

} // namespace miqat::schedule
