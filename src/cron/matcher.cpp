#include "cronlet/cron/matcher.hpp"

#include <ctime>

namespace cronlet::cron {

auto matches(const ParsedSchedule& schedule, Timestamp t) -> bool {
    auto time_t_val = Clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&time_t_val, &tm);

    if (schedule.has_seconds && !schedule.second.contains(tm.tm_sec)) {
        return false;
    }

    return schedule.minute.contains(tm.tm_min) &&
           schedule.hour.contains(tm.tm_hour) &&
           schedule.day.contains(tm.tm_mday) &&
           schedule.month.contains(tm.tm_mon + 1) &&  // tm_mon is 0-based
           schedule.weekday.contains(tm.tm_wday);     // tm_wday: 0 = Sunday
}

} // namespace cronlet::cron
