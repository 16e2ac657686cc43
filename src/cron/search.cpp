#include "cronlet/cron/search.hpp"
#include "cronlet/cron/matcher.hpp"

#include <algorithm>
#include <ctime>

namespace cronlet::cron {

namespace {

auto to_local_tm(Timestamp ts) -> std::tm {
    auto time_t_val = Clock::to_time_t(ts);
    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);
    return tm_val;
}

auto is_midnight(const std::tm& tm) -> bool {
    return tm.tm_hour == 0 && tm.tm_min == 0 && tm.tm_sec == 0;
}

/// Local midnight starting day `mday` of month `month` (0-based, both may
/// overflow) in the year of `base`.
///
/// The wall time is first read with the DST flag of `base`. If the zone's
/// offset changed in between, the result is not midnight and the other
/// flag is tried. When midnight itself falls in a spring-forward gap
/// neither attempt is midnight; the later one is the first instant of the
/// day.
auto local_midnight(const std::tm& base, int month, int mday) -> Timestamp {
    auto resolve = [&](int isdst, std::tm& out) {
        out = std::tm{};
        out.tm_year = base.tm_year;
        out.tm_mon = month;
        out.tm_mday = mday;
        out.tm_isdst = isdst;
        return std::mktime(&out);
    };

    std::tm first_tm{};
    auto first = resolve(base.tm_isdst, first_tm);
    if (is_midnight(first_tm)) return Clock::from_time_t(first);

    std::tm second_tm{};
    auto second = resolve(first_tm.tm_isdst, second_tm);
    if (is_midnight(second_tm)) return Clock::from_time_t(second);

    return Clock::from_time_t(std::max(first, second));
}

/// The earliest instant after `candidate` that could still match.
///
/// Months and days that already fail are skipped to the next local
/// midnight. Hours and minutes are skipped in absolute time, so a repeated
/// fall-back hour is visited twice exactly as a one-granule walk would.
auto next_candidate(const ParsedSchedule& schedule, Timestamp candidate) -> Timestamp {
    using std::chrono::minutes;
    using std::chrono::seconds;

    const auto tm = to_local_tm(candidate);

    if (!schedule.month.contains(tm.tm_mon + 1)) {
        return local_midnight(tm, tm.tm_mon + 1, 1);
    }
    if (!schedule.day.contains(tm.tm_mday) || !schedule.weekday.contains(tm.tm_wday)) {
        return local_midnight(tm, tm.tm_mon, tm.tm_mday + 1);
    }
    if (!schedule.hour.contains(tm.tm_hour)) {
        return candidate + minutes(60 - tm.tm_min) - seconds(tm.tm_sec);
    }
    if (!schedule.minute.contains(tm.tm_min)) {
        return candidate + seconds(60 - tm.tm_sec);
    }
    return candidate + seconds(1);
}

} // anonymous namespace

auto next_run(const ParsedSchedule& schedule, Timestamp from) -> std::optional<Timestamp> {
    using std::chrono::floor;

    const Clock::duration granularity = schedule.has_seconds
        ? Clock::duration(std::chrono::seconds(1))
        : Clock::duration(std::chrono::minutes(1));

    Timestamp candidate = schedule.has_seconds
        ? floor<std::chrono::seconds>(from) + granularity
        : floor<std::chrono::minutes>(from) + granularity;

    const Timestamp deadline = from + kSearchHorizon;

    while (candidate <= deadline) {
        if (matches(schedule, candidate)) {
            return candidate;
        }

        auto next = next_candidate(schedule, candidate);
        if (next <= candidate) {
            next = candidate + granularity;
        }
        candidate = next;
    }

    return std::nullopt;
}

} // namespace cronlet::cron
