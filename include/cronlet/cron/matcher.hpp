#pragma once

#include "cronlet/core/types.hpp"
#include "cronlet/cron/schedule.hpp"

namespace cronlet::cron {

/// Check whether a timestamp satisfies every field of a schedule.
///
/// Components are taken in local time. Seconds are only compared for
/// six-field schedules; five-field schedules ignore them.
///
/// Day-of-month and day-of-week are combined with AND: "0 0 13 * 5" only
/// matches a Friday the 13th. This differs from the classic cron rule
/// (OR when both are restricted) and is intended.
auto matches(const ParsedSchedule& schedule, Timestamp t) -> bool;

} // namespace cronlet::cron
