#pragma once

#include <chrono>
#include <optional>

#include "cronlet/core/types.hpp"
#include "cronlet/cron/schedule.hpp"

namespace cronlet::cron {

/// How far ahead next_run() looks before giving up.
inline constexpr auto kSearchHorizon = std::chrono::hours(366 * 24);

/// Compute the next instant after `from` that matches `schedule`.
///
/// Candidates are whole seconds for six-field schedules and whole minutes
/// otherwise, starting with the first one strictly after `from`.
///
/// @returns The earliest matching candidate within `from + kSearchHorizon`,
///          or std::nullopt when none exists (e.g. "0 0 30 2 *").
auto next_run(const ParsedSchedule& schedule, Timestamp from) -> std::optional<Timestamp>;

} // namespace cronlet::cron
