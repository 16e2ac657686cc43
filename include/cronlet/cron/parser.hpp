#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "cronlet/core/error.hpp"
#include "cronlet/cron/schedule.hpp"
#include "cronlet/cron/token.hpp"

namespace cronlet::cron {

/// Expansion of a named shorthand, or std::nullopt when `schedule` is not
/// one of @yearly, @monthly, @weekly, @daily, @hourly, @minutely.
auto expand_alias(std::string_view schedule) -> std::optional<std::string_view>;

/// The expression a schedule string stands for: its alias expansion, or
/// the string itself.
auto resolve_alias(std::string_view schedule) -> std::string_view;

/// Expand scanned tokens into per-field value sets, enforcing field bounds.
///
///   - Any            the whole field
///   - Number v       {v}
///   - Range a-b      [a, b]; a == b gives {a}
///   - Step           start (default field min) up to end (default field
///                    max) every n; a start past `end - n` gives {start}
///
/// Tokens of the same field are unioned. The first invalid token aborts
/// the expansion with OutOfBound or InvalidValue.
auto expand(const std::vector<Token>& tokens) -> Result<ParsedSchedule>;

/// Alias substitution, scanning and expansion in one step.
///
/// @param schedule  An alias or a raw 5- or 6-field expression.
/// @returns         The parsed schedule, or the first lexical or semantic
///                  error.
auto parse_schedule(std::string_view schedule) -> Result<ParsedSchedule>;

} // namespace cronlet::cron
