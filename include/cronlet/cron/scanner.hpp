#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "cronlet/core/error.hpp"
#include "cronlet/cron/token.hpp"

namespace cronlet::cron {

/// Number of whitespace-separated fields a schedule may have.
inline constexpr std::size_t kMinFieldCount = 5;
inline constexpr std::size_t kMaxFieldCount = 6;

/// Tokenize a raw 5- or 6-field cron expression.
///
/// Grammar per field (list items separated by `,`):
///   - `*`          Any
///   - `N`          Number (digits only)
///   - `N-M`        Range
///   - `*/S`, `N/S`, `-M/S`, `N-M/S`  Step
///
/// Fields are tagged minute, hour, day, month, weekday; a sixth leading
/// field is tagged second. Numeric bounds are not checked here.
///
/// @param expr  The expression, e.g. "*/10,30 * * * *".
/// @returns     Every token in order, or the first error found. Errors are
///              EmptyExpression, LengthMismatch or MalformedToken.
auto scan(std::string_view expr) -> Result<std::vector<Token>>;

} // namespace cronlet::cron
