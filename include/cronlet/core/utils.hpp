#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cronlet/core/error.hpp"
#include "cronlet/core/types.hpp"

namespace cronlet::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;

/// Build a Timestamp from local wall-clock components (month is 1-based).
auto make_local_time(int year, int month, int day,
                     int hour = 0, int minute = 0, int second = 0) -> Timestamp;

/// Render a Timestamp as "YYYY-MM-DD HH:MM:SS" in local time.
auto format_local_time(Timestamp ts) -> std::string;

/// Parse "YYYY-MM-DD HH:MM:SS" (or with a 'T' separator) as local time.
/// The seconds component is optional.
auto parse_local_time(std::string_view text) -> Result<Timestamp>;

} // namespace cronlet::utils
