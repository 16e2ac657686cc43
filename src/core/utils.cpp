#include "cronlet/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cronlet::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto make_local_time(int year, int month, int day,
                     int hour, int minute, int second) -> Timestamp {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

auto format_local_time(Timestamp ts) -> std::string {
    auto time_t_val = Clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&time_t_val, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto parse_local_time(std::string_view text) -> Result<Timestamp> {
    std::string normalized = trim(text);
    std::ranges::replace(normalized, 'T', ' ');

    std::tm tm{};
    std::istringstream iss(normalized);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M");
    if (iss.fail()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Invalid local time, expected 'YYYY-MM-DD HH:MM[:SS]'",
            std::string(text)));
    }

    if (iss.peek() == ':') {
        iss.get();
        int second = -1;
        iss >> second;
        if (iss.fail() || second < 0 || second > 59) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Invalid seconds in local time",
                std::string(text)));
        }
        tm.tm_sec = second;
    }

    iss >> std::ws;
    if (!iss.eof()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Trailing characters in local time",
            std::string(text)));
    }

    return make_local_time(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                           tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace cronlet::utils
