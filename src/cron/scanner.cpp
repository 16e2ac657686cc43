#include "cronlet/cron/scanner.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <string>

namespace cronlet::cron {

namespace {

constexpr std::array<FieldName, kMinFieldCount> kFiveFieldLayout = {
    FieldName::Minute, FieldName::Hour, FieldName::Day,
    FieldName::Month, FieldName::Weekday,
};

constexpr std::array<FieldName, kMaxFieldCount> kSixFieldLayout = {
    FieldName::Second, FieldName::Minute, FieldName::Hour,
    FieldName::Day, FieldName::Month, FieldName::Weekday,
};

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/// Returns the first position at or after `pos` that is not a digit.
auto skip_digits(std::string_view s, size_t pos) -> size_t {
    while (pos < s.size() && is_digit(s[pos])) ++pos;
    return pos;
}

/// Digit sequences longer than int64 saturate; the expander rejects them
/// as out of bound.
auto to_integer(std::string_view digits) -> std::int64_t {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return value;
}

auto split_whitespace(std::string_view s) -> std::vector<std::string_view> {
    std::vector<std::string_view> groups;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        if (i >= s.size()) break;

        size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        groups.push_back(s.substr(start, i - start));
    }
    return groups;
}

auto malformed(std::string_view what, std::string_view item, FieldName field) -> Error {
    return make_error(
        ErrorCode::MalformedToken,
        "Invalid " + std::string(what) + " '" + std::string(item) +
            "' for field '" + std::string(to_string(field)) + "'");
}

/// `item[slash]` is the '/'; everything after it must be the step digits.
auto scan_step(std::string_view item, size_t slash, FieldName field) -> Result<Token> {
    auto step = item.substr(slash + 1);
    if (step.empty() || skip_digits(step, 0) != step.size()) {
        return std::unexpected(malformed("step expression", item, field));
    }
    return Token{
        .lexeme = std::string(item),
        .kind = TokenKind::Step,
        .value = to_integer(step),
        .field = field,
    };
}

/// Scan one list item: `*`, `*/S`, `-M/S`, `N`, `N/S`, `N-M` or `N-M/S`.
auto scan_item(std::string_view item, std::string_view expr, FieldName field)
    -> Result<Token>
{
    const char first = item.front();

    if (first == '*') {
        if (item.size() == 1) {
            return Token{
                .lexeme = "*",
                .kind = TokenKind::Any,
                .value = std::string("*"),
                .field = field,
            };
        }
        if (item[1] == '/') {
            return scan_step(item, 1, field);
        }
        return std::unexpected(malformed("any expression", item, field));
    }

    if (first == '-') {
        // Only valid as the implicit-start step form `-M/S`.
        auto end = skip_digits(item, 1);
        if (end == 1 || end == item.size() || item[end] != '/') {
            return std::unexpected(malformed("range expression", item, field));
        }
        return scan_step(item, end, field);
    }

    if (!is_digit(first)) {
        return std::unexpected(make_error(
            ErrorCode::MalformedToken,
            "Invalid cron expression '" + std::string(expr) + "' in field '" +
                std::string(to_string(field)) + "'"));
    }

    auto pos = skip_digits(item, 0);
    if (pos == item.size()) {
        return Token{
            .lexeme = std::string(item),
            .kind = TokenKind::Number,
            .value = to_integer(item),
            .field = field,
        };
    }

    if (item[pos] == '/') {
        return scan_step(item, pos, field);
    }

    if (item[pos] != '-') {
        return std::unexpected(malformed("number", item, field));
    }

    auto end = skip_digits(item, pos + 1);
    if (end == pos + 1) {
        return std::unexpected(malformed("range expression", item, field));
    }
    if (end == item.size()) {
        return Token{
            .lexeme = std::string(item),
            .kind = TokenKind::Range,
            .value = std::string(item),
            .field = field,
        };
    }
    if (item[end] == '/') {
        return scan_step(item, end, field);
    }
    return std::unexpected(malformed("range expression", item, field));
}

/// Scan one whitespace-delimited field, appending a token per list item.
auto scan_field(std::string_view text, std::string_view expr, FieldName field,
                std::vector<Token>& tokens) -> VoidResult
{
    size_t start = 0;
    while (true) {
        auto comma = text.find(',', start);
        auto item = text.substr(start, comma == std::string_view::npos
                                           ? std::string_view::npos
                                           : comma - start);
        if (item.empty()) {
            return std::unexpected(malformed("list expression", text, field));
        }

        auto token = scan_item(item, expr, field);
        if (!token) return std::unexpected(token.error());
        tokens.push_back(std::move(*token));

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return {};
}

} // anonymous namespace

auto scan(std::string_view expr) -> Result<std::vector<Token>> {
    if (expr.empty()) {
        return std::unexpected(make_error(
            ErrorCode::EmptyExpression,
            "Cron expression has zero length"));
    }

    auto groups = split_whitespace(expr);
    if (groups.size() != kMinFieldCount && groups.size() != kMaxFieldCount) {
        return std::unexpected(make_error(
            ErrorCode::LengthMismatch,
            "Invalid number of fields for '" + std::string(expr) +
                "'. Expected 5 or 6 fields but got " +
                std::to_string(groups.size()) + " field(s)"));
    }

    const bool has_seconds = groups.size() == kMaxFieldCount;

    std::vector<Token> tokens;
    tokens.reserve(groups.size());

    for (size_t i = 0; i < groups.size(); ++i) {
        auto field = has_seconds ? kSixFieldLayout[i] : kFiveFieldLayout[i];
        auto result = scan_field(groups[i], expr, field, tokens);
        if (!result) return std::unexpected(result.error());
    }

    return tokens;
}

} // namespace cronlet::cron
