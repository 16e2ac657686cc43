#include "cronlet/cron/parser.hpp"
#include "cronlet/cron/scanner.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <string>
#include <utility>

namespace cronlet::cron {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kAliases = {{
    {"@yearly", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@hourly", "0 * * * *"},
    {"@minutely", "* * * * *"},
}};

auto field_label(FieldName field) -> std::string {
    return "'" + std::string(to_string(field)) + "'";
}

auto out_of_bound(std::int64_t value, FieldName field) -> Error {
    auto [min, max] = field_bounds(field);
    return make_error(
        ErrorCode::OutOfBound,
        "Value " + std::to_string(value) + " out of bounds for field " +
            field_label(field) + " (expected " + std::to_string(min) + "-" +
            std::to_string(max) + ")");
}

auto invalid_value(std::string_view what, std::string_view lexeme, FieldName field) -> Error {
    return make_error(
        ErrorCode::InvalidValue,
        "Invalid " + std::string(what) + " '" + std::string(lexeme) +
            "' for field " + field_label(field));
}

auto check_bounds(std::int64_t value, FieldName field) -> Result<int> {
    auto [min, max] = field_bounds(field);
    if (value < min || value > max) {
        return std::unexpected(out_of_bound(value, field));
    }
    return static_cast<int>(value);
}

/// Parse a digits-only endpoint. Anything else (empty, sign, fraction,
/// exponent) is an InvalidValue; overflow is OutOfBound.
auto parse_integer(std::string_view text, std::string_view lexeme, FieldName field)
    -> Result<std::int64_t>
{
    if (text.empty()) {
        return std::unexpected(invalid_value("number", lexeme, field));
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::unexpected(invalid_value("number", lexeme, field));
        }
    }

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(out_of_bound(std::numeric_limits<std::int64_t>::max(), field));
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(invalid_value("number", lexeme, field));
    }
    return value;
}

auto expand_number(const Token& token, FieldValueSet& set) -> VoidResult {
    const auto* number = token.number();
    if (!number) {
        return std::unexpected(invalid_value("number", token.lexeme, token.field));
    }
    auto value = check_bounds(*number, token.field);
    if (!value) return std::unexpected(value.error());
    set.insert(*value);
    return {};
}

auto expand_range(const Token& token, FieldValueSet& set) -> VoidResult {
    const auto* text = token.text();
    if (!text) {
        return std::unexpected(invalid_value("range", token.lexeme, token.field));
    }
    std::string_view lexeme = *text;
    auto dash = lexeme.find('-');
    if (dash == std::string_view::npos) {
        return std::unexpected(invalid_value("range", lexeme, token.field));
    }

    auto start_raw = parse_integer(lexeme.substr(0, dash), lexeme, token.field);
    if (!start_raw) return std::unexpected(start_raw.error());
    auto end_raw = parse_integer(lexeme.substr(dash + 1), lexeme, token.field);
    if (!end_raw) return std::unexpected(end_raw.error());

    auto start = check_bounds(*start_raw, token.field);
    if (!start) return std::unexpected(start.error());
    auto end = check_bounds(*end_raw, token.field);
    if (!end) return std::unexpected(end.error());

    if (*start > *end) {
        return std::unexpected(invalid_value("range", lexeme, token.field));
    }

    set.insert_range(*start, *end);
    return {};
}

/// Step forms: `*/n`, `a/n`, `-b/n`, `a-b/n`.
auto expand_step(const Token& token, FieldValueSet& set) -> VoidResult {
    std::string_view lexeme = token.lexeme;
    auto [min, max] = field_bounds(token.field);

    auto slash = lexeme.find('/');
    if (slash == std::string_view::npos) {
        return std::unexpected(invalid_value("step expression", lexeme, token.field));
    }
    auto range_part = lexeme.substr(0, slash);

    auto step = parse_integer(lexeme.substr(slash + 1), lexeme, token.field);
    if (!step) return std::unexpected(step.error());
    if (*step < 1) {
        return std::unexpected(invalid_value("step value", lexeme, token.field));
    }

    int start = min;
    int end = max;

    if (range_part != "*") {
        auto dash = range_part.find('-');
        auto start_text = range_part.substr(0, dash);
        auto end_text = dash == std::string_view::npos
                            ? std::string_view{}
                            : range_part.substr(dash + 1);

        if (!start_text.empty()) {
            auto raw = parse_integer(start_text, lexeme, token.field);
            if (!raw) return std::unexpected(raw.error());
            auto bounded = check_bounds(*raw, token.field);
            if (!bounded) return std::unexpected(bounded.error());
            start = *bounded;
        }
        if (dash != std::string_view::npos) {
            auto raw = parse_integer(end_text, lexeme, token.field);
            if (!raw) return std::unexpected(raw.error());
            auto bounded = check_bounds(*raw, token.field);
            if (!bounded) return std::unexpected(bounded.error());
            end = *bounded;
        }
    }

    if (start > end) {
        return std::unexpected(invalid_value("step range", lexeme, token.field));
    }

    // Any step wider than the field behaves like one exactly as wide.
    auto width = static_cast<std::int64_t>(max - min + 1);
    set.insert_range(start, end, static_cast<int>(std::min(*step, width)));
    return {};
}

} // anonymous namespace

auto expand_alias(std::string_view schedule) -> std::optional<std::string_view> {
    for (const auto& [alias, expression] : kAliases) {
        if (alias == schedule) return expression;
    }
    return std::nullopt;
}

auto resolve_alias(std::string_view schedule) -> std::string_view {
    return expand_alias(schedule).value_or(schedule);
}

auto expand(const std::vector<Token>& tokens) -> Result<ParsedSchedule> {
    ParsedSchedule schedule;

    for (const auto& token : tokens) {
        if (token.field == FieldName::Second) {
            schedule.has_seconds = true;
        }
        auto& set = schedule.field(token.field);

        VoidResult result;
        switch (token.kind) {
            case TokenKind::Any: {
                auto [min, max] = field_bounds(token.field);
                set.insert_range(min, max);
                break;
            }
            case TokenKind::Number:
                result = expand_number(token, set);
                break;
            case TokenKind::Range:
                result = expand_range(token, set);
                break;
            case TokenKind::Step:
                result = expand_step(token, set);
                break;
        }
        if (!result) return std::unexpected(result.error());
    }

    return schedule;
}

auto parse_schedule(std::string_view schedule) -> Result<ParsedSchedule> {
    auto tokens = scan(resolve_alias(schedule));
    if (!tokens) return std::unexpected(tokens.error());
    return expand(*tokens);
}

} // namespace cronlet::cron
