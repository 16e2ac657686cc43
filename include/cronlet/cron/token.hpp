#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cronlet::cron {

/// Schedule components, in the order they appear in a six-field expression.
/// `Second` only exists for six-field expressions.
enum class FieldName {
    Second,
    Minute,
    Hour,
    Day,
    Month,
    Weekday,
};

enum class TokenKind {
    Any,     // `*`
    Number,  // `N`
    Step,    // `*/S`, `N/S`, `-M/S`, `N-M/S`
    Range,   // `N-M`
};

/// One scanned item of a field. A list field produces one token per item.
///
/// `value` holds `"*"` for Any, the integer for Number, the step integer
/// for Step and the verbatim lexeme for Range.
struct Token {
    std::string lexeme;
    TokenKind kind = TokenKind::Any;
    std::variant<std::string, std::int64_t> value;
    FieldName field = FieldName::Minute;

    /// The integer value, or null when `value` holds text.
    [[nodiscard]] auto number() const noexcept -> const std::int64_t* {
        return std::get_if<std::int64_t>(&value);
    }

    /// The text value, or null when `value` holds an integer.
    [[nodiscard]] auto text() const noexcept -> const std::string* {
        return std::get_if<std::string>(&value);
    }

    auto operator==(const Token&) const -> bool = default;
};

inline auto to_string(FieldName field) -> std::string_view {
    switch (field) {
        case FieldName::Second: return "second";
        case FieldName::Minute: return "minute";
        case FieldName::Hour: return "hour";
        case FieldName::Day: return "day";
        case FieldName::Month: return "month";
        case FieldName::Weekday: return "weekday";
    }
    return "unknown";
}

inline auto to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
        case TokenKind::Any: return "any";
        case TokenKind::Number: return "number";
        case TokenKind::Step: return "step";
        case TokenKind::Range: return "range";
    }
    return "unknown";
}

} // namespace cronlet::cron
