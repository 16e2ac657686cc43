#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace cronlet {

enum class ErrorCode {
    Unknown = 1,
    // Lexical errors reported by the scanner.
    EmptyExpression,
    LengthMismatch,
    MalformedToken,
    // Semantic errors reported by the field expander.
    InvalidValue,
    OutOfBound,
    // Host-level errors.
    InvalidArgument,
    NotFound,
    AlreadyExists,
    InvalidConfig,
    IoError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::EmptyExpression: return "EMPTY_EXPRESSION";
        case ErrorCode::LengthMismatch: return "LENGTH_MISMATCH";
        case ErrorCode::MalformedToken: return "MALFORMED_TOKEN";
        case ErrorCode::InvalidValue: return "INVALID_VALUE";
        case ErrorCode::OutOfBound: return "OUT_OF_BOUND";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// True for the errors the scanner produces (bad lexical structure).
inline auto is_scan_error(ErrorCode code) noexcept -> bool {
    return code == ErrorCode::EmptyExpression ||
           code == ErrorCode::LengthMismatch ||
           code == ErrorCode::MalformedToken;
}

/// True for the errors the field expander produces (bad values).
inline auto is_semantic_error(ErrorCode code) noexcept -> bool {
    return code == ErrorCode::InvalidValue || code == ErrorCode::OutOfBound;
}

} // namespace cronlet
