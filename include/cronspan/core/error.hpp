#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace cronspan {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfiguration,
    MalformedField,
    InvalidWindow,
    WindowTooLarge,
    ResultTooLarge,
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

/// Upper snake case name of an ErrorCode, as emitted in JSON results.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfiguration: return "INVALID_CONFIGURATION";
        case ErrorCode::MalformedField: return "MALFORMED_FIELD";
        case ErrorCode::InvalidWindow: return "INVALID_WINDOW";
        case ErrorCode::WindowTooLarge: return "WINDOW_TOO_LARGE";
        case ErrorCode::ResultTooLarge: return "RESULT_TOO_LARGE";
        default: return "UNKNOWN";
    }
}

} // namespace cronspan
