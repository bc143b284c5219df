#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace warden {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    IoError,
    Timeout,
    Cancelled,
    PathTraversal,
    CommandNotAllowed,
    CommandInjection,
    ValidationFailed,
    ProcessError,
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

/// A path resolved outside the security boundary.
/// The detail carries "attempted=<path> base=<dir>".
inline auto path_traversal_error(std::string_view attempted, std::string_view base) -> Error {
    return Error(ErrorCode::PathTraversal,
                 "Path traversal attempt detected",
                 "attempted=" + std::string(attempted) + " base=" + std::string(base));
}

/// A command (or "command subcommand") that the whitelist refuses.
inline auto command_not_allowed_error(std::string_view command, std::string_view reason) -> Error {
    return Error(ErrorCode::CommandNotAllowed,
                 "Command not allowed: " + std::string(command),
                 std::string(reason));
}

/// An argument carrying injection characters. `masked_arg` must already be masked.
inline auto command_injection_error(std::string_view masked_arg, std::string_view pattern) -> Error {
    return Error(ErrorCode::CommandInjection,
                 "Potential command injection detected",
                 "argument=" + std::string(masked_arg) + " pattern=" + std::string(pattern));
}

inline auto validation_error(std::string_view errors) -> Error {
    return Error(ErrorCode::ValidationFailed, "Validation failed", std::string(errors));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::PathTraversal: return "PATH_TRAVERSAL";
        case ErrorCode::CommandNotAllowed: return "COMMAND_NOT_ALLOWED";
        case ErrorCode::CommandInjection: return "COMMAND_INJECTION";
        case ErrorCode::ValidationFailed: return "VALIDATION_FAILED";
        case ErrorCode::ProcessError: return "PROCESS_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The wrapper defers the std::unexpected -> std::expected conversion to a
// user-defined conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace warden
