#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace makemcp {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    ProtocolError,
    SerializationError,
    IoError,
    InternalError,
    MethodNotFound,
    SecurityViolation,
    InvalidTarget,
    InvalidPattern,
    MakefileNotFound,
    MakefileReadFailure,
    InvalidMakefile,
    ExecutionTimeout,
    TargetExecutionFailed,
    SpawnFailure,
    UnknownResource,
    ResourceReadFailure,
    UnknownTool,
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

/// Stable upper-snake name for an ErrorCode, used in logs and error payloads.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        case ErrorCode::MethodNotFound: return "METHOD_NOT_FOUND";
        case ErrorCode::SecurityViolation: return "SECURITY_VIOLATION";
        case ErrorCode::InvalidTarget: return "INVALID_TARGET";
        case ErrorCode::InvalidPattern: return "INVALID_PATTERN";
        case ErrorCode::MakefileNotFound: return "MAKEFILE_NOT_FOUND";
        case ErrorCode::MakefileReadFailure: return "MAKEFILE_READ_FAILURE";
        case ErrorCode::InvalidMakefile: return "INVALID_MAKEFILE";
        case ErrorCode::ExecutionTimeout: return "EXECUTION_TIMEOUT";
        case ErrorCode::TargetExecutionFailed: return "TARGET_EXECUTION_FAILED";
        case ErrorCode::SpawnFailure: return "SPAWN_FAILURE";
        case ErrorCode::UnknownResource: return "UNKNOWN_RESOURCE";
        case ErrorCode::ResourceReadFailure: return "RESOURCE_READ_FAILURE";
        case ErrorCode::UnknownTool: return "UNKNOWN_TOOL";
        default: return "UNKNOWN";
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The conversion to std::expected happens in a user-defined conversion
// operator outside the coroutine frame.
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

} // namespace makemcp
