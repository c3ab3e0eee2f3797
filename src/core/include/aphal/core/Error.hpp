/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the HAL error codes and a lightweight Error value type carrying
 * the code, a human-readable message, and the source location where the
 * error was raised.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef APHAL_CORE_ERROR_HPP
    #define APHAL_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace aphal::core {

/**
 * @brief HAL-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotSupported,

    kNoBackendAvailable,
    kNotInitialized,
    kBackendRejected,
    kRemoteDied,
    kServiceUnavailable,

    kInternalError,
};

/**
 * @brief Returns the stable name of an error code, for logs and dumps.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:               return "None";
        case ErrorCode::kInvalidArgument:    return "InvalidArgument";
        case ErrorCode::kInvalidState:       return "InvalidState";
        case ErrorCode::kNotSupported:       return "NotSupported";
        case ErrorCode::kNoBackendAvailable: return "NoBackendAvailable";
        case ErrorCode::kNotInitialized:     return "NotInitialized";
        case ErrorCode::kBackendRejected:    return "BackendRejected";
        case ErrorCode::kRemoteDied:         return "RemoteDied";
        case ErrorCode::kServiceUnavailable: return "ServiceUnavailable";
        case ErrorCode::kInternalError:      return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief "<CodeName>: <message>", the form used in log lines.
    [[nodiscard]] std::string describe() const
    {
        std::string out{errorCodeName(_code)};
        out += ": ";
        out += _message;
        return out;
    }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace aphal::core

#endif // APHAL_CORE_ERROR_HPP
