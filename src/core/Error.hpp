// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace vocatype
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    Cancelled,

    // Audio hardware: fatal to the current attempt, never retried automatically.
    DeviceUnavailable,
    StreamInitError,

    // Per-provider failures, absorbed by the orchestrator's fallback loop.
    AuthError,
    RateLimited,
    NetworkError,
    Timeout,
    ProtocolError,

    TranscriptionError,
    AllProvidersExhausted,
};

/// @brief Returns a stable name for an error code (used in logs and formatted errors).
[[nodiscard]] constexpr auto errorCodeToString(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::StreamInitError: return "StreamInitError";
        case ErrorCode::AuthError: return "AuthError";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TranscriptionError: return "TranscriptionError";
        case ErrorCode::AllProvidersExhausted: return "AllProvidersExhausted";
    }
    return "Unknown";
}

/// @brief Returns true for provider failures that the orchestrator recovers from by trying the
///        next provider.
[[nodiscard]] constexpr auto isProviderRecoverable(ErrorCode code) -> bool
{
    switch (code)
    {
        case ErrorCode::AuthError:
        case ErrorCode::RateLimited:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ProtocolError: return true;
        default: return false;
    }
}

/// @brief Represents an error with a code and descriptive message.
///
/// Aggregate failures (e.g. AllProvidersExhausted) keep the concrete error that caused them.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::shared_ptr<const Error> cause;

    /// @brief Returns the innermost error of the cause chain (this error if it has no cause).
    [[nodiscard]] auto rootCause() const -> const Error&
    {
        auto const* current = this;
        while (current->cause)
            current = current->cause.get();
        return *current;
    }
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message), .cause = nullptr });
}

/// @brief Creates an unexpected Error that wraps another error as its cause.
/// @param code The error code.
/// @param message A descriptive error message.
/// @param cause The underlying error.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, Error cause)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = code,
        .message = std::move(message),
        .cause = std::make_shared<const Error>(std::move(cause)),
    });
}

} // namespace vocatype

template <>
struct std::formatter<vocatype::Error>: std::formatter<std::string>
{
    auto format(const vocatype::Error& error, auto& ctx) const
    {
        auto text = std::format("[{}] {}", vocatype::errorCodeToString(error.code), error.message);
        if (error.cause)
            text += std::format(" (caused by [{}] {})",
                                vocatype::errorCodeToString(error.cause->code),
                                error.cause->message);
        return std::formatter<std::string>::format(text, ctx);
    }
};
