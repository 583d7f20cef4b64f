// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Error codes for categorizing failures across the tool runtime.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    SpawnError,
    InitializeError,
    TransportError,
    ProtocolError,
    TimeoutError,
    ToolNotFound,
    ToolCallError,
    ProcessDied,
    ServerNotReady,
    RestartLimitReached,
    EvolutionError,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::SpawnError: return "SpawnError";
        case ErrorCode::InitializeError: return "InitializeError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ToolNotFound: return "ToolNotFound";
        case ErrorCode::ToolCallError: return "ToolCallError";
        case ErrorCode::ProcessDied: return "ProcessDied";
        case ErrorCode::ServerNotReady: return "ServerNotReady";
        case ErrorCode::RestartLimitReached: return "RestartLimitReached";
        case ErrorCode::EvolutionError: return "EvolutionError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
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
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace toolbridge

template <>
struct std::formatter<toolbridge::Error>: std::formatter<std::string>
{
    auto format(const toolbridge::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolbridge::errorCodeName(error.code), error.message), ctx);
    }
};
