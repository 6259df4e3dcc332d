// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Error codes for categorizing failures across the tool bridge.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    SpawnError,
    TransportError,
    ProtocolError,
    RpcError,
    TimeoutError,
    ConnectionClosed,
    NotInitialized,
    AlreadyConnected,
    NotFound,
    PolicyError,
};

/// @brief Returns a short human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::SpawnError: return "spawn";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::RpcError: return "rpc";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::ConnectionClosed: return "connection-closed";
        case ErrorCode::NotInitialized: return "not-initialized";
        case ErrorCode::AlreadyConnected: return "already-connected";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::PolicyError: return "policy";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// For ErrorCode::RpcError, rpcCode carries the numeric JSON-RPC error code reported by the server.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    int rpcCode = 0;
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected Error for a JSON-RPC error object returned by a server.
/// @param rpcCode The numeric JSON-RPC error code.
/// @param message The server-supplied error message.
/// @return An unexpected Error with ErrorCode::RpcError.
[[nodiscard]] inline auto makeRpcError(int rpcCode, std::string_view message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::RpcError,
        .message = std::format("MCP error {}: {}", rpcCode, message),
        .rpcCode = rpcCode,
    });
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
