// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief Per-server restrictions supplied by the settings store.
struct ServerPolicy
{
    /// @brief Commands the server may be launched with. Empty permits any command.
    std::vector<std::string> commandAllowlist;

    /// @brief Tools that agent-issued calls may invoke. Empty permits any tool.
    std::vector<std::string> toolAllowlist;

    /// @brief Per-server request timeout override in milliseconds.
    std::optional<int> timeoutMs;
};

/// @brief Describes how to spawn a tool server. Never mutated once loaded.
struct ServerConfig
{
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;
    ServerPolicy policy;
};

/// @brief Lifecycle state of a single server connection.
enum class ConnectionStatus : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Error,
    Reconnecting,
};

/// @brief Converts a ConnectionStatus to its wire/display name.
[[nodiscard]] constexpr auto statusToString(ConnectionStatus status) -> std::string_view
{
    switch (status)
    {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error: return "error";
        case ConnectionStatus::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

/// @brief Severity of a per-connection diagnostic entry.
enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] constexpr auto logLevelToString(LogLevel level) -> std::string_view
{
    switch (level)
    {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// @brief A structured diagnostic entry kept in a connection's bounded log ring.
struct LogEntry
{
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::Info;
    std::string message;
    std::optional<nlohmann::json> data;
};

/// @brief Read-only health projection of a connection.
struct ServerHealth
{
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<std::chrono::system_clock::time_point> lastConnected;
    std::optional<std::string> lastError;
    int reconnectAttempts = 0;
    std::optional<std::chrono::milliseconds> uptime; ///< Only present while connected.
    std::optional<std::chrono::milliseconds> latency;
};

/// @brief How a tool server process ended.
struct ExitStatus
{
    std::optional<int> code;   ///< Exit code when the process exited normally.
    std::optional<int> signal; ///< Terminating signal when killed.

    /// @brief Returns true unless the process exited cleanly with code 0.
    [[nodiscard]] auto isFailure() const -> bool { return !code.has_value() || *code != 0; }
};

/// @brief A tool declared by a server through tools/list.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A resource declared by a server through resources/list.
struct ResourceDescriptor
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
};

/// @brief One entry of a resources/read response.
struct ResourceContents
{
    std::string uri;
    std::string mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

/// @brief A text block of a tools/call response.
struct TextBlock
{
    std::string text;
};

/// @brief An image block of a tools/call response.
struct ImageBlock
{
    std::string data;
    std::string mimeType;
};

/// @brief Any other block type, kept verbatim.
struct OtherBlock
{
    std::string type;
    nlohmann::json raw;
};

/// @brief Discriminated union of the content blocks a tool may return.
using ContentBlock = std::variant<TextBlock, ImageBlock, OtherBlock>;

/// @brief An image selected as the output of a tool call.
struct ImageOutput
{
    std::string data;
    std::string mimeType;
};

/// @brief The value of a tool call: joined text, an image, or the raw result object.
using ToolOutput = std::variant<std::string, ImageOutput, nlohmann::json>;

/// @brief A tool invocation extracted from agent text.
struct ParsedToolCall
{
    std::string serverId;
    std::string toolName;
    nlohmann::json args = nlohmann::json::object();

    auto operator==(const ParsedToolCall&) const -> bool = default;
};

} // namespace toolbridge
