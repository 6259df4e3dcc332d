// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionRegistry.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace toolbridge
{

/// @brief What one server offers, or why it could not be asked.
struct ServerToolsInfo
{
    std::string serverId;
    std::string serverName;
    bool connected = false;
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::optional<std::string> error;
};

/// @brief Connects every enabled server in order and collects its tools and resources.
///
/// Servers are visited one at a time. A server that fails to connect or to list its tools is
/// recorded with connected == false and an error; the remaining servers are still visited.
/// Resource listing is best-effort. Disabled servers are skipped.
[[nodiscard]] auto describeAllServers(ConnectionRegistry& registry, std::span<const ServerConfig> configs)
    -> std::vector<ServerToolsInfo>;

/// @brief Renders the tool catalogue an agent is prompted with.
///
/// Lists each connected server that has at least one tool, then ends with the call syntax
/// that parseToolCalls() understands.
[[nodiscard]] auto renderPromptContext(const std::vector<ServerToolsInfo>& servers) -> std::string;

/// @brief Same as renderPromptContext().
[[nodiscard]] inline auto buildToolPromptContext(const std::vector<ServerToolsInfo>& servers) -> std::string
{
    return renderPromptContext(servers);
}

/// @brief Results of executeToolCalls(), keyed by "serverId:toolName".
using ToolCallResults = std::map<std::string, Result<ToolOutput>>;

/// @brief Runs parsed calls in order against their servers, connecting them as needed.
///
/// Each call fails on its own: an unknown server id yields "Server <id> not found", a tool
/// outside the server's tool allowlist a PolicyError. A later call with the same key replaces
/// the earlier result.
[[nodiscard]] auto executeToolCalls(ConnectionRegistry& registry,
                                    const std::vector<ParsedToolCall>& calls,
                                    std::span<const ServerConfig> configs) -> ToolCallResults;

/// @brief Renders call results as a JSON object; failures become {"error": message}.
[[nodiscard]] auto toolCallResultsToJson(const ToolCallResults& results) -> nlohmann::json;

[[nodiscard]] auto serverToolsInfoToJson(const ServerToolsInfo& info) -> nlohmann::json;

} // namespace toolbridge
