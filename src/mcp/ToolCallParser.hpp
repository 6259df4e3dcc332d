// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief The marker that opens every tool call embedded in agent text.
constexpr auto ToolCallMarker = std::string_view { "[MCP_TOOL_CALL]" };

/// @brief Extracts tool calls from free-form agent text.
///
/// Recognizes `[MCP_TOOL_CALL] server=<id> tool=<name> args=<json>` where `<json>` is a flat
/// object (no nested closing brace), a ```json fenced block, or an object that is the last
/// thing before the next marker or the end of the text. Matches whose arguments do not decode
/// to a JSON object are dropped. Calls are returned in discovery order, without duplicates
/// (see toolCallKey()). Runs in linear time over the input.
/// @param text The agent output, possibly containing arbitrary prose and code.
/// @return The parsed calls.
[[nodiscard]] auto parseToolCalls(std::string_view text) -> std::vector<ParsedToolCall>;

/// @brief Formats a tool call in the grammar parseToolCalls() accepts.
///
/// Arguments whose pretty-printed form spans several lines are emitted as a fenced block,
/// everything else inline. parseToolCalls(formatToolCallForAgent(c)) yields exactly { c }.
[[nodiscard]] auto formatToolCallForAgent(std::string_view serverId,
                                          std::string_view toolName,
                                          const nlohmann::json& args) -> std::string;

[[nodiscard]] auto formatToolCallForAgent(const ParsedToolCall& call) -> std::string;

/// @brief Identity of a call: server id, tool name and canonical arguments.
[[nodiscard]] auto toolCallKey(const ParsedToolCall& call) -> std::string;

[[nodiscard]] auto parsedToolCallsToJson(const std::vector<ParsedToolCall>& calls) -> nlohmann::json;

} // namespace toolbridge
