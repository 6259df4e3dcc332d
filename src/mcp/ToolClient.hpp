// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Connection.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Typed wrappers for the tool and resource methods of the protocol.
///
/// Every operation requires the connection to be connected and fails with
/// ErrorCode::NotInitialized otherwise.
class ToolClient
{
  public:
    /// @brief Constructs a ToolClient on top of an existing connection.
    /// @param connection The connection to issue requests on. Must outlive the client.
    explicit ToolClient(Connection& connection);

    /// @brief Lists the tools the server declares.
    /// @return The tool descriptors, empty if the server sent none.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return Joined text, the first image, or the raw result; see selectToolOutput().
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolOutput>;

    [[nodiscard]] auto listResources() -> Result<std::vector<ResourceDescriptor>>;

    /// @brief Reads a resource.
    /// @param uri The resource URI.
    /// @return The first content entry, or std::nullopt if the server returned none.
    [[nodiscard]] auto readResource(std::string_view uri) -> Result<std::optional<ResourceContents>>;

  private:
    Connection& _connection;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>;
};

/// @brief Classifies one entry of a tools/call "content" array.
[[nodiscard]] auto parseContentBlock(const nlohmann::json& block) -> ContentBlock;

/// @brief Reduces a tools/call result to its output value.
///
/// Non-empty text blocks win and are joined with newlines. Otherwise the first image block is
/// returned. Otherwise the raw result is returned unchanged.
[[nodiscard]] auto selectToolOutput(const nlohmann::json& result) -> ToolOutput;

/// @brief Renders a tool output as JSON: a string, {type:"image", data, mimeType}, or the raw value.
[[nodiscard]] auto toolOutputToJson(const ToolOutput& output) -> nlohmann::json;

} // namespace toolbridge
