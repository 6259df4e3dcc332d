// SPDX-License-Identifier: Apache-2.0
#include "BatchOperations.hpp"

#include <core/Log.hpp>
#include <mcp/ToolCallParser.hpp>
#include <mcp/ToolClient.hpp>

#include <algorithm>
#include <format>

namespace toolbridge
{

namespace
{
    auto indentLines(std::string_view text, std::string_view indent) -> std::string
    {
        auto result = std::string {};
        auto start = std::size_t { 0 };
        while (true)
        {
            auto const end = text.find('\n', start);
            result += indent;
            result += text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
            if (end == std::string_view::npos)
                break;
            result += '\n';
            start = end + 1;
        }
        return result;
    }

    auto callResultKey(const ParsedToolCall& call) -> std::string
    {
        return std::format("{}:{}", call.serverId, call.toolName);
    }

    auto isToolAllowed(const ServerPolicy& policy, std::string_view toolName) -> bool
    {
        return policy.toolAllowlist.empty()
               || std::find(policy.toolAllowlist.begin(), policy.toolAllowlist.end(), toolName)
                      != policy.toolAllowlist.end();
    }
} // namespace

auto describeAllServers(ConnectionRegistry& registry, std::span<const ServerConfig> configs)
    -> std::vector<ServerToolsInfo>
{
    auto results = std::vector<ServerToolsInfo> {};

    for (const auto& config: configs)
    {
        if (!config.enabled)
        {
            log::debug("Skipping disabled MCP server '{}'", config.id);
            continue;
        }

        auto info = ServerToolsInfo { .serverId = config.id, .serverName = config.name };

        auto connection = registry.connect(config);
        if (!connection)
        {
            info.error = connection.error().message;
            results.push_back(std::move(info));
            continue;
        }

        auto client = ToolClient(**connection);
        auto tools = client.listTools();
        if (!tools)
        {
            info.error = tools.error().message;
            results.push_back(std::move(info));
            continue;
        }

        info.connected = true;
        info.tools = std::move(*tools);

        // Not every server supports resources.
        if (auto resources = client.listResources())
            info.resources = std::move(*resources);
        else
            log::debug("[{}] resources/list failed: {}", config.id, resources.error().message);

        results.push_back(std::move(info));
    }

    return results;
}

auto renderPromptContext(const std::vector<ServerToolsInfo>& servers) -> std::string
{
    auto lines = std::vector<std::string> { "Available MCP Tools:" };

    for (const auto& server: servers)
    {
        if (!server.connected || server.tools.empty())
            continue;

        lines.push_back(std::format("\n## Server: {} ({})", server.serverName, server.serverId));
        for (const auto& tool: server.tools)
        {
            lines.push_back(std::format("- **{}**: {}", tool.name, tool.description));
            if (tool.inputSchema.is_object() && !tool.inputSchema.empty())
            {
                auto const schema = tool.inputSchema.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
                lines.push_back(std::format("  Input schema:\n{}", indentLines(schema, "    ")));
            }
        }
    }

    lines.emplace_back("\nTo call an MCP tool, use this format:");
    lines.push_back(std::format("{} server=<serverId> tool=<toolName> args={{\"param\": \"value\"}}", ToolCallMarker));

    auto document = std::string {};
    for (const auto& line: lines)
    {
        if (!document.empty())
            document += '\n';
        document += line;
    }
    return document;
}

auto executeToolCalls(ConnectionRegistry& registry,
                      const std::vector<ParsedToolCall>& calls,
                      std::span<const ServerConfig> configs) -> ToolCallResults
{
    auto results = ToolCallResults {};

    for (const auto& call: calls)
    {
        auto const key = callResultKey(call);
        auto const config = std::ranges::find(configs, call.serverId, &ServerConfig::id);
        if (config == configs.end())
        {
            results.insert_or_assign(key, makeError(ErrorCode::NotFound, std::format("Server {} not found", call.serverId)));
            continue;
        }

        if (!isToolAllowed(config->policy, call.toolName))
        {
            results.insert_or_assign(
                key,
                makeError(ErrorCode::PolicyError,
                          std::format("Tool '{}' is not allowed on server '{}'", call.toolName, call.serverId)));
            continue;
        }

        auto output = registry.connect(*config).and_then([&call](const std::shared_ptr<Connection>& connection) {
            return ToolClient(*connection).callTool(call.toolName, call.args);
        });

        if (!output)
            log::warning("Tool call {} failed: {}", key, output.error().message);

        results.insert_or_assign(key, std::move(output));
    }

    return results;
}

auto toolCallResultsToJson(const ToolCallResults& results) -> nlohmann::json
{
    auto object = nlohmann::json::object();
    for (const auto& [key, result]: results)
    {
        if (result)
            object[key] = toolOutputToJson(*result);
        else
            object[key] = nlohmann::json { { "error", result.error().message } };
    }
    return object;
}

auto serverToolsInfoToJson(const ServerToolsInfo& info) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    for (const auto& tool: info.tools)
        tools.push_back({ { "name", tool.name }, { "description", tool.description }, { "inputSchema", tool.inputSchema } });

    auto resources = nlohmann::json::array();
    for (const auto& resource: info.resources)
        resources.push_back({ { "uri", resource.uri }, { "name", resource.name }, { "mimeType", resource.mimeType } });

    auto result = nlohmann::json {
        { "serverId", info.serverId },
        { "serverName", info.serverName },
        { "connected", info.connected },
        { "tools", std::move(tools) },
        { "resources", std::move(resources) },
    };
    if (info.error)
        result["error"] = *info.error;
    return result;
}

} // namespace toolbridge
