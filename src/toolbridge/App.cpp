// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/BatchOperations.hpp>
#include <mcp/ConnectionRegistry.hpp>
#include <mcp/ToolCallParser.hpp>
#include <mcp/ToolClient.hpp>

#include <format>
#include <iterator>
#include <ostream>
#include <print>
#include <sstream>
#include <string>

namespace toolbridge
{

struct App::Impl
{
    AppConfig config;
    std::ostream& output;
    ConnectionRegistry registry;

    Impl(AppConfig config, std::ostream& output):
        config(std::move(config)), output(output), registry(this->config.connection)
    {
    }

    /// @brief Looks up an enabled server and connects it.
    [[nodiscard]] auto connectServer(std::string_view serverId) -> Result<std::shared_ptr<Connection>>
    {
        auto const* server = findServer(config, serverId);
        if (!server)
            return makeError(ErrorCode::NotFound, std::format("Server {} not found", serverId));
        return registry.connect(*server);
    }
};

App::App(AppConfig config, std::ostream& output): _impl(std::make_unique<Impl>(std::move(config), output))
{
}

App::~App() = default;

auto App::describe() -> int
{
    auto const servers = describeAllServers(_impl->registry, _impl->config.servers);
    for (const auto& server: servers)
    {
        if (server.error)
            log::warning("Server '{}' unavailable: {}", server.serverId, *server.error);
    }

    std::println(_impl->output, "{}", renderPromptContext(servers));
    return 0;
}

auto App::status() -> int
{
    auto snapshots = nlohmann::json::array();
    for (const auto& server: enabledServers(_impl->config))
    {
        auto const connected = _impl->registry.connect(server);
        auto snapshot = _impl->registry.serverStatus(server.id);
        if (snapshot)
        {
            snapshots.push_back(serverStatusToJson(*snapshot));
            continue;
        }

        snapshots.push_back({
            { "id", server.id },
            { "name", server.name },
            { "status", statusToString(ConnectionStatus::Error) },
            { "error", connected ? snapshot.error().message : connected.error().message },
        });
    }

    std::println(_impl->output, "{}", snapshots.dump(2));
    return 0;
}

auto App::call(std::string_view serverId, std::string_view toolName, std::string_view argsJson) -> int
{
    auto args = json::parse(argsJson.empty() ? std::string_view { "{}" } : argsJson);
    if (!args || !args->is_object())
    {
        log::error("Tool arguments must be a JSON object");
        return 1;
    }

    auto output = _impl->connectServer(serverId).and_then([&](const std::shared_ptr<Connection>& connection) {
        return ToolClient(*connection).callTool(toolName, *args);
    });

    if (!output)
    {
        log::error("Tool call failed: {}", output.error());
        return 1;
    }

    if (auto const* text = std::get_if<std::string>(&*output))
        std::println(_impl->output, "{}", *text);
    else
        std::println(_impl->output, "{}", toolOutputToJson(*output).dump(2));
    return 0;
}

auto App::parse(std::istream& input, bool execute) -> int
{
    auto const text = std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    auto const calls = parseToolCalls(text);
    log::debug("Found {} tool call(s)", calls.size());

    if (!execute)
    {
        std::println(_impl->output, "{}", parsedToolCallsToJson(calls).dump(2));
        return 0;
    }

    auto const results = executeToolCalls(_impl->registry, calls, _impl->config.servers);
    std::println(_impl->output, "{}", toolCallResultsToJson(results).dump(2));
    return 0;
}

auto App::ping(std::string_view serverId) -> int
{
    auto latency = _impl->connectServer(serverId).and_then(
        [](const std::shared_ptr<Connection>& connection) { return connection->ping(); });

    if (!latency)
    {
        log::error("Ping failed: {}", latency.error());
        return 1;
    }

    std::println(_impl->output, "{}: {}ms", serverId, latency->count());
    return 0;
}

} // namespace toolbridge
