// SPDX-License-Identifier: Apache-2.0
#include "ConnectionRegistry.hpp"

#include <core/Log.hpp>
#include <mcp/ToolClient.hpp>

#include <format>
#include <thread>
#include <utility>

namespace toolbridge
{

namespace
{
    auto millisSinceEpoch(std::chrono::system_clock::time_point tp) -> std::int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
} // namespace

auto validateCommandAgainstPolicy(std::string_view command, const std::vector<std::string>& allowlist) -> VoidResult
{
    if (allowlist.empty())
        return {};

    for (const auto& allowed: allowlist)
    {
        if (command == allowed)
            return {};
        if (command.size() > allowed.size() && command.starts_with(allowed) && command[allowed.size()] == ' ')
            return {};
    }

    return makeError(ErrorCode::PolicyError, std::format("Command '{}' is not in the allowlist", command));
}

ConnectionRegistry::ConnectionRegistry(ConnectionOptions options, TransportFactory transportFactory):
    _options(std::move(options)), _transportFactory(std::move(transportFactory))
{
}

ConnectionRegistry::~ConnectionRegistry()
{
    disconnectAll();
}

auto ConnectionRegistry::connect(const ServerConfig& config) -> Result<std::shared_ptr<Connection>>
{
    if (!config.enabled)
        return makeError(ErrorCode::ConfigError, std::format("Server '{}' is disabled", config.id));

    if (auto allowed = validateCommandAgainstPolicy(config.command, config.policy.commandAllowlist); !allowed)
        return std::unexpected(allowed.error());

    auto observer = std::shared_ptr<ConnectionObserver> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (auto const it = _connections.find(config.id); it != _connections.end() && it->second->isConnected())
            return it->second;
        observer = _observer;
    }

    auto options = _options;
    if (config.policy.timeoutMs)
        options.requestTimeout = std::chrono::milliseconds(*config.policy.timeoutMs);

    auto connection = std::make_shared<Connection>(config, std::move(options), _transportFactory);
    if (observer)
        connection->addObserver(observer);

    // Connecting happens outside the registry lock; a handshake can take up to the request timeout.
    if (auto connected = connection->connect(); !connected)
    {
        log::warning("Failed to connect MCP server '{}': {}", config.id, connected.error().message);
        return std::unexpected(connected.error());
    }

    auto previous = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        auto& slot = _connections[config.id];
        if (slot && slot->isConnected())
        {
            // Another caller connected the same server meanwhile; keep theirs.
            previous = std::exchange(connection, slot);
        }
        else
        {
            previous = std::exchange(slot, connection);
        }
    }

    if (previous)
        previous->disconnect();

    log::info("MCP server '{}' connected", config.id);
    return connection;
}

auto ConnectionRegistry::get(std::string_view id) const -> std::shared_ptr<Connection>
{
    auto const lock = std::lock_guard(_mutex);
    if (auto const it = _connections.find(id); it != _connections.end())
        return it->second;
    return nullptr;
}

auto ConnectionRegistry::listActive() const -> std::vector<std::shared_ptr<Connection>>
{
    auto result = std::vector<std::shared_ptr<Connection>> {};
    for (auto& connection: listAll())
    {
        if (connection->isConnected())
            result.push_back(std::move(connection));
    }
    return result;
}

auto ConnectionRegistry::listAll() const -> std::vector<std::shared_ptr<Connection>>
{
    auto const lock = std::lock_guard(_mutex);
    auto result = std::vector<std::shared_ptr<Connection>> {};
    result.reserve(_connections.size());
    for (const auto& [id, connection]: _connections)
        result.push_back(connection);
    return result;
}

auto ConnectionRegistry::disconnectAndRemove(std::string_view id) -> bool
{
    auto connection = std::shared_ptr<Connection> {};
    {
        auto const lock = std::lock_guard(_mutex);
        auto const it = _connections.find(id);
        if (it == _connections.end())
            return false;
        connection = std::move(it->second);
        _connections.erase(it);
    }

    connection->disconnect();
    log::info("MCP server '{}' removed", id);
    return true;
}

void ConnectionRegistry::disconnectAll()
{
    auto connections = std::map<std::string, std::shared_ptr<Connection>, std::less<>> {};
    {
        auto const lock = std::lock_guard(_mutex);
        connections.swap(_connections);
    }

    if (connections.empty())
        return;

    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(connections.size());
        for (auto& [id, connection]: connections)
            workers.emplace_back([&connection] { connection->disconnect(); });
    }

    log::info("Disconnected {} MCP server(s)", connections.size());
}

auto ConnectionRegistry::serverStatus(std::string_view id) const -> Result<ServerStatus>
{
    auto connection = get(id);
    if (!connection)
        return makeError(ErrorCode::NotFound, std::format("Server {} not found", id));
    return snapshot(*connection);
}

auto ConnectionRegistry::allServerStatuses() const -> std::vector<ServerStatus>
{
    auto result = std::vector<ServerStatus> {};
    for (const auto& connection: listAll())
        result.push_back(snapshot(*connection));
    return result;
}

void ConnectionRegistry::setObserver(std::shared_ptr<ConnectionObserver> observer)
{
    auto const lock = std::lock_guard(_mutex);
    _observer = std::move(observer);
}

auto ConnectionRegistry::size() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _connections.size();
}

auto ConnectionRegistry::snapshot(Connection& connection) -> ServerStatus
{
    auto const& config = connection.config();
    auto result = ServerStatus {
        .id = config.id,
        .name = config.name,
        .status = connection.status(),
        .health = connection.health(),
        .logs = connection.logs(),
        .tools = {},
        .resources = {},
        .capabilities = connection.capabilities(),
    };

    if (!connection.isConnected())
        return result;

    auto client = ToolClient(connection);
    if (auto tools = client.listTools())
        result.tools = std::move(*tools);
    else
        log::debug("[{}] tools/list failed: {}", config.id, tools.error().message);

    if (auto resources = client.listResources())
        result.resources = std::move(*resources);
    else
        log::debug("[{}] resources/list failed: {}", config.id, resources.error().message);

    return result;
}

auto serverStatusToJson(const ServerStatus& status) -> nlohmann::json
{
    auto health = nlohmann::json {
        { "status", statusToString(status.health.status) },
        { "reconnectAttempts", status.health.reconnectAttempts },
    };
    if (status.health.lastConnected)
        health["lastConnected"] = millisSinceEpoch(*status.health.lastConnected);
    if (status.health.lastError)
        health["lastError"] = *status.health.lastError;
    if (status.health.uptime)
        health["uptimeMs"] = status.health.uptime->count();
    if (status.health.latency)
        health["latencyMs"] = status.health.latency->count();

    auto logs = nlohmann::json::array();
    for (const auto& entry: status.logs)
    {
        auto item = nlohmann::json {
            { "timestamp", millisSinceEpoch(entry.timestamp) },
            { "level", logLevelToString(entry.level) },
            { "message", entry.message },
        };
        if (entry.data)
            item["data"] = *entry.data;
        logs.push_back(std::move(item));
    }

    auto tools = nlohmann::json::array();
    for (const auto& tool: status.tools)
    {
        tools.push_back({
            { "name", tool.name },
            { "description", tool.description },
            { "inputSchema", tool.inputSchema },
        });
    }

    auto resources = nlohmann::json::array();
    for (const auto& resource: status.resources)
    {
        resources.push_back({
            { "uri", resource.uri },
            { "name", resource.name },
            { "description", resource.description },
            { "mimeType", resource.mimeType },
        });
    }

    return nlohmann::json {
        { "id", status.id },
        { "name", status.name },
        { "status", statusToString(status.status) },
        { "health", std::move(health) },
        { "logs", std::move(logs) },
        { "tools", std::move(tools) },
        { "resources", std::move(resources) },
        { "capabilities", status.capabilities },
    };
}

} // namespace toolbridge
