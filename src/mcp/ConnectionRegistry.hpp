// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Connection.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Snapshot of one server: connection state plus a best-effort listing.
struct ServerStatus
{
    std::string id;
    std::string name;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    ServerHealth health;
    std::vector<LogEntry> logs;
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    nlohmann::json capabilities = nlohmann::json::object();
};

/// @brief Checks a server command against an allowlist.
///
/// An empty allowlist permits every command. Otherwise the command must equal an entry or
/// start with an entry followed by a space.
[[nodiscard]] auto validateCommandAgainstPolicy(std::string_view command, const std::vector<std::string>& allowlist)
    -> VoidResult;

/// @brief Keyed store of connections, at most one per server id.
class ConnectionRegistry
{
  public:
    /// @param options Defaults for every connection; a server's policy.timeoutMs overrides the timeout.
    /// @param transportFactory Passed on to every connection. Empty selects StdioTransport.
    explicit ConnectionRegistry(ConnectionOptions options = {}, TransportFactory transportFactory = {});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// @brief Returns the stored connection if it is connected, otherwise connects a new one.
    ///
    /// A connection that fails to connect is not stored. A stored connection that is no
    /// longer connected is replaced.
    /// @return The connected connection, or ConfigError for a disabled server, PolicyError for a
    ///         command outside the allowlist, or the connect error.
    [[nodiscard]] auto connect(const ServerConfig& config) -> Result<std::shared_ptr<Connection>>;

    /// @brief Returns the connection stored under the id, or nullptr.
    [[nodiscard]] auto get(std::string_view id) const -> std::shared_ptr<Connection>;

    /// @brief Returns the connections whose status is connected.
    [[nodiscard]] auto listActive() const -> std::vector<std::shared_ptr<Connection>>;

    [[nodiscard]] auto listAll() const -> std::vector<std::shared_ptr<Connection>>;

    /// @brief Disconnects and removes one connection. Returns false if the id is unknown.
    auto disconnectAndRemove(std::string_view id) -> bool;

    /// @brief Disconnects every connection concurrently and clears the registry.
    void disconnectAll();

    /// @brief Builds the snapshot of one server, or NotFound.
    [[nodiscard]] auto serverStatus(std::string_view id) const -> Result<ServerStatus>;

    /// @brief Builds snapshots of every stored server, ordered by id.
    [[nodiscard]] auto allServerStatuses() const -> std::vector<ServerStatus>;

    /// @brief Installs an observer on every connection created from now on.
    void setObserver(std::shared_ptr<ConnectionObserver> observer);

    [[nodiscard]] auto size() const -> std::size_t;

  private:
    ConnectionOptions _options;
    TransportFactory _transportFactory;
    std::shared_ptr<ConnectionObserver> _observer;

    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> _connections;

    [[nodiscard]] static auto snapshot(Connection& connection) -> ServerStatus;
};

/// @brief Renders a snapshot as JSON for display.
[[nodiscard]] auto serverStatusToJson(const ServerStatus& status) -> nlohmann::json;

} // namespace toolbridge
