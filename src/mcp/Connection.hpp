// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Automatic reconnection after a qualifying failure.
///
/// The n-th attempt is scheduled after baseDelay * 2^(n-1).
struct ReconnectPolicy
{
    bool enabled = true;
    int maxAttempts = 5;
    std::chrono::milliseconds baseDelay { 2000 };
};

/// @brief Tunables of a single connection.
struct ConnectionOptions
{
    std::chrono::milliseconds requestTimeout { 30000 };
    std::size_t maxLogEntries = 100;
    ReconnectPolicy reconnect;
    std::string protocolVersion = "2024-11-05";
    std::string clientName = "toolbridge";
    std::string clientVersion = "0.1.0";
};

/// @brief Receives events of a connection.
///
/// Callbacks are invoked without any connection lock held, from the thread that caused the
/// event (the transport reader, the timer thread or the calling thread). Callbacks must not
/// call the blocking Connection API (connect(), request(), ping()).
class ConnectionObserver
{
  public:
    virtual ~ConnectionObserver() = default;

    virtual void onStatusChange(std::string_view /*serverId*/, ConnectionStatus /*status*/) {}
    virtual void onLog(std::string_view /*serverId*/, const LogEntry& /*entry*/) {}
    virtual void onNotification(std::string_view /*serverId*/, const jsonrpc::Notification& /*notification*/) {}
    /// @brief A request sent by the server. The connection has already answered it with "method not found".
    virtual void onRequest(std::string_view /*serverId*/, const jsonrpc::Request& /*request*/) {}
    virtual void onStderr(std::string_view /*serverId*/, std::string_view /*line*/) {}
    virtual void onParseError(std::string_view /*serverId*/, std::string_view /*line*/) {}
    virtual void onConnected(std::string_view /*serverId*/) {}
    virtual void onExit(std::string_view /*serverId*/, const ExitStatus& /*status*/) {}
};

/// @brief One tool server process and the JSON-RPC session running over it.
///
/// Owns the transport, the pending-request table (id to completion plus timeout timer), the
/// status state machine, a bounded log ring and the reconnect timer. Requests may be issued
/// from any thread and be in flight concurrently; replies are matched by id in arrival order.
class Connection
{
  public:
    using RequestCallback = std::function<void(Result<nlohmann::json>)>;
    using ConnectCallback = std::function<void(VoidResult)>;

    /// @brief Creates a disconnected connection.
    /// @param config How to spawn the server.
    /// @param options Timeouts, log cap, reconnect policy and handshake identity.
    /// @param transportFactory Creates the transport for each attempt. Defaults to StdioTransport.
    explicit Connection(ServerConfig config, ConnectionOptions options = {}, TransportFactory transportFactory = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// @brief Spawns the server and performs the initialize handshake, blocking until it completes.
    ///
    /// Fails with AlreadyConnected while connecting or connected. Resets the reconnect attempt
    /// counter and re-enables auto-reconnect according to the policy.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Non-blocking connect(). The callback runs once the handshake succeeded or failed.
    void connectAsync(ConnectCallback done);

    /// @brief Disables auto-reconnect, fails every pending request and terminates the server.
    ///
    /// Idempotent.
    void disconnect();

    /// @brief Sends a request and blocks until its reply, error or timeout.
    [[nodiscard]] auto request(std::string_view method, nlohmann::json params = nlohmann::json::object())
        -> Result<nlohmann::json>;

    /// @brief Sends a request; the callback receives the result, an RpcError, a TimeoutError or
    /// ConnectionClosed. It is invoked exactly once.
    void sendRequestAsync(std::string_view method, nlohmann::json params, RequestCallback done);

    /// @brief Sends a notification. No reply is expected.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nlohmann::json::object())
        -> VoidResult;

    /// @brief Sends a ping request and returns the round-trip time.
    ///
    /// Fails with NotInitialized unless connected. Updates the health latency.
    [[nodiscard]] auto ping() -> Result<std::chrono::milliseconds>;

    void setReconnectPolicy(ReconnectPolicy policy);

    /// @brief Cancels a scheduled reconnect and resets the attempt counter.
    void cancelReconnect();

    void clearLogs();

    void addObserver(std::shared_ptr<ConnectionObserver> observer);
    void removeObserver(const std::shared_ptr<ConnectionObserver>& observer);

    [[nodiscard]] auto config() const -> const ServerConfig&;
    [[nodiscard]] auto options() const -> ConnectionOptions;
    [[nodiscard]] auto status() const -> ConnectionStatus;
    [[nodiscard]] auto isConnected() const -> bool;
    [[nodiscard]] auto health() const -> ServerHealth;
    [[nodiscard]] auto logs() const -> std::vector<LogEntry>;

    /// @brief Returns the capabilities object the server sent in its initialize reply.
    [[nodiscard]] auto capabilities() const -> nlohmann::json;

    [[nodiscard]] auto pendingRequestCount() const -> std::size_t;
    [[nodiscard]] auto reconnectScheduled() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
