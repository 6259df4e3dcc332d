// SPDX-License-Identifier: Apache-2.0
#include <mcp/Connection.hpp>

#include "MockTransport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>
#include <future>
#include <mutex>
#include <string>
#include <vector>

using namespace toolbridge;
using namespace toolbridge::test;
using namespace std::chrono_literals;

namespace
{

class RecordingObserver: public ConnectionObserver
{
  public:
    void onStatusChange(std::string_view /*serverId*/, ConnectionStatus status) override
    {
        auto const lock = std::lock_guard(_mutex);
        _statuses.push_back(status);
    }

    void onNotification(std::string_view /*serverId*/, const jsonrpc::Notification& notification) override
    {
        auto const lock = std::lock_guard(_mutex);
        _notifications.push_back(notification.method);
    }

    void onStderr(std::string_view /*serverId*/, std::string_view line) override
    {
        auto const lock = std::lock_guard(_mutex);
        _stderrLines.emplace_back(line);
    }

    void onRequest(std::string_view /*serverId*/, const jsonrpc::Request& request) override
    {
        auto const lock = std::lock_guard(_mutex);
        _requests.push_back(request.method);
    }

    void onParseError(std::string_view /*serverId*/, std::string_view line) override
    {
        auto const lock = std::lock_guard(_mutex);
        _parseErrors.emplace_back(line);
    }

    void onConnected(std::string_view serverId) override
    {
        auto const lock = std::lock_guard(_mutex);
        _connected.emplace_back(serverId);
    }

    [[nodiscard]] auto statuses() -> std::vector<ConnectionStatus>
    {
        auto const lock = std::lock_guard(_mutex);
        return _statuses;
    }

    [[nodiscard]] auto countStatus(ConnectionStatus status) -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return static_cast<std::size_t>(std::ranges::count(_statuses, status));
    }

    [[nodiscard]] auto notifications() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _notifications;
    }

    [[nodiscard]] auto requests() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _requests;
    }

    [[nodiscard]] auto stderrLines() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _stderrLines;
    }

    [[nodiscard]] auto parseErrors() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _parseErrors;
    }

    [[nodiscard]] auto connected() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _connected;
    }

  private:
    std::mutex _mutex;
    std::vector<ConnectionStatus> _statuses;
    std::vector<std::string> _notifications;
    std::vector<std::string> _requests;
    std::vector<std::string> _stderrLines;
    std::vector<std::string> _parseErrors;
    std::vector<std::string> _connected;
};

auto testConfig() -> ServerConfig
{
    return ServerConfig { .id = "fs", .name = "Filesystem", .command = "mock-server" };
}

auto noReconnect() -> ConnectionOptions
{
    auto options = ConnectionOptions {};
    options.reconnect.enabled = false;
    return options;
}

auto hasLog(const Connection& connection, LogLevel level, std::string_view message) -> bool
{
    return std::ranges::any_of(connection.logs(), [&](const LogEntry& entry) {
        return entry.level == level && entry.message == message;
    });
}

/// Wraps the standard responder, adding a few methods used by the tests below.
auto extendedResponder() -> MockServer::Responder
{
    return [standard = standardResponder()](const ServerConfig& config,
                                            const nlohmann::json& message) -> std::vector<nlohmann::json> {
        auto const method = message.value("method", "");
        if (method == "echo")
            return { reply(message, message["params"]) };
        if (method == "fail")
            return { replyError(message, -32000, "Boom") };
        return standard(config, message);
    };
}

} // namespace

TEST_CASE("Connection performs the initialize handshake", "[connection]")
{
    auto server = makeStandardServer();
    auto observer = std::make_shared<RecordingObserver>();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    connection.addObserver(observer);

    CHECK(connection.status() == ConnectionStatus::Disconnected);
    REQUIRE(connection.connect().has_value());

    CHECK(connection.isConnected());
    CHECK(connection.status() == ConnectionStatus::Connected);
    CHECK(connection.capabilities().contains("tools"));

    auto const initialize = server->waitForMethod("initialize");
    REQUIRE(initialize.has_value());
    CHECK((*initialize)["params"]["protocolVersion"] == "2024-11-05");
    CHECK((*initialize)["params"]["capabilities"] == nlohmann::json::object());
    CHECK((*initialize)["params"]["clientInfo"]["name"] == "toolbridge");

    REQUIRE(server->waitForMethod("notifications/initialized").has_value());
    auto const methods = server->receivedMethods();
    REQUIRE(methods.size() == 2);
    CHECK(methods[0] == "initialize");
    CHECK(methods[1] == "notifications/initialized");
    CHECK(!server->received()[1].contains("id"));

    auto const health = connection.health();
    CHECK(health.status == ConnectionStatus::Connected);
    CHECK(health.lastConnected.has_value());
    CHECK(health.uptime.has_value());
    CHECK(health.latency.has_value());
    CHECK(health.reconnectAttempts == 0);

    CHECK(hasLog(connection, LogLevel::Info, "Connecting to MCP server: Filesystem"));
    CHECK(hasLog(connection, LogLevel::Info, "Connected to MCP server: Filesystem"));

    auto const statuses = observer->statuses();
    REQUIRE(statuses.size() == 2);
    CHECK(statuses[0] == ConnectionStatus::Connecting);
    CHECK(statuses[1] == ConnectionStatus::Connected);
    CHECK(observer->connected() == std::vector<std::string> { "fs" });
}

TEST_CASE("Connection rejects a second connect while connected", "[connection]")
{
    auto server = makeStandardServer();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());

    REQUIRE(connection.connect().has_value());
    auto const second = connection.connect();
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::AlreadyConnected);
    CHECK(server->startCount() == 1);
}

TEST_CASE("Connection matches replies to requests by id", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    auto const standard = standardResponder();
    // Requests to "slow" are answered manually by the test.
    server->responder = [standard](const ServerConfig& config, const nlohmann::json& message) {
        if (message.value("method", "") == "slow")
            return std::vector<nlohmann::json> {};
        return standard(config, message);
    };

    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    REQUIRE(connection.connect().has_value());

    auto first = std::promise<Result<nlohmann::json>> {};
    auto second = std::promise<Result<nlohmann::json>> {};
    connection.sendRequestAsync("slow", { { "n", 1 } }, [&](Result<nlohmann::json> r) { first.set_value(std::move(r)); });
    connection.sendRequestAsync("slow", { { "n", 2 } }, [&](Result<nlohmann::json> r) { second.set_value(std::move(r)); });
    CHECK(connection.pendingRequestCount() == 2);

    auto requests = std::vector<nlohmann::json> {};
    REQUIRE(eventually([&] {
        requests.clear();
        for (const auto& message: server->received())
            if (message.value("method", "") == "slow")
                requests.push_back(message);
        return requests.size() == 2;
    }));
    CHECK(requests[0]["id"] != requests[1]["id"]);

    // Answer in reverse order.
    server->send(reply(requests[1], { { "answer", "two" } }));
    server->send(reply(requests[0], { { "answer", "one" } }));

    auto firstResult = first.get_future().get();
    auto secondResult = second.get_future().get();
    REQUIRE(firstResult.has_value());
    REQUIRE(secondResult.has_value());
    CHECK((*firstResult)["answer"] == "one");
    CHECK((*secondResult)["answer"] == "two");
    CHECK(connection.pendingRequestCount() == 0);
}

TEST_CASE("Connection times out requests that get no reply", "[connection]")
{
    auto server = makeStandardServer();
    auto options = noReconnect();
    options.requestTimeout = 50ms;
    auto connection = Connection(testConfig(), options, server->factory());
    REQUIRE(connection.connect().has_value());

    auto const result = connection.request("never/answered");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(result.error().message == "Request timed out: never/answered");
    CHECK(connection.pendingRequestCount() == 0);
    CHECK(hasLog(connection, LogLevel::Warn, "Request timed out: never/answered"));

    // A late reply is dropped and the connection stays usable.
    auto const request = server->waitForMethod("never/answered");
    REQUIRE(request.has_value());
    server->send(reply(*request, nlohmann::json::object()));
    CHECK(connection.ping().has_value());
    CHECK(connection.isConnected());
}

TEST_CASE("Connection survives malformed server output", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    server->responder = extendedResponder();
    auto observer = std::make_shared<RecordingObserver>();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    connection.addObserver(observer);
    REQUIRE(connection.connect().has_value());

    server->sendRaw("{not json}\n");
    server->sendRaw("\n");

    auto const echoed = connection.request("echo", { { "value", 42 } });
    REQUIRE(echoed.has_value());
    CHECK((*echoed)["value"] == 42);
    CHECK(connection.isConnected());
    CHECK(hasLog(connection, LogLevel::Debug, "Failed to parse message: {not json}"));
    CHECK(observer->parseErrors() == std::vector<std::string> { "{not json}" });
}

TEST_CASE("Connection reassembles replies split across chunks", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    auto const standard = standardResponder();
    server->responder = [standard](const ServerConfig& config, const nlohmann::json& message) {
        if (message.value("method", "") == "split")
            return std::vector<nlohmann::json> {};
        return standard(config, message);
    };

    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    REQUIRE(connection.connect().has_value());

    auto result = std::promise<Result<nlohmann::json>> {};
    connection.sendRequestAsync("split", nlohmann::json::object(), [&](Result<nlohmann::json> r) {
        result.set_value(std::move(r));
    });

    auto const request = server->waitForMethod("split");
    REQUIRE(request.has_value());
    auto const text = reply(*request, { { "done", true } }).dump();
    server->sendRaw(text.substr(0, 10));
    server->sendRaw(text.substr(10) + "\r\n");

    auto value = result.get_future().get();
    REQUIRE(value.has_value());
    CHECK((*value)["done"] == true);
}

TEST_CASE("Connection reports server errors without disconnecting", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    server->responder = extendedResponder();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    REQUIRE(connection.connect().has_value());

    auto const result = connection.request("fail");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RpcError);
    CHECK(result.error().rpcCode == -32000);
    CHECK(result.error().message == "MCP error -32000: Boom");
    CHECK(connection.isConnected());
}

TEST_CASE("Connection forwards notifications and stderr lines to observers", "[connection]")
{
    auto server = makeStandardServer();
    auto observer = std::make_shared<RecordingObserver>();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    connection.addObserver(observer);
    REQUIRE(connection.connect().has_value());

    server->send({ { "jsonrpc", "2.0" }, { "method", "notifications/tools/list_changed" } });
    server->sendStderr("warning one\nwarn");
    server->sendStderr("ing two\n");

    REQUIRE(eventually([&] { return observer->stderrLines().size() == 2 && !observer->notifications().empty(); }));
    CHECK(observer->notifications() == std::vector<std::string> { "notifications/tools/list_changed" });
    CHECK(observer->stderrLines() == std::vector<std::string> { "warning one", "warning two" });
    CHECK(hasLog(connection, LogLevel::Warn, "stderr: warning one"));
    CHECK(hasLog(connection, LogLevel::Warn, "stderr: warning two"));

    connection.removeObserver(observer);
    server->sendStderr("ignored\n");
    REQUIRE(eventually([&] { return hasLog(connection, LogLevel::Warn, "stderr: ignored"); }));
    CHECK(observer->stderrLines().size() == 2);
}

TEST_CASE("Connection answers server requests without resolving its own requests", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    auto const standard = standardResponder();
    server->responder = [standard](const ServerConfig& config, const nlohmann::json& message) {
        if (message.value("method", "") == "slow")
            return std::vector<nlohmann::json> {};
        return standard(config, message);
    };
    auto observer = std::make_shared<RecordingObserver>();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    connection.addObserver(observer);
    REQUIRE(connection.connect().has_value());

    auto result = std::promise<Result<nlohmann::json>> {};
    connection.sendRequestAsync("slow", nlohmann::json::object(), [&](Result<nlohmann::json> r) {
        result.set_value(std::move(r));
    });
    auto const request = server->waitForMethod("slow");
    REQUIRE(request.has_value());

    // Same id as the pending client request.
    server->send({ { "jsonrpc", "2.0" }, { "id", (*request)["id"] }, { "method", "roots/list" } });

    REQUIRE(eventually([&] { return !observer->requests().empty(); }));
    CHECK(observer->requests() == std::vector<std::string> { "roots/list" });
    CHECK(connection.pendingRequestCount() == 1);

    auto answers = std::vector<nlohmann::json> {};
    REQUIRE(eventually([&] {
        answers.clear();
        for (const auto& message: server->received())
            if (message.contains("error"))
                answers.push_back(message);
        return answers.size() == 1;
    }));
    CHECK(answers[0]["id"] == (*request)["id"]);
    CHECK(answers[0]["error"]["code"] == -32601);
    CHECK(answers[0]["error"]["message"] == "Method not found: roots/list");

    server->send(reply(*request, { { "ok", true } }));
    auto value = result.get_future().get();
    REQUIRE(value.has_value());
    CHECK((*value)["ok"] == true);
}

TEST_CASE("Connection discards an output line that never ends", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    server->responder = extendedResponder();
    auto observer = std::make_shared<RecordingObserver>();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    connection.addObserver(observer);
    REQUIRE(connection.connect().has_value());

    server->sendRaw(std::string(jsonrpc::DefaultMaxLineLength + 1, 'x'));
    server->sendRaw(std::string(1024, 'x') + "\n");

    REQUIRE(eventually([&] { return !observer->parseErrors().empty(); }));
    auto const message = std::format("Discarded unterminated output line longer than {} bytes",
                                     jsonrpc::DefaultMaxLineLength);
    CHECK(observer->parseErrors() == std::vector<std::string> { message });
    CHECK(hasLog(connection, LogLevel::Warn, message));

    auto const echoed = connection.request("echo", { { "value", 7 } });
    REQUIRE(echoed.has_value());
    CHECK((*echoed)["value"] == 7);
    CHECK(observer->parseErrors().size() == 1);
}

TEST_CASE("Connection keeps its timers on time while a retired transport is torn down", "[connection]")
{
    auto server = makeStandardServer();
    server->teardownDelay = 1500ms;
    auto options = noReconnect();
    options.requestTimeout = 100ms;
    auto connection = Connection(testConfig(), options, server->factory());

    REQUIRE(connection.connect().has_value());
    connection.disconnect();
    REQUIRE(connection.connect().has_value());

    auto const start = std::chrono::steady_clock::now();
    auto const result = connection.request("never/answered");
    auto const elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed < 1s);
}

TEST_CASE("Connection keeps a bounded log", "[connection]")
{
    auto server = makeStandardServer();
    auto options = noReconnect();
    options.maxLogEntries = 5;
    auto connection = Connection(testConfig(), options, server->factory());
    REQUIRE(connection.connect().has_value());

    for (auto i = 0; i < 10; ++i)
        server->sendStderr(std::format("line {}\n", i));

    REQUIRE(eventually([&] { return hasLog(connection, LogLevel::Warn, "stderr: line 9"); }));
    auto const logs = connection.logs();
    CHECK(logs.size() == 5);
    CHECK(logs.back().message == "stderr: line 9");
    CHECK(logs.front().message == "stderr: line 5");

    connection.clearLogs();
    CHECK(connection.logs().empty());
}

TEST_CASE("Connection disconnect fails pending requests", "[connection]")
{
    auto server = makeStandardServer();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    REQUIRE(connection.connect().has_value());

    auto pending = std::promise<Result<nlohmann::json>> {};
    connection.sendRequestAsync("never/answered", nlohmann::json::object(), [&](Result<nlohmann::json> r) {
        pending.set_value(std::move(r));
    });

    connection.disconnect();

    auto const result = pending.get_future().get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);
    CHECK(connection.status() == ConnectionStatus::Disconnected);
    CHECK(!connection.isConnected());
    CHECK(connection.pendingRequestCount() == 0);
    CHECK(!connection.health().uptime.has_value());
    CHECK(server->terminateCount() == 1);

    connection.disconnect();
    CHECK(connection.status() == ConnectionStatus::Disconnected);
    CHECK(server->terminateCount() == 1);
}

TEST_CASE("Connection requires a connection before requests", "[connection]")
{
    auto server = makeStandardServer();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());

    auto const result = connection.request("tools/list");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);

    auto const latency = connection.ping();
    REQUIRE(!latency.has_value());
    CHECK(latency.error().code == ErrorCode::NotInitialized);

    CHECK(!connection.notify("notifications/cancelled").has_value());
}

TEST_CASE("Connection ping measures latency", "[connection]")
{
    auto server = makeStandardServer();
    auto connection = Connection(testConfig(), noReconnect(), server->factory());
    REQUIRE(connection.connect().has_value());

    auto const latency = connection.ping();
    REQUIRE(latency.has_value());
    CHECK(connection.health().latency == *latency);
}

TEST_CASE("Connection reports a spawn failure", "[connection]")
{
    auto server = makeStandardServer();
    server->acceptStart = [](const ServerConfig&) { return false; };
    auto connection = Connection(testConfig(), noReconnect(), server->factory());

    auto const result = connection.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SpawnError);
    CHECK(connection.status() == ConnectionStatus::Error);
    CHECK(connection.health().lastError.has_value());
    CHECK(!connection.reconnectScheduled());
}

TEST_CASE("Connection fails the handshake on an initialize error", "[connection]")
{
    auto server = std::make_shared<MockServer>();
    server->responder = [](const ServerConfig&, const nlohmann::json& message) -> std::vector<nlohmann::json> {
        if (message.value("method", "") == "initialize")
            return { replyError(message, -32602, "Unsupported protocol version") };
        return {};
    };
    auto connection = Connection(testConfig(), noReconnect(), server->factory());

    auto const result = connection.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RpcError);
    CHECK(connection.status() == ConnectionStatus::Error);
    CHECK(server->terminateCount() == 1);
    CHECK(connection.health().lastError == "MCP error -32602: Unsupported protocol version");
}

TEST_CASE("Connection reconnects after the server crashes", "[connection]")
{
    auto server = makeStandardServer();
    auto options = ConnectionOptions {};
    options.reconnect.baseDelay = 10ms;
    auto connection = Connection(testConfig(), options, server->factory());
    REQUIRE(connection.connect().has_value());

    auto pending = std::promise<Result<nlohmann::json>> {};
    connection.sendRequestAsync("never/answered", nlohmann::json::object(), [&](Result<nlohmann::json> r) {
        pending.set_value(std::move(r));
    });
    REQUIRE(server->waitForMethod("never/answered").has_value());

    server->exit(1);

    auto const result = pending.get_future().get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionClosed);

    REQUIRE(eventually([&] { return server->startCount() == 2 && connection.isConnected(); }));
    CHECK(connection.health().reconnectAttempts == 0);
    CHECK(hasLog(connection, LogLevel::Info, "Process exited with code 1, signal null"));
    CHECK(hasLog(connection, LogLevel::Info, "Scheduling reconnect attempt 1 in 10ms"));
}

TEST_CASE("Connection does not reconnect after a clean exit", "[connection]")
{
    auto server = makeStandardServer();
    auto options = ConnectionOptions {};
    options.reconnect.baseDelay = 1ms;
    auto connection = Connection(testConfig(), options, server->factory());
    REQUIRE(connection.connect().has_value());

    server->exit(0);

    REQUIRE(eventually([&] { return connection.status() == ConnectionStatus::Disconnected; }));
    std::this_thread::sleep_for(30ms);
    CHECK(connection.status() == ConnectionStatus::Disconnected);
    CHECK(!connection.reconnectScheduled());
    CHECK(server->startCount() == 1);
}

TEST_CASE("Connection stops reconnecting after the configured number of attempts", "[connection]")
{
    auto server = makeStandardServer();
    server->acceptStart = [](const ServerConfig&) { return false; };
    auto observer = std::make_shared<RecordingObserver>();

    auto options = ConnectionOptions {};
    options.reconnect.maxAttempts = 3;
    options.reconnect.baseDelay = 1ms;
    auto connection = Connection(testConfig(), options, server->factory());
    connection.addObserver(observer);

    CHECK(!connection.connect().has_value());

    REQUIRE(eventually([&] { return hasLog(connection, LogLevel::Error, "Max reconnect attempts (3) reached"); }));
    CHECK(connection.status() == ConnectionStatus::Error);
    CHECK(!connection.reconnectScheduled());
    CHECK(server->startCount() == 4);
    CHECK(observer->countStatus(ConnectionStatus::Reconnecting) == 3);
    CHECK(hasLog(connection, LogLevel::Info, "Scheduling reconnect attempt 1 in 1ms"));
    CHECK(hasLog(connection, LogLevel::Info, "Scheduling reconnect attempt 2 in 2ms"));
    CHECK(hasLog(connection, LogLevel::Info, "Scheduling reconnect attempt 3 in 4ms"));
}

TEST_CASE("Connection cancelReconnect stops a scheduled attempt", "[connection]")
{
    auto server = makeStandardServer();
    server->acceptStart = [](const ServerConfig&) { return false; };

    auto options = ConnectionOptions {};
    options.reconnect.baseDelay = 10s;
    auto connection = Connection(testConfig(), options, server->factory());

    CHECK(!connection.connect().has_value());
    CHECK(connection.status() == ConnectionStatus::Reconnecting);
    CHECK(connection.reconnectScheduled());

    connection.cancelReconnect();
    CHECK(connection.status() == ConnectionStatus::Disconnected);
    CHECK(!connection.reconnectScheduled());
    CHECK(connection.health().reconnectAttempts == 0);
}

TEST_CASE("Connection can be destroyed while reconnecting", "[connection]")
{
    auto server = makeStandardServer();
    server->acceptStart = [](const ServerConfig&) { return false; };

    auto options = ConnectionOptions {};
    options.reconnect.baseDelay = 1ms;
    options.reconnect.maxAttempts = 1000;

    {
        auto connection = Connection(testConfig(), options, server->factory());
        CHECK(!connection.connect().has_value());
        std::this_thread::sleep_for(20ms);
    }

    auto const starts = server->startCount();
    std::this_thread::sleep_for(20ms);
    CHECK(server->startCount() == starts);
}
