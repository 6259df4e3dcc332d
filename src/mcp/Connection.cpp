// SPDX-License-Identifier: Apache-2.0
#include "Connection.hpp"

#include <core/Log.hpp>
#include <core/TimerQueue.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace toolbridge
{

namespace
{
    constexpr auto MaxBackoffShift = 20;

    auto connectionClosed() -> Error
    {
        return Error { .code = ErrorCode::ConnectionClosed, .message = "Connection closed" };
    }

    auto describeExit(const ExitStatus& status) -> std::string
    {
        return std::format("Process exited with code {}, signal {}",
                           status.code ? std::to_string(*status.code) : "null",
                           status.signal ? std::to_string(*status.signal) : "null");
    }

    /// @brief Destroys retired transports on a thread of its own.
    ///
    /// Destroying a transport joins its reader thread, which can be the retiring thread itself
    /// and can wait for a child that ignores SIGTERM to be killed.
    class TransportReaper
    {
      public:
        TransportReaper()
        {
            _worker = std::jthread([this](const std::stop_token& token) { run(token); });
        }

        ~TransportReaper() { shutdown(); }

        TransportReaper(const TransportReaper&) = delete;
        TransportReaper& operator=(const TransportReaper&) = delete;

        void retire(std::unique_ptr<Transport> transport)
        {
            auto const lock = std::lock_guard(_mutex);
            _queue.push_back(std::move(transport));
            _cv.notify_one();
        }

        /// @brief Destroys everything still queued and joins the worker. Idempotent.
        void shutdown()
        {
            if (_worker.joinable())
            {
                _worker.request_stop();
                _worker.join();
            }

            auto rest = std::vector<std::unique_ptr<Transport>> {};
            {
                auto const lock = std::lock_guard(_mutex);
                rest.swap(_queue);
            }
        }

      private:
        std::mutex _mutex;
        std::condition_variable_any _cv;
        std::vector<std::unique_ptr<Transport>> _queue;
        std::jthread _worker;

        void run(const std::stop_token& stopToken)
        {
            while (true)
            {
                auto batch = std::vector<std::unique_ptr<Transport>> {};
                {
                    auto lock = std::unique_lock(_mutex);
                    _cv.wait(lock, stopToken, [this] { return !_queue.empty(); });
                    if (_queue.empty())
                        return;
                    batch.swap(_queue);
                }
            }
        }
    };
} // namespace

struct Connection::Impl
{
    /// @brief Work deferred until the connection lock is released, run in order.
    using Events = std::vector<std::function<void()>>;

    struct PendingRequest
    {
        std::string method;
        RequestCallback done;
        TimerQueue::TimerId timer = 0;
    };

    ServerConfig config;
    ConnectionOptions options;
    TransportFactory factory;

    mutable std::mutex mutex;
    std::unique_ptr<Transport> transport;
    std::uint64_t generation = 0;
    jsonrpc::LineBuffer stdoutLines;
    jsonrpc::LineBuffer stderrLines;

    std::map<std::int64_t, PendingRequest> pending;
    std::int64_t lastRequestId = 0;

    bool initialized = false;
    bool autoReconnect = true;
    bool destroying = false;
    nlohmann::json serverCapabilities = nlohmann::json::object();

    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::deque<LogEntry> logs;
    std::optional<std::chrono::system_clock::time_point> lastConnected;
    std::optional<std::string> lastError;
    int reconnectAttempts = 0;
    std::optional<std::chrono::steady_clock::time_point> connectedAt;
    std::optional<std::chrono::milliseconds> latency;
    std::optional<TimerQueue::TimerId> reconnectTimer;

    std::vector<std::shared_ptr<ConnectionObserver>> observers;

    TimerQueue timers;
    TransportReaper reaper;

    Impl(ServerConfig config, ConnectionOptions options, TransportFactory factory):
        config(std::move(config)), options(std::move(options)), factory(std::move(factory))
    {
        autoReconnect = this->options.reconnect.enabled;
    }

    static void run(Events& events)
    {
        for (auto& event: events)
            event();
        events.clear();
    }

    template <typename F>
    void emit(Events& events, F f)
    {
        if (observers.empty())
            return;
        events.emplace_back([observers = observers, id = config.id, f = std::move(f)] {
            for (const auto& observer: observers)
                f(*observer, std::string_view(id));
        });
    }

    void addLog(Events& events, LogLevel level, std::string message, std::optional<nlohmann::json> data = std::nullopt)
    {
        switch (level)
        {
            case LogLevel::Debug: log::debug("[{}] {}", config.id, message); break;
            case LogLevel::Info: log::info("[{}] {}", config.id, message); break;
            case LogLevel::Warn: log::warning("[{}] {}", config.id, message); break;
            case LogLevel::Error: log::error("[{}] {}", config.id, message); break;
        }

        auto entry = LogEntry {
            .timestamp = std::chrono::system_clock::now(),
            .level = level,
            .message = std::move(message),
            .data = std::move(data),
        };
        logs.push_back(entry);
        while (logs.size() > options.maxLogEntries)
            logs.pop_front();

        emit(events, [entry = std::move(entry)](ConnectionObserver& o, std::string_view id) { o.onLog(id, entry); });
    }

    void setStatus(Events& events, ConnectionStatus newStatus)
    {
        if (status == newStatus)
            return;
        status = newStatus;
        emit(events, [newStatus](ConnectionObserver& o, std::string_view id) { o.onStatusChange(id, newStatus); });
    }

    /// @brief Detaches the current transport, terminates its process and hands it to the reaper.
    void retireTransport()
    {
        if (!transport)
            return;

        transport->terminate();
        reaper.retire(std::move(transport));
        stdoutLines.clear();
        stderrLines.clear();
        initialized = false;
        connectedAt.reset();
    }

    void failPending(Events& events, const Error& error)
    {
        for (auto& [id, request]: pending)
        {
            timers.cancel(request.timer);
            events.emplace_back([done = std::move(request.done), error] { done(std::unexpected(error)); });
        }
        pending.clear();
    }

    void cancelReconnectTimer()
    {
        if (reconnectTimer)
        {
            timers.cancel(*reconnectTimer);
            reconnectTimer.reset();
        }
    }

    void scheduleReconnect(Events& events)
    {
        if (destroying || !autoReconnect)
            return;

        if (reconnectAttempts >= options.reconnect.maxAttempts)
        {
            addLog(events,
                   LogLevel::Error,
                   std::format("Max reconnect attempts ({}) reached", options.reconnect.maxAttempts));
            setStatus(events, ConnectionStatus::Error);
            return;
        }

        cancelReconnectTimer();
        ++reconnectAttempts;
        auto const shift = std::min(reconnectAttempts - 1, MaxBackoffShift);
        auto const delay = options.reconnect.baseDelay * (std::int64_t { 1 } << shift);
        addLog(events,
               LogLevel::Info,
               std::format("Scheduling reconnect attempt {} in {}ms", reconnectAttempts, delay.count()));
        setStatus(events, ConnectionStatus::Reconnecting);
        reconnectTimer = timers.schedule(delay, [this] { onReconnectTimer(); });
    }

    void onReconnectTimer()
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            reconnectTimer.reset();
            beginConnect(events, [this](VoidResult result) {
                if (result)
                    return;
                auto failureEvents = Events {};
                {
                    auto const failureLock = std::lock_guard(mutex);
                    addLog(failureEvents, LogLevel::Error, std::format("Reconnect failed: {}", result.error().message));
                }
                run(failureEvents);
            });
        }
        run(events);
    }

    void sendRequestLocked(Events& events, std::string_view method, nlohmann::json params, RequestCallback done)
    {
        if (!transport)
        {
            events.emplace_back([done = std::move(done)] {
                done(std::unexpected(Error { .code = ErrorCode::ConnectionClosed, .message = "Not connected" }));
            });
            return;
        }

        auto const id = ++lastRequestId;
        auto const timer = timers.schedule(options.requestTimeout, [this, id] { onRequestTimeout(id); });
        auto const payload = jsonrpc::encode(jsonrpc::makeRequest(id, method, std::move(params)));

        if (auto written = transport->write(payload); !written)
        {
            timers.cancel(timer);
            addLog(events, LogLevel::Error, std::format("Failed to send {}: {}", method, written.error().message));
            events.emplace_back([done = std::move(done), error = written.error()] { done(std::unexpected(error)); });
            return;
        }

        addLog(events, LogLevel::Debug, std::format("Sent request {}: {}", id, method));
        pending.emplace(id, PendingRequest { .method = std::string(method), .done = std::move(done), .timer = timer });
    }

    void onRequestTimeout(std::int64_t id)
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            auto const it = pending.find(id);
            if (it == pending.end())
                return;

            auto request = std::move(it->second);
            pending.erase(it);
            auto message = std::format("Request timed out: {}", request.method);
            addLog(events, LogLevel::Warn, message);
            events.emplace_back([done = std::move(request.done), message = std::move(message)] {
                done(makeError(ErrorCode::TimeoutError, message));
            });
        }
        run(events);
    }

    void beginConnect(Events& events, ConnectCallback done)
    {
        if (destroying)
        {
            events.emplace_back([done = std::move(done)] { done(std::unexpected(connectionClosed())); });
            return;
        }

        if (transport || status == ConnectionStatus::Connecting || status == ConnectionStatus::Connected)
        {
            events.emplace_back([done = std::move(done)] { done(makeError(ErrorCode::AlreadyConnected, "Already connected")); });
            return;
        }

        cancelReconnectTimer();
        setStatus(events, ConnectionStatus::Connecting);
        addLog(events, LogLevel::Info, std::format("Connecting to MCP server: {}", config.name));

        transport = factory ? factory() : std::make_unique<StdioTransport>();
        auto const gen = ++generation;
        stdoutLines.clear();
        stderrLines.clear();

        auto callbacks = TransportCallbacks {
            .onStdout = [this, gen](std::string_view chunk) { onStdout(gen, chunk); },
            .onStderr = [this, gen](std::string_view chunk) { onStderr(gen, chunk); },
            .onExit = [this, gen](const ExitStatus& exitStatus) { onExit(gen, exitStatus); },
            .onError = [this, gen](const Error& error) { onTransportError(gen, error); },
        };

        if (auto started = transport->start(config, std::move(callbacks)); !started)
        {
            auto const error = started.error();
            addLog(events, LogLevel::Error, std::format("Failed to spawn process: {}", error.message));
            lastError = error.message;
            retireTransport();
            setStatus(events, ConnectionStatus::Error);
            scheduleReconnect(events);
            events.emplace_back([done = std::move(done), error] { done(std::unexpected(error)); });
            return;
        }

        addLog(events, LogLevel::Debug, "Sending initialize request");
        auto params = nlohmann::json {
            { "protocolVersion", options.protocolVersion },
            { "capabilities", nlohmann::json::object() },
            { "clientInfo", { { "name", options.clientName }, { "version", options.clientVersion } } },
        };

        auto const startTime = std::chrono::steady_clock::now();
        sendRequestLocked(events,
                          "initialize",
                          std::move(params),
                          [this, gen, startTime, done = std::move(done)](Result<nlohmann::json> result) {
                              onInitializeResponse(gen, startTime, std::move(result), done);
                          });
    }

    void onInitializeResponse(std::uint64_t gen,
                              std::chrono::steady_clock::time_point startTime,
                              Result<nlohmann::json> result,
                              const ConnectCallback& done)
    {
        auto events = Events {};
        auto outcome = VoidResult {};
        {
            auto const lock = std::lock_guard(mutex);
            auto const superseded = destroying || gen != generation || !transport
                                    || status != ConnectionStatus::Connecting;

            if (superseded)
            {
                outcome = std::unexpected(result ? connectionClosed() : result.error());
            }
            else if (!result)
            {
                lastError = result.error().message;
                addLog(events, LogLevel::Error, std::format("Initialize failed: {}", result.error().message));
                failPending(events, connectionClosed());
                retireTransport();
                setStatus(events, ConnectionStatus::Error);
                scheduleReconnect(events);
                outcome = std::unexpected(result.error());
            }
            else
            {
                latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                               - startTime);
                serverCapabilities = result->value("capabilities", nlohmann::json::object());

                auto const notification = jsonrpc::encode(jsonrpc::makeNotification("notifications/initialized",
                                                                                     nlohmann::json::object()));
                if (auto written = transport->write(notification); !written)
                {
                    lastError = written.error().message;
                    addLog(events, LogLevel::Error, std::format("Failed to send initialized: {}", lastError.value()));
                    failPending(events, connectionClosed());
                    retireTransport();
                    setStatus(events, ConnectionStatus::Error);
                    scheduleReconnect(events);
                    outcome = std::unexpected(written.error());
                }
                else
                {
                    initialized = true;
                    connectedAt = std::chrono::steady_clock::now();
                    lastConnected = std::chrono::system_clock::now();
                    reconnectAttempts = 0;
                    setStatus(events, ConnectionStatus::Connected);
                    addLog(events,
                           LogLevel::Info,
                           std::format("Connected to MCP server: {}", config.name),
                           nlohmann::json { { "latencyMs", latency->count() } });
                    emit(events, [](ConnectionObserver& o, std::string_view id) { o.onConnected(id); });
                }
            }
        }
        run(events);
        done(std::move(outcome));
    }

    [[nodiscard]] auto isCurrent(std::uint64_t gen) const -> bool { return gen == generation && transport; }

    void onStdout(std::uint64_t gen, std::string_view chunk)
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            if (!isCurrent(gen))
                return;
            for (auto const& line: stdoutLines.feed(chunk))
                handleLine(events, line);
            if (stdoutLines.takeDiscardedLines() > 0)
            {
                auto message = std::format("Discarded unterminated output line longer than {} bytes",
                                           jsonrpc::DefaultMaxLineLength);
                addLog(events, LogLevel::Warn, message);
                emit(events, [message](ConnectionObserver& o, std::string_view id) { o.onParseError(id, message); });
            }
        }
        run(events);
    }

    void handleLine(Events& events, const std::string& line)
    {
        auto message = jsonrpc::decodeLine(line);
        if (!message)
        {
            addLog(events, LogLevel::Debug, std::format("Failed to parse message: {}", line));
            emit(events, [line](ConnectionObserver& o, std::string_view id) { o.onParseError(id, line); });
            return;
        }

        if (auto const* notification = std::get_if<jsonrpc::Notification>(&*message))
        {
            addLog(events, LogLevel::Debug, std::format("Notification: {}", notification->method));
            emit(events, [notification = *notification](ConnectionObserver& o, std::string_view id) {
                o.onNotification(id, notification);
            });
            return;
        }

        if (auto const* request = std::get_if<jsonrpc::Request>(&*message))
        {
            handleServerRequest(events, *request);
            return;
        }

        auto& response = std::get<jsonrpc::Response>(*message);
        if (!response.id.is_number_integer())
        {
            addLog(events, LogLevel::Debug, std::format("Response with unknown id: {}", response.id.dump()));
            return;
        }

        auto const it = pending.find(response.id.get<std::int64_t>());
        if (it == pending.end())
        {
            addLog(events, LogLevel::Debug, std::format("Response with unknown id: {}", response.id.dump()));
            return;
        }

        auto request = std::move(it->second);
        pending.erase(it);
        timers.cancel(request.timer);

        auto result = Result<nlohmann::json> {};
        if (response.error)
        {
            addLog(events,
                   LogLevel::Warn,
                   std::format("{} failed: {} (code {})", request.method, response.error->message, response.error->code),
                   response.error->data.is_null() ? std::nullopt : std::optional(response.error->data));
            result = makeRpcError(response.error->code, response.error->message);
        }
        else
        {
            result = std::move(response.result).value_or(nlohmann::json::object());
        }

        events.emplace_back([done = std::move(request.done), result = std::move(result)] { done(result); });
    }

    /// @brief Answers a server-initiated request. The client offers no server-callable methods.
    void handleServerRequest(Events& events, const jsonrpc::Request& request)
    {
        addLog(events, LogLevel::Debug, std::format("Server request: {}", request.method));
        auto const reply = jsonrpc::makeErrorResponse(request.id,
                                                      jsonrpc::MethodNotFound,
                                                      std::format("Method not found: {}", request.method));
        if (auto written = transport->write(jsonrpc::encode(reply)); !written)
            addLog(events, LogLevel::Warn, std::format("Failed to answer {}: {}", request.method, written.error().message));
        emit(events, [request](ConnectionObserver& o, std::string_view id) { o.onRequest(id, request); });
    }

    void onStderr(std::uint64_t gen, std::string_view chunk)
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            if (!isCurrent(gen))
                return;
            for (auto const& line: stderrLines.feed(chunk))
            {
                addLog(events, LogLevel::Warn, std::format("stderr: {}", line));
                emit(events, [line](ConnectionObserver& o, std::string_view id) { o.onStderr(id, line); });
            }
            if (stderrLines.takeDiscardedLines() > 0)
                addLog(events, LogLevel::Warn, "Discarded an overlong stderr line");
        }
        run(events);
    }

    void onExit(std::uint64_t gen, const ExitStatus& exitStatus)
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            if (!isCurrent(gen))
                return;

            addLog(events, LogLevel::Info, describeExit(exitStatus));
            emit(events, [exitStatus](ConnectionObserver& o, std::string_view id) { o.onExit(id, exitStatus); });
            failPending(events, connectionClosed());
            retireTransport();
            setStatus(events, ConnectionStatus::Disconnected);
            if (exitStatus.isFailure())
                scheduleReconnect(events);
        }
        run(events);
    }

    void onTransportError(std::uint64_t gen, const Error& error)
    {
        auto events = Events {};
        {
            auto const lock = std::lock_guard(mutex);
            if (!isCurrent(gen))
                return;

            addLog(events, LogLevel::Error, std::format("Process error: {}", error.message));
            lastError = error.message;
            failPending(events, connectionClosed());
            retireTransport();
            setStatus(events, ConnectionStatus::Error);
            scheduleReconnect(events);
        }
        run(events);
    }
};

Connection::Connection(ServerConfig config, ConnectionOptions options, TransportFactory transportFactory):
    _impl(std::make_unique<Impl>(std::move(config), std::move(options), std::move(transportFactory)))
{
}

Connection::~Connection()
{
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->destroying = true;
    }
    disconnect();
    _impl->timers.shutdown();
    _impl->reaper.shutdown();
}

auto Connection::connect() -> VoidResult
{
    auto promise = std::make_shared<std::promise<VoidResult>>();
    auto future = promise->get_future();
    connectAsync([promise](VoidResult result) { promise->set_value(std::move(result)); });
    return future.get();
}

void Connection::connectAsync(ConnectCallback done)
{
    auto events = Impl::Events {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        if (!_impl->transport && _impl->status != ConnectionStatus::Connecting
            && _impl->status != ConnectionStatus::Connected)
        {
            _impl->reconnectAttempts = 0;
            _impl->autoReconnect = _impl->options.reconnect.enabled;
        }
        _impl->beginConnect(events, std::move(done));
    }
    Impl::run(events);
}

void Connection::disconnect()
{
    auto events = Impl::Events {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->cancelReconnectTimer();
        _impl->reconnectAttempts = 0;
        _impl->autoReconnect = false;

        if (_impl->transport)
            _impl->addLog(events, LogLevel::Info, "Disconnecting from server");

        _impl->failPending(events, connectionClosed());
        _impl->retireTransport();
        _impl->setStatus(events, ConnectionStatus::Disconnected);
    }
    Impl::run(events);
}

auto Connection::request(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto promise = std::make_shared<std::promise<Result<nlohmann::json>>>();
    auto future = promise->get_future();
    sendRequestAsync(method, std::move(params), [promise](Result<nlohmann::json> result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

void Connection::sendRequestAsync(std::string_view method, nlohmann::json params, RequestCallback done)
{
    auto events = Impl::Events {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->sendRequestLocked(events, method, std::move(params), std::move(done));
    }
    Impl::run(events);
}

auto Connection::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->mutex);
    if (!_impl->transport)
        return makeError(ErrorCode::ConnectionClosed, "Not connected");
    return _impl->transport->write(jsonrpc::encode(jsonrpc::makeNotification(method, std::move(params))));
}

auto Connection::ping() -> Result<std::chrono::milliseconds>
{
    if (!isConnected())
        return makeError(ErrorCode::NotInitialized, "Not initialized");

    auto const start = std::chrono::steady_clock::now();
    return request("ping").transform([this, start](const nlohmann::json&) {
        auto const elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->latency = elapsed;
        return elapsed;
    });
}

void Connection::setReconnectPolicy(ReconnectPolicy policy)
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->options.reconnect = policy;
    _impl->autoReconnect = policy.enabled;
}

void Connection::cancelReconnect()
{
    auto events = Impl::Events {};
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->cancelReconnectTimer();
        _impl->reconnectAttempts = 0;
        if (_impl->status == ConnectionStatus::Reconnecting)
            _impl->setStatus(events, ConnectionStatus::Disconnected);
    }
    Impl::run(events);
}

void Connection::clearLogs()
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->logs.clear();
}

void Connection::addObserver(std::shared_ptr<ConnectionObserver> observer)
{
    auto const lock = std::lock_guard(_impl->mutex);
    _impl->observers.push_back(std::move(observer));
}

void Connection::removeObserver(const std::shared_ptr<ConnectionObserver>& observer)
{
    auto const lock = std::lock_guard(_impl->mutex);
    std::erase(_impl->observers, observer);
}

auto Connection::config() const -> const ServerConfig&
{
    return _impl->config;
}

auto Connection::options() const -> ConnectionOptions
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->options;
}

auto Connection::status() const -> ConnectionStatus
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->status;
}

auto Connection::isConnected() const -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->status == ConnectionStatus::Connected && _impl->initialized;
}

auto Connection::health() const -> ServerHealth
{
    auto const lock = std::lock_guard(_impl->mutex);
    auto result = ServerHealth {
        .status = _impl->status,
        .lastConnected = _impl->lastConnected,
        .lastError = _impl->lastError,
        .reconnectAttempts = _impl->reconnectAttempts,
        .uptime = std::nullopt,
        .latency = _impl->latency,
    };
    if (_impl->status == ConnectionStatus::Connected && _impl->connectedAt)
    {
        result.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                             - *_impl->connectedAt);
    }
    return result;
}

auto Connection::logs() const -> std::vector<LogEntry>
{
    auto const lock = std::lock_guard(_impl->mutex);
    return { _impl->logs.begin(), _impl->logs.end() };
}

auto Connection::capabilities() const -> nlohmann::json
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->serverCapabilities;
}

auto Connection::pendingRequestCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->pending.size();
}

auto Connection::reconnectScheduled() const -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->reconnectTimer.has_value();
}

} // namespace toolbridge
