// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolbridge
{

namespace
{

    /// @brief Grace period between SIGTERM and SIGKILL when terminating a child.
    constexpr auto TerminateGracePeriod = std::chrono::milliseconds(2000);
    constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief Builds the child environment: the current process environment overlaid by the config env.
    auto buildEnvironment(const std::map<std::string, std::string>& overlay) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overlay)
            merged[key] = value;

        auto envStrings = std::vector<std::string> {};
        envStrings.reserve(merged.size());
        for (const auto& [key, value]: merged)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

    auto toExitStatus(int status) -> ExitStatus
    {
        auto result = ExitStatus {};
        if (WIFEXITED(status))
            result.code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            result.signal = WTERMSIG(status);
        return result;
    }

} // namespace

struct StdioTransport::Impl
{
    // pidMutex guards childPid so that kill() never targets a reaped (and possibly reused) pid.
    std::mutex pidMutex;
    pid_t childPid = -1;

    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    int wakeRead = -1;
    int wakeWrite = -1;

    std::atomic<bool> running = false;
    std::atomic<bool> terminating = false;
    std::string command;
    TransportCallbacks callbacks;

    std::mutex writeMutex;
    std::condition_variable_any writeCv;
    std::deque<std::string> writeQueue;

    std::jthread reader;
    std::jthread writer;

    /// @brief Waits for the child to exit without reaping it, then reaps it under pidMutex.
    auto waitForExit() -> ExitStatus
    {
        auto info = siginfo_t {};
        while (::waitid(P_PID, static_cast<id_t>(childPid), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR)
        {
        }

        auto const lock = std::lock_guard(pidMutex);
        auto status = 0;
        while (::waitpid(childPid, &status, 0) < 0 && errno == EINTR)
        {
        }
        childPid = -1;
        return toExitStatus(status);
    }

    /// @brief Reaps a child that was asked to terminate, escalating to SIGKILL after the grace period.
    void reapTerminated()
    {
        auto const deadline = std::chrono::steady_clock::now() + TerminateGracePeriod;
        while (true)
        {
            {
                auto const lock = std::lock_guard(pidMutex);
                if (childPid <= 0)
                    return;

                auto status = 0;
                auto const rc = ::waitpid(childPid, &status, WNOHANG);
                if (rc == childPid || (rc < 0 && errno != EINTR))
                {
                    childPid = -1;
                    return;
                }

                if (std::chrono::steady_clock::now() >= deadline)
                {
                    log::warning("MCP server '{}' ignored SIGTERM, sending SIGKILL", command);
                    ::kill(childPid, SIGKILL);
                    while (::waitpid(childPid, &status, 0) < 0 && errno == EINTR)
                    {
                    }
                    childPid = -1;
                    return;
                }
            }
            std::this_thread::sleep_for(ReapPollInterval);
        }
    }

    void readLoop()
    {
        auto fds = std::array<pollfd, 3> { {
            { .fd = stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = stderrRead, .events = POLLIN, .revents = 0 },
            { .fd = wakeRead, .events = POLLIN, .revents = 0 },
        } };
        auto openStreams = 2;
        auto woken = false;
        auto buf = std::array<char, 4096> {};

        while (openStreams > 0 && !woken)
        {
            auto const rc = ::poll(fds.data(), fds.size(), -1);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                if (callbacks.onError)
                    callbacks.onError(Error { .code = ErrorCode::TransportError,
                                              .message = std::format("poll failed: {}", std::strerror(errno)) });
                break;
            }

            if (fds[2].revents != 0)
            {
                woken = true;
                break;
            }

            for (auto i = 0u; i < 2; ++i)
            {
                if (fds[i].fd < 0 || fds[i].revents == 0)
                    continue;

                auto const bytesRead = ::read(fds[i].fd, buf.data(), buf.size());
                if (bytesRead > 0)
                {
                    auto const chunk = std::string_view(buf.data(), static_cast<std::size_t>(bytesRead));
                    auto const& sink = (i == 0) ? callbacks.onStdout : callbacks.onStderr;
                    if (sink)
                        sink(chunk);
                }
                else if (bytesRead == 0 || (errno != EINTR && errno != EAGAIN))
                {
                    // poll() ignores negative descriptors; the fd itself is closed by the destructor.
                    fds[i].fd = -1;
                    --openStreams;
                }
            }
        }

        if (woken || terminating)
        {
            reapTerminated();
            running = false;
            return;
        }

        auto const status = waitForExit();
        running = false;
        if (terminating)
            return;

        log::debug("MCP server '{}' exited (code: {}, signal: {})",
                   command,
                   status.code ? std::to_string(*status.code) : "none",
                   status.signal ? std::to_string(*status.signal) : "none");
        if (callbacks.onExit)
            callbacks.onExit(status);
    }

    void writeLoop(const std::stop_token& stopToken)
    {
        // A child that closed its stdin must surface as EPIPE here, not kill the whole process.
        auto blocked = sigset_t {};
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &blocked, nullptr);

        while (!stopToken.stop_requested())
        {
            auto data = std::string {};
            {
                auto lock = std::unique_lock(writeMutex);
                writeCv.wait(lock, stopToken, [this] { return !writeQueue.empty(); });
                if (stopToken.stop_requested())
                    return;
                data = std::move(writeQueue.front());
                writeQueue.pop_front();
            }

            auto offset = std::size_t { 0 };
            while (offset < data.size())
            {
                auto const written = ::write(stdinWrite, data.data() + offset, data.size() - offset);
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    log::debug("MCP server '{}' stdin closed: {}", command, std::strerror(errno));
                    auto lock = std::lock_guard(writeMutex);
                    writeQueue.clear();
                    return;
                }
                offset += static_cast<std::size_t>(written);
            }
        }
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    terminate();

    if (_impl->reader.joinable())
        _impl->reader.join();
    if (_impl->writer.joinable())
    {
        _impl->writer.request_stop();
        _impl->writer.join();
    }

    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
    closeFd(_impl->wakeRead);
    closeFd(_impl->wakeWrite);
}

auto StdioTransport::start(const ServerConfig& config, TransportCallbacks callbacks) -> VoidResult
{
    if (_impl->running || _impl->reader.joinable())
        return makeError(ErrorCode::TransportError, "Transport already started");

    if (config.command.empty())
        return makeError(ErrorCode::SpawnError, "No command configured");

    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };
    auto stderrPipe = std::array<int, 2> { -1, -1 };
    auto wakePipe = std::array<int, 2> { -1, -1 };

    auto const closeAll = [&] {
        for (auto* p: { &stdinPipe, &stdoutPipe, &stderrPipe, &wakePipe })
        {
            closeFd((*p)[0]);
            closeFd((*p)[1]);
        }
    };

    // O_CLOEXEC keeps our pipe ends out of the child; dup2 clears it on the child's 0/1/2.
    if (::pipe2(stdinPipe.data(), O_CLOEXEC) != 0 || ::pipe2(stdoutPipe.data(), O_CLOEXEC) != 0
        || ::pipe2(stderrPipe.data(), O_CLOEXEC) != 0 || ::pipe2(wakePipe.data(), O_CLOEXEC) != 0)
    {
        auto const reason = std::strerror(errno);
        closeAll();
        return makeError(ErrorCode::SpawnError, std::format("Failed to create pipes: {}", reason));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closeAll();
        return makeError(ErrorCode::SpawnError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    {
        auto const lock = std::lock_guard(_impl->pidMutex);
        _impl->childPid = pid;
    }
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->wakeRead = wakePipe[0];
    _impl->wakeWrite = wakePipe[1];
    _impl->command = config.command;
    _impl->callbacks = std::move(callbacks);
    _impl->running = true;

    _impl->writer = std::jthread([this](const std::stop_token& token) { _impl->writeLoop(token); });
    _impl->reader = std::jthread([this] { _impl->readLoop(); });

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::write(std::string_view data) -> VoidResult
{
    if (!_impl->running)
        return makeError(ErrorCode::TransportError, "Transport not running");

    auto const lock = std::lock_guard(_impl->writeMutex);
    _impl->writeQueue.emplace_back(data);
    _impl->writeCv.notify_one();
    return {};
}

void StdioTransport::terminate()
{
    if (_impl->terminating.exchange(true))
        return;

    _impl->running = false;
    if (_impl->writer.joinable())
        _impl->writer.request_stop();

    {
        auto const lock = std::lock_guard(_impl->pidMutex);
        if (_impl->childPid > 0)
            ::kill(_impl->childPid, SIGTERM);
    }

    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const ignored = ::write(_impl->wakeWrite, &byte, 1);
    }

    log::debug("MCP transport terminated: {}", _impl->command);
}

auto StdioTransport::isRunning() const -> bool
{
    return _impl->running;
}

} // namespace toolbridge
