// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace toolbridge
{

/// @brief Callbacks through which a transport reports process activity.
///
/// All callbacks of one transport are invoked from a single thread, in the order the
/// corresponding events happened. No callback is invoked after the transport is destroyed.
struct TransportCallbacks
{
    std::function<void(std::string_view chunk)> onStdout;
    std::function<void(std::string_view chunk)> onStderr;
    std::function<void(const ExitStatus& status)> onExit;
    std::function<void(const Error& error)> onError;
};

/// @brief Abstract interface for the byte channel to one tool server process.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Launches the server process described by the config.
    /// @param config The server configuration (command, args, env overlay).
    /// @param callbacks Receivers for output, exit and runtime faults.
    /// @return Success or an ErrorCode::SpawnError.
    [[nodiscard]] virtual auto start(const ServerConfig& config, TransportCallbacks callbacks) -> VoidResult = 0;

    /// @brief Queues bytes for the process's stdin. Never blocks on the process.
    /// @param data The bytes to write.
    /// @return Success or an error if the transport is not running.
    [[nodiscard]] virtual auto write(std::string_view data) -> VoidResult = 0;

    /// @brief Asks the process to terminate. Safe to call from any thread, including callbacks.
    virtual void terminate() = 0;

    /// @brief Returns true between a successful start() and the process exit or terminate().
    [[nodiscard]] virtual auto isRunning() const -> bool = 0;
};

/// @brief Creates a fresh, unstarted transport for each connection attempt.
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace toolbridge
