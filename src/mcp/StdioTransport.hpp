// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <memory>

namespace toolbridge
{

/// @brief Transport that communicates with a tool server via stdio pipes.
///
/// Spawns a child process with piped stdin/stdout/stderr. A reader thread polls stdout and
/// stderr and reports chunks, then the exit status once both streams close. A writer thread
/// drains queued stdin writes, so write() never blocks on a slow child.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto start(const ServerConfig& config, TransportCallbacks callbacks) -> VoidResult override;
    [[nodiscard]] auto write(std::string_view data) -> VoidResult override;
    void terminate() override;
    [[nodiscard]] auto isRunning() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
