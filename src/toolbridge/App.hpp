// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <toolbridge/Config.hpp>

#include <iosfwd>
#include <memory>
#include <string_view>

namespace toolbridge
{

/// @brief Command-line front end: wires the configuration, the registry and the tool layer together.
///
/// Every command returns a process exit code. Results go to the output stream, diagnostics to the
/// process log.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param output Where command results are written.
    explicit App(AppConfig config, std::ostream& output);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Prints the prompt-context document for all enabled servers.
    [[nodiscard]] auto describe() -> int;

    /// @brief Connects all enabled servers and prints their status snapshots as JSON.
    [[nodiscard]] auto status() -> int;

    /// @brief Calls one tool and prints its output.
    /// @param serverId The server to call.
    /// @param toolName The tool to invoke.
    /// @param argsJson The arguments as a JSON object text.
    [[nodiscard]] auto call(std::string_view serverId, std::string_view toolName, std::string_view argsJson) -> int;

    /// @brief Reads agent text and prints the tool calls it contains as JSON.
    /// @param input The agent text source.
    /// @param execute When set, runs the calls and prints their results keyed by "serverId:toolName".
    [[nodiscard]] auto parse(std::istream& input, bool execute) -> int;

    /// @brief Connects one server and prints its round-trip latency.
    [[nodiscard]] auto ping(std::string_view serverId) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
