// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolbridge/App.hpp>
#include <toolbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolbridge - MCP tool server client and connection manager" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* describeCommand = app.add_subcommand("describe", "Print the tool catalogue of all enabled servers");
    auto* statusCommand = app.add_subcommand("status", "Connect all enabled servers and print their status");

    auto* callCommand = app.add_subcommand("call", "Call a tool on a server");
    auto callServer = std::string {};
    auto callTool = std::string {};
    auto callArgs = std::string { "{}" };
    callCommand->add_option("server", callServer, "Server id")->required();
    callCommand->add_option("tool", callTool, "Tool name")->required();
    callCommand->add_option("--args", callArgs, "Tool arguments as a JSON object");

    auto* parseCommand = app.add_subcommand("parse", "Extract tool calls from agent text on stdin");
    auto execute = false;
    parseCommand->add_flag("--execute", execute, "Run the extracted calls and print their results");

    auto* pingCommand = app.add_subcommand("ping", "Measure the round-trip time to a server");
    auto pingServer = std::string {};
    pingCommand->add_option("server", pingServer, "Server id")->required();

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? toolbridge::loadConfig() : toolbridge::loadConfigFromFile(configPath);

    if (!configResult)
    {
        toolbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (verbose)
        toolbridge::log::setLevel(toolbridge::log::Level::Debug);
    else if (auto const level = toolbridge::log::levelFromString(config.logLevel))
        toolbridge::log::setLevel(*level);

    auto application = toolbridge::App(std::move(config), std::cout);

    if (*describeCommand)
        return application.describe();
    if (*statusCommand)
        return application.status();
    if (*callCommand)
        return application.call(callServer, callTool, callArgs);
    if (*parseCommand)
        return application.parse(std::cin, execute);
    if (*pingCommand)
        return application.ping(pingServer);

    return 1;
}
