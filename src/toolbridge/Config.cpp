// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>

namespace toolbridge
{

namespace
{

    constexpr auto MaxEnvValueLength = std::size_t { 2048 };

    auto const EnvKeyPattern = std::regex(R"(^[A-Z_][A-Z0-9_]{0,127}$)");

    auto parseServer(std::string id, const nlohmann::json& serverJson) -> Result<ServerConfig>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' is not an object", id));

        if (id.empty())
            return makeError(ErrorCode::ConfigError, "Server entry without an id");

        auto server = ServerConfig {
            .id = id,
            .name = json::getStringOr(serverJson, "name", id),
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = sanitizeEnv(json::getStringMap(serverJson, "env")),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .policy = {},
        };

        if (server.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", id));

        if (serverJson.contains("policy") && serverJson["policy"].is_object())
        {
            auto const& policy = serverJson["policy"];
            server.policy.commandAllowlist = json::getStringArray(policy, "commandAllowlist");
            server.policy.toolAllowlist = json::getStringArray(policy, "toolAllowlist");
            if (policy.contains("timeoutMs"))
            {
                auto const timeoutMs = json::getIntOr(policy, "timeoutMs", 0);
                if (timeoutMs <= 0)
                    return makeError(ErrorCode::ConfigError,
                                     std::format("Server '{}' has an invalid policy.timeoutMs", id));
                server.policy.timeoutMs = timeoutMs;
            }
        }

        return server;
    }

    auto parseConnection(const nlohmann::json& connection, ConnectionOptions& options) -> VoidResult
    {
        auto const timeoutMs = json::getIntOr(connection, "requestTimeoutMs", 30000);
        if (timeoutMs <= 0)
            return makeError(ErrorCode::ConfigError, "connection.requestTimeoutMs must be positive");
        options.requestTimeout = std::chrono::milliseconds(timeoutMs);

        auto const maxLogEntries = json::getIntOr(connection, "maxLogEntries", 100);
        if (maxLogEntries <= 0)
            return makeError(ErrorCode::ConfigError, "connection.maxLogEntries must be positive");
        options.maxLogEntries = static_cast<std::size_t>(maxLogEntries);

        options.clientName = json::getStringOr(connection, "clientName", options.clientName);
        options.clientVersion = json::getStringOr(connection, "clientVersion", options.clientVersion);
        options.protocolVersion = json::getStringOr(connection, "protocolVersion", options.protocolVersion);

        if (connection.contains("reconnect"))
        {
            auto const& reconnect = connection["reconnect"];
            options.reconnect.enabled = json::getBoolOr(reconnect, "enabled", true);
            options.reconnect.maxAttempts = json::getIntOr(reconnect, "maxAttempts", 5);
            auto const baseDelayMs = json::getIntOr(reconnect, "baseDelayMs", 2000);
            if (options.reconnect.maxAttempts < 0 || baseDelayMs < 0)
                return makeError(ErrorCode::ConfigError, "connection.reconnect values must not be negative");
            options.reconnect.baseDelay = std::chrono::milliseconds(baseDelayMs);
        }

        return {};
    }

    auto stringsToJson(const std::vector<std::string>& values) -> nlohmann::json
    {
        auto array = nlohmann::json::array();
        for (const auto& value: values)
            array.push_back(value);
        return array;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/toolbridge";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/toolbridge";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto sanitizeEnv(const std::map<std::string, std::string>& env) -> std::map<std::string, std::string>
{
    auto sanitized = std::map<std::string, std::string> {};
    for (const auto& [key, value]: env)
    {
        if (!std::regex_match(key, EnvKeyPattern))
        {
            log::warning("Dropping environment variable with invalid name: {}", key);
            continue;
        }
        if (value.size() > MaxEnvValueLength)
        {
            log::warning("Dropping environment variable {}: value exceeds {} characters", key, MaxEnvValueLength);
            continue;
        }
        sanitized.emplace(key, value);
    }
    return sanitized;
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    config.logLevel = json::getStringOr(root, "logLevel", "info");
    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.logLevel));

    // Connection section
    if (root.contains("connection"))
    {
        if (auto parsed = parseConnection(root["connection"], config.connection); !parsed)
            return std::unexpected(parsed.error());
    }

    // Servers section
    if (root.contains("servers") && root["servers"].is_array())
    {
        for (const auto& serverJson: root["servers"])
        {
            auto server = parseServer(json::getStringOr(serverJson, "id", ""), serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }

    // Legacy MCP servers section, keyed by name
    if (root.contains("mcpServers") && root["mcpServers"].is_object())
    {
        for (const auto& [name, serverJson]: root["mcpServers"].items())
        {
            auto server = parseServer(name, serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }

    auto ids = std::set<std::string> {};
    for (const auto& server: config.servers)
    {
        if (!ids.insert(server.id).second)
            return makeError(ErrorCode::ConfigError, std::format("Duplicate server id: {}", server.id));
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    return json::parse(ss.str())
        .transform_error([path](Error error) {
            error.code = ErrorCode::ConfigError;
            error.message = std::format("{}: {}", path, error.message);
            return error;
        })
        .and_then([](const nlohmann::json& root) { return parseConfig(root); });
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = config.logLevel;

    // Connection section
    auto const& options = config.connection;
    root["connection"] = nlohmann::json {
        { "requestTimeoutMs", options.requestTimeout.count() },
        { "maxLogEntries", options.maxLogEntries },
        { "clientName", options.clientName },
        { "clientVersion", options.clientVersion },
        { "protocolVersion", options.protocolVersion },
        { "reconnect",
          {
              { "enabled", options.reconnect.enabled },
              { "maxAttempts", options.reconnect.maxAttempts },
              { "baseDelayMs", options.reconnect.baseDelay.count() },
          } },
    };

    // Servers section
    auto servers = nlohmann::json::array();
    for (const auto& serverConfig: config.servers)
    {
        auto server = nlohmann::json::object();
        server["id"] = serverConfig.id;
        server["name"] = serverConfig.name;
        server["command"] = serverConfig.command;
        if (!serverConfig.args.empty())
            server["args"] = stringsToJson(serverConfig.args);
        if (!serverConfig.env.empty())
        {
            auto env = nlohmann::json::object();
            for (const auto& [key, value]: serverConfig.env)
                env[key] = value;
            server["env"] = std::move(env);
        }
        server["enabled"] = serverConfig.enabled;

        auto const& policy = serverConfig.policy;
        if (!policy.commandAllowlist.empty() || !policy.toolAllowlist.empty() || policy.timeoutMs)
        {
            auto policyJson = nlohmann::json::object();
            policyJson["commandAllowlist"] = stringsToJson(policy.commandAllowlist);
            policyJson["toolAllowlist"] = stringsToJson(policy.toolAllowlist);
            if (policy.timeoutMs)
                policyJson["timeoutMs"] = *policy.timeoutMs;
            server["policy"] = std::move(policyJson);
        }
        servers.push_back(std::move(server));
    }
    root["servers"] = std::move(servers);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto findServer(const AppConfig& config, std::string_view id) -> const ServerConfig*
{
    auto const it = std::ranges::find_if(config.servers, [id](const ServerConfig& server) { return server.id == id; });
    return it == config.servers.end() ? nullptr : &*it;
}

auto enabledServers(const AppConfig& config) -> std::vector<ServerConfig>
{
    auto result = std::vector<ServerConfig> {};
    std::ranges::copy_if(config.servers, std::back_inserter(result), &ServerConfig::enabled);
    return result;
}

} // namespace toolbridge
