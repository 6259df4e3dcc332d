// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Connection.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Process log level name, see log::levelFromString().
    std::string logLevel = "info";

    /// @brief Defaults applied to every server connection.
    ConnectionOptions connection;

    /// @brief Tool servers in declaration order.
    std::vector<ServerConfig> servers;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error and yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds the configuration from an already parsed JSON document.
///
/// Accepts the "servers" array as well as the legacy "mcpServers" object keyed by name.
/// Server environments are passed through sanitizeEnv().
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Drops environment entries a server must not receive.
///
/// Keys must match ^[A-Z_][A-Z0-9_]{0,127}$ and values must not exceed 2048 characters.
[[nodiscard]] auto sanitizeEnv(const std::map<std::string, std::string>& env) -> std::map<std::string, std::string>;

/// @brief Returns the server with the given id, or nullptr.
[[nodiscard]] auto findServer(const AppConfig& config, std::string_view id) -> const ServerConfig*;

/// @brief Returns the servers whose enabled flag is set, in declaration order.
[[nodiscard]] auto enabledServers(const AppConfig& config) -> std::vector<ServerConfig>;

} // namespace toolbridge
