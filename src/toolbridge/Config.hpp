// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ServerProcess.hpp>
#include <mcp/ToolManager.hpp>

#include <map>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Tool server section ("mcp" in the config file).
struct ToolsConfig
{
    bool enabled = true;
    int healthCheckIntervalSeconds = 60;
    int maxAuditEntries = 1000;

    /// @brief Lifetime of cached tool results; 0 disables the cache.
    int cacheTtlSeconds = 0;

    std::map<std::string, ServerConfig> servers;

    /// @brief Options for servers found in the dynamic directory ("dynamicServers").
    ServerOptions dynamicServerOptions;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Base directory for relative server paths and dynamic servers.
    /// Empty means the current working directory.
    std::string runtimePath;

    std::string logLevel = "info";
    ToolsConfig tools;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns $XDG_CONFIG_HOME/toolbridge or ~/.config/toolbridge.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the built-in tool configuration: the void-tools server below @p runtimePath.
[[nodiscard]] auto defaultToolsConfig(std::string_view runtimePath) -> ToolsConfig;

/// @brief Builds the manager configuration, falling back to defaultToolsConfig() when
///        tools are enabled but no server is configured.
[[nodiscard]] auto makeToolManagerConfig(const AppConfig& config) -> ToolManagerConfig;

} // namespace toolbridge
