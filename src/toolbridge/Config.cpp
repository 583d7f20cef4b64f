// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace toolbridge
{

namespace
{

    auto parseServerOptions(const nlohmann::json& optionsJson) -> ServerOptions
    {
        auto const defaults = ServerOptions {};
        auto const seconds = [&](std::string_view key, std::chrono::milliseconds fallback) {
            auto const fallbackSeconds = std::chrono::duration_cast<std::chrono::seconds>(fallback).count();
            return std::chrono::milliseconds(
                std::chrono::seconds(json::getIntOr(optionsJson, key, static_cast<int>(fallbackSeconds))));
        };

        return ServerOptions {
            .toolTimeout = seconds("toolTimeoutSeconds", defaults.toolTimeout),
            .initTimeout = seconds("initTimeoutSeconds", defaults.initTimeout),
            .healthCheckTimeout = defaults.healthCheckTimeout,
            .restartDelay = std::chrono::milliseconds(
                json::getIntOr(optionsJson, "restartDelayMs", static_cast<int>(defaults.restartDelay.count()))),
            .maxRestartAttempts = static_cast<size_t>(std::max(
                0, json::getIntOr(optionsJson, "maxRestartAttempts", static_cast<int>(defaults.maxRestartAttempts)))),
            .requestQueueCapacity = defaults.requestQueueCapacity,
        };
    }

    void writeServerOptions(nlohmann::json& target, const ServerOptions& options)
    {
        target["toolTimeoutSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(options.toolTimeout).count();
        target["initTimeoutSeconds"] = std::chrono::duration_cast<std::chrono::seconds>(options.initTimeout).count();
        target["maxRestartAttempts"] = options.maxRestartAttempts;
        target["restartDelayMs"] = options.restartDelay.count();
    }

    auto parseServer(const std::string& name, const nlohmann::json& serverJson) -> ServerConfig
    {
        auto serverConfig = ServerConfig {
            .name = name,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = {},
            .requiresConfirmation = json::getStringArray(serverJson, "requiresConfirmation"),
            .options = parseServerOptions(serverJson),
        };

        if (serverJson.contains("env") && serverJson["env"].is_object())
        {
            for (const auto& [key, value]: serverJson["env"].items())
            {
                if (value.is_string())
                    serverConfig.env[key] = value.get<std::string>();
            }
        }

        return serverConfig;
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

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));

    auto config = AppConfig {};
    config.runtimePath = json::getStringOr(root, "runtimePath", "");
    config.logLevel = json::getStringOr(root, "logLevel", "info");

    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logLevel));

    // Tool servers section
    if (root.contains("mcp") && root["mcp"].is_object())
    {
        auto const& mcp = root["mcp"];
        config.tools.enabled = json::getBoolOr(mcp, "enabled", true);
        config.tools.healthCheckIntervalSeconds = json::getIntOr(mcp, "healthCheckIntervalSeconds", 60);
        config.tools.maxAuditEntries = json::getIntOr(mcp, "maxAuditEntries", 1000);
        config.tools.cacheTtlSeconds = json::getIntOr(mcp, "cacheTtlSeconds", 0);

        if (config.tools.healthCheckIntervalSeconds <= 0)
            return makeError(ErrorCode::ConfigError, "mcp.healthCheckIntervalSeconds must be positive");

        if (mcp.contains("servers") && mcp["servers"].is_object())
        {
            for (const auto& [name, serverJson]: mcp["servers"].items())
            {
                auto serverConfig = parseServer(name, serverJson);
                if (serverConfig.command.empty())
                    return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", name));
                config.tools.servers[name] = std::move(serverConfig);
            }
        }

        if (mcp.contains("dynamicServers") && mcp["dynamicServers"].is_object())
            config.tools.dynamicServerOptions = parseServerOptions(mcp["dynamicServers"]);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    if (!config.runtimePath.empty())
        root["runtimePath"] = config.runtimePath;
    root["logLevel"] = config.logLevel;

    auto mcp = nlohmann::json::object();
    mcp["enabled"] = config.tools.enabled;
    mcp["healthCheckIntervalSeconds"] = config.tools.healthCheckIntervalSeconds;
    mcp["maxAuditEntries"] = config.tools.maxAuditEntries;
    mcp["cacheTtlSeconds"] = config.tools.cacheTtlSeconds;

    auto servers = nlohmann::json::object();
    for (const auto& [name, serverConfig]: config.tools.servers)
    {
        auto server = nlohmann::json::object();
        server["command"] = serverConfig.command;
        if (!serverConfig.args.empty())
            server["args"] = serverConfig.args;
        if (!serverConfig.env.empty())
            server["env"] = serverConfig.env;
        if (!serverConfig.requiresConfirmation.empty())
            server["requiresConfirmation"] = serverConfig.requiresConfirmation;

        writeServerOptions(server, serverConfig.options);
        servers[name] = std::move(server);
    }
    mcp["servers"] = std::move(servers);

    auto dynamicServers = nlohmann::json::object();
    writeServerOptions(dynamicServers, config.tools.dynamicServerOptions);
    mcp["dynamicServers"] = std::move(dynamicServers);
    root["mcp"] = std::move(mcp);

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

auto defaultToolsConfig(std::string_view runtimePath) -> ToolsConfig
{
    auto tools = ToolsConfig {};
    tools.servers["void-tools"] = ServerConfig {
        .name = "void-tools",
        .command = "python3",
        .args = { std::format("{}/mcp-servers/void-tools/void_tools.py", runtimePath) },
        .env = {},
        .requiresConfirmation = { "xbps_install", "xbps_remove", "service_control" },
        .options = {},
    };
    return tools;
}

auto makeToolManagerConfig(const AppConfig& config) -> ToolManagerConfig
{
    auto runtimePath = std::filesystem::path(config.runtimePath);
    if (runtimePath.empty())
    {
        auto ec = std::error_code {};
        runtimePath = std::filesystem::current_path(ec);
        if (ec)
            runtimePath = ".";
    }

    auto managerConfig = ToolManagerConfig {
        .enabled = config.tools.enabled,
        .servers = {},
        .runtimePath = runtimePath,
        .healthCheckInterval = std::chrono::seconds(config.tools.healthCheckIntervalSeconds),
        .maxAuditEntries = static_cast<size_t>(std::max(1, config.tools.maxAuditEntries)),
        .cacheCleanupThreshold = ToolManagerConfig {}.cacheCleanupThreshold,
        .dynamicServerOptions = config.tools.dynamicServerOptions,
    };

    auto const& servers = config.tools.enabled && config.tools.servers.empty()
                              ? defaultToolsConfig(runtimePath.string()).servers
                              : config.tools.servers;
    for (const auto& [name, serverConfig]: servers)
        managerConfig.servers.push_back(serverConfig);

    return managerConfig;
}

} // namespace toolbridge
