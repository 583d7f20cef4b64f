// SPDX-License-Identifier: Apache-2.0
#include "ToolManager.hpp"

#include <agent/ToolFormatting.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/CapabilityEvolver.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <system_error>
#include <utility>

namespace toolbridge
{

namespace
{

    constexpr auto AddCapabilityDescription = std::string_view {
        "Add a new capability by creating a new tool server.\n"
        "IMPORTANT: The code MUST be a complete, runnable MCP server.\n"
        "For JavaScript, use '@modelcontextprotocol/sdk/server/index.js' and 'StdioServerTransport'.\n"
        "Example structure:\n"
        "const { Server } = require('@modelcontextprotocol/sdk/server/index.js');\n"
        "const { StdioServerTransport } = require('@modelcontextprotocol/sdk/server/stdio.js');\n"
        "const server = new Server({name: 'my-server', version: '1.0.0'}, {capabilities: {tools: {}}});\n"
        "// ... define tools ...\n"
        "const transport = new StdioServerTransport();\n"
        "server.connect(transport);"
    };

    auto elapsedMs(std::chrono::steady_clock::time_point since) -> uint64_t
    {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count());
    }

} // namespace

auto riskLevelName(RiskLevel level) -> std::string_view
{
    switch (level)
    {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
    }
    return "high";
}

ToolManager::ToolManager(ToolManagerConfig config, EventSink* events, TransportFactory factory):
    _config(std::move(config)), _events(events), _factory(std::move(factory))
{
}

ToolManager::~ToolManager()
{
    stopAll();
}

auto ToolManager::startServers() -> VoidResult
{
    if (!_config.enabled)
    {
        log::info("Tool servers are disabled in configuration");
        return {};
    }

    for (const auto& serverConfig: _config.servers)
    {
        if (auto started = startServer(serverConfig); !started)
            log::warning("Failed to start tool server '{}': {}", serverConfig.name, started.error().message);
    }

    auto dynamic = loadDynamicServers();
    startHealthMonitor();
    return dynamic;
}

auto ToolManager::startServer(ServerConfig config) -> VoidResult
{
    config.command = resolveCommand(config.command);
    config.args = resolveArgs(config.args);

    auto process = std::make_shared<ServerProcess>(std::move(config), _factory);

    auto replaced = std::shared_ptr<ServerProcess> {};
    {
        auto const lock = std::lock_guard { _serversMutex };
        auto& slot = _servers[process->name()];
        replaced = std::exchange(slot, process);
    }
    if (replaced)
    {
        log::info("Replacing tool server '{}'", replaced->name());
        replaced->stop();
    }

    return process->start();
}

auto ToolManager::addDynamicServer(std::string_view name, std::string_view command, std::vector<std::string> args)
    -> VoidResult
{
    return startServer(ServerConfig {
        .name = std::string(name),
        .command = std::string(command),
        .args = std::move(args),
        .env = {},
        .requiresConfirmation = {},
        .options = _config.dynamicServerOptions,
    });
}

auto ToolManager::dynamicServersPath() const -> std::filesystem::path
{
    return _config.runtimePath / "mcp-servers" / "dynamic";
}

auto ToolManager::loadDynamicServers() -> VoidResult
{
    auto const dir = dynamicServersPath();
    auto ec = std::error_code {};
    if (!std::filesystem::is_directory(dir, ec))
        return {};

    auto iterator = std::filesystem::directory_iterator(dir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot read dynamic server directory {}: {}", dir.string(), ec.message()));

    // Collected first so that servers start in a stable order.
    auto serverDirs = std::vector<std::filesystem::path> {};
    for (const auto& entry: iterator)
    {
        if (entry.is_directory(ec))
            serverDirs.push_back(entry.path());
    }
    std::ranges::sort(serverDirs);

    for (const auto& serverDir: serverDirs)
    {
        auto const name = serverDir.filename().string();
        auto command = std::string {};
        auto entrypoint = std::filesystem::path {};

        if (std::filesystem::exists(serverDir / "index.js", ec))
        {
            command = "node";
            entrypoint = serverDir / "index.js";
        }
        else if (std::filesystem::exists(serverDir / "server.py", ec))
        {
            command = "python3";
            entrypoint = serverDir / "server.py";
        }
        else
        {
            log::debug("Skipping {}: no index.js or server.py", serverDir.string());
            continue;
        }

        log::info("Loading dynamic tool server: {}", name);
        if (auto added = addDynamicServer(name, command, { entrypoint.string() }); !added)
            log::warning("Failed to load dynamic tool server '{}': {}", name, added.error().message);
    }

    return {};
}

auto ToolManager::resolveCommand(const std::string& command) const -> std::string
{
    if (command.starts_with('/') || command.find('/') == std::string::npos)
        return command;

    auto ec = std::error_code {};
    auto const fullPath = _config.runtimePath / command;
    if (std::filesystem::exists(fullPath, ec))
        return fullPath.string();

    return command;
}

auto ToolManager::resolveArgs(const std::vector<std::string>& args) const -> std::vector<std::string>
{
    auto resolved = std::vector<std::string> {};
    resolved.reserve(args.size());

    for (const auto& arg: args)
    {
        if (arg.find('/') != std::string::npos && !arg.starts_with('/') && !arg.starts_with("--"))
        {
            auto ec = std::error_code {};
            auto const fullPath = _config.runtimePath / arg;
            if (std::filesystem::exists(fullPath, ec) || std::filesystem::exists(fullPath.parent_path(), ec))
            {
                resolved.push_back(fullPath.string());
                continue;
            }
        }
        resolved.push_back(arg);
    }

    return resolved;
}

auto ToolManager::snapshotServers() const -> std::vector<std::shared_ptr<ServerProcess>>
{
    auto const lock = std::lock_guard { _serversMutex };
    auto servers = std::vector<std::shared_ptr<ServerProcess>> {};
    servers.reserve(_servers.size());
    for (const auto& [name, process]: _servers)
        servers.push_back(process);
    return servers;
}

auto ToolManager::getAllTools() const -> std::vector<McpTool>
{
    auto allTools = std::vector<McpTool> {};
    for (const auto& process: snapshotServers())
    {
        if (!process->state().isReady())
            continue;
        auto tools = process->tools();
        allTools.insert(allTools.end(), std::make_move_iterator(tools.begin()), std::make_move_iterator(tools.end()));
    }
    return allTools;
}

auto ToolManager::findToolServer(std::string_view toolName) const -> std::shared_ptr<ServerProcess>
{
    auto owner = std::shared_ptr<ServerProcess> {};
    for (const auto& process: snapshotServers())
    {
        if (!process->state().isReady())
            continue;

        auto const tools = process->tools();
        if (std::ranges::none_of(tools, [&](const McpTool& tool) { return tool.name == toolName; }))
            continue;

        if (!owner)
            owner = process;
        else
            log::warning("Tool '{}' is exposed by both '{}' and '{}'; using '{}'",
                         toolName,
                         owner->name(),
                         process->name(),
                         owner->name());
    }
    return owner;
}

auto ToolManager::server(std::string_view name) const -> std::shared_ptr<ServerProcess>
{
    auto const lock = std::lock_guard { _serversMutex };
    auto const it = _servers.find(name);
    return it != _servers.end() ? it->second : nullptr;
}

auto ToolManager::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto const startTime = std::chrono::steady_clock::now();

    auto process = findToolServer(name);
    if (!process)
        return makeError(ErrorCode::ToolNotFound, std::format("No server provides tool '{}'", name));

    auto result = process->callTool(name, arguments);
    auto const responseTimeMs = elapsedMs(startTime);
    if (!result)
        log::warning("Tool '{}' on '{}' failed: {}", name, process->name(), result.error().message);

    recordAudit(ToolAuditEntry {
        .timestamp = std::chrono::system_clock::now(),
        .toolName = std::string(name),
        .arguments = arguments,
        .success = result.has_value(),
        .responseTimeMs = responseTimeMs,
        .error = result ? std::nullopt : std::optional { result.error().message },
        .serverName = process->name(),
    });

    publish(ToolCalled {
        .toolName = std::string(name),
        .serverName = process->name(),
        .success = result.has_value(),
        .responseTimeMs = responseTimeMs,
    });

    return result;
}

auto ToolManager::callToolCached(std::string_view name,
                                 const nlohmann::json& arguments,
                                 std::chrono::milliseconds ttl) -> Result<std::string>
{
    auto const key = cacheKey(name, arguments);

    {
        auto const lock = std::lock_guard { _cacheMutex };
        auto const it = _cache.find(key);
        if (it != _cache.end() && it->second.expiresAt > std::chrono::steady_clock::now())
        {
            log::debug("Cache hit for tool '{}'", name);
            return it->second.result;
        }
    }

    auto result = callTool(name, arguments);
    if (!result)
        return std::unexpected(result.error());

    auto formatted = formatToolResult(name, *result);

    auto const lock = std::lock_guard { _cacheMutex };
    auto const now = std::chrono::steady_clock::now();
    _cache.insert_or_assign(key, CachedResult { .result = formatted, .expiresAt = now + ttl });

    if (_cache.size() > _config.cacheCleanupThreshold)
        std::erase_if(_cache, [now](const auto& entry) { return entry.second.expiresAt <= now; });

    return formatted;
}

auto ToolManager::callToolsParallel(std::span<const ToolCall> calls) -> std::vector<Result<std::string>>
{
    auto results = std::vector<Result<std::string>>(calls.size(), makeError(ErrorCode::Unknown, "Not executed"));

    auto workers = std::vector<std::thread> {};
    workers.reserve(calls.size());
    for (size_t i = 0; i < calls.size(); ++i)
        workers.emplace_back([this, &calls, &results, i] { results[i] = processToolCall(calls[i]); });

    for (auto& worker: workers)
        worker.join();

    return results;
}

auto ToolManager::processToolCall(const ToolCall& call) -> Result<std::string>
{
    log::info("Processing tool call: {} {}", call.name, call.arguments.dump());

    if (call.name == AddCapabilityTool || call.name == InstallCapabilityTool)
        return evolveCapability(call);

    return callTool(call.name, call.arguments).transform([&](const ToolResult& result) {
        return formatToolResult(call.name, result);
    });
}

auto ToolManager::evolveCapability(const ToolCall& call) -> Result<std::string>
{
    auto name = json::getString(call.arguments, "name");
    if (!name)
        return makeError(ErrorCode::InvalidArgument, "Missing 'name' argument");
    auto language = json::getString(call.arguments, "language");
    if (!language)
        return makeError(ErrorCode::InvalidArgument, "Missing 'language' argument");
    auto code = json::getString(call.arguments, "code");
    if (!code)
        return makeError(ErrorCode::InvalidArgument, "Missing 'code' argument");

    auto const lock = std::lock_guard { _evolverMutex };
    if (!_evolver)
        return makeError(ErrorCode::EvolutionError, "Capability evolution is not available");

    return _evolver->createServer(*name, *language, *code);
}

auto ToolManager::processToolCallsWithConfirmation(std::span<const ToolCall> calls) -> ConfirmationBatch
{
    auto batch = ConfirmationBatch {};

    for (const auto& call: calls)
    {
        if (requiresConfirmation(call.name))
        {
            batch.pending.push_back(createPendingConfirmation(call.name, call.arguments));
            batch.results.emplace_back(std::format("Tool '{}' requires confirmation before execution.", call.name));
        }
        else
        {
            batch.results.push_back(processToolCall(call));
        }
    }

    return batch;
}

auto ToolManager::requiresConfirmation(std::string_view toolName) const -> bool
{
    if (auto process = findToolServer(toolName))
        return process->requiresConfirmation(toolName);
    return true;
}

auto ToolManager::createPendingConfirmation(std::string_view toolName, const nlohmann::json& arguments)
    -> PendingConfirmation
{
    auto description = std::string {};
    if (toolName == "xbps_install")
        description = std::format("Install package: {}", json::getStringOr(arguments, "package", "unknown"));
    else if (toolName == "xbps_remove")
        description = std::format("Remove package: {}", json::getStringOr(arguments, "package", "unknown"));
    else if (toolName == "service_control")
        description = std::format("{} service: {}",
                                  json::getStringOr(arguments, "action", "control"),
                                  json::getStringOr(arguments, "service", "unknown"));
    else
        description = std::format("Execute tool '{}' with arguments", toolName);

    return PendingConfirmation {
        .toolName = std::string(toolName),
        .arguments = arguments,
        .description = std::move(description),
        .riskLevel = assessRiskLevel(toolName),
        .createdAt = std::chrono::steady_clock::now(),
    };
}

auto ToolManager::assessRiskLevel(std::string_view toolName) -> RiskLevel
{
    if (toolName == "xbps_search" || toolName == "xbps_info" || toolName == "service_status"
        || toolName == "system_info")
        return RiskLevel::Low;

    if (toolName == "xbps_install" || toolName == "service_control")
        return RiskLevel::Medium;

    return RiskLevel::High;
}

auto ToolManager::renderToolOutcome(std::string_view toolName, const Result<std::string>& outcome) -> std::string
{
    if (outcome)
        return *outcome;
    return std::format("Tool '{}' error: {}", toolName, outcome.error().message);
}

auto ToolManager::cacheKey(std::string_view toolName, const nlohmann::json& arguments) -> std::string
{
    return std::format("{}:{}", toolName, json::canonicalDump(arguments));
}

auto ToolManager::metaTools() -> std::vector<McpTool>
{
    return {
        McpTool {
            .name = std::string(AddCapabilityTool),
            .description = std::string(AddCapabilityDescription),
            .inputSchema = {
                { "type", "object" },
                { "properties",
                  {
                      { "name",
                        { { "type", "string" },
                          { "description", "Short name for the new capability (e.g. 'weather-tools')" } } },
                      { "language",
                        { { "type", "string" },
                          { "enum", { "javascript", "python" } },
                          { "description", "Language to use for the server" } } },
                      { "code",
                        { { "type", "string" },
                          { "description",
                            "Complete source code for the MCP server. Must implement the Model Context Protocol SDK." } } },
                  } },
                { "required", { "name", "language", "code" } },
            },
        },
        McpTool {
            .name = std::string(InstallCapabilityTool),
            .description = "Install a capability discovered on the global registry.",
            .inputSchema = {
                { "type", "object" },
                { "properties",
                  {
                      { "name", { { "type", "string" } } },
                      { "language", { { "type", "string" } } },
                      { "code", { { "type", "string" } } },
                  } },
                { "required", { "name", "language", "code" } },
            },
        },
    };
}

auto ToolManager::getToolsPrompt() const -> std::string
{
    auto tools = getAllTools();
    auto meta = metaTools();
    tools.insert(tools.end(), std::make_move_iterator(meta.begin()), std::make_move_iterator(meta.end()));
    return formatToolsForPrompt(tools);
}

void ToolManager::recordAudit(ToolAuditEntry entry)
{
    auto const lock = std::lock_guard { _auditMutex };
    _auditLog.push_back(std::move(entry));
    while (_auditLog.size() > _config.maxAuditEntries)
        _auditLog.pop_front();
}

auto ToolManager::getAuditLog(size_t limit) const -> std::vector<ToolAuditEntry>
{
    auto const lock = std::lock_guard { _auditMutex };
    auto const count = std::min(limit, _auditLog.size());
    return std::vector<ToolAuditEntry>(_auditLog.rbegin(), _auditLog.rbegin() + static_cast<std::ptrdiff_t>(count));
}

void ToolManager::clearCache()
{
    auto const lock = std::lock_guard { _cacheMutex };
    _cache.clear();
}

auto ToolManager::stopServer(std::string_view name) -> VoidResult
{
    auto process = std::shared_ptr<ServerProcess> {};
    {
        auto const lock = std::lock_guard { _serversMutex };
        auto const it = _servers.find(name);
        if (it == _servers.end())
            return makeError(ErrorCode::InvalidArgument, std::format("Unknown tool server '{}'", name));
        process = std::move(it->second);
        _servers.erase(it);
    }

    process->stop();
    log::info("Stopped tool server '{}'", name);
    return {};
}

void ToolManager::stopAll()
{
    stopHealthMonitor();

    auto servers = decltype(_servers) {};
    {
        auto const lock = std::lock_guard { _serversMutex };
        servers.swap(_servers);
    }

    for (auto& [name, process]: servers)
    {
        log::debug("Stopping tool server '{}'", name);
        process->stop();
    }
}

auto ToolManager::isActive() const -> bool
{
    if (!_config.enabled)
        return false;

    auto const lock = std::lock_guard { _serversMutex };
    return !_servers.empty();
}

auto ToolManager::getStatus() const -> std::map<std::string, std::string>
{
    auto status = std::map<std::string, std::string> {};
    for (const auto& process: snapshotServers())
        status.emplace(process->name(), std::string(stateLabel(process->state().kind)));
    return status;
}

auto ToolManager::getHealthStats() const -> std::map<std::string, ServerHealth>
{
    auto stats = std::map<std::string, ServerHealth> {};
    for (const auto& process: snapshotServers())
        stats.emplace(process->name(), process->health());
    return stats;
}

void ToolManager::setCapabilityEvolver(CapabilityEvolver* evolver)
{
    auto const lock = std::lock_guard { _evolverMutex };
    _evolver = evolver;
}

void ToolManager::publish(const SystemEvent& event)
{
    if (_events)
        _events->publish(event);
}

void ToolManager::checkServerHealth()
{
    for (const auto& process: snapshotServers())
    {
        // Servers in the middle of a start or restart are left alone.
        auto const kind = process->state().kind;
        if (kind == ServerState::Kind::Stopped || kind == ServerState::Kind::Starting
            || kind == ServerState::Kind::Restarting || process->healthCheck())
            continue;

        log::warning("[{}] Health check failed, attempting restart", process->name());
        auto restarted = process->restartIfNeeded();
        if (!restarted)
        {
            log::warning("[{}] Failed to restart: {}", process->name(), restarted.error().message);
            continue;
        }

        if (*restarted)
        {
            log::info("[{}] Server restarted successfully", process->name());
            publish(ServerRestarted { .name = process->name() });
        }
    }
}

void ToolManager::startHealthMonitor()
{
    auto const lock = std::lock_guard { _monitorMutex };
    if (_monitor.joinable())
        return;

    _monitorStopping = false;
    _monitor = std::thread([this] { runHealthMonitor(); });
}

void ToolManager::stopHealthMonitor()
{
    {
        auto const lock = std::lock_guard { _monitorMutex };
        if (!_monitor.joinable())
            return;
        _monitorStopping = true;
    }
    _monitorWakeup.notify_all();
    _monitor.join();
}

void ToolManager::runHealthMonitor()
{
    auto lock = std::unique_lock { _monitorMutex };
    while (!_monitorStopping)
    {
        if (_monitorWakeup.wait_for(lock, _config.healthCheckInterval, [this] { return _monitorStopping; }))
            break;

        lock.unlock();
        checkServerHealth();
        lock.lock();
    }
}

} // namespace toolbridge
