// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Events.hpp>
#include <mcp/ServerProcess.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace toolbridge
{

class CapabilityEvolver;

/// Name of the meta-tool that creates a new tool server from source code.
constexpr auto AddCapabilityTool = std::string_view { "evolve_os_add_capability" };

/// Name of the meta-tool that installs a tool server fetched from a registry.
constexpr auto InstallCapabilityTool = std::string_view { "evolve_os_install_capability" };

/// @brief How much damage a tool call can do if it was not intended.
enum class RiskLevel
{
    Low,    ///< Read-only.
    Medium, ///< Mutating but recoverable.
    High,   ///< Destructive, or unknown.
};

[[nodiscard]] auto riskLevelName(RiskLevel level) -> std::string_view;

/// @brief A tool call waiting for the user's approval.
struct PendingConfirmation
{
    std::string toolName;
    nlohmann::json arguments;
    std::string description;
    RiskLevel riskLevel = RiskLevel::High;
    std::chrono::steady_clock::time_point createdAt;

    [[nodiscard]] auto isExpired(std::chrono::steady_clock::time_point now,
                                 std::chrono::steady_clock::duration maxAge) const -> bool
    {
        return now - createdAt > maxAge;
    }
};

/// @brief Record of one routed tool call.
struct ToolAuditEntry
{
    std::chrono::system_clock::time_point timestamp;
    std::string toolName;
    nlohmann::json arguments;
    bool success = false;
    uint64_t responseTimeMs = 0;
    std::optional<std::string> error;
    std::string serverName;
};

/// @brief Outcome of processing a batch of calls through the confirmation gate.
struct ConfirmationBatch
{
    std::vector<Result<std::string>> results; ///< One entry per call, in input order.
    std::vector<PendingConfirmation> pending; ///< Calls held back for approval.
};

struct ToolManagerConfig
{
    bool enabled = true;
    std::vector<ServerConfig> servers;
    std::filesystem::path runtimePath;
    std::chrono::milliseconds healthCheckInterval = std::chrono::seconds(60);
    size_t maxAuditEntries = 1000;
    size_t cacheCleanupThreshold = 100;

    /// @brief Options given to servers loaded from the dynamic directory or hot-loaded at runtime.
    ServerOptions dynamicServerOptions {};
};

/// @brief Routes tool calls to a fleet of tool servers.
///
/// Owns every ServerProcess, aggregates their tools, and adds a result cache, an
/// audit log, a confirmation gate and a background health monitor that restarts
/// servers whose liveness probe fails. All public methods are thread-safe; calls to
/// different servers never wait on each other.
class ToolManager
{
  public:
    /// @param config Servers and policy.
    /// @param events Optional sink for ToolCalled and ServerRestarted events; must outlive the manager.
    /// @param factory Transport factory handed to every server.
    explicit ToolManager(ToolManagerConfig config,
                         EventSink* events = nullptr,
                         TransportFactory factory = stdioTransportFactory());
    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    /// @brief Starts the configured servers and previously installed dynamic servers,
    ///        then launches the health monitor.
    ///
    /// Individual server failures are logged, not returned.
    /// @return An IoError only if the dynamic server directory cannot be read.
    [[nodiscard]] auto startServers() -> VoidResult;

    /// @brief Starts one server and registers it, replacing any server of the same name.
    ///
    /// The server stays registered even when starting fails, so that it shows up in the
    /// status and the health monitor may restart it.
    [[nodiscard]] auto startServer(ServerConfig config) -> VoidResult;

    /// @brief Hot-loads a server with ToolManagerConfig::dynamicServerOptions and no confirmation list.
    [[nodiscard]] auto addDynamicServer(std::string_view name,
                                        std::string_view command,
                                        std::vector<std::string> args) -> VoidResult;

    /// @brief Directory that holds dynamically created tool servers, one per subdirectory.
    [[nodiscard]] auto dynamicServersPath() const -> std::filesystem::path;

    /// @brief Returns the tools of all Ready servers.
    [[nodiscard]] auto getAllTools() const -> std::vector<McpTool>;

    /// @brief Returns the first Ready server (in name order) that exposes @p toolName.
    [[nodiscard]] auto findToolServer(std::string_view toolName) const -> std::shared_ptr<ServerProcess>;

    /// @brief Returns the registered server with the given name.
    [[nodiscard]] auto server(std::string_view name) const -> std::shared_ptr<ServerProcess>;

    /// @brief Routes a call to the owning server, recording an audit entry and a ToolCalled event.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    /// @brief Like callTool(), but serves identical calls within @p ttl from a cache of formatted results.
    [[nodiscard]] auto callToolCached(std::string_view name,
                                      const nlohmann::json& arguments,
                                      std::chrono::milliseconds ttl) -> Result<std::string>;

    /// @brief Processes all calls concurrently. Results are in input order.
    [[nodiscard]] auto callToolsParallel(std::span<const ToolCall> calls) -> std::vector<Result<std::string>>;

    /// @brief Executes one parsed call, dispatching meta-tools to the capability evolver.
    /// @return The conversational result text.
    [[nodiscard]] auto processToolCall(const ToolCall& call) -> Result<std::string>;

    /// @brief Processes calls sequentially, holding back those that require confirmation.
    [[nodiscard]] auto processToolCallsWithConfirmation(std::span<const ToolCall> calls) -> ConfirmationBatch;

    /// @brief Returns true if the tool needs the user's approval. Unknown tools always do.
    [[nodiscard]] auto requiresConfirmation(std::string_view toolName) const -> bool;

    [[nodiscard]] static auto createPendingConfirmation(std::string_view toolName, const nlohmann::json& arguments)
        -> PendingConfirmation;

    [[nodiscard]] static auto assessRiskLevel(std::string_view toolName) -> RiskLevel;

    /// @brief Renders a call outcome as conversation text; errors become "Tool '<name>' error: ...".
    [[nodiscard]] static auto renderToolOutcome(std::string_view toolName, const Result<std::string>& outcome)
        -> std::string;

    /// @brief Returns the cache key of a call: name plus canonical JSON of the arguments.
    [[nodiscard]] static auto cacheKey(std::string_view toolName, const nlohmann::json& arguments) -> std::string;

    /// @brief Returns the tool definitions of the capability meta-tools.
    [[nodiscard]] static auto metaTools() -> std::vector<McpTool>;

    /// @brief Renders all Ready tools plus the meta-tools as a system prompt section.
    [[nodiscard]] auto getToolsPrompt() const -> std::string;

    /// @brief Returns up to @p limit audit entries, newest first.
    [[nodiscard]] auto getAuditLog(size_t limit) const -> std::vector<ToolAuditEntry>;

    void clearCache();

    /// @brief Stops and unregisters one server.
    [[nodiscard]] auto stopServer(std::string_view name) -> VoidResult;

    /// @brief Stops the health monitor and every server.
    void stopAll();

    /// @brief Runs one pass of the health monitor over all registered servers.
    void checkServerHealth();

    /// @brief Returns true if tool routing is enabled and at least one server is registered.
    [[nodiscard]] auto isActive() const -> bool;

    /// @brief Returns the state label of every registered server.
    [[nodiscard]] auto getStatus() const -> std::map<std::string, std::string>;

    [[nodiscard]] auto getHealthStats() const -> std::map<std::string, ServerHealth>;

    /// @brief Installs the collaborator that handles the capability meta-tools.
    /// @param evolver Must outlive the manager, or be reset to nullptr first.
    void setCapabilityEvolver(CapabilityEvolver* evolver);

    [[nodiscard]] auto config() const -> const ToolManagerConfig& { return _config; }

  private:
    struct CachedResult
    {
        std::string result;
        std::chrono::steady_clock::time_point expiresAt;
    };

    ToolManagerConfig _config;
    EventSink* _events;
    TransportFactory _factory;

    mutable std::mutex _serversMutex;
    std::map<std::string, std::shared_ptr<ServerProcess>, std::less<>> _servers;

    mutable std::mutex _cacheMutex;
    std::map<std::string, CachedResult> _cache;

    mutable std::mutex _auditMutex;
    std::deque<ToolAuditEntry> _auditLog;

    mutable std::mutex _evolverMutex;
    CapabilityEvolver* _evolver = nullptr;

    std::mutex _monitorMutex;
    std::condition_variable _monitorWakeup;
    bool _monitorStopping = false;
    std::thread _monitor;

    [[nodiscard]] auto snapshotServers() const -> std::vector<std::shared_ptr<ServerProcess>>;
    [[nodiscard]] auto resolveCommand(const std::string& command) const -> std::string;
    [[nodiscard]] auto resolveArgs(const std::vector<std::string>& args) const -> std::vector<std::string>;
    [[nodiscard]] auto loadDynamicServers() -> VoidResult;
    [[nodiscard]] auto evolveCapability(const ToolCall& call) -> Result<std::string>;

    void recordAudit(ToolAuditEntry entry);
    void publish(const SystemEvent& event);

    void startHealthMonitor();
    void stopHealthMonitor();
    void runHealthMonitor();
};

} // namespace toolbridge
