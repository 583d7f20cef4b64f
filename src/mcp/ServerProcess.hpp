// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief Timeouts and restart policy for one tool server.
struct ServerOptions
{
    std::chrono::milliseconds toolTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds initTimeout = std::chrono::seconds(60);
    std::chrono::milliseconds healthCheckTimeout = std::chrono::seconds(5);
    std::chrono::milliseconds restartDelay = std::chrono::seconds(1);
    size_t maxRestartAttempts = 3;
    size_t requestQueueCapacity = 32;
};

/// @brief Launch description of a tool server. Immutable once the server exists.
struct ServerConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> requiresConfirmation;
    ServerOptions options;
};

/// @brief Lifecycle state of a tool server.
struct ServerState
{
    enum class Kind
    {
        Stopped,
        Starting,
        Ready,
        Failed,
        Restarting,
    };

    Kind kind = Kind::Stopped;
    std::string reason; ///< Set only for Kind::Failed.

    [[nodiscard]] static auto failed(std::string reason) -> ServerState
    {
        return ServerState { .kind = Kind::Failed, .reason = std::move(reason) };
    }

    [[nodiscard]] auto isReady() const -> bool { return kind == Kind::Ready; }

    auto operator==(const ServerState&) const -> bool = default;
};

/// @brief Returns the lower-case label of a state kind ("ready", "failed", ...).
[[nodiscard]] auto stateLabel(ServerState::Kind kind) -> std::string_view;

/// @brief Rolling request statistics of a tool server.
struct ServerHealth
{
    uint64_t requestsSucceeded = 0;
    uint64_t requestsFailed = 0;
    uint64_t restartCount = 0;
    std::optional<std::chrono::steady_clock::time_point> lastSuccess;
    std::optional<std::string> lastError;
    double averageResponseMs = 0.0;
};

/// @brief Creates and connects the transport for a freshly started server.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerConfig& config)>;

/// @brief Returns the factory that spawns the configured command over stdio pipes.
[[nodiscard]] auto stdioTransportFactory() -> TransportFactory;

/// @brief Owns one tool server subprocess and its JSON-RPC session.
///
/// Three threads serve a running session: a stdout reader that correlates
/// responses to pending requests by id, a stderr reader that logs diagnostics, and
/// a stdin writer that drains the outbound request queue. Any number of caller
/// threads may issue requests concurrently; each request owns its own id,
/// response channel and timeout.
///
/// Lifecycle methods (start, stop, restartIfNeeded) are serialized per instance.
class ServerProcess
{
  public:
    /// @brief Creates a stopped server.
    /// @param config The launch configuration.
    /// @param factory Transport factory; defaults to spawning the command over stdio.
    explicit ServerProcess(ServerConfig config, TransportFactory factory = stdioTransportFactory());
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /// @brief Spawns the server, performs the initialize handshake and loads its tools.
    /// @return Success once the server is Ready; otherwise the server is Failed.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Terminates the server process and drops all queued requests.
    void stop();

    /// @brief Sends a request and waits for its response.
    /// @param method The JSON-RPC method.
    /// @param params The request parameters (may be null).
    /// @param timeout Upper bound for enqueueing plus waiting for the reply.
    /// @return The parsed response (which may carry an RPC error) or a transport-level error.
    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<jsonrpc::Response>;

    /// @brief Calls a tool with the configured tool timeout.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;

    /// @brief Calls a tool with an explicit timeout.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<ToolResult>;

    /// @brief Re-fetches the tool list via `tools/list`.
    [[nodiscard]] auto refreshTools() -> VoidResult;

    /// @brief Liveness probe: a `tools/list` round trip under the health-check timeout.
    /// @return false on any error, timeout, or when the server is not Ready.
    [[nodiscard]] auto healthCheck() -> bool;

    /// @brief Restarts the server when its health check fails.
    /// @return true if a restart happened, false if the server was healthy, or an error
    ///         when the restart failed or the attempt budget is exhausted.
    [[nodiscard]] auto restartIfNeeded() -> Result<bool>;

    /// @brief Returns true if the tool is on this server's confirmation list.
    [[nodiscard]] auto requiresConfirmation(std::string_view toolName) const -> bool;

    [[nodiscard]] auto name() const -> const std::string& { return _config.name; }
    [[nodiscard]] auto config() const -> const ServerConfig& { return _config; }
    [[nodiscard]] auto state() const -> ServerState;
    [[nodiscard]] auto tools() const -> std::vector<McpTool>;
    [[nodiscard]] auto health() const -> ServerHealth;
    [[nodiscard]] auto serverInfo() const -> std::optional<ServerInfo>;
    [[nodiscard]] auto restartAttempts() const -> size_t { return _restartAttempts; }

  private:
    struct Session;

    ServerConfig _config;
    TransportFactory _factory;

    std::mutex _lifecycleMutex;

    mutable std::mutex _sessionMutex;
    std::shared_ptr<Session> _session;

    mutable std::mutex _stateMutex;
    ServerState _state;

    mutable std::mutex _toolsMutex;
    std::vector<McpTool> _tools;

    mutable std::mutex _infoMutex;
    std::optional<ServerInfo> _serverInfo;

    mutable std::mutex _healthMutex;
    ServerHealth _health;

    std::atomic<int64_t> _nextId = 1;
    std::atomic<size_t> _restartAttempts = 0;
    std::atomic<bool> _spawnFailed = false;

    [[nodiscard]] auto startLocked() -> VoidResult;
    [[nodiscard]] auto initialize() -> VoidResult;
    [[nodiscard]] auto refreshTools(std::chrono::milliseconds timeout) -> VoidResult;
    [[nodiscard]] auto currentSession() const -> std::shared_ptr<Session>;
    void shutdownSession();
    void failStart(const Error& error);

    void setState(ServerState state);
    void recordSuccess(std::chrono::steady_clock::duration elapsed);
    void recordFailure(const std::string& message);
    void recordError(std::string message);

    void runStdoutReader(Session& session);
    void runStderrReader(Session& session);
    void runWriter(Session& session);
};

} // namespace toolbridge
