// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/BoundedQueue.hpp>
#include <core/Types.hpp>
#include <mcp/ServerProcess.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace toolbridge::test
{

using namespace std::chrono_literals;

/// Launch configuration for the mock tool server built alongside the tests.
inline auto mockServerConfig(std::string name, std::vector<std::string> args = {}) -> ServerConfig
{
    return ServerConfig {
        .name = std::move(name),
        .command = MOCK_TOOL_SERVER_PATH,
        .args = std::move(args),
        .env = {},
        .requiresConfirmation = {},
        .options = ServerOptions {
            .toolTimeout = 5s,
            .initTimeout = 5s,
            .healthCheckTimeout = 2s,
            .restartDelay = 10ms,
            .maxRestartAttempts = 3,
            .requestQueueCapacity = 32,
        },
    };
}

/// Transport factory that ignores the configured command and spawns the mock server.
inline auto mockTransportFactory(std::vector<std::string> args = {}) -> TransportFactory
{
    return [args = std::move(args)](const ServerConfig& config) {
        auto patched = config;
        patched.command = MOCK_TOOL_SERVER_PATH;
        patched.args = args;
        return stdioTransportFactory()(patched);
    };
}

inline auto firstText(const ToolResult& result) -> std::string
{
    for (const auto& item: result.content)
    {
        if (auto const* text = std::get_if<TextContent>(&item))
            return text->text;
    }
    return {};
}

inline auto waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

/// In-process tool server for one session. It answers initialize, tools/list and
/// tools/call by echoing the msg argument, and lets tests break individual writes.
class ScriptedServer: public std::enable_shared_from_this<ScriptedServer>
{
  public:
    /// Sending a tools/call for @p toolName fails with a TransportError.
    void failWritesFor(std::string toolName)
    {
        auto const lock = std::lock_guard { _mutex };
        _failingTool = std::move(toolName);
    }

    /// A tools/call for @p toolName is accepted but left unanswered.
    void holdCallsTo(std::string toolName)
    {
        auto const lock = std::lock_guard { _mutex };
        _heldTool = std::move(toolName);
    }

    /// While the gate is closed, sending a reply to a server-initiated request blocks.
    void closeGate()
    {
        auto const lock = std::lock_guard { _mutex };
        _gateOpen = false;
    }

    void openGate()
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _gateOpen = true;
        }
        _gateChanged.notify_all();
    }

    /// Delivers @p message to the client as if the server had written it.
    void inject(nlohmann::json message) { (void) _inbound.push(std::move(message)); }

    [[nodiscard]] auto heldRequestId() const -> std::optional<nlohmann::json>
    {
        auto const lock = std::lock_guard { _mutex };
        return _heldRequestId;
    }

    [[nodiscard]] auto repliesSent() const -> size_t
    {
        auto const lock = std::lock_guard { _mutex };
        return _repliesSent;
    }

    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [self = shared_from_this()](const ServerConfig&) -> Result<std::unique_ptr<Transport>> {
            return std::make_unique<Connection>(self);
        };
    }

  private:
    class Connection: public Transport
    {
      public:
        explicit Connection(std::shared_ptr<ScriptedServer> server): _server(std::move(server)) {}
        ~Connection() override { close(); }

        auto send(const nlohmann::json& message) -> VoidResult override { return _server->receiveFromClient(message); }

        auto receive() -> Result<nlohmann::json> override
        {
            auto message = _server->_inbound.pop();
            if (!message)
                return makeError(ErrorCode::TransportError, "Scripted server closed");
            return std::move(*message);
        }

        auto receiveDiagnostic() -> Result<std::string> override
        {
            auto line = _server->_diagnostics.pop();
            if (!line)
                return makeError(ErrorCode::TransportError, "Scripted server closed");
            return std::move(*line);
        }

        void close() override { _server->shutdown(); }

        [[nodiscard]] auto isConnected() const -> bool override { return !_server->_inbound.isClosed(); }

      private:
        std::shared_ptr<ScriptedServer> _server;
    };

    auto receiveFromClient(const nlohmann::json& message) -> VoidResult
    {
        if (!message.contains("method"))
        {
            auto lock = std::unique_lock { _mutex };
            _gateChanged.wait(lock, [this] { return _gateOpen || _inbound.isClosed(); });
            ++_repliesSent;
            return {};
        }

        auto const method = message["method"].get<std::string>();
        if (!message.contains("id"))
            return {};

        auto const& id = message["id"];
        if (method == "initialize")
            reply(id,
                  { { "protocolVersion", "2024-11-05" },
                    { "capabilities", nlohmann::json::object() },
                    { "serverInfo", { { "name", "scripted" }, { "version", "0.1" } } } });
        else if (method == "tools/list")
            reply(id, { { "tools", nlohmann::json::array({ { { "name", "echo" }, { "description", "Echoes msg" } } }) } });
        else if (method == "tools/call")
        {
            auto const tool = message["params"].value("name", std::string {});
            {
                auto const lock = std::lock_guard { _mutex };
                if (tool == _failingTool)
                    return makeError(ErrorCode::TransportError, std::format("Broken pipe writing '{}'", tool));
                if (tool == _heldTool)
                {
                    _heldRequestId = id;
                    return {};
                }
            }
            auto const text = message["params"].value("arguments", nlohmann::json::object()).value("msg", std::string {});
            reply(id, { { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) } });
        }
        else
            inject({ { "jsonrpc", "2.0" }, { "id", id }, { "error", { { "code", -32601 }, { "message", "Unknown" } } } });
        return {};
    }

    void reply(const nlohmann::json& id, nlohmann::json result)
    {
        inject({ { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } });
    }

    void shutdown()
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _inbound.close();
            _diagnostics.close();
        }
        _gateChanged.notify_all();
    }

    BoundedQueue<nlohmann::json> _inbound { 1024 };
    BoundedQueue<std::string> _diagnostics { 16 };

    mutable std::mutex _mutex;
    std::condition_variable _gateChanged;
    bool _gateOpen = true;
    std::string _failingTool;
    std::string _heldTool;
    std::optional<nlohmann::json> _heldRequestId;
    size_t _repliesSent = 0;
};

/// Creates a fresh directory below the system temp directory and removes it on destruction.
class TemporaryDirectory
{
  public:
    TemporaryDirectory()
    {
        auto random = std::random_device {};
        _path = std::filesystem::temp_directory_path() / std::format("toolbridge-test-{:08x}", random());
        std::filesystem::create_directories(_path);
    }

    ~TemporaryDirectory()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    std::filesystem::path _path;
};

} // namespace toolbridge::test
