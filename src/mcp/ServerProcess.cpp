// SPDX-License-Identifier: Apache-2.0
#include "ServerProcess.hpp"

#include <core/BoundedQueue.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Overloaded.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <future>
#include <thread>

namespace toolbridge
{

namespace
{

    constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };
    constexpr auto ClientName = std::string_view { "toolbridge" };
    constexpr auto ClientVersion = std::string_view { "0.1.0" };

    auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
    {
        auto const it = std::ranges::search(haystack, needle, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
        return !it.empty();
    }

    auto parseContentItem(const nlohmann::json& item) -> std::optional<ToolContent>
    {
        auto const type = json::getStringOr(item, "type", "");
        if (type == "text")
            return TextContent { .text = json::getStringOr(item, "text", "") };
        if (type == "image")
            return ImageContent { .data = json::getStringOr(item, "data", ""),
                                  .mimeType = json::getStringOr(item, "mimeType", "") };
        if (type == "resource" && item.contains("resource") && item["resource"].is_object())
        {
            auto const& resource = item["resource"];
            auto content = ResourceContent { .uri = json::getStringOr(resource, "uri", ""), .text = {} };
            if (resource.contains("text") && resource["text"].is_string())
                content.text = resource["text"].get<std::string>();
            return content;
        }
        return std::nullopt;
    }

    auto parseToolResult(const nlohmann::json& result) -> Result<ToolResult>
    {
        if (!result.is_object())
            return makeError(ErrorCode::ProtocolError, "Tool result is not an object");

        auto toolResult = ToolResult {};
        toolResult.isError = json::getBoolOr(result, "isError", false);

        if (result.contains("content") && result["content"].is_array())
        {
            for (const auto& item: result["content"])
            {
                if (auto content = parseContentItem(item))
                    toolResult.content.push_back(std::move(*content));
                else
                    log::debug("Skipping unsupported tool content: {}", item.dump());
            }
        }

        return toolResult;
    }

    auto parseTool(const nlohmann::json& toolJson) -> std::optional<McpTool>
    {
        auto name = json::getStringOr(toolJson, "name", "");
        if (name.empty())
            return std::nullopt;

        auto schema = nlohmann::json::object();
        if (toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object())
            schema = toolJson["inputSchema"];
        else if (toolJson.contains("input_schema") && toolJson["input_schema"].is_object())
            schema = toolJson["input_schema"];

        return McpTool {
            .name = std::move(name),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = std::move(schema),
        };
    }

} // namespace

auto stateLabel(ServerState::Kind kind) -> std::string_view
{
    switch (kind)
    {
        case ServerState::Kind::Stopped: return "stopped";
        case ServerState::Kind::Starting: return "starting";
        case ServerState::Kind::Ready: return "ready";
        case ServerState::Kind::Failed: return "failed";
        case ServerState::Kind::Restarting: return "restarting";
    }
    return "unknown";
}

auto stdioTransportFactory() -> TransportFactory
{
    return [](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        auto transport = std::make_unique<StdioTransport>();
        auto started = transport->start(StdioTransportConfig {
            .command = config.command,
            .args = config.args,
            .env = config.env,
        });
        if (!started)
            return std::unexpected(started.error());
        return std::unique_ptr<Transport>(std::move(transport));
    };
}

/// One started subprocess: its transport, outbound queue, pending requests and threads.
struct ServerProcess::Session
{
    /// An outbound line; requests carry the id of their pending entry.
    struct Outbound
    {
        nlohmann::json payload;
        std::optional<int64_t> id;
    };

    using Channel = std::promise<Result<jsonrpc::Response>>;

    explicit Session(std::unique_ptr<Transport> t, size_t queueCapacity):
        transport(std::move(t)), queue(queueCapacity)
    {
    }

    std::unique_ptr<Transport> transport;
    BoundedQueue<Outbound> queue;

    std::mutex pendingMutex;
    std::map<int64_t, Channel> pending;
    bool acceptingRequests = true;

    std::atomic<bool> stopping = false;

    std::thread stdoutReader;
    std::thread stderrReader;
    std::thread writer;

    void resolve(int64_t id, Result<jsonrpc::Response> value)
    {
        auto channel = std::optional<Channel> {};
        {
            auto const lock = std::lock_guard { pendingMutex };
            auto const it = pending.find(id);
            if (it == pending.end())
                return;
            channel = std::move(it->second);
            pending.erase(it);
        }
        channel->set_value(std::move(value));
    }

    void forget(int64_t id)
    {
        auto const lock = std::lock_guard { pendingMutex };
        pending.erase(id);
    }

    /// Fails every pending request and refuses new ones.
    void failAll(const Error& error)
    {
        auto channels = std::map<int64_t, Channel> {};
        {
            auto const lock = std::lock_guard { pendingMutex };
            acceptingRequests = false;
            channels.swap(pending);
        }
        for (auto& [id, channel]: channels)
            channel.set_value(std::unexpected(error));
    }

    void join()
    {
        for (auto* thread: { &stdoutReader, &stderrReader, &writer })
        {
            if (thread->joinable())
                thread->join();
        }
    }
};

ServerProcess::ServerProcess(ServerConfig config, TransportFactory factory):
    _config(std::move(config)), _factory(std::move(factory))
{
}

ServerProcess::~ServerProcess()
{
    stop();
}

auto ServerProcess::start() -> VoidResult
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    _spawnFailed = false;
    return startLocked();
}

auto ServerProcess::startLocked() -> VoidResult
{
    if (state().isReady())
        return {};

    setState(ServerState { .kind = ServerState::Kind::Starting, .reason = {} });
    auto commandLine = _config.command;
    for (const auto& arg: _config.args)
        commandLine += " " + arg;
    log::info("Starting tool server: {} ({})", _config.name, commandLine);

    auto transport = _factory(_config);
    if (!transport)
    {
        _spawnFailed = true;
        auto const error =
            Error { ErrorCode::SpawnError,
                    std::format("Failed to start tool server '{}': {}", _config.name, transport.error().message) };
        failStart(error);
        return std::unexpected(error);
    }

    auto session = std::make_shared<Session>(std::move(*transport), _config.options.requestQueueCapacity);
    session->stdoutReader = std::thread([this, s = session.get()] { runStdoutReader(*s); });
    session->stderrReader = std::thread([this, s = session.get()] { runStderrReader(*s); });
    session->writer = std::thread([this, s = session.get()] { runWriter(*s); });

    {
        auto const sessionLock = std::lock_guard { _sessionMutex };
        _session = std::move(session);
    }

    if (auto initialized = initialize(); !initialized)
    {
        failStart(initialized.error());
        return std::unexpected(initialized.error());
    }

    if (auto listed = refreshTools(_config.options.toolTimeout); !listed)
    {
        auto const error = Error { listed.error().code, std::format("Failed to list tools: {}", listed.error().message) };
        failStart(error);
        return std::unexpected(error);
    }

    setState(ServerState { .kind = ServerState::Kind::Ready, .reason = {} });
    _restartAttempts = 0;

    log::info("Tool server '{}' is ready with {} tools", _config.name, tools().size());
    return {};
}

void ServerProcess::failStart(const Error& error)
{
    log::error("[{}] {}", _config.name, error.message);
    shutdownSession();
    recordError(error.message);
    setState(ServerState::failed(error.message));
}

auto ServerProcess::initialize() -> VoidResult
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    auto response = sendRequest("initialize", std::move(params), _config.options.initTimeout);
    if (!response)
    {
        if (response.error().code == ErrorCode::TimeoutError)
            return makeError(ErrorCode::TimeoutError, "Initialize timed out");
        return makeError(ErrorCode::InitializeError, std::format("Initialize failed: {}", response.error().message));
    }

    if (response->error)
        return makeError(ErrorCode::InitializeError, std::format("Initialize failed: {}", response->error->message));

    if (response->result && response->result->is_object())
    {
        auto const serverInfoJson = response->result->value("serverInfo", nlohmann::json::object());
        auto const info = ServerInfo {
            .name = json::getStringOr(serverInfoJson, "name", "unknown"),
            .version = json::getStringOr(serverInfoJson, "version", "unknown"),
        };
        log::debug("[{}] initialized: {} v{}", _config.name, info.name, info.version);

        auto const lock = std::lock_guard { _infoMutex };
        _serverInfo = info;
    }

    // Fire-and-forget: no response is expected for notifications.
    if (auto session = currentSession())
    {
        auto const status = session->queue.pushFor(
            Session::Outbound { .payload = jsonrpc::makeNotification("notifications/initialized"), .id = {} },
            _config.options.initTimeout);
        if (status != PushStatus::Pushed)
            log::warning("[{}] Could not send initialized notification", _config.name);
    }

    return {};
}

auto ServerProcess::sendRequest(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<jsonrpc::Response>
{
    auto session = currentSession();
    if (!session)
        return makeError(ErrorCode::ServerNotReady, std::format("Server '{}' is not started", _config.name));

    auto const id = _nextId++;
    auto channel = Session::Channel {};
    auto response = channel.get_future();

    {
        auto const lock = std::lock_guard { session->pendingMutex };
        if (!session->acceptingRequests)
            return makeError(ErrorCode::ProcessDied,
                             std::format("Server '{}' process has exited", _config.name));
        session->pending.emplace(id, std::move(channel));
    }

    auto const startTime = std::chrono::steady_clock::now();
    auto const deadline = startTime + timeout;

    auto const pushed = session->queue.pushFor(
        Session::Outbound { .payload = jsonrpc::makeRequest(id, method, std::move(params)), .id = id }, timeout);
    if (pushed != PushStatus::Pushed)
    {
        session->forget(id);
        auto const message = pushed == PushStatus::TimedOut
                                 ? std::format("Request '{}' timed out waiting for the request queue", method)
                                 : std::format("Failed to send request '{}' - server may have crashed", method);
        recordFailure(message);
        return makeError(pushed == PushStatus::TimedOut ? ErrorCode::TimeoutError : ErrorCode::TransportError,
                         message);
    }

    if (response.wait_until(deadline) != std::future_status::ready)
    {
        // The subprocess is not told; a late reply is dropped by the reader.
        session->forget(id);
        auto const message = std::format("Request '{}' timed out after {}ms", method, timeout.count());
        recordFailure(message);
        return makeError(ErrorCode::TimeoutError, message);
    }

    auto result = response.get();
    if (result)
        recordSuccess(std::chrono::steady_clock::now() - startTime);
    else
        recordFailure(result.error().message);

    return result;
}

auto ServerProcess::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    return callTool(name, arguments, _config.options.toolTimeout);
}

auto ServerProcess::callTool(std::string_view name,
                             const nlohmann::json& arguments,
                             std::chrono::milliseconds timeout) -> Result<ToolResult>
{
    auto const st = state();
    if (!st.isReady())
        return makeError(ErrorCode::ServerNotReady,
                         std::format("Server '{}' is not ready ({})", _config.name, stateLabel(st.kind)));

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_object() ? arguments : nlohmann::json::object() },
    };

    return sendRequest("tools/call", std::move(params), timeout)
        .and_then([&name](const jsonrpc::Response& response) -> Result<ToolResult> {
            if (response.error)
                return makeError(ErrorCode::ToolCallError,
                                 std::format("Tool call failed: {} (code {})", response.error->message, response.error->code));
            if (!response.result || response.result->is_null())
                return makeError(ErrorCode::ProtocolError, "Empty result from tool call");

            auto toolResult = parseToolResult(*response.result);
            if (toolResult)
                log::debug("Tool '{}' returned {} content item(s) (isError: {})",
                           name,
                           toolResult->content.size(),
                           toolResult->isError);
            return toolResult;
        });
}

auto ServerProcess::refreshTools() -> VoidResult
{
    return refreshTools(_config.options.toolTimeout);
}

auto ServerProcess::refreshTools(std::chrono::milliseconds timeout) -> VoidResult
{
    auto response = sendRequest("tools/list", nullptr, timeout);
    if (!response)
        return std::unexpected(response.error());

    if (response->error)
        return makeError(ErrorCode::ProtocolError, std::format("tools/list failed: {}", response->error->message));

    auto tools = std::vector<McpTool> {};
    if (response->result && response->result->contains("tools") && (*response->result)["tools"].is_array())
    {
        for (const auto& toolJson: (*response->result)["tools"])
        {
            if (auto tool = parseTool(toolJson))
                tools.push_back(std::move(*tool));
        }
    }

    auto const lock = std::lock_guard { _toolsMutex };
    _tools = std::move(tools);
    return {};
}

auto ServerProcess::healthCheck() -> bool
{
    if (!state().isReady())
        return false;

    auto result = refreshTools(_config.options.healthCheckTimeout);
    if (!result)
    {
        log::warning("[{}] Health check failed: {}", _config.name, result.error().message);
        return false;
    }
    return true;
}

auto ServerProcess::restartIfNeeded() -> Result<bool>
{
    if (healthCheck())
        return false;

    auto const lock = std::lock_guard { _lifecycleMutex };

    // A start() that held the lock may have brought the server up meanwhile.
    if (state().isReady() && healthCheck())
        return false;

    if (_spawnFailed)
        return makeError(ErrorCode::SpawnError,
                         std::format("Server '{}' could not be spawned; not restarting automatically", _config.name));

    auto const attempts = _restartAttempts.load();
    auto const maxAttempts = _config.options.maxRestartAttempts;
    if (attempts >= maxAttempts)
    {
        log::warning("[{}] Max restart attempts ({}) reached", _config.name, maxAttempts);
        if (state().kind != ServerState::Kind::Failed)
        {
            shutdownSession();
            setState(ServerState::failed("Max restart attempts reached"));
        }
        return makeError(ErrorCode::RestartLimitReached,
                         std::format("Server '{}' reached its restart limit ({})", _config.name, maxAttempts));
    }

    log::info("[{}] Restarting server (attempt {}/{})", _config.name, attempts + 1, maxAttempts);
    setState(ServerState { .kind = ServerState::Kind::Restarting, .reason = {} });
    ++_restartAttempts;
    {
        auto const healthLock = std::lock_guard { _healthMutex };
        ++_health.restartCount;
    }

    shutdownSession();
    std::this_thread::sleep_for(_config.options.restartDelay);

    auto started = startLocked();
    if (!started)
        return std::unexpected(started.error());

    return true;
}

void ServerProcess::stop()
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    shutdownSession();
    setState(ServerState { .kind = ServerState::Kind::Stopped, .reason = {} });
}

void ServerProcess::shutdownSession()
{
    auto session = std::shared_ptr<Session> {};
    {
        auto const lock = std::lock_guard { _sessionMutex };
        session = std::move(_session);
    }
    if (!session)
        return;

    session->stopping = true;
    session->queue.close();
    session->transport->close();
    session->join();
    session->failAll(Error { ErrorCode::TransportError, std::format("Server '{}' was stopped", _config.name) });
}

auto ServerProcess::requiresConfirmation(std::string_view toolName) const -> bool
{
    return std::ranges::find(_config.requiresConfirmation, toolName) != _config.requiresConfirmation.end();
}

auto ServerProcess::state() const -> ServerState
{
    auto const lock = std::lock_guard { _stateMutex };
    return _state;
}

auto ServerProcess::tools() const -> std::vector<McpTool>
{
    auto const lock = std::lock_guard { _toolsMutex };
    return _tools;
}

auto ServerProcess::health() const -> ServerHealth
{
    auto const lock = std::lock_guard { _healthMutex };
    return _health;
}

auto ServerProcess::serverInfo() const -> std::optional<ServerInfo>
{
    auto const lock = std::lock_guard { _infoMutex };
    return _serverInfo;
}

auto ServerProcess::currentSession() const -> std::shared_ptr<Session>
{
    auto const lock = std::lock_guard { _sessionMutex };
    return _session;
}

void ServerProcess::setState(ServerState state)
{
    auto const lock = std::lock_guard { _stateMutex };
    _state = std::move(state);
}

void ServerProcess::recordSuccess(std::chrono::steady_clock::duration elapsed)
{
    auto const elapsedMs = std::chrono::duration<double, std::milli>(elapsed).count();

    auto const lock = std::lock_guard { _healthMutex };
    ++_health.requestsSucceeded;
    _health.lastSuccess = std::chrono::steady_clock::now();
    auto const n = static_cast<double>(_health.requestsSucceeded);
    _health.averageResponseMs = (_health.averageResponseMs * (n - 1.0) + elapsedMs) / n;
}

void ServerProcess::recordFailure(const std::string& message)
{
    auto const lock = std::lock_guard { _healthMutex };
    ++_health.requestsFailed;
    _health.lastError = message;
}

void ServerProcess::recordError(std::string message)
{
    auto const lock = std::lock_guard { _healthMutex };
    _health.lastError = std::move(message);
}

void ServerProcess::runStdoutReader(Session& session)
{
    while (true)
    {
        auto message = session.transport->receive();
        if (!message)
        {
            if (message.error().code == ErrorCode::ProtocolError)
            {
                log::warning("[{}] Failed to parse message: {}", _config.name, message.error().message);
                continue;
            }
            break;
        }

        log::trace("[{}] <- {}", _config.name, message->dump());

        auto parsed = jsonrpc::parseMessage(*message);
        if (!parsed)
        {
            log::warning("[{}] Ignoring message: {}", _config.name, parsed.error().message);
            continue;
        }

        std::visit(Overloaded {
                       [&](jsonrpc::Response& response) {
                           auto const id = jsonrpc::idToInteger(response.id);
                           if (!id)
                           {
                               log::warning("[{}] Response with unusable id: {}", _config.name, response.id.dump());
                               return;
                           }
                           session.resolve(*id, std::move(response));
                       },
                       [&](jsonrpc::Request& request) {
                           auto reply = request.method == "ping"
                                            ? jsonrpc::makeResult(request.id, nlohmann::json::object())
                                            : jsonrpc::makeErrorResponse(request.id,
                                                                         jsonrpc::MethodNotFound,
                                                                         std::format("Method not found: {}", request.method));
                           // The reader must keep draining stdout, so a reply that does not fit is dropped.
                           auto const pushed = session.queue.pushFor(
                               Session::Outbound { .payload = std::move(reply), .id = {} }, std::chrono::milliseconds(0));
                           if (pushed == PushStatus::TimedOut)
                               log::warning("[{}] Request queue full, dropping reply to '{}'", _config.name, request.method);
                       },
                       [&](jsonrpc::Notification& notification) {
                           log::debug("[{}] notification: {}", _config.name, notification.method);
                       },
                   },
                   *parsed);
    }

    log::debug("[{}] stdout reader exited", _config.name);

    if (session.stopping)
    {
        session.failAll(Error { ErrorCode::TransportError, std::format("Server '{}' was stopped", _config.name) });
        return;
    }

    session.failAll(Error { ErrorCode::ProcessDied, std::format("Server '{}' process exited", _config.name) });

    auto const lock = std::lock_guard { _stateMutex };
    if (_state.isReady())
    {
        log::error("[{}] Server process exited unexpectedly", _config.name);
        _state = ServerState::failed("process exited");
        recordError("Server process exited");
    }
}

void ServerProcess::runStderrReader(Session& session)
{
    while (true)
    {
        auto line = session.transport->receiveDiagnostic();
        if (!line)
            break;

        log::debug("[{}] stderr: {}", _config.name, *line);

        if (containsIgnoreCase(*line, "error") || containsIgnoreCase(*line, "exception"))
            recordError(*line);
    }
}

void ServerProcess::runWriter(Session& session)
{
    while (auto outbound = session.queue.pop())
    {
        log::trace("[{}] -> {}", _config.name, outbound->payload.dump());

        auto sent = session.transport->send(outbound->payload);
        if (!sent)
        {
            log::error("[{}] Write error: {}", _config.name, sent.error().message);
            if (outbound->id)
                session.resolve(*outbound->id, std::unexpected(sent.error()));
        }
    }

    log::debug("[{}] writer exited", _config.name);
}

} // namespace toolbridge
