// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerProcess.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <future>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace toolbridge;
using namespace toolbridge::test;
using namespace std::chrono_literals;

TEST_CASE("ServerProcess starts stopped", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    CHECK(server.state().kind == ServerState::Kind::Stopped);
    CHECK(server.tools().empty());
    CHECK(!server.serverInfo().has_value());
}

TEST_CASE("ServerProcess handshake makes the server ready", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock", { "--prefix", "m_" }));
    auto started = server.start();
    REQUIRE(started.has_value());

    CHECK(server.state().isReady());
    REQUIRE(server.serverInfo().has_value());
    CHECK(server.serverInfo()->name == "mock-tool-server");
    CHECK(server.serverInfo()->version == "1.2.3");

    auto const tools = server.tools();
    REQUIRE(!tools.empty());
    CHECK(std::ranges::any_of(tools, [](const McpTool& tool) { return tool.name == "m_echo"; }));
    CHECK(tools.front().inputSchema["type"] == "object");

    // Starting a ready server is a no-op.
    CHECK(server.start().has_value());
    CHECK(server.state().isReady());
}

TEST_CASE("ServerProcess reports spawn failures", "[server]")
{
    auto config = mockServerConfig("missing");
    config.command = "/nonexistent/tool/server";

    auto server = ServerProcess(config);
    auto started = server.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::SpawnError);
    CHECK(server.state().kind == ServerState::Kind::Failed);
    CHECK(!server.state().reason.empty());

    // Spawn failures are not retried automatically.
    auto restarted = server.restartIfNeeded();
    REQUIRE(!restarted.has_value());
    CHECK(restarted.error().code == ErrorCode::SpawnError);
}

TEST_CASE("ServerProcess fails when initialize is never answered", "[server]")
{
    auto config = mockServerConfig("silent", { "--no-initialize" });
    config.options.initTimeout = 300ms;

    auto server = ServerProcess(config);
    auto const startTime = std::chrono::steady_clock::now();
    auto started = server.start();
    auto const elapsed = std::chrono::steady_clock::now() - startTime;

    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::TimeoutError);
    CHECK(server.state().kind == ServerState::Kind::Failed);
    CHECK(elapsed < 3s);
}

TEST_CASE("ServerProcess fails when initialize is rejected", "[server]")
{
    auto server = ServerProcess(mockServerConfig("grumpy", { "--reject-initialize" }));
    auto started = server.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::InitializeError);
    CHECK(started.error().message.find("Initialization refused") != std::string::npos);
    CHECK(server.state().kind == ServerState::Kind::Failed);
}

TEST_CASE("ServerProcess callTool returns tool content", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    SECTION("text")
    {
        auto result = server.callTool("echo", { { "msg", "hello" } });
        REQUIRE(result.has_value());
        CHECK(!result->isError);
        CHECK(firstText(*result) == "hello");
    }

    SECTION("rich content")
    {
        auto result = server.callTool("rich", nlohmann::json::object());
        REQUIRE(result.has_value());
        REQUIRE(result->content.size() == 4);
        CHECK(std::holds_alternative<TextContent>(result->content[0]));
        auto const& image = std::get<ImageContent>(result->content[1]);
        CHECK(image.mimeType == "image/png");
        auto const& resource = std::get<ResourceContent>(result->content[2]);
        CHECK(resource.uri == "file:///tmp/a.txt");
        CHECK(resource.text == std::optional<std::string>("file body"));
        CHECK(!std::get<ResourceContent>(result->content[3]).text.has_value());
    }

    SECTION("result flagged as error")
    {
        auto result = server.callTool("tool_error", nlohmann::json::object());
        REQUIRE(result.has_value());
        CHECK(result->isError);
        CHECK(firstText(*result) == "bad input");
    }

    SECTION("JSON-RPC error")
    {
        auto result = server.callTool("fail", nlohmann::json::object());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ToolCallError);
        CHECK(result.error().message == "Tool call failed: Intentional failure (code -32000)");
    }
}

TEST_CASE("ServerProcess refuses tool calls unless ready", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    auto result = server.callTool("echo", { { "msg", "x" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ServerNotReady);
}

TEST_CASE("ServerProcess correlates concurrent requests by id", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    constexpr auto CallCount = 24;
    auto futures = std::vector<std::future<Result<ToolResult>>> {};
    for (auto i = 0; i < CallCount; ++i)
    {
        futures.push_back(std::async(std::launch::async, [&server, i] {
            // Staggered sleeps make the server reply out of order.
            return server.callTool("sleep", { { "ms", (CallCount - i) * 5 }, { "msg", std::format("reply-{}", i) } });
        }));
    }

    for (auto i = 0; i < CallCount; ++i)
    {
        auto result = futures[static_cast<size_t>(i)].get();
        REQUIRE(result.has_value());
        CHECK(firstText(*result) == std::format("reply-{}", i));
    }
}

TEST_CASE("ServerProcess slow call does not block other callers", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    auto slow = std::async(std::launch::async, [&server] {
        return server.callTool("sleep", { { "ms", 800 }, { "msg", "slow" } });
    });
    std::this_thread::sleep_for(50ms);

    auto const startTime = std::chrono::steady_clock::now();
    auto fast = server.callTool("echo", { { "msg", "fast" } });
    auto const elapsed = std::chrono::steady_clock::now() - startTime;

    REQUIRE(fast.has_value());
    CHECK(firstText(*fast) == "fast");
    CHECK(elapsed < 600ms);

    auto slowResult = slow.get();
    REQUIRE(slowResult.has_value());
    CHECK(firstText(*slowResult) == "slow");
}

TEST_CASE("ServerProcess times out one request without affecting others", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    auto timedOut = server.callTool("sleep", { { "ms", 1500 } }, 200ms);
    REQUIRE(!timedOut.has_value());
    CHECK(timedOut.error().code == ErrorCode::TimeoutError);
    CHECK(timedOut.error().message == "Request 'tools/call' timed out after 200ms");

    // The late reply for the abandoned id is dropped; later requests still work.
    auto next = server.callTool("echo", { { "msg", "still alive" } });
    REQUIRE(next.has_value());
    CHECK(firstText(*next) == "still alive");
    CHECK(server.state().isReady());
    CHECK(server.health().requestsFailed >= 1);
}

TEST_CASE("ServerProcess fails pending requests when the process dies", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    auto const startTime = std::chrono::steady_clock::now();
    auto result = server.callTool("crash", nlohmann::json::object());
    auto const elapsed = std::chrono::steady_clock::now() - startTime;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessDied);
    CHECK(elapsed < 4s);

    REQUIRE(waitUntil([&] { return server.state().kind == ServerState::Kind::Failed; }));
    CHECK(server.state().reason == "process exited");
    CHECK(server.health().lastError.has_value());

    auto afterwards = server.callTool("echo", { { "msg", "x" } });
    REQUIRE(!afterwards.has_value());
    CHECK(afterwards.error().code == ErrorCode::ServerNotReady);
}

TEST_CASE("ServerProcess health check and restart", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    CHECK(server.healthCheck());

    auto healthy = server.restartIfNeeded();
    REQUIRE(healthy.has_value());
    CHECK(*healthy == false);

    (void) server.callTool("crash", nlohmann::json::object());
    REQUIRE(waitUntil([&] { return !server.state().isReady(); }));
    CHECK(!server.healthCheck());

    auto restarted = server.restartIfNeeded();
    REQUIRE(restarted.has_value());
    CHECK(*restarted == true);
    CHECK(server.state().isReady());
    CHECK(server.health().restartCount == 1);
    CHECK(server.restartAttempts() == 0);

    auto result = server.callTool("echo", { { "msg", "back" } });
    REQUIRE(result.has_value());
    CHECK(firstText(*result) == "back");
}

TEST_CASE("ServerProcess restarts a hung server", "[server]")
{
    auto config = mockServerConfig("mock");
    config.options.healthCheckTimeout = 200ms;
    auto server = ServerProcess(config);
    REQUIRE(server.start().has_value());

    (void) server.callTool("hang", nlohmann::json::object(), 100ms);
    CHECK(!server.healthCheck());

    auto restarted = server.restartIfNeeded();
    REQUIRE(restarted.has_value());
    CHECK(*restarted);
    CHECK(server.healthCheck());
}

TEST_CASE("ServerProcess gives up after the restart budget", "[server]")
{
    auto config = mockServerConfig("grumpy", { "--reject-initialize" });
    config.options.maxRestartAttempts = 2;

    auto server = ServerProcess(config);
    REQUIRE(!server.start().has_value());

    for (auto attempt = 0; attempt < 2; ++attempt)
    {
        auto restarted = server.restartIfNeeded();
        REQUIRE(!restarted.has_value());
        CHECK(restarted.error().code == ErrorCode::InitializeError);
    }
    CHECK(server.restartAttempts() == 2);

    auto exhausted = server.restartIfNeeded();
    REQUIRE(!exhausted.has_value());
    CHECK(exhausted.error().code == ErrorCode::RestartLimitReached);
    CHECK(server.state().kind == ServerState::Kind::Failed);
    CHECK(server.health().restartCount == 2);
}

TEST_CASE("ServerProcess answers requests initiated by the server", "[server]")
{
    auto server = ServerProcess(mockServerConfig("chatty", { "--server-requests" }));
    REQUIRE(server.start().has_value());

    auto replies = nlohmann::json::array();
    REQUIRE(waitUntil([&] {
        auto result = server.callTool("client_replies", nlohmann::json::object());
        if (!result)
            return false;
        replies = nlohmann::json::parse(firstText(*result));
        return replies.size() >= 2;
    }));

    auto const findReply = [&](std::string_view id) -> nlohmann::json {
        for (const auto& reply: replies)
        {
            if (reply.value("id", std::string {}) == id)
                return reply;
        }
        return nullptr;
    };

    auto const ping = findReply("srv-ping");
    REQUIRE(ping.is_object());
    CHECK(ping["result"] == nlohmann::json::object());

    auto const unknown = findReply("srv-sample");
    REQUIRE(unknown.is_object());
    CHECK(unknown["error"]["code"] == -32601);
}

TEST_CASE("ServerProcess passes environment overrides", "[server]")
{
    auto config = mockServerConfig("mock");
    config.env["TOOLBRIDGE_SERVER_TEST"] = "configured";

    auto server = ServerProcess(config);
    REQUIRE(server.start().has_value());

    auto result = server.callTool("env", { { "name", "TOOLBRIDGE_SERVER_TEST" } });
    REQUIRE(result.has_value());
    CHECK(firstText(*result) == "configured");
}

TEST_CASE("ServerProcess records health statistics", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    auto const before = server.health().requestsSucceeded;
    REQUIRE(server.callTool("echo", { { "msg", "a" } }).has_value());
    REQUIRE(server.callTool("echo", { { "msg", "b" } }).has_value());

    auto const health = server.health();
    CHECK(health.requestsSucceeded == before + 2);
    CHECK(health.lastSuccess.has_value());
    CHECK(health.averageResponseMs >= 0.0);

    SECTION("stderr errors are remembered")
    {
        REQUIRE(server.callTool("noise", { { "msg", "disk on fire" } }).has_value());
        REQUIRE(waitUntil([&] {
            auto const lastError = server.health().lastError;
            return lastError && lastError->find("disk on fire") != std::string::npos;
        }));
    }
}

TEST_CASE("ServerProcess stop terminates the session", "[server]")
{
    auto server = ServerProcess(mockServerConfig("mock"));
    REQUIRE(server.start().has_value());

    server.stop();
    CHECK(server.state().kind == ServerState::Kind::Stopped);
    CHECK(!server.healthCheck());

    auto result = server.sendRequest("tools/list", nullptr, 500ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ServerNotReady);
}

TEST_CASE("ServerProcess accepts a custom transport factory", "[server]")
{
    auto factoryCalls = 0;
    auto factory = [&factoryCalls](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        ++factoryCalls;
        auto patched = config;
        patched.command = MOCK_TOOL_SERVER_PATH;
        return stdioTransportFactory()(patched);
    };

    auto config = mockServerConfig("custom");
    config.command = "does-not-matter";
    auto server = ServerProcess(config, factory);
    REQUIRE(server.start().has_value());
    CHECK(factoryCalls == 1);
    CHECK(server.state().isReady());
}

TEST_CASE("ServerProcess write failure fails only the affected request", "[server]")
{
    auto scripted = std::make_shared<ScriptedServer>();
    scripted->failWritesFor("doomed");

    auto server = ServerProcess(mockServerConfig("scripted"), scripted->factory());
    REQUIRE(server.start().has_value());
    REQUIRE(server.serverInfo().has_value());
    CHECK(server.serverInfo()->name == "scripted");

    auto concurrent = std::async(std::launch::async, [&server] {
        return server.callTool("echo", { { "msg", "still here" } });
    });
    auto const failed = server.callTool("doomed", nlohmann::json::object());

    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::TransportError);
    CHECK(failed.error().message == "Broken pipe writing 'doomed'");

    auto const echoed = concurrent.get();
    REQUIRE(echoed.has_value());
    CHECK(firstText(*echoed) == "still here");

    CHECK(server.state().isReady());
    auto const after = server.callTool("echo", { { "msg", "after" } });
    REQUIRE(after.has_value());
    CHECK(firstText(*after) == "after");
    CHECK(server.health().requestsFailed == 1);
}

TEST_CASE("ServerProcess keeps reading responses while replies to the server back up", "[server]")
{
    auto scripted = std::make_shared<ScriptedServer>();
    scripted->holdCallsTo("held");

    auto config = mockServerConfig("scripted");
    config.options.requestQueueCapacity = 1;
    auto server = ServerProcess(config, scripted->factory());
    REQUIRE(server.start().has_value());

    auto held = std::async(std::launch::async, [&server] { return server.callTool("held", nlohmann::json::object()); });
    REQUIRE(waitUntil([&] { return scripted->heldRequestId().has_value(); }));

    // The writer blocks on the first reply, the queue fills with the second.
    scripted->closeGate();
    for (auto i = 0; i < 4; ++i)
        scripted->inject({ { "jsonrpc", "2.0" }, { "id", std::format("srv-{}", i) }, { "method", "ping" } });
    scripted->inject({
        { "jsonrpc", "2.0" },
        { "id", *scripted->heldRequestId() },
        { "result", { { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "released" } } }) } } },
    });

    REQUIRE(held.wait_for(2s) == std::future_status::ready);
    auto const result = held.get();
    REQUIRE(result.has_value());
    CHECK(firstText(*result) == "released");

    scripted->openGate();
    CHECK(waitUntil([&] { return scripted->repliesSent() >= 1; }));
    CHECK(server.state().isReady());
}

TEST_CASE("ServerProcess restartIfNeeded leaves a server alone that finished starting meanwhile", "[server]")
{
    auto server = ServerProcess(mockServerConfig("slow", { "--init-delay", "300" }));

    auto started = std::async(std::launch::async, [&server] { return server.start(); });
    REQUIRE(waitUntil([&] { return server.state().kind == ServerState::Kind::Starting; }));

    // Waits for the running start() and then finds the server healthy.
    auto const restarted = server.restartIfNeeded();
    REQUIRE(started.get().has_value());

    REQUIRE(restarted.has_value());
    CHECK(!*restarted);
    CHECK(server.state().isReady());
    CHECK(server.restartAttempts() == 0);
    CHECK(server.health().restartCount == 0);
}

TEST_CASE("stateLabel names every state", "[server]")
{
    CHECK(stateLabel(ServerState::Kind::Stopped) == "stopped");
    CHECK(stateLabel(ServerState::Kind::Starting) == "starting");
    CHECK(stateLabel(ServerState::Kind::Ready) == "ready");
    CHECK(stateLabel(ServerState::Kind::Failed) == "failed");
    CHECK(stateLabel(ServerState::Kind::Restarting) == "restarting");
}
