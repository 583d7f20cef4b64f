// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <mcp/CapabilityEvolver.hpp>
#include <mcp/Events.hpp>
#include <mcp/ToolManager.hpp>

#include <format>
#include <print>
#include <string>

namespace toolbridge
{

namespace
{

    constexpr auto TurnSeparator = std::string_view { "---" };

} // namespace

struct App::Impl
{
    AppConfig config;
    AppOptions options;
    LoggingEventSink events;
    std::unique_ptr<ToolManager> tools;
    std::unique_ptr<DirectoryCapabilityEvolver> evolver;
    std::unique_ptr<AgentLoop> agent;

    ~Impl()
    {
        if (tools)
        {
            tools->setCapabilityEvolver(nullptr);
            tools->stopAll();
        }
    }

    void printTurn(std::ostream& output, const TurnOutcome& outcome)
    {
        if (!outcome.text.empty())
            std::println(output, "{}", outcome.text);

        for (const auto& result: outcome.results)
        {
            std::println(output, "");
            std::println(output, "{}", result);
        }

        for (const auto& pending: outcome.pending)
        {
            std::println(output, "");
            std::println(output, "Pending confirmation ({} risk): {}", riskLevelName(pending.riskLevel), pending.description);
        }
    }
};

App::App(AppConfig config, AppOptions options): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->options = std::move(options);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    _impl->tools = std::make_unique<ToolManager>(makeToolManagerConfig(_impl->config), &_impl->events);
    _impl->evolver = std::make_unique<DirectoryCapabilityEvolver>(*_impl->tools, &_impl->events);
    _impl->tools->setCapabilityEvolver(_impl->evolver.get());

    if (auto started = _impl->tools->startServers(); !started)
        log::warning("Failed to start tool servers: {}", started.error().message);

    for (const auto& [name, state]: _impl->tools->getStatus())
        log::info("Tool server '{}': {}", name, state);

    _impl->agent = std::make_unique<AgentLoop>(*_impl->tools, _impl->options.agent);

    log::info("Application initialized successfully");
    return {};
}

auto App::run(std::istream& input, std::ostream& output) -> int
{
    if (!_impl->tools || !_impl->agent)
    {
        log::error("Application is not initialized");
        return 1;
    }

    if (_impl->options.listTools)
    {
        std::print(output, "{}", _impl->tools->getToolsPrompt());
        return 0;
    }

    auto processTurn = [&](const std::string& turn) {
        if (turn.find_first_not_of(" \t\r\n") == std::string::npos)
            return;
        auto const outcome = _impl->agent->processTurn(turn);
        _impl->printTurn(output, outcome);
        std::println(output, "{}", TurnSeparator);
        output.flush();
    };

    auto turn = std::string {};
    auto line = std::string {};
    while (std::getline(input, line))
    {
        if (line == TurnSeparator)
        {
            processTurn(turn);
            turn.clear();
            continue;
        }
        turn += line;
        turn += '\n';
    }
    processTurn(turn);

    return 0;
}

} // namespace toolbridge
