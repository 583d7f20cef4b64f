// SPDX-License-Identifier: Apache-2.0
#include "AgentLoop.hpp"

#include <core/Log.hpp>

#include <format>

namespace toolbridge
{

AgentLoop::AgentLoop(ToolManager& tools, AgentConfig config): _tools(tools), _config(std::move(config))
{
}

auto AgentLoop::processTurn(std::string_view modelText, ToolResultCallback resultCb) -> TurnOutcome
{
    auto parsed = parseToolCalls(modelText);

    auto outcome = TurnOutcome {};
    outcome.text = parsed.textOnly();
    outcome.format = parsed.format;
    outcome.calls = std::move(parsed.toolCalls);

    if (outcome.calls.empty())
        return outcome;

    log::info("Model requested {} tool call(s) ({})",
              outcome.calls.size(),
              toolCallFormatName(*outcome.format));

    // Sequential mode goes through the manager's own confirmation path.
    if (_config.mode == ExecutionMode::Sequential && !_config.autoApprove)
    {
        auto batch = _tools.processToolCallsWithConfirmation(outcome.calls);
        for (size_t i = 0; i < outcome.calls.size(); ++i)
            outcome.results.push_back(ToolManager::renderToolOutcome(outcome.calls[i].name, batch.results[i]));
        outcome.pending = std::move(batch.pending);
    }
    else
    {
        outcome.results.resize(outcome.calls.size());

        auto approved = std::vector<ToolCall> {};
        auto approvedIndex = std::vector<size_t> {};
        for (size_t i = 0; i < outcome.calls.size(); ++i)
        {
            auto const& call = outcome.calls[i];
            if (!_config.autoApprove && _tools.requiresConfirmation(call.name))
            {
                outcome.pending.push_back(ToolManager::createPendingConfirmation(call.name, call.arguments));
                outcome.results[i] = std::format("Tool '{}' requires confirmation before execution.", call.name);
                continue;
            }
            approved.push_back(call);
            approvedIndex.push_back(i);
        }

        auto executed = executeToolCalls(approved);
        for (size_t k = 0; k < executed.size(); ++k)
            outcome.results[approvedIndex[k]] = std::move(executed[k]);
    }

    if (resultCb)
    {
        for (size_t i = 0; i < outcome.calls.size(); ++i)
            resultCb(outcome.calls[i], outcome.results[i]);
    }

    return outcome;
}

auto AgentLoop::approve(const PendingConfirmation& confirmation) -> std::string
{
    log::info("Executing approved tool call: {} ({} risk)",
              confirmation.toolName,
              riskLevelName(confirmation.riskLevel));

    auto const call = ToolCall { .name = confirmation.toolName, .arguments = confirmation.arguments };
    return ToolManager::renderToolOutcome(call.name, _tools.processToolCall(call));
}

auto AgentLoop::config() const -> const AgentConfig&
{
    return _config;
}

auto AgentLoop::executeToolCalls(std::span<const ToolCall> calls) -> std::vector<std::string>
{
    auto results = std::vector<std::string> {};
    results.reserve(calls.size());

    switch (_config.mode)
    {
        case ExecutionMode::Parallel: {
            auto outcomes = _tools.callToolsParallel(calls);
            for (size_t i = 0; i < calls.size(); ++i)
                results.push_back(ToolManager::renderToolOutcome(calls[i].name, outcomes[i]));
            break;
        }
        case ExecutionMode::Cached:
            for (const auto& call: calls)
            {
                auto const isMetaTool = call.name == AddCapabilityTool || call.name == InstallCapabilityTool;
                auto outcome = isMetaTool ? _tools.processToolCall(call)
                                          : _tools.callToolCached(call.name, call.arguments, _config.cacheTtl);
                results.push_back(ToolManager::renderToolOutcome(call.name, outcome));
            }
            break;
        case ExecutionMode::Sequential:
            for (const auto& call: calls)
                results.push_back(ToolManager::renderToolOutcome(call.name, _tools.processToolCall(call)));
            break;
    }

    return results;
}

} // namespace toolbridge
