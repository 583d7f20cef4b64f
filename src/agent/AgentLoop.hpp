// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/ToolCallParser.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ToolManager.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief How approved tool calls of one turn are executed.
enum class ExecutionMode
{
    Sequential, ///< One after another, in order.
    Parallel,   ///< All at once; results still in call order.
    Cached,     ///< One after another, served from the result cache where possible.
};

/// @brief Configuration for the agent loop.
struct AgentConfig
{
    ExecutionMode mode = ExecutionMode::Parallel;

    /// @brief Lifetime of cached results in ExecutionMode::Cached.
    std::chrono::milliseconds cacheTtl = std::chrono::minutes(5);

    /// @brief Execute calls that require confirmation without asking.
    bool autoApprove = false;
};

/// @brief Everything that came out of one model turn.
struct TurnOutcome
{
    std::string text;                          ///< Conversational text with tool calls removed.
    std::optional<ToolCallFormat> format;      ///< Shape of the tool calls, if any.
    std::vector<ToolCall> calls;               ///< Calls in the order the model issued them.
    std::vector<std::string> results;          ///< One rendered result per call.
    std::vector<PendingConfirmation> pending;  ///< Calls waiting for approval.

    [[nodiscard]] auto hasToolCalls() const -> bool { return !calls.empty(); }
};

/// @brief Callback receiving each rendered tool result as soon as it is known.
using ToolResultCallback = std::function<void(const ToolCall& call, std::string_view result)>;

/// @brief Turns raw model output into tool executions and conversation text.
///
/// Each turn is parsed for tool calls; calls that need the user's approval are held
/// back as pending confirmations, the rest run through the ToolManager. Failures are
/// rendered inline so that the conversation can continue.
class AgentLoop
{
  public:
    /// @brief Constructs an AgentLoop.
    /// @param tools Reference to the tool manager.
    /// @param config Agent configuration.
    AgentLoop(ToolManager& tools, AgentConfig config);

    /// @brief Processes one model turn.
    /// @param modelText The raw model output.
    /// @param resultCb Optional callback for each rendered result.
    [[nodiscard]] auto processTurn(std::string_view modelText, ToolResultCallback resultCb = {}) -> TurnOutcome;

    /// @brief Executes a call the user has approved.
    /// @return The rendered result text.
    [[nodiscard]] auto approve(const PendingConfirmation& confirmation) -> std::string;

    /// @brief Returns the agent configuration.
    [[nodiscard]] auto config() const -> const AgentConfig&;

  private:
    ToolManager& _tools;
    AgentConfig _config;

    [[nodiscard]] auto executeToolCalls(std::span<const ToolCall> calls) -> std::vector<std::string>;
};

} // namespace toolbridge
