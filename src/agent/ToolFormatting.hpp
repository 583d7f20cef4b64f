// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace toolbridge
{

/// @brief Renders the tool catalogue as a system prompt section.
/// @param tools The tools to advertise. An empty list renders as an empty string.
/// @return Per-tool headings with description and parameter names, followed by usage instructions.
[[nodiscard]] auto formatToolsForPrompt(std::span<const McpTool> tools) -> std::string;

/// @brief Renders a tool result as conversational text for the next model turn.
[[nodiscard]] auto formatToolResult(std::string_view toolName, const ToolResult& result) -> std::string;

/// @brief Concatenates the textual representation of all content items.
[[nodiscard]] auto toolResultText(const ToolResult& result) -> std::string;

} // namespace toolbridge
