// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolbridge
{

/// @brief The textual shape in which tool calls were found in model output.
enum class ToolCallFormat
{
    TagDelimited,    ///< <tool_call>{...}</tool_call> and its aliases
    FencedCodeBlock, ///< ```json {...} ```
    FunctionSyntax,  ///< name({...})
    BareJson,        ///< {"name": ..., "arguments": {...}} inline in prose
};

[[nodiscard]] auto toolCallFormatName(ToolCallFormat format) -> std::string_view;

/// @brief Model output split into conversational text and tool calls.
struct ParsedResponse
{
    std::string prefixText;
    std::vector<ToolCall> toolCalls;
    std::string suffixText;
    std::optional<ToolCallFormat> format;

    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }

    /// @brief Returns the trimmed prefix and suffix joined by a single space.
    [[nodiscard]] auto textOnly() const -> std::string;
};

/// @brief Extracts tool calls from free-form model output.
///
/// Strategies are tried from the most to the least explicit shape, and the first
/// one that yields at least one call wins. Text without any recognizable call is
/// returned unchanged as prefix text with no calls; this is not an error.
[[nodiscard]] auto parseToolCalls(std::string_view text) -> ParsedResponse;

/// @brief Parses the body of a single tool call, tolerating fences and surrounding noise.
///
/// Accepts `arguments`, `args` or `params` as the argument map key.
[[nodiscard]] auto parseToolCallBody(std::string_view body) -> std::optional<ToolCall>;

/// @brief Finds the first balanced {...} at or after @p from.
///
/// Braces inside string literals (with backslash escapes) are ignored.
/// @return The half-open [begin, end) range of the object, or std::nullopt.
[[nodiscard]] auto findBalancedObject(std::string_view text, size_t from = 0)
    -> std::optional<std::pair<size_t, size_t>>;

} // namespace toolbridge
