// SPDX-License-Identifier: Apache-2.0
#include "ToolFormatting.hpp"

#include <core/Overloaded.hpp>

#include <format>
#include <variant>

namespace toolbridge
{

namespace
{

    constexpr auto PromptHeader = std::string_view { "You have access to these tools:\n\n" };

    constexpr auto UsageInstructions = std::string_view {
        "To use a tool, respond with:\n"
        "<tool_call>\n"
        "{\"name\": \"tool_name\", \"arguments\": {\"param\": \"value\"}}\n"
        "</tool_call>\n"
        "\n"
        "After the tool result, continue your response naturally.\n"
    };

} // namespace

auto formatToolsForPrompt(std::span<const McpTool> tools) -> std::string
{
    if (tools.empty())
        return {};

    auto output = std::string(PromptHeader);

    for (const auto& tool: tools)
    {
        output += std::format("## {}\n{}\n", tool.name, tool.description);

        auto const properties = tool.inputSchema.find("properties");
        if (tool.inputSchema.is_object() && properties != tool.inputSchema.end() && properties->is_object())
        {
            auto params = std::string {};
            for (const auto& [key, value]: properties->items())
            {
                if (!params.empty())
                    params += ", ";
                params += std::format("\"{}\"", key);
            }
            output += std::format("Parameters: {{{}}}\n", params);
        }

        output += '\n';
    }

    output += UsageInstructions;
    return output;
}

auto toolResultText(const ToolResult& result) -> std::string
{
    auto output = std::string {};
    for (const auto& content: result.content)
    {
        std::visit(Overloaded {
                       [&](const TextContent& text) { output += text.text; },
                       [&](const ImageContent&) { output += "[Image content]"; },
                       [&](const ResourceContent& resource) {
                           if (resource.text)
                               output += *resource.text;
                           else
                               output += std::format("[Resource: {}]", resource.uri);
                       },
                   },
                   content);
    }
    return output;
}

auto formatToolResult(std::string_view toolName, const ToolResult& result) -> std::string
{
    if (result.isError)
        return std::format("Tool '{}' error: {}", toolName, toolResultText(result));
    return std::format("Tool '{}' result:\n{}", toolName, toolResultText(result));
}

} // namespace toolbridge
