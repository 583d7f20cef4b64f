// SPDX-License-Identifier: Apache-2.0
#include <agent/ToolFormatting.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace toolbridge;

TEST_CASE("formatToolsForPrompt is empty without tools", "[formatting]")
{
    CHECK(formatToolsForPrompt({}).empty());
}

TEST_CASE("formatToolsForPrompt lists tools with their parameters", "[formatting]")
{
    auto const tools = std::vector<McpTool> {
        McpTool {
            .name = "echo",
            .description = "Echoes a message",
            .inputSchema = { { "type", "object" }, { "properties", { { "msg", { { "type", "string" } } } } } },
        },
        McpTool { .name = "uptime", .description = "Reports uptime", .inputSchema = nlohmann::json::object() },
    };

    auto const prompt = formatToolsForPrompt(tools);

    CHECK(prompt.starts_with("You have access to these tools:"));
    CHECK(prompt.find("## echo\nEchoes a message\nParameters: {\"msg\"}\n") != std::string::npos);
    CHECK(prompt.find("## uptime\nReports uptime\n\n") != std::string::npos);
    CHECK(prompt.find("<tool_call>") != std::string::npos);
    CHECK(prompt.find("</tool_call>") != std::string::npos);
}

TEST_CASE("toolResultText flattens every content kind", "[formatting]")
{
    auto const result = ToolResult {
        .content = {
            TextContent { .text = "a" },
            ImageContent { .data = "AAAA", .mimeType = "image/png" },
            ResourceContent { .uri = "file:///x", .text = "body" },
            ResourceContent { .uri = "file:///y", .text = std::nullopt },
        },
        .isError = false,
    };

    CHECK(toolResultText(result) == "a[Image content]body[Resource: file:///y]");
}

TEST_CASE("formatToolResult distinguishes errors", "[formatting]")
{
    auto result = ToolResult { .content = { TextContent { .text = "42 files" } }, .isError = false };
    CHECK(formatToolResult("count", result) == "Tool 'count' result:\n42 files");

    result.isError = true;
    CHECK(formatToolResult("count", result) == "Tool 'count' error: 42 files");
}
