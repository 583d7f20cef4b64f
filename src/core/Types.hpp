// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief A structured tool invocation extracted from model output.
///
/// Arguments always hold a JSON object (string keys, arbitrary values).
struct ToolCall
{
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

/// @brief Describes a tool exposed by a server via `tools/list`.
struct McpTool
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();
};

/// @brief Identity reported by a server in its initialize reply.
struct ServerInfo
{
    std::string name;
    std::string version;
};

/// @brief Plain text content returned by a tool.
struct TextContent
{
    std::string text;
};

/// @brief Image content returned by a tool (base64 data).
struct ImageContent
{
    std::string data;
    std::string mimeType;
};

/// @brief Embedded resource returned by a tool.
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> text;
};

using ToolContent = std::variant<TextContent, ImageContent, ResourceContent>;

/// @brief The result of a `tools/call` request.
struct ToolResult
{
    std::vector<ToolContent> content;
    bool isError = false;
};

} // namespace toolbridge
