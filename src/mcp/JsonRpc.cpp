// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <charconv>
#include <format>

namespace toolbridge::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error",
          nlohmann::json {
              { "code", code },
              { "message", message },
          } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        // It's neither a valid response nor a notification
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC method must be a string");

        auto method = message["method"].get<std::string>();
        auto params = message.value("params", nlohmann::json {});

        if (message.contains("id") && !message["id"].is_null())
            return Request { .id = message["id"], .method = std::move(method), .params = std::move(params) };

        return Notification { .method = std::move(method), .params = std::move(params) };
    }

    if (!message.contains("id"))
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response is missing its id");

    return parseResponse(message).transform([](Response response) -> Message { return response; });
}

auto idToInteger(const nlohmann::json& id) -> std::optional<int64_t>
{
    if (id.is_number_integer())
        return id.get<int64_t>();

    if (id.is_string())
    {
        auto const& text = id.get_ref<const std::string&>();
        auto value = int64_t { 0 };
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc {} && ptr == text.data() + text.size())
            return value;
    }

    return std::nullopt;
}

} // namespace toolbridge::jsonrpc
