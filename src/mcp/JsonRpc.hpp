// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace toolbridge::jsonrpc
{

/// Standard JSON-RPC 2.0 error code for an unknown method.
constexpr auto MethodNotFound = -32601;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief A request initiated by the peer (carries an id and expects a reply).
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A notification initiated by the peer (no id, no reply).
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief Any inbound JSON-RPC 2.0 message.
using Message = std::variant<Response, Request, Notification>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response to a peer request.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response to a peer request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Classifies and parses any inbound JSON-RPC 2.0 message.
///
/// Messages that are neither a response, a request nor a notification are rejected.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Interprets a message id as an integer request id.
///
/// Accepts integer ids and strings holding a decimal integer.
[[nodiscard]] auto idToInteger(const nlohmann::json& id) -> std::optional<int64_t>;

} // namespace toolbridge::jsonrpc
