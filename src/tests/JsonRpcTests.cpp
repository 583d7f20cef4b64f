// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <variant>

using namespace toolbridge;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 42);
    CHECK(request["method"] == "test/method");
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("makeResult and makeErrorResponse echo the peer's id", "[jsonrpc]")
{
    auto const ok = jsonrpc::makeResult("abc", nlohmann::json::object());
    CHECK(ok["jsonrpc"] == "2.0");
    CHECK(ok["id"] == "abc");
    CHECK(ok["result"].is_object());

    auto const err = jsonrpc::makeErrorResponse(7, jsonrpc::MethodNotFound, "Method not found: sampling/createMessage");
    CHECK(err["id"] == 7);
    CHECK(err["error"]["code"] == -32601);
    CHECK(err["error"]["message"] == "Method not found: sampling/createMessage");
    CHECK(!err.contains("result"));
}

TEST_CASE("parseMessage classifies responses", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "result", { { "tools", nlohmann::json::array() } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Response>(*result));
    CHECK(std::get<jsonrpc::Response>(*result).id == 3);
}

TEST_CASE("parseMessage classifies server-initiated requests", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", "srv-1" },
        { "method", "ping" },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Request>(*result));
    auto const& request = std::get<jsonrpc::Request>(*result);
    CHECK(request.method == "ping");
    CHECK(request.id == "srv-1");
}

TEST_CASE("parseMessage classifies notifications", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", "notifications/tools/list_changed" },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Notification>(*result));
    CHECK(std::get<jsonrpc::Notification>(*result).method == "notifications/tools/list_changed");
}

TEST_CASE("parseMessage rejects responses without id", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "result", nlohmann::json::object() },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseMessage rejects non-string methods", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "method", 42 },
    };

    CHECK(!jsonrpc::parseMessage(msg).has_value());
}

TEST_CASE("idToInteger accepts integers and decimal strings", "[jsonrpc]")
{
    CHECK(jsonrpc::idToInteger(nlohmann::json(17)) == 17);
    CHECK(jsonrpc::idToInteger(nlohmann::json("42")) == 42);
    CHECK(!jsonrpc::idToInteger(nlohmann::json("42abc")).has_value());
    CHECK(!jsonrpc::idToInteger(nlohmann::json(nullptr)).has_value());
    CHECK(!jsonrpc::idToInteger(nlohmann::json(1.5)).has_value());
}
