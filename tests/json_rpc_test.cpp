#include <catch2/catch_test_macros.hpp>

#include "mcps/protocol/json_rpc.hpp"

#include <cstdint>

using namespace mcps;

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcId accepts integers, strings and null", "[jsonrpc]") {
    auto number = JsonRpcId::from_json(Json(42));
    REQUIRE(number.has_value());
    REQUIRE(*number == JsonRpcId::integer(42));
    REQUIRE(number->to_json() == 42);

    auto text = JsonRpcId::from_json(Json("req-1"));
    REQUIRE(text.has_value());
    REQUIRE(*text == JsonRpcId::string("req-1"));
    REQUIRE(text->to_string() == "\"req-1\"");

    auto null = JsonRpcId::from_json(Json(nullptr));
    REQUIRE(null.has_value());
    REQUIRE(null->is_null());
    REQUIRE(null->to_json().is_null());
}

TEST_CASE("JsonRpcId rejects other types", "[jsonrpc]") {
    REQUIRE_FALSE(JsonRpcId::from_json(Json(1.5)).has_value());
    REQUIRE_FALSE(JsonRpcId::from_json(Json(true)).has_value());
    REQUIRE_FALSE(JsonRpcId::from_json(Json::array()).has_value());

    auto object = JsonRpcId::from_json(Json::object());
    REQUIRE_FALSE(object.has_value());
    REQUIRE(object.error().code == JsonError::Code::InvalidId);
}

TEST_CASE("JsonRpcId keeps the full int64 range and rejects larger ids", "[jsonrpc]") {
    auto largest = JsonRpcId::from_json(Json(std::uint64_t{9223372036854775807ULL}));
    REQUIRE(largest.has_value());
    REQUIRE(largest->to_string() == "9223372036854775807");

    auto too_big = JsonRpcId::from_json(Json(std::uint64_t{18446744073709551615ULL}));
    REQUIRE_FALSE(too_big.has_value());
    REQUIRE(too_big.error().code == JsonError::Code::InvalidId);
}

TEST_CASE("Integer and string ids with the same digits differ", "[jsonrpc]") {
    REQUIRE_FALSE(JsonRpcId::integer(1) == JsonRpcId::string("1"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Message::from_json classifies envelopes", "[jsonrpc]") {
    SECTION("Request") {
        auto m = Message::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
        REQUIRE(m.has_value());
        REQUIRE(m->kind() == Message::Kind::Request);
        REQUIRE(*m->method() == "ping");
        REQUIRE_FALSE(m->params().has_value());
    }

    SECTION("Notification") {
        auto m = Message::from_json({{"jsonrpc", "2.0"}, {"method", "initialized"}});
        REQUIRE(m.has_value());
        REQUIRE(m->kind() == Message::Kind::Notification);
        REQUIRE_FALSE(m->id().has_value());
    }

    SECTION("Response") {
        auto m = Message::from_json({{"jsonrpc", "2.0"}, {"id", "a"}, {"result", Json::object()}});
        REQUIRE(m.has_value());
        REQUIRE(m->kind() == Message::Kind::Response);
    }

    SECTION("Error response") {
        auto m = Message::from_json(
            {{"jsonrpc", "2.0"}, {"id", 3}, {"error", {{"code", -32601}, {"message", "nope"}}}});
        REQUIRE(m.has_value());
        REQUIRE(m->kind() == Message::Kind::Response);
        REQUIRE(m->error()->code == -32601);
    }

    SECTION("Id without method or outcome") {
        auto m = Message::from_json({{"jsonrpc", "2.0"}, {"id", 9}});
        REQUIRE(m.has_value());
        REQUIRE(m->kind() == Message::Kind::Invalid);
    }
}

TEST_CASE("Message::from_json accepts a missing jsonrpc member", "[jsonrpc]") {
    auto m = Message::from_json({{"id", 1}, {"method", "tools/list"}});
    REQUIRE(m.has_value());
    REQUIRE(m->kind() == Message::Kind::Request);
}

TEST_CASE("Message::from_json enforces envelope shape", "[jsonrpc]") {
    SECTION("Top level must be an object") {
        auto m = Message::from_json(Json::array({1, 2}));
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code == JsonError::Code::InvalidShape);
    }

    SECTION("Wrong protocol version") {
        auto m = Message::from_json({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("Non-string version") {
        auto m = Message::from_json({{"jsonrpc", 2}, {"id", 1}, {"method", "ping"}});
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("Method must be a string") {
        auto m = Message::from_json({{"id", 1}, {"method", 5}});
        REQUIRE_FALSE(m.has_value());
    }

    SECTION("Params must be structured") {
        auto m = Message::from_json({{"id", 1}, {"method", "ping"}, {"params", "x"}});
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code == JsonError::Code::InvalidParams);
    }

    SECTION("Result and error together") {
        auto m = Message::from_json(
            {{"id", 1}, {"result", 1}, {"error", {{"code", 1}, {"message", "m"}}}});
        REQUIRE_FALSE(m.has_value());
    }

    SECTION("Method on a response") {
        auto m = Message::from_json({{"id", 1}, {"method", "ping"}, {"result", 1}});
        REQUIRE_FALSE(m.has_value());
    }

    SECTION("Response without id") {
        auto m = Message::from_json({{"result", 1}});
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().code == JsonError::Code::MissingField);
    }

    SECTION("Error object without integer code") {
        auto m = Message::from_json({{"id", 1}, {"error", {{"code", "x"}, {"message", "m"}}}});
        REQUIRE_FALSE(m.has_value());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Message::to_json always carries jsonrpc 2.0", "[jsonrpc]") {
    const auto request = Message::request(JsonRpcId::integer(5), "tools/list").to_json();
    REQUIRE(request["jsonrpc"] == "2.0");
    REQUIRE(request["id"] == 5);
    REQUIRE_FALSE(request.contains("params"));

    const auto notification = Message::notification("notifications/initialized").to_json();
    REQUIRE_FALSE(notification.contains("id"));

    const auto error = Message::error_response(JsonRpcId::null(), JsonRpcError{-32700, "Parse error", {}}).to_json();
    REQUIRE(error["id"].is_null());
    REQUIRE(error["error"]["code"] == -32700);
    REQUIRE_FALSE(error["error"].contains("data"));
}

TEST_CASE("Error data is preserved", "[jsonrpc]") {
    const JsonRpcError error{-32602, "Invalid params", Json{{"pointer", "/expression"}}};
    auto parsed = JsonRpcError::from_json(error.to_json());

    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == error);
}

TEST_CASE("Message kind names", "[jsonrpc]") {
    REQUIRE(to_string(Message::Kind::Request) == "request");
    REQUIRE(to_string(Message::Kind::Invalid) == "invalid");
}
