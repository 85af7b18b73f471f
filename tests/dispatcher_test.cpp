#include <catch2/catch_test_macros.hpp>

#include "mcps/server/dispatcher.hpp"
#include "mcps/version.hpp"
#include "mocks/recording_logger.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace mcps;

namespace {

std::shared_ptr<ToolRegistry> make_tools() {
    auto tools = std::make_shared<ToolRegistry>();

    Tool echo;
    echo.name = "echo";
    echo.description = "Echo the text argument";
    echo.input_schema = Json{
        {"type", "object"},
        {"properties", {{"text", {{"type", "string"}}}}},
        {"required", Json::array({"text"})}
    };
    tools->add(echo, [](const Json& args) {
        return CallToolResult::text(args.at("text").get<std::string>());
    });

    Tool fail;
    fail.name = "fail";
    fail.description = "Always reports a tool error";
    tools->add(fail, [](const Json&) { return CallToolResult::error("nope"); });

    return tools;
}

std::shared_ptr<PromptRegistry> make_prompts() {
    auto prompts = std::make_shared<PromptRegistry>();

    Prompt greet;
    greet.name = "greet";
    greet.description = "Greet someone";
    greet.arguments = {PromptArgument{"who", "Name to greet", true}};
    prompts->add(greet, [](const PromptArguments& args) {
        return std::vector<PromptMessage>{{Role::User, TextContent{"Hello " + args.at("who")}}};
    });

    Prompt broken;
    broken.name = "broken";
    broken.description = "Renderer throws";
    prompts->add(broken, [](const PromptArguments&) -> std::vector<PromptMessage> {
        throw std::runtime_error("template missing");
    });

    return prompts;
}

Json initialize_params() {
    return Json{
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}
    };
}

class DispatcherFixture {
public:
    DispatcherFixture()
        : logger_(LogLevel::Trace)
        , dispatcher_(make_tools(), make_prompts())
    {}

    std::optional<Message> request(std::int64_t id, std::string method, std::optional<Json> params = std::nullopt) {
        return dispatcher_.handle(session_, Message::request(JsonRpcId::integer(id), std::move(method), std::move(params)));
    }

    std::optional<Message> notify(std::string method) {
        return dispatcher_.handle(session_, Message::notification(std::move(method)));
    }

    void handshake() {
        REQUIRE(request(1, "initialize", initialize_params()).has_value());
        REQUIRE_FALSE(notify("notifications/initialized").has_value());
        REQUIRE(session_.phase() == SessionPhase::Initialized);
    }

    Session& session() { return session_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }
    testing::ScopedRecordingLogger& logger() { return logger_; }

private:
    testing::ScopedRecordingLogger logger_;
    Dispatcher dispatcher_;
    Session session_{"test-peer"};
};

int error_code(const std::optional<Message>& reply) {
    REQUIRE(reply.has_value());
    REQUIRE(reply->error().has_value());
    return static_cast<int>(reply->error()->code);
}

Json result_of(const std::optional<Message>& reply) {
    REQUIRE(reply.has_value());
    REQUIRE(reply->result().has_value());
    return *reply->result();
}

}  // namespace

TEST_CASE("Dispatcher rejects null registries", "[dispatcher]") {
    REQUIRE_THROWS_AS(Dispatcher(nullptr, make_prompts()), std::invalid_argument);
    REQUIRE_THROWS_AS(Dispatcher(make_tools(), nullptr), std::invalid_argument);
}

TEST_CASE("initialize answers with server info and capabilities", "[dispatcher]") {
    DispatcherFixture fx;

    auto reply = fx.request(1, "initialize", initialize_params());
    const Json result = result_of(reply);

    REQUIRE(reply->id() == JsonRpcId::integer(1));
    REQUIRE(result["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(result["serverInfo"]["name"] == kServerName);
    REQUIRE(result["serverInfo"]["version"] == MCPS_VERSION);
    REQUIRE(result["capabilities"].contains("tools"));
    REQUIRE(result["capabilities"].contains("prompts"));
    REQUIRE(result.contains("instructions"));

    REQUIRE(fx.session().phase() == SessionPhase::InitializeAcknowledged);
    REQUIRE(fx.session().client_info()->name == "test-client");
}

TEST_CASE("initialize with a different protocol version still succeeds", "[dispatcher]") {
    DispatcherFixture fx;
    Json params = initialize_params();
    params["protocolVersion"] = "1999-01-01";

    const Json result = result_of(fx.request(1, "initialize", params));
    REQUIRE(result["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(fx.logger()->contains("1999-01-01"));
}

TEST_CASE("initialize with malformed params is INVALID_PARAMS", "[dispatcher]") {
    DispatcherFixture fx;

    REQUIRE(error_code(fx.request(1, "initialize", Json{{"capabilities", Json::object()}})) == ErrorCode::InvalidParams);
    REQUIRE(fx.session().phase() == SessionPhase::AwaitingInitialize);
}

TEST_CASE("Requests before the handshake are INVALID_REQUEST", "[dispatcher]") {
    DispatcherFixture fx;

    SECTION("Before initialize") {
        auto reply = fx.request(7, "tools/call", Json{{"name", "echo"}, {"arguments", {{"text", "hi"}}}});
        REQUIRE(error_code(reply) == ErrorCode::InvalidRequest);
        REQUIRE(reply->id() == JsonRpcId::integer(7));
    }

    SECTION("Between initialize and the initialized notification") {
        REQUIRE(fx.request(1, "initialize", initialize_params()).has_value());
        REQUIRE(error_code(fx.request(2, "tools/list")) == ErrorCode::InvalidRequest);
        REQUIRE(error_code(fx.request(3, "ping")) == ErrorCode::InvalidRequest);
    }

    SECTION("A second initialize") {
        fx.handshake();
        REQUIRE(error_code(fx.request(2, "initialize", initialize_params())) == ErrorCode::InvalidRequest);
    }
}

TEST_CASE("Notifications never get a reply", "[dispatcher]") {
    DispatcherFixture fx;

    REQUIRE_FALSE(fx.notify("notifications/initialized").has_value());
    REQUIRE_FALSE(fx.notify("notifications/cancelled").has_value());
    REQUIRE(fx.session().phase() == SessionPhase::AwaitingInitialize);

    fx.handshake();
    REQUIRE_FALSE(fx.notify("initialized").has_value());
    REQUIRE_FALSE(fx.notify("tools/list").has_value());
}

TEST_CASE("initialized sent as a request completes the handshake", "[dispatcher]") {
    DispatcherFixture fx;
    REQUIRE(fx.request(1, "initialize", initialize_params()).has_value());

    const Json result = result_of(fx.request(2, "initialized"));
    REQUIRE(result == Json::object());
    REQUIRE(fx.session().phase() == SessionPhase::Initialized);
}

TEST_CASE("ping and unknown methods after the handshake", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    REQUIRE(result_of(fx.request(2, "ping")) == Json::object());

    auto unknown = fx.request(3, "resources/list");
    REQUIRE(error_code(unknown) == ErrorCode::MethodNotFound);
    REQUIRE(unknown->error()->message.find("resources/list") != std::string::npos);
}

TEST_CASE("tools/list reports every registered tool", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    const Json result = result_of(fx.request(2, "tools/list"));
    REQUIRE(result["tools"].size() == 2);
    REQUIRE(result["tools"][0]["name"] == "echo");
    REQUIRE(result["tools"][0]["inputSchema"]["required"][0] == "text");
    REQUIRE(result["tools"][1]["name"] == "fail");
}

TEST_CASE("tools/call", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    SECTION("Successful call") {
        const Json result = result_of(fx.request(2, "tools/call", Json{{"name", "echo"}, {"arguments", {{"text", "hi"}}}}));
        REQUIRE(result["isError"] == false);
        REQUIRE(result["content"][0]["type"] == "text");
        REQUIRE(result["content"][0]["text"] == "hi");
    }

    SECTION("Tool-level failure is a result, not a protocol error") {
        const Json result = result_of(fx.request(2, "tools/call", Json{{"name", "fail"}}));
        REQUIRE(result["isError"] == true);
        REQUIRE(result["content"][0]["text"] == "nope");
    }

    SECTION("Unknown tool") {
        auto reply = fx.request(2, "tools/call", Json{{"name", "teleport"}});
        REQUIRE(error_code(reply) == ErrorCode::MethodNotFound);
        REQUIRE(reply->error()->message == "Unknown tool: teleport");
    }

    SECTION("Arguments that violate the input schema") {
        auto reply = fx.request(2, "tools/call", Json{{"name", "echo"}, {"arguments", {{"text", 42}}}});
        REQUIRE(error_code(reply) == ErrorCode::InvalidParams);
        REQUIRE(reply->error()->data.has_value());
        REQUIRE((*reply->error()->data)["pointer"] == "/text");
    }

    SECTION("Arguments missing a required field") {
        auto reply = fx.request(2, "tools/call", Json{{"name", "echo"}, {"arguments", Json::object()}});
        REQUIRE(error_code(reply) == ErrorCode::InvalidParams);
        REQUIRE(reply->error()->message.find("text") != std::string::npos);
    }

    SECTION("Missing tool name") {
        REQUIRE(error_code(fx.request(2, "tools/call", Json{{"arguments", Json::object()}})) == ErrorCode::InvalidParams);
    }
}

TEST_CASE("tools/call only runs handlers for valid arguments", "[dispatcher]") {
    testing::ScopedRecordingLogger logger(LogLevel::Trace);

    auto calls = std::make_shared<int>(0);
    auto tools = std::make_shared<ToolRegistry>();

    Tool count;
    count.name = "count";
    count.description = "Counts invocations";
    count.input_schema = Json{
        {"type", "object"},
        {"properties", {{"label", {{"type", "string"}}}}},
        {"required", Json::array({"label"})}
    };
    tools->add(count, [calls](const Json&) {
        ++*calls;
        return CallToolResult::text("counted");
    });

    Tool explode;
    explode.name = "explode";
    explode.description = "Handler throws";
    tools->add(explode, [](const Json&) -> CallToolResult {
        throw std::runtime_error("disk on fire");
    });

    Dispatcher dispatcher(tools, std::make_shared<PromptRegistry>());
    Session session("test-peer");
    REQUIRE(dispatcher.handle(session, Message::request(JsonRpcId::integer(1), "initialize", initialize_params())).has_value());
    REQUIRE_FALSE(dispatcher.handle(session, Message::notification("notifications/initialized")).has_value());

    auto call = [&](std::int64_t id, Json params) {
        return dispatcher.handle(session, Message::request(JsonRpcId::integer(id), "tools/call", std::move(params)));
    };

    SECTION("Missing required field never reaches the handler") {
        REQUIRE(error_code(call(2, Json{{"name", "count"}, {"arguments", Json::object()}})) == ErrorCode::InvalidParams);
        REQUIRE(error_code(call(3, Json{{"name", "count"}})) == ErrorCode::InvalidParams);
        REQUIRE(*calls == 0);

        REQUIRE(result_of(call(4, Json{{"name", "count"}, {"arguments", {{"label", "a"}}}}))["isError"] == false);
        REQUIRE(*calls == 1);
    }

    SECTION("A throwing handler yields an isError result") {
        auto reply = call(2, Json{{"name", "explode"}, {"arguments", Json::object()}});
        REQUIRE(reply.has_value());
        REQUIRE_FALSE(reply->error().has_value());

        const Json result = result_of(reply);
        REQUIRE(result["isError"] == true);
        REQUIRE(result["content"][0]["text"].get<std::string>().find("disk on fire") != std::string::npos);

        const Json wire = reply->to_json();
        REQUIRE_FALSE(wire.contains("error"));
        REQUIRE(wire["id"] == 2);
    }
}

TEST_CASE("prompts/list and prompts/get", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    SECTION("Listing") {
        const Json result = result_of(fx.request(2, "prompts/list"));
        REQUIRE(result["prompts"].size() == 2);
        REQUIRE(result["prompts"][0]["name"] == "greet");
        REQUIRE(result["prompts"][0]["arguments"][0]["required"] == true);
    }

    SECTION("Rendering") {
        const Json result = result_of(fx.request(2, "prompts/get", Json{{"name", "greet"}, {"arguments", {{"who", "Ada"}}}}));
        REQUIRE(result["description"] == "Greet someone");
        REQUIRE(result["messages"][0]["role"] == "user");
        REQUIRE(result["messages"][0]["content"]["text"] == "Hello Ada");
    }

    SECTION("Missing required argument") {
        auto reply = fx.request(2, "prompts/get", Json{{"name", "greet"}});
        REQUIRE(error_code(reply) == ErrorCode::InvalidParams);
        REQUIRE(reply->error()->message.find("'who'") != std::string::npos);
    }

    SECTION("Unknown prompt") {
        REQUIRE(error_code(fx.request(2, "prompts/get", Json{{"name", "nothing"}})) == ErrorCode::InvalidParams);
    }

    SECTION("Renderer failure is INTERNAL_ERROR") {
        auto reply = fx.request(2, "prompts/get", Json{{"name", "broken"}});
        REQUIRE(error_code(reply) == ErrorCode::InternalError);
        REQUIRE(reply->error()->message.find("template missing") != std::string::npos);
        REQUIRE(fx.logger()->contains("failed to render"));
    }
}

TEST_CASE("logging/setLevel changes the session filter", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    REQUIRE(result_of(fx.request(2, "logging/setLevel", Json{{"level", "error"}})) == Json::object());
    REQUIRE(fx.session().log_level() == LoggingLevel::Error);

    REQUIRE(error_code(fx.request(3, "logging/setLevel", Json{{"level", "chatty"}})) == ErrorCode::InvalidParams);
    REQUIRE(fx.session().log_level() == LoggingLevel::Error);
}

TEST_CASE("Responses from the client are INVALID_REQUEST", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();

    auto reply = fx.dispatcher().handle(fx.session(), Message::response(JsonRpcId::string("abc"), Json::object()));
    REQUIRE(error_code(reply) == ErrorCode::InvalidRequest);
    REQUIRE(reply->id() == JsonRpcId::string("abc"));
}

TEST_CASE("Undecodable frames become PARSE_ERROR responses", "[dispatcher]") {
    DispatcherFixture fx;

    DecodeError error{DecodeError::Kind::Syntax, "unexpected end of input", std::nullopt};
    Message reply = fx.dispatcher().reject_undecodable(fx.session(), error);

    REQUIRE(reply.error().has_value());
    REQUIRE(reply.error()->code == ErrorCode::ParseError);
    REQUIRE(reply.id() == JsonRpcId::null());
    REQUIRE(fx.logger()->contains("PARSE_ERROR"));

    error.id = JsonRpcId::integer(9);
    REQUIRE(fx.dispatcher().reject_undecodable(fx.session(), error).id() == JsonRpcId::integer(9));
}

TEST_CASE("Session log level silences dispatcher logging", "[dispatcher]") {
    DispatcherFixture fx;
    fx.handshake();
    REQUIRE(fx.request(2, "logging/setLevel", Json{{"level", "emergency"}}).has_value());
    fx.logger()->clear();

    REQUIRE(fx.request(3, "tools/call", Json{{"name", "teleport"}}).has_value());
    REQUIRE_FALSE(fx.logger()->contains("teleport"));
}
