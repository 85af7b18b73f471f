#include <catch2/catch_test_macros.hpp>

#include "mcps/server/session.hpp"

#include <string>

using namespace mcps;

namespace {

InitializeParams client_hello() {
    InitializeParams params;
    params.protocol_version = "2024-11-05";
    params.client_info = {"test-client", "0.1"};
    params.capabilities.roots = ClientCapabilities::Roots{true};
    return params;
}

Session initialized_session() {
    Session session("127.0.0.1:5000");
    session.on_initialize(client_hello());
    session.on_initialized();
    return session;
}

}  // namespace

TEST_CASE("Initialization notification names", "[session]") {
    REQUIRE(is_initialized_notification("initialized"));
    REQUIRE(is_initialized_notification("notifications/initialized"));
    REQUIRE_FALSE(is_initialized_notification("initialize"));
    REQUIRE_FALSE(is_initialized_notification("notifications/cancelled"));
}

TEST_CASE("A new session only admits initialize", "[session]") {
    Session session;

    REQUIRE(session.phase() == SessionPhase::AwaitingInitialize);
    REQUIRE(session.admit("initialize").has_value());

    for (const char* name : {"tools/list", "tools/call", "prompts/list", "prompts/get", "ping", "initialized"}) {
        auto admitted = session.admit(name);
        REQUIRE_FALSE(admitted.has_value());
        REQUIRE(admitted.error().code == ErrorCode::InvalidRequest);
    }
}

TEST_CASE("on_initialize records the client handshake", "[session]") {
    Session session;
    session.on_initialize(client_hello());

    REQUIRE(session.phase() == SessionPhase::InitializeAcknowledged);
    REQUIRE(session.client_info() == Implementation{"test-client", "0.1"});
    REQUIRE(session.client_capabilities().roots.has_value());
    REQUIRE(session.requested_protocol_version() == std::optional<std::string>("2024-11-05"));
}

TEST_CASE("Before the initialized notification only the notification is admitted", "[session]") {
    Session session;
    session.on_initialize(client_hello());

    REQUIRE(session.admit("initialized").has_value());
    REQUIRE(session.admit("notifications/initialized").has_value());

    for (const char* name : {"tools/list", "prompts/list", "tools/call", "ping"}) {
        auto admitted = session.admit(name);
        REQUIRE_FALSE(admitted.has_value());
        REQUIRE(admitted.error().code == ErrorCode::InvalidRequest);
        REQUIRE(admitted.error().message.find("Handshake incomplete") != std::string::npos);
    }

    auto again = session.admit("initialize");
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().message == "Session already initialized");
}

TEST_CASE("on_initialized completes the handshake exactly once", "[session]") {
    Session session;

    SECTION("Early notification is ignored") {
        REQUIRE_FALSE(session.on_initialized());
        REQUIRE(session.phase() == SessionPhase::AwaitingInitialize);
    }

    SECTION("Duplicate notification is ignored") {
        session.on_initialize(client_hello());
        REQUIRE(session.on_initialized());
        REQUIRE_FALSE(session.on_initialized());
        REQUIRE(session.phase() == SessionPhase::Initialized);
    }
}

TEST_CASE("An initialized session admits everything except initialize", "[session]") {
    auto session = initialized_session();

    for (const char* name : {"tools/list", "tools/call", "prompts/list", "prompts/get", "ping",
                             "logging/setLevel", "no/such/method"}) {
        REQUIRE(session.admit(name).has_value());
    }

    auto again = session.admit("initialize");
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ErrorCode::InvalidRequest);
}

TEST_CASE("A closed session admits nothing", "[session]") {
    auto session = initialized_session();
    session.close();

    REQUIRE(session.is_closed());
    REQUIRE_FALSE(session.admit("tools/list").has_value());
    REQUIRE_FALSE(session.admit("initialize").has_value());
    REQUIRE_FALSE(session.on_initialized());
}

TEST_CASE("Session log level filters by severity", "[session]") {
    Session session;
    REQUIRE(session.log_level() == LoggingLevel::Debug);
    REQUIRE(session.should_log(LoggingLevel::Debug));

    session.set_log_level(LoggingLevel::Error);
    REQUIRE_FALSE(session.should_log(LoggingLevel::Warning));
    REQUIRE(session.should_log(LoggingLevel::Error));
    REQUIRE(session.should_log(LoggingLevel::Emergency));
}

TEST_CASE("describe names the peer and phase", "[session]") {
    Session session("10.0.0.1:4242");
    REQUIRE(session.describe() == "peer=10.0.0.1:4242 phase=AwaitingInitialize");

    session.on_initialize(client_hello());
    REQUIRE(session.describe().find("InitializeAcknowledged") != std::string::npos);
    REQUIRE(to_string(SessionPhase::Closed) == "Closed");
}
