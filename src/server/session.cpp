#include "mcps/server/session.hpp"

namespace mcps {

bool is_initialized_notification(std::string_view method_name) noexcept {
    return method_name == method::Initialized || method_name == method::InitializedNotification;
}

Session::Session(std::string peer)
    : peer_(std::move(peer))
{}

tl::expected<void, McpError> Session::admit(std::string_view method_name) const {
    const bool is_initialize = (method_name == method::Initialize);
    const bool is_handshake_ack = is_initialized_notification(method_name);

    switch (phase_) {
        case SessionPhase::AwaitingInitialize:
            if (is_initialize) {
                return {};
            }
            return tl::unexpected(McpError::invalid_request(
                "Session not initialized: '" + std::string(method_name) + "' requires a completed initialize handshake"));

        case SessionPhase::InitializeAcknowledged:
            if (is_handshake_ack) {
                return {};
            }
            if (is_initialize) {
                return tl::unexpected(McpError::invalid_request("Session already initialized"));
            }
            return tl::unexpected(McpError::invalid_request(
                "Handshake incomplete: '" + std::string(method_name) + "' is not allowed before the initialized notification"));

        case SessionPhase::Initialized:
            if (is_initialize) {
                return tl::unexpected(McpError::invalid_request("Session already initialized"));
            }
            return {};

        case SessionPhase::Closed:
            return tl::unexpected(McpError::invalid_request("Session is closed"));
    }
    return tl::unexpected(McpError::internal_error("Unknown session phase"));
}

void Session::on_initialize(InitializeParams params) {
    client_info_ = std::move(params.client_info);
    client_capabilities_ = std::move(params.capabilities);
    requested_protocol_version_ = std::move(params.protocol_version);
    phase_ = SessionPhase::InitializeAcknowledged;
}

bool Session::on_initialized() noexcept {
    if (phase_ != SessionPhase::InitializeAcknowledged) {
        return false;
    }
    phase_ = SessionPhase::Initialized;
    return true;
}

std::string Session::describe() const {
    return "peer=" + peer_ + " phase=" + std::string(to_string(phase_));
}

}  // namespace mcps
