#pragma once

#include "mcps/protocol/mcp_types.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcps {

// ═══════════════════════════════════════════════════════════════════════════
// Session - per-connection handshake state
// ═══════════════════════════════════════════════════════════════════════════
//
//   AwaitingInitialize --initialize--> InitializeAcknowledged
//   InitializeAcknowledged --initialized--> Initialized
//   any --close()--> Closed
//
// Owned by exactly one connection thread; never shared, never locked.

enum class SessionPhase {
    AwaitingInitialize,
    InitializeAcknowledged,
    Initialized,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::AwaitingInitialize:     return "AwaitingInitialize";
        case SessionPhase::InitializeAcknowledged: return "InitializeAcknowledged";
        case SessionPhase::Initialized:            return "Initialized";
        case SessionPhase::Closed:                 return "Closed";
    }
    return "Unknown";
}

/// "initialized" or "notifications/initialized"
[[nodiscard]] bool is_initialized_notification(std::string_view method_name) noexcept;

class Session {
public:
    explicit Session(std::string peer = "local");

    [[nodiscard]] SessionPhase phase() const noexcept { return phase_; }
    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }
    [[nodiscard]] bool is_closed() const noexcept { return phase_ == SessionPhase::Closed; }

    /// Whether `method` may run in the current phase. The error carries
    /// INVALID_REQUEST and a message naming the phase.
    [[nodiscard]] tl::expected<void, McpError> admit(std::string_view method_name) const;

    /// Record the client's handshake and move to InitializeAcknowledged.
    /// Only valid from AwaitingInitialize; admit() guards every call site.
    void on_initialize(InitializeParams params);

    /// Returns true when this completed the handshake. Early or repeated
    /// notifications leave the phase unchanged.
    bool on_initialized() noexcept;

    void close() noexcept { phase_ = SessionPhase::Closed; }

    [[nodiscard]] const std::optional<Implementation>& client_info() const noexcept { return client_info_; }
    [[nodiscard]] const ClientCapabilities& client_capabilities() const noexcept { return client_capabilities_; }
    [[nodiscard]] const std::optional<std::string>& requested_protocol_version() const noexcept {
        return requested_protocol_version_;
    }

    [[nodiscard]] LoggingLevel log_level() const noexcept { return log_level_; }
    void set_log_level(LoggingLevel level) noexcept { log_level_ = level; }

    /// Session-scoped log filter set through logging/setLevel.
    [[nodiscard]] bool should_log(LoggingLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(log_level_);
    }

    /// "peer=... phase=..." prefix for log lines.
    [[nodiscard]] std::string describe() const;

private:
    std::string peer_;
    SessionPhase phase_ = SessionPhase::AwaitingInitialize;
    std::optional<Implementation> client_info_;
    ClientCapabilities client_capabilities_;
    std::optional<std::string> requested_protocol_version_;
    LoggingLevel log_level_ = LoggingLevel::Debug;
};

}  // namespace mcps
