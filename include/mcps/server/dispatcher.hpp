#pragma once

#include "mcps/protocol/codec.hpp"
#include "mcps/protocol/json_rpc.hpp"
#include "mcps/protocol/mcp_types.hpp"
#include "mcps/server/prompt_registry.hpp"
#include "mcps/server/session.hpp"
#include "mcps/server/tool_registry.hpp"

#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcps {

using HandlerResult = tl::expected<Json, McpError>;

struct DispatcherOptions {
    Implementation server_info;
    std::optional<std::string> instructions;

    /// mcp-server / MCPS_VERSION with the default usage instructions.
    static DispatcherOptions defaults();
};

// ═══════════════════════════════════════════════════════════════════════════
// Dispatcher - routes one decoded message to its handler
// ═══════════════════════════════════════════════════════════════════════════
// Stateless apart from the shared read-only registries, so one instance
// serves every connection. All per-connection state lives in Session.

class Dispatcher {
public:
    Dispatcher(
        std::shared_ptr<const ToolRegistry> tools,
        std::shared_ptr<const PromptRegistry> prompts,
        DispatcherOptions options = DispatcherOptions::defaults()
    );

    /// Response to send, or nullopt for notifications. Never throws:
    /// unexpected failures become INTERNAL_ERROR responses.
    [[nodiscard]] std::optional<Message> handle(Session& session, const Message& message) const;

    /// PARSE_ERROR response for a frame the codec rejected, logged with
    /// the session context.
    [[nodiscard]] Message reject_undecodable(const Session& session, const DecodeError& error) const;

    [[nodiscard]] ServerCapabilities capabilities() const;

    [[nodiscard]] const ToolRegistry& tools() const noexcept { return *tools_; }
    [[nodiscard]] const PromptRegistry& prompts() const noexcept { return *prompts_; }

private:
    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<const PromptRegistry> prompts_;
    DispatcherOptions options_;

    std::optional<Message> handle_notification(Session& session, const std::string& method) const;
    HandlerResult route(Session& session, const std::string& method, const Json& params) const;

    HandlerResult handle_initialize(Session& session, const Json& params) const;
    HandlerResult handle_tools_list() const;
    HandlerResult handle_tools_call(Session& session, const Json& params) const;
    HandlerResult handle_prompts_list() const;
    HandlerResult handle_prompts_get(Session& session, const Json& params) const;
    HandlerResult handle_set_level(Session& session, const Json& params) const;
};

}  // namespace mcps
