#include "mcps/server/dispatcher.hpp"

#include "mcps/log/logger.hpp"
#include "mcps/server/schema_validator.hpp"
#include "mcps/server/server_config.hpp"
#include "mcps/version.hpp"

#include <stdexcept>

namespace mcps {

namespace {

constexpr const char* kInstructions =
    "Tools: calculator, datetime, file operations inside the workspace and, when enabled, "
    "shell commands. Prompts: code_review, text_summary, code_explanation, test_generation.";

// Log through the process logger, filtered by the session's logging/setLevel.
void session_log(const Session& session, LoggingLevel level, const std::string& message) {
    if (session.should_log(level) == false) {
        return;
    }
    get_logger()->write(to_log_level(level), "[" + session.describe() + "] " + message);
}

void log_protocol_error(const Session& session, const std::string& method, const McpError& error) {
    session_log(session, LoggingLevel::Warning,
        "method=" + method + " error=" + std::string(error_code_name(error.code)) + " " + error.message);
}

Message error_message(const JsonRpcId& id, const McpError& error) {
    return Message::error_response(id, error.to_rpc_error());
}

McpError invalid_params(const JsonError& error) {
    return McpError::invalid_params("Invalid params: " + error.message);
}

const Json& params_or_empty(const Message& message) {
    static const Json empty = Json::object();
    return message.params().has_value() ? *message.params() : empty;
}

}  // namespace

DispatcherOptions DispatcherOptions::defaults() {
    return DispatcherOptions{Implementation{kServerName, MCPS_VERSION}, std::string(kInstructions)};
}

Dispatcher::Dispatcher(
    std::shared_ptr<const ToolRegistry> tools,
    std::shared_ptr<const PromptRegistry> prompts,
    DispatcherOptions options
)
    : tools_(std::move(tools))
    , prompts_(std::move(prompts))
    , options_(std::move(options))
{
    if (!tools_ || !prompts_) {
        throw std::invalid_argument("Dispatcher: registries cannot be null");
    }
}

ServerCapabilities Dispatcher::capabilities() const {
    ServerCapabilities caps;
    caps.tools = ServerCapabilities::Tools{false};
    caps.prompts = ServerCapabilities::Prompts{false};
    caps.logging = ServerCapabilities::Logging{};
    return caps;
}

// ─────────────────────────────────────────────────────────────────────────────
// Entry points
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Message> Dispatcher::handle(Session& session, const Message& message) const {
    const auto kind = message.kind();

    if (kind == Message::Kind::Notification) {
        return handle_notification(session, *message.method());
    }

    const JsonRpcId id = message.id().value_or(JsonRpcId::null());

    if (kind == Message::Kind::Response) {
        const auto error = McpError::invalid_request("Unexpected response: this server issues no requests");
        log_protocol_error(session, "<response>", error);
        return error_message(id, error);
    }
    if (kind == Message::Kind::Invalid) {
        const auto error = McpError::invalid_request("Invalid request: missing method");
        log_protocol_error(session, "<none>", error);
        return error_message(id, error);
    }

    const std::string& method = *message.method();
    session_log(session, LoggingLevel::Debug, "request id=" + id.to_string() + " method=" + method);

    HandlerResult result;
    try {
        result = route(session, method, params_or_empty(message));
    } catch (const std::exception& e) {
        MCPS_LOG_ERROR("[" + session.describe() + "] method=" + method + " internal failure: " + e.what());
        result = tl::unexpected(McpError::internal_error(std::string("Internal error: ") + e.what()));
    }

    if (!result) {
        if (result.error().code != ErrorCode::InternalError) {
            log_protocol_error(session, method, result.error());
        }
        return error_message(id, result.error());
    }
    return Message::response(id, std::move(*result));
}

Message Dispatcher::reject_undecodable(const Session& session, const DecodeError& error) const {
    session_log(session, LoggingLevel::Warning,
        "error=PARSE_ERROR kind=" + std::string(to_string(error.kind)) + " " + error.message);
    return make_parse_error_response(error);
}

std::optional<Message> Dispatcher::handle_notification(Session& session, const std::string& method) const {
    if (is_initialized_notification(method)) {
        if (session.on_initialized()) {
            session_log(session, LoggingLevel::Info, "handshake complete");
        } else {
            session_log(session, LoggingLevel::Notice, "ignoring " + method + " notification");
        }
        return std::nullopt;
    }

    session_log(session, LoggingLevel::Debug, "ignoring unknown notification " + method);
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────────────────────────────────────

HandlerResult Dispatcher::route(Session& session, const std::string& method, const Json& params) const {
    auto admitted = session.admit(method);
    if (!admitted) {
        return tl::unexpected(admitted.error());
    }

    if (method == method::Initialize) {
        return handle_initialize(session, params);
    }
    if (is_initialized_notification(method)) {
        // Sent as a request; treated as the notification and acknowledged
        if (session.on_initialized()) {
            session_log(session, LoggingLevel::Info, "handshake complete");
        }
        return Json::object();
    }
    if (method == method::Ping) {
        return Json::object();
    }
    if (method == method::ToolsList) {
        return handle_tools_list();
    }
    if (method == method::ToolsCall) {
        return handle_tools_call(session, params);
    }
    if (method == method::PromptsList) {
        return handle_prompts_list();
    }
    if (method == method::PromptsGet) {
        return handle_prompts_get(session, params);
    }
    if (method == method::LoggingSetLevel) {
        return handle_set_level(session, params);
    }

    return tl::unexpected(McpError::method_not_found("Method not found: " + method));
}

// ─────────────────────────────────────────────────────────────────────────────
// Handlers
// ─────────────────────────────────────────────────────────────────────────────

HandlerResult Dispatcher::handle_initialize(Session& session, const Json& params) const {
    auto parsed = InitializeParams::from_json(params);
    if (!parsed) {
        return tl::unexpected(invalid_params(parsed.error()));
    }

    if (parsed->protocol_version != MCP_PROTOCOL_VERSION) {
        // Mismatch is not fatal; the client decides whether to continue
        session_log(session, LoggingLevel::Notice,
            "client requested protocol " + parsed->protocol_version + ", answering with " + MCP_PROTOCOL_VERSION);
    }

    const std::string client = parsed->client_info.name + " " + parsed->client_info.version;
    session.on_initialize(std::move(*parsed));
    session_log(session, LoggingLevel::Info, "initialized by " + client);

    InitializeResult result;
    result.protocol_version = MCP_PROTOCOL_VERSION;
    result.capabilities = capabilities();
    result.server_info = options_.server_info;
    result.instructions = options_.instructions;
    return result.to_json();
}

HandlerResult Dispatcher::handle_tools_list() const {
    return ListToolsResult{tools_->list()}.to_json();
}

HandlerResult Dispatcher::handle_tools_call(Session& session, const Json& params) const {
    auto parsed = CallToolParams::from_json(params);
    if (!parsed) {
        return tl::unexpected(invalid_params(parsed.error()));
    }

    const ToolEntry* entry = tools_->find(parsed->name);
    if (entry == nullptr) {
        return tl::unexpected(McpError::method_not_found("Unknown tool: " + parsed->name));
    }

    auto valid = validate_schema(entry->tool.input_schema, parsed->arguments);
    if (!valid) {
        auto error = McpError::invalid_params(
            "Invalid arguments for tool '" + parsed->name + "': " + valid.error().to_string());
        error.data = Json{{"pointer", valid.error().pointer}};
        return tl::unexpected(std::move(error));
    }

    session_log(session, LoggingLevel::Debug, "calling tool " + parsed->name);
    const CallToolResult result = entry->invoke(parsed->arguments);
    if (result.is_error) {
        session_log(session, LoggingLevel::Warning, "tool " + parsed->name + " reported an error");
    }
    return result.to_json();
}

HandlerResult Dispatcher::handle_prompts_list() const {
    return ListPromptsResult{prompts_->list()}.to_json();
}

HandlerResult Dispatcher::handle_prompts_get(Session& session, const Json& params) const {
    auto parsed = GetPromptParams::from_json(params);
    if (!parsed) {
        return tl::unexpected(invalid_params(parsed.error()));
    }

    const PromptEntry* entry = prompts_->find(parsed->name);
    if (entry == nullptr) {
        return tl::unexpected(McpError::invalid_params("Unknown prompt: " + parsed->name));
    }

    PromptArguments arguments;
    for (const auto& [key, value] : parsed->arguments.items()) {
        arguments.emplace(key, value.get<std::string>());
    }

    if (auto missing = entry->missing_required(arguments)) {
        return tl::unexpected(McpError::invalid_params(
            "Missing required argument '" + *missing + "' for prompt '" + parsed->name + "'"));
    }

    GetPromptResult result;
    result.description = entry->prompt.description;
    try {
        result.messages = entry->renderer(arguments);
    } catch (const std::exception& e) {
        MCPS_LOG_ERROR("[" + session.describe() + "] prompt " + parsed->name + " failed to render: " + e.what());
        return tl::unexpected(McpError::internal_error(
            "Failed to render prompt '" + parsed->name + "': " + e.what()));
    }
    return result.to_json();
}

HandlerResult Dispatcher::handle_set_level(Session& session, const Json& params) const {
    auto parsed = SetLevelParams::from_json(params);
    if (!parsed) {
        return tl::unexpected(invalid_params(parsed.error()));
    }
    session.set_log_level(parsed->level);
    MCPS_LOG_INFO("[" + session.describe() + "] log level set to " + std::string(to_string(parsed->level)));
    return Json::object();
}

}  // namespace mcps
