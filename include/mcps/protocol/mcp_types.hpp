#ifndef MCPS_PROTOCOL_MCP_TYPES_HPP
#define MCPS_PROTOCOL_MCP_TYPES_HPP

#include "mcps/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcps {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Method Names
// ═══════════════════════════════════════════════════════════════════════════

namespace method {
    inline constexpr std::string_view Initialize = "initialize";
    inline constexpr std::string_view Initialized = "initialized";
    inline constexpr std::string_view InitializedNotification = "notifications/initialized";
    inline constexpr std::string_view Ping = "ping";
    inline constexpr std::string_view ToolsList = "tools/list";
    inline constexpr std::string_view ToolsCall = "tools/call";
    inline constexpr std::string_view PromptsList = "prompts/list";
    inline constexpr std::string_view PromptsGet = "prompts/get";
    inline constexpr std::string_view LoggingSetLevel = "logging/setLevel";
}

namespace detail {

inline tl::unexpected<JsonError> invalid(std::string message) {
    return tl::unexpected(JsonError{JsonError::Code::InvalidParams, std::move(message)});
}

// Reads an optional string member; a present non-string value is an error.
inline JsonResult<std::optional<std::string>> optional_string(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return std::optional<std::string>{};
    }
    if (it->is_string() == false) {
        return invalid(std::string(key) + " must be a string");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

inline JsonResult<std::string> required_string(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField, std::string("missing ") + key});
    }
    if (it->is_string() == false) {
        return invalid(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static JsonResult<Implementation> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("implementation must be an object");
        }
        auto name = detail::required_string(j, "name");
        if (!name) {
            return tl::unexpected(name.error());
        }
        auto version = detail::required_string(j, "version");
        if (!version) {
            return tl::unexpected(version.error());
        }
        return Implementation{std::move(*name), std::move(*version)};
    }

    friend bool operator==(const Implementation&, const Implementation&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ClientCapabilities {
    struct Roots {
        bool list_changed = false;
        friend bool operator==(const Roots&, const Roots&) = default;
    };
    struct Sampling {
        friend bool operator==(const Sampling&, const Sampling&) = default;
    };

    std::optional<Roots> roots;
    std::optional<Sampling> sampling;
    Json experimental;  // For future extensions

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (roots) {
            j["roots"] = {{"listChanged", roots->list_changed}};
        }
        if (sampling) {
            j["sampling"] = Json::object();
        }
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }

    static JsonResult<ClientCapabilities> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("capabilities must be an object");
        }
        ClientCapabilities caps;
        if (j.contains("roots")) {
            const auto& roots = j["roots"];
            if (roots.is_object() == false) {
                return detail::invalid("capabilities.roots must be an object");
            }
            const auto changed = roots.find("listChanged");
            if ((changed != roots.end()) && (changed->is_boolean() == false)) {
                return detail::invalid("capabilities.roots.listChanged must be a boolean");
            }
            caps.roots = Roots{changed != roots.end() && changed->get<bool>()};
        }
        if (j.contains("sampling")) {
            caps.sampling = Sampling{};
        }
        if (j.contains("experimental")) {
            caps.experimental = j["experimental"];
        }
        return caps;
    }

    friend bool operator==(const ClientCapabilities&, const ClientCapabilities&) = default;
};

struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
        friend bool operator==(const Prompts&, const Prompts&) = default;
    };
    struct Tools {
        bool list_changed = false;
        friend bool operator==(const Tools&, const Tools&) = default;
    };
    struct Logging {
        friend bool operator==(const Logging&, const Logging&) = default;
    };

    std::optional<Prompts> prompts;
    std::optional<Tools> tools;
    std::optional<Logging> logging;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (prompts) {
            j["prompts"] = {{"listChanged", prompts->list_changed}};
        }
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (logging) {
            j["logging"] = Json::object();
        }
        return j;
    }

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.contains("prompts")) {
            caps.prompts = Prompts{
                j["prompts"].value("listChanged", false)
            };
        }
        if (j.contains("tools")) {
            caps.tools = Tools{
                j["tools"].value("listChanged", false)
            };
        }
        if (j.contains("logging")) {
            caps.logging = Logging{};
        }
        return caps;
    }

    friend bool operator==(const ServerCapabilities&, const ServerCapabilities&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }

    static JsonResult<InitializeParams> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("initialize params must be an object");
        }
        InitializeParams params;

        auto version = detail::required_string(j, "protocolVersion");
        if (!version) {
            return tl::unexpected(version.error());
        }
        params.protocol_version = std::move(*version);

        if (j.contains("capabilities") == false) {
            return tl::unexpected(JsonError{JsonError::Code::MissingField, "missing capabilities"});
        }
        auto caps = ClientCapabilities::from_json(j["capabilities"]);
        if (!caps) {
            return tl::unexpected(caps.error());
        }
        params.capabilities = std::move(*caps);

        if (j.contains("clientInfo") == false) {
            return tl::unexpected(JsonError{JsonError::Code::MissingField, "missing clientInfo"});
        }
        auto info = Implementation::from_json(j["clientInfo"]);
        if (!info) {
            return tl::unexpected(JsonError{info.error().code, "clientInfo: " + info.error().message});
        }
        params.client_info = std::move(*info);
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
        if (instructions) {
            j["instructions"] = *instructions;
        }
        return j;
    }

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo")) {
            const auto& info = j["serverInfo"];
            result.server_info = {info.value("name", ""), info.value("version", "")};
        }
        if (j.contains("instructions")) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content Types (used in tool results and prompt messages)
// ═══════════════════════════════════════════════════════════════════════════
// Content is a closed variant discriminated by "type". New content kinds are
// added as alternatives here and in content_from_json().

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }

    static JsonResult<TextContent> from_json(const Json& j) {
        auto text = detail::required_string(j, "text");
        if (!text) {
            return tl::unexpected(text.error());
        }
        return TextContent{std::move(*text)};
    }

    friend bool operator==(const TextContent&, const TextContent&) = default;
};

using Content = std::variant<TextContent>;

[[nodiscard]] inline Json content_to_json(const Content& content) {
    return std::visit([](const auto& block) { return block.to_json(); }, content);
}

inline JsonResult<Content> content_from_json(const Json& j) {
    if (j.is_object() == false) {
        return detail::invalid("content block must be an object");
    }
    auto type = detail::required_string(j, "type");
    if (!type) {
        return tl::unexpected(type.error());
    }
    if (*type == "text") {
        auto text = TextContent::from_json(j);
        if (!text) {
            return tl::unexpected(text.error());
        }
        return Content{std::move(*text)};
    }
    return detail::invalid("unsupported content type: " + *type);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::string description;
    Json input_schema = Json::object();  // JSON Schema for tool arguments

    [[nodiscard]] Json to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.value("name", "");
        tool.description = j.value("description", "");
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;

    [[nodiscard]] Json to_json() const {
        Json list = Json::array();
        for (const auto& tool : tools) {
            list.push_back(tool.to_json());
        }
        return {{"tools", list}};
    }

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                result.tools.push_back(Tool::from_json(t));
            }
        }
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }

    static JsonResult<CallToolParams> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("tools/call params must be an object");
        }
        auto name = detail::required_string(j, "name");
        if (!name) {
            return tl::unexpected(name.error());
        }
        CallToolParams params;
        params.name = std::move(*name);
        const auto args_it = j.find("arguments");
        if (args_it != j.end() && args_it->is_null() == false) {
            if (args_it->is_object() == false) {
                return detail::invalid("arguments must be an object");
            }
            params.arguments = *args_it;
        }
        return params;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    static CallToolResult text(std::string text) {
        return CallToolResult{{TextContent{std::move(text)}}, false};
    }

    static CallToolResult error(std::string text) {
        return CallToolResult{{TextContent{std::move(text)}}, true};
    }

    [[nodiscard]] Json to_json() const {
        Json blocks = Json::array();
        for (const auto& block : content) {
            blocks.push_back(content_to_json(block));
        }
        return {{"content", blocks}, {"isError", is_error}};
    }

    static JsonResult<CallToolResult> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("tool result must be an object");
        }
        CallToolResult result;
        const auto is_error_it = j.find("isError");
        if (is_error_it != j.end()) {
            if (is_error_it->is_boolean() == false) {
                return detail::invalid("isError must be a boolean");
            }
            result.is_error = is_error_it->get<bool>();
        }
        const auto content_it = j.find("content");
        if ((content_it == j.end()) || (content_it->is_array() == false)) {
            return detail::invalid("content must be an array");
        }
        for (const auto& c : *content_it) {
            auto block = content_from_json(c);
            if (!block) {
                return tl::unexpected(block.error());
            }
            result.content.push_back(std::move(*block));
        }
        return result;
    }

    friend bool operator==(const CallToolResult&, const CallToolResult&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"description", description}, {"required", required}};
    }

    static PromptArgument from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("description", ""),
            j.value("required", false)
        };
    }
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    [[nodiscard]] Json to_json() const {
        Json args = Json::array();
        for (const auto& arg : arguments) {
            args.push_back(arg.to_json());
        }
        return {{"name", name}, {"description", description}, {"arguments", args}};
    }

    static Prompt from_json(const Json& j) {
        Prompt prompt;
        prompt.name = j.value("name", "");
        prompt.description = j.value("description", "");
        if (j.contains("arguments") && j["arguments"].is_array()) {
            for (const auto& a : j["arguments"]) {
                prompt.arguments.push_back(PromptArgument::from_json(a));
            }
        }
        return prompt;
    }
};

struct ListPromptsResult {
    std::vector<Prompt> prompts;

    [[nodiscard]] Json to_json() const {
        Json list = Json::array();
        for (const auto& prompt : prompts) {
            list.push_back(prompt.to_json());
        }
        return {{"prompts", list}};
    }

    static ListPromptsResult from_json(const Json& j) {
        ListPromptsResult result;
        if (j.contains("prompts") && j["prompts"].is_array()) {
            for (const auto& p : j["prompts"]) {
                result.prompts.push_back(Prompt::from_json(p));
            }
        }
        return result;
    }
};

enum class Role {
    User,
    Assistant,
    System
};

[[nodiscard]] constexpr std::string_view to_string(Role role) noexcept {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "user";
}

[[nodiscard]] inline std::optional<Role> role_from_string(std::string_view s) noexcept {
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    if (s == "system") return Role::System;
    return std::nullopt;
}

struct PromptMessage {
    Role role = Role::User;
    Content content;

    [[nodiscard]] Json to_json() const {
        return {{"role", std::string(to_string(role))}, {"content", content_to_json(content)}};
    }

    static JsonResult<PromptMessage> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("prompt message must be an object");
        }
        auto role_name = detail::required_string(j, "role");
        if (!role_name) {
            return tl::unexpected(role_name.error());
        }
        const auto role = role_from_string(*role_name);
        if (!role) {
            return detail::invalid("unknown role: " + *role_name);
        }
        if (j.contains("content") == false) {
            return tl::unexpected(JsonError{JsonError::Code::MissingField, "missing content"});
        }
        auto content = content_from_json(j["content"]);
        if (!content) {
            return tl::unexpected(content.error());
        }
        return PromptMessage{*role, std::move(*content)};
    }

    friend bool operator==(const PromptMessage&, const PromptMessage&) = default;
};

struct GetPromptParams {
    std::string name;
    Json arguments = Json::object();  // name -> string value

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }

    static JsonResult<GetPromptParams> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("prompts/get params must be an object");
        }
        auto name = detail::required_string(j, "name");
        if (!name) {
            return tl::unexpected(name.error());
        }
        GetPromptParams params;
        params.name = std::move(*name);
        const auto args_it = j.find("arguments");
        if (args_it != j.end() && args_it->is_null() == false) {
            if (args_it->is_object() == false) {
                return detail::invalid("arguments must be an object");
            }
            for (const auto& [key, value] : args_it->items()) {
                if (value.is_string() == false) {
                    return detail::invalid("argument '" + key + "' must be a string");
                }
            }
            params.arguments = *args_it;
        }
        return params;
    }
};

struct GetPromptResult {
    std::string description;
    std::vector<PromptMessage> messages;

    [[nodiscard]] Json to_json() const {
        Json list = Json::array();
        for (const auto& message : messages) {
            list.push_back(message.to_json());
        }
        return {{"description", description}, {"messages", list}};
    }

    static JsonResult<GetPromptResult> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("prompt result must be an object");
        }
        GetPromptResult result;
        result.description = j.value("description", "");
        if (j.contains("messages") && j["messages"].is_array()) {
            for (const auto& m : j["messages"]) {
                auto message = PromptMessage::from_json(m);
                if (!message) {
                    return tl::unexpected(message.error());
                }
                result.messages.push_back(std::move(*message));
            }
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

enum class LoggingLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

inline std::string to_string(LoggingLevel level) {
    switch (level) {
        case LoggingLevel::Debug: return "debug";
        case LoggingLevel::Info: return "info";
        case LoggingLevel::Notice: return "notice";
        case LoggingLevel::Warning: return "warning";
        case LoggingLevel::Error: return "error";
        case LoggingLevel::Critical: return "critical";
        case LoggingLevel::Alert: return "alert";
        case LoggingLevel::Emergency: return "emergency";
    }
    return "info";
}

inline std::optional<LoggingLevel> logging_level_from_string(std::string_view s) {
    if (s == "debug") return LoggingLevel::Debug;
    if (s == "info") return LoggingLevel::Info;
    if (s == "notice") return LoggingLevel::Notice;
    if (s == "warning") return LoggingLevel::Warning;
    if (s == "error") return LoggingLevel::Error;
    if (s == "critical") return LoggingLevel::Critical;
    if (s == "alert") return LoggingLevel::Alert;
    if (s == "emergency") return LoggingLevel::Emergency;
    return std::nullopt;
}

struct SetLevelParams {
    LoggingLevel level = LoggingLevel::Info;

    [[nodiscard]] Json to_json() const {
        return {{"level", to_string(level)}};
    }

    static JsonResult<SetLevelParams> from_json(const Json& j) {
        if (j.is_object() == false) {
            return detail::invalid("logging/setLevel params must be an object");
        }
        auto name = detail::required_string(j, "level");
        if (!name) {
            return tl::unexpected(name.error());
        }
        const auto level = logging_level_from_string(*name);
        if (!level) {
            return detail::invalid("unknown logging level: " + *name);
        }
        return SetLevelParams{*level};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

[[nodiscard]] constexpr std::string_view error_code_name(int code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:     return "PARSE_ERROR";
        case ErrorCode::InvalidRequest: return "INVALID_REQUEST";
        case ErrorCode::MethodNotFound: return "METHOD_NOT_FOUND";
        case ErrorCode::InvalidParams:  return "INVALID_PARAMS";
        case ErrorCode::InternalError:  return "INTERNAL_ERROR";
        default:                        return "UNKNOWN_ERROR";
    }
}

struct McpError {
    int code;
    std::string message;
    std::optional<Json> data;

    static McpError parse_error(std::string msg) { return {ErrorCode::ParseError, std::move(msg), std::nullopt}; }
    static McpError invalid_request(std::string msg) { return {ErrorCode::InvalidRequest, std::move(msg), std::nullopt}; }
    static McpError method_not_found(std::string msg) { return {ErrorCode::MethodNotFound, std::move(msg), std::nullopt}; }
    static McpError invalid_params(std::string msg) { return {ErrorCode::InvalidParams, std::move(msg), std::nullopt}; }
    static McpError internal_error(std::string msg) { return {ErrorCode::InternalError, std::move(msg), std::nullopt}; }

    static McpError from_json(const Json& j) {
        McpError err;
        err.code = j.value("code", 0);
        err.message = j.value("message", "");
        if (j.contains("data")) {
            err.data = j["data"];
        }
        return err;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }

    [[nodiscard]] JsonRpcError to_rpc_error() const {
        return JsonRpcError{code, message, data};
    }
};

}  // namespace mcps

#endif  // MCPS_PROTOCOL_MCP_TYPES_HPP
