#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcps {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidShape,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId - integer, string, or null (null only answers unparseable input)
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::monostate, std::int64_t, std::string> value;

    static JsonRpcId null();
    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    static JsonResult<JsonRpcId> from_json(const Json& node);

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& node);

    friend bool operator==(const JsonRpcError&, const JsonRpcError&) = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Message - one JSON-RPC envelope
// ═══════════════════════════════════════════════════════════════════════════
// Requests carry id + method, notifications carry method only, responses
// carry id + exactly one of result/error. Anything else is Invalid and is
// answered with INVALID_REQUEST by the dispatcher.

class Message {
public:
    enum class Kind { Request, Notification, Response, Invalid };

    Message() = default;

    static Message request(JsonRpcId id, std::string method, std::optional<Json> params = std::nullopt);
    static Message notification(std::string method, std::optional<Json> params = std::nullopt);
    static Message response(JsonRpcId id, Json result);
    static Message error_response(JsonRpcId id, JsonRpcError error);

    [[nodiscard]] Kind kind() const noexcept;

    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept { return id_; }
    [[nodiscard]] const std::optional<std::string>& method() const noexcept { return method_; }
    [[nodiscard]] const std::optional<Json>& params() const noexcept { return params_; }
    [[nodiscard]] const std::optional<Json>& result() const noexcept { return result_; }
    [[nodiscard]] const std::optional<JsonRpcError>& error() const noexcept { return error_; }

    [[nodiscard]] Json to_json() const;

    /// Validate envelope shape. Never throws for malformed input.
    static JsonResult<Message> from_json(const Json& payload);

    friend bool operator==(const Message&, const Message&) = default;

private:
    std::optional<JsonRpcId> id_;
    std::optional<std::string> method_;
    std::optional<Json> params_;
    std::optional<Json> result_;
    std::optional<JsonRpcError> error_;
};

[[nodiscard]] constexpr std::string_view to_string(Message::Kind kind) noexcept {
    switch (kind) {
        case Message::Kind::Request:      return "request";
        case Message::Kind::Notification: return "notification";
        case Message::Kind::Response:     return "response";
        case Message::Kind::Invalid:      return "invalid";
    }
    return "unknown";
}

}  // namespace mcps
