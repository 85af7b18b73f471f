#include "mcps/protocol/json_rpc.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace mcps {
namespace {

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

tl::unexpected<JsonError> shape_error(JsonError::Code code, std::string message) {
    return tl::unexpected(JsonError{code, std::move(message)});
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::null() {
    return JsonRpcId{std::monostate{}};
}

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

bool JsonRpcId::is_null() const noexcept {
    return std::holds_alternative<std::monostate>(value);
}

Json JsonRpcId::to_json() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return nullptr;
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return "\"" + *text + "\"";
    }
    return "null";
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& id_node) {
    // Ids are held as int64; larger unsigned values would wrap on echo
    if (id_node.is_number_unsigned() == true
        && id_node.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return shape_error(JsonError::Code::InvalidId, "id is out of range");
    }
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }
    if (id_node.is_null() == true) {
        return JsonRpcId::null();
    }

    return shape_error(JsonError::Code::InvalidId, "id must be an integer, string or null");
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return shape_error(JsonError::Code::InvalidShape, "error must be an object");
    }
    const auto code_it = node.find("code");
    if ((code_it == node.end()) || (code_it->is_number_integer() == false)) {
        return shape_error(JsonError::Code::InvalidShape, "error.code must be an integer");
    }
    const auto message_it = node.find("message");
    if ((message_it == node.end()) || (message_it->is_string() == false)) {
        return shape_error(JsonError::Code::InvalidShape, "error.message must be a string");
    }

    JsonRpcError error;
    error.code = code_it->get<std::int64_t>();
    error.message = message_it->get<std::string>();
    if (node.contains("data")) {
        error.data = node.at("data");
    }
    return error;
}

// ═══════════════════════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════════════════════

Message Message::request(JsonRpcId id, std::string method, std::optional<Json> params) {
    Message message;
    message.id_ = std::move(id);
    message.method_ = std::move(method);
    message.params_ = std::move(params);
    return message;
}

Message Message::notification(std::string method, std::optional<Json> params) {
    Message message;
    message.method_ = std::move(method);
    message.params_ = std::move(params);
    return message;
}

Message Message::response(JsonRpcId id, Json result) {
    Message message;
    message.id_ = std::move(id);
    message.result_ = std::move(result);
    return message;
}

Message Message::error_response(JsonRpcId id, JsonRpcError error) {
    Message message;
    message.id_ = std::move(id);
    message.error_ = std::move(error);
    return message;
}

Message::Kind Message::kind() const noexcept {
    const bool has_id = id_.has_value();
    const bool has_method = method_.has_value();
    const bool has_outcome = result_.has_value() || error_.has_value();

    if (has_method && has_id) {
        return Kind::Request;
    }
    if (has_method) {
        return Kind::Notification;
    }
    if (has_id && has_outcome) {
        return Kind::Response;
    }
    return Kind::Invalid;
}

Json Message::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    if (id_.has_value()) {
        payload["id"] = id_->to_json();
    }
    if (method_.has_value()) {
        payload["method"] = *method_;
    }
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    if (result_.has_value()) {
        payload["result"] = *result_;
    }
    if (error_.has_value()) {
        payload["error"] = error_->to_json();
    }
    return payload;
}

JsonResult<Message> Message::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return shape_error(JsonError::Code::InvalidShape, "message must be a JSON object");
    }

    // jsonrpc is optional on the wire but must be "2.0" when present
    const auto version_it = payload.find("jsonrpc");
    if (version_it != payload.end()) {
        const bool version_is_string = version_it->is_string();
        if ((version_is_string == false) || (*version_it != kJsonRpcVersion)) {
            return shape_error(JsonError::Code::InvalidVersion, "jsonrpc must equal \"2.0\"");
        }
    }

    Message message;

    const auto id_it = payload.find("id");
    if (id_it != payload.end()) {
        auto parsed_id = JsonRpcId::from_json(*id_it);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        message.id_ = std::move(*parsed_id);
    }

    const auto method_it = payload.find("method");
    if (method_it != payload.end()) {
        if (method_it->is_string() == false) {
            return shape_error(JsonError::Code::InvalidShape, "method must be a string");
        }
        message.method_ = method_it->get<std::string>();
    }

    const auto params_it = payload.find("params");
    if (params_it != payload.end()) {
        if (is_valid_params_type(*params_it) == false) {
            return shape_error(JsonError::Code::InvalidParams, "params must be an object or array");
        }
        message.params_ = *params_it;
    }

    const auto result_it = payload.find("result");
    if (result_it != payload.end()) {
        message.result_ = *result_it;
    }

    const auto error_it = payload.find("error");
    if (error_it != payload.end()) {
        auto parsed_error = JsonRpcError::from_json(*error_it);
        if (parsed_error.has_value() == false) {
            return tl::unexpected(parsed_error.error());
        }
        message.error_ = std::move(*parsed_error);
    }

    if (message.result_.has_value() && message.error_.has_value()) {
        return shape_error(JsonError::Code::InvalidShape, "response carries both result and error");
    }
    const bool is_response_shaped = message.result_.has_value() || message.error_.has_value();
    if (is_response_shaped && message.method_.has_value()) {
        return shape_error(JsonError::Code::InvalidShape, "method is not allowed on a response");
    }
    if (is_response_shaped && (message.id_.has_value() == false)) {
        return shape_error(JsonError::Code::MissingField, "response is missing its id");
    }

    return message;
}

}  // namespace mcps
