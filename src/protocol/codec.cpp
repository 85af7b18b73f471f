#include "mcps/protocol/codec.hpp"

#include "mcps/json/fast_json.hpp"
#include "mcps/protocol/mcp_types.hpp"

namespace mcps {

namespace {

bool is_json_whitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Best effort: an id that is itself well-formed is echoed back even when the
// rest of the envelope is not.
std::optional<JsonRpcId> recover_id(const Json& payload) {
    if (payload.is_object() == false) {
        return std::nullopt;
    }
    const auto it = payload.find("id");
    if (it == payload.end()) {
        return std::nullopt;
    }
    auto id = JsonRpcId::from_json(*it);
    if (!id) {
        return std::nullopt;
    }
    return *id;
}

}  // namespace

std::string encode(const Message& message) {
    return message.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string encode_frame(const Message& message) {
    std::string frame = encode(message);
    frame.push_back('\n');
    return frame;
}

DecodeResult<Message> decode(std::string_view frame) {
    auto parsed = fast_parse(frame);
    if (!parsed) {
        return tl::unexpected(DecodeError{
            DecodeError::Kind::Syntax,
            parsed.error().message,
            std::nullopt
        });
    }

    auto message = Message::from_json(*parsed);
    if (!message) {
        return tl::unexpected(DecodeError{
            DecodeError::Kind::Shape,
            message.error().message,
            recover_id(*parsed)
        });
    }
    return std::move(*message);
}

std::optional<std::string_view> trim_frame(std::string_view line) noexcept {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    for (const char c : line) {
        if (is_json_whitespace(c) == false) {
            return line;
        }
    }
    return std::nullopt;
}

Message make_parse_error_response(const DecodeError& error) {
    const auto mcp_error = McpError::parse_error("Parse error: " + error.message);
    return Message::error_response(error.id.value_or(JsonRpcId::null()), mcp_error.to_rpc_error());
}

}  // namespace mcps
