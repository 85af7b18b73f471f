#pragma once

#include "mcps/protocol/json_rpc.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcps {

// ═══════════════════════════════════════════════════════════════════════════
// Message Codec - newline-delimited JSON
// ═══════════════════════════════════════════════════════════════════════════
// One message per line. encode() never emits a raw newline inside a frame
// (nlohmann escapes control characters in strings), so '\n' is an unambiguous
// boundary.

struct DecodeError {
    enum class Kind {
        Syntax,  // not JSON at all
        Shape    // JSON, but not a valid JSON-RPC envelope
    };

    Kind kind{Kind::Syntax};
    std::string message;
    std::optional<JsonRpcId> id;  // recovered from the payload when possible
};

template <typename T>
using DecodeResult = tl::expected<T, DecodeError>;

[[nodiscard]] constexpr std::string_view to_string(DecodeError::Kind kind) noexcept {
    switch (kind) {
        case DecodeError::Kind::Syntax: return "syntax";
        case DecodeError::Kind::Shape:  return "shape";
    }
    return "unknown";
}

/// Serialize to a single line without the trailing newline.
/// Invalid UTF-8 in string values is replaced, never thrown on.
[[nodiscard]] std::string encode(const Message& message);

/// encode() plus the '\n' frame terminator.
[[nodiscard]] std::string encode_frame(const Message& message);

/// Parse one frame. Never throws for malformed input.
[[nodiscard]] DecodeResult<Message> decode(std::string_view frame);

/// Strip a trailing '\r'. Returns nullopt for a frame that is empty or only
/// whitespace, which the read loop skips.
[[nodiscard]] std::optional<std::string_view> trim_frame(std::string_view line) noexcept;

/// PARSE_ERROR response for a frame that could not be decoded, echoing the
/// recovered id or null.
[[nodiscard]] Message make_parse_error_response(const DecodeError& error);

}  // namespace mcps
