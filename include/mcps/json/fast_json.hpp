#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Inbound JSON parsing
// ─────────────────────────────────────────────────────────────────────────────
//
// Frames read off a connection are parsed with simdjson's on-demand API and
// converted into nlohmann::json, which the rest of the server uses for
// inspection and for building replies.
//
//   auto parsed = mcps::fast_parse(line);
//   if (!parsed) {
//       // parsed.error().message describes the syntax problem
//   }
//
// Parsing is pure: no part of the document is interpreted beyond its JSON
// structure.
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcps {

struct JsonParseError {
    std::string message;
    std::size_t position{0};  // byte offset, 0 when simdjson does not report one

    JsonParseError() = default;
    explicit JsonParseError(std::string msg, std::size_t pos = 0)
        : message(std::move(msg))
        , position(pos)
    {}
};

using ParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Deeper documents are rejected before conversion recurses
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parse one complete JSON document. Trailing non-whitespace is an error.
    [[nodiscard]] ParseResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] ParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] ParseResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] ParseResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

/// Parse with a thread-local FastJsonParser. Connection threads each get their own.
[[nodiscard]] ParseResult fast_parse(std::string_view json_str);

/// Name of the simdjson kernel selected at runtime ("haswell", "fallback", ...).
[[nodiscard]] std::string fast_json_implementation();

}  // namespace mcps
