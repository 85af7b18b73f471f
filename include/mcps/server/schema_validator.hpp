#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <string>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// Tool argument validation against a JSON Schema subset
// ─────────────────────────────────────────────────────────────────────────────
// Supported keywords: type (string or array of strings), properties,
// required, additionalProperties (false only), items, enum, minimum,
// maximum, minLength, maxLength. Anything else is ignored.

struct SchemaError {
    std::string pointer;  // JSON pointer of the offending value, "" for the root
    std::string message;

    [[nodiscard]] std::string to_string() const {
        return (pointer.empty() ? std::string("/") : pointer) + ": " + message;
    }
};

using SchemaResult = tl::expected<void, SchemaError>;

/// Validate `value` against `schema`. Stops at the first violation.
[[nodiscard]] SchemaResult validate_schema(const nlohmann::json& schema, const nlohmann::json& value);

}  // namespace mcps
