#include "mcps/server/schema_validator.hpp"

#include <cmath>
#include <string_view>

namespace mcps {

namespace {

using nlohmann::json;

tl::unexpected<SchemaError> violation(const std::string& pointer, std::string message) {
    return tl::unexpected(SchemaError{pointer, std::move(message)});
}

// RFC 6901 escaping for one reference token
std::string escape_token(std::string_view token) {
    std::string escaped;
    escaped.reserve(token.size());
    for (const char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

bool matches_type(std::string_view type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        // 2.0 is an integer in JSON Schema
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    // Unknown type names never match
    return false;
}

SchemaResult check_type(const json& schema, const json& value, const std::string& pointer) {
    const auto it = schema.find("type");
    if (it == schema.end()) {
        return {};
    }
    if (it->is_string()) {
        const auto type = it->get<std::string>();
        if (matches_type(type, value) == false) {
            return violation(pointer, "expected " + type + ", got " + std::string(value.type_name()));
        }
        return {};
    }
    if (it->is_array()) {
        std::string expected;
        for (const auto& t : *it) {
            if (t.is_string() == false) {
                continue;
            }
            const auto type = t.get<std::string>();
            if (matches_type(type, value)) {
                return {};
            }
            expected += expected.empty() ? type : " or " + type;
        }
        return violation(pointer, "expected " + expected + ", got " + std::string(value.type_name()));
    }
    return {};
}

SchemaResult check_bounds(const json& schema, const json& value, const std::string& pointer) {
    if (value.is_number()) {
        const double number = value.get<double>();
        const auto min_it = schema.find("minimum");
        if (min_it != schema.end() && min_it->is_number() && number < min_it->get<double>()) {
            return violation(pointer, "value is below minimum " + min_it->dump());
        }
        const auto max_it = schema.find("maximum");
        if (max_it != schema.end() && max_it->is_number() && number > max_it->get<double>()) {
            return violation(pointer, "value is above maximum " + max_it->dump());
        }
    }
    if (value.is_string()) {
        // Length in code points, not bytes
        std::size_t length = 0;
        for (const unsigned char c : value.get_ref<const std::string&>()) {
            if ((c & 0xC0) != 0x80) {
                ++length;
            }
        }
        const auto min_it = schema.find("minLength");
        if (min_it != schema.end() && min_it->is_number_integer()
            && static_cast<long long>(length) < min_it->get<long long>()) {
            return violation(pointer, "string is shorter than " + min_it->dump());
        }
        const auto max_it = schema.find("maxLength");
        if (max_it != schema.end() && max_it->is_number_integer()
            && static_cast<long long>(length) > max_it->get<long long>()) {
            return violation(pointer, "string is longer than " + max_it->dump());
        }
    }
    return {};
}

SchemaResult validate_at(const json& schema, const json& value, const std::string& pointer) {
    if (schema.is_object() == false) {
        // `true`/`{}`-style schemas accept anything
        return {};
    }

    if (auto typed = check_type(schema, value, pointer); !typed) {
        return typed;
    }

    const auto enum_it = schema.find("enum");
    if (enum_it != schema.end() && enum_it->is_array()) {
        bool found = false;
        for (const auto& candidate : *enum_it) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (found == false) {
            return violation(pointer, "value is not one of " + enum_it->dump());
        }
    }

    if (auto bounded = check_bounds(schema, value, pointer); !bounded) {
        return bounded;
    }

    if (value.is_object()) {
        const auto required_it = schema.find("required");
        if (required_it != schema.end() && required_it->is_array()) {
            for (const auto& name : *required_it) {
                if (name.is_string() && value.contains(name.get<std::string>()) == false) {
                    return violation(pointer, "missing required property '" + name.get<std::string>() + "'");
                }
            }
        }

        const auto props_it = schema.find("properties");
        const bool has_props = (props_it != schema.end()) && props_it->is_object();
        const auto additional_it = schema.find("additionalProperties");
        const bool closed = (additional_it != schema.end())
            && additional_it->is_boolean()
            && (additional_it->get<bool>() == false);

        for (const auto& [key, member] : value.items()) {
            const std::string child = pointer + "/" + escape_token(key);
            if (has_props && props_it->contains(key)) {
                if (auto nested = validate_at((*props_it)[key], member, child); !nested) {
                    return nested;
                }
            } else if (closed) {
                return violation(child, "unexpected property '" + key + "'");
            }
        }
    }

    if (value.is_array()) {
        const auto items_it = schema.find("items");
        if (items_it != schema.end() && items_it->is_object()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (auto nested = validate_at(*items_it, value[i], pointer + "/" + std::to_string(i)); !nested) {
                    return nested;
                }
            }
        }
    }

    return {};
}

}  // namespace

SchemaResult validate_schema(const nlohmann::json& schema, const nlohmann::json& value) {
    return validate_at(schema, value, "");
}

}  // namespace mcps
