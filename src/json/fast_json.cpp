#include "mcps/json/fast_json.hpp"

namespace mcps {
namespace {

tl::unexpected<JsonParseError> simd_failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

}  // namespace

ParseResult FastJsonParser::parse(std::string_view json_str) {
    simdjson::padded_string padded(json_str);

    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return simd_failure(doc_result.error());
    }

    try {
        auto doc = std::move(doc_result).value();

        // Top-level scalars fail here; callers only accept objects
        auto value = doc.get_value();
        if (value.error() != simdjson::SUCCESS) {
            return simd_failure(value.error());
        }
        auto converted = convert(value.value(), 0);
        if (!converted) {
            return converted;
        }
        if (doc.at_end() == false) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

ParseResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"));
    }

    auto type_result = value.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return simd_failure(type_result.error());
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return simd_failure(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return simd_failure(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return simd_failure(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            // Integers stay integers so request ids survive the round trip
            auto int_val = value.get_int64();
            if (int_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(int_val.value());
            }
            auto uint_val = value.get_uint64();
            if (uint_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(uint_val.value());
            }
            auto double_val = value.get_double();
            if (double_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(double_val.value());
            }
            return simd_failure(double_val.error());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto bool_val = value.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return simd_failure(bool_val.error());
            }
            return nlohmann::json(bool_val.value());
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

ParseResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    nlohmann::json result = nlohmann::json::object();

    for (auto field : obj) {
        auto key_result = field.unescaped_key();
        if (key_result.error() != simdjson::SUCCESS) {
            return simd_failure(key_result.error());
        }
        std::string key(key_result.value());

        auto val_result = field.value();
        if (val_result.error() != simdjson::SUCCESS) {
            return simd_failure(val_result.error());
        }
        auto converted = convert(val_result.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(key)] = std::move(*converted);
    }

    return result;
}

ParseResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    nlohmann::json result = nlohmann::json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return simd_failure(element.error());
        }
        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

ParseResult fast_parse(std::string_view json_str) {
    thread_local FastJsonParser parser;
    return parser.parse(json_str);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace mcps
