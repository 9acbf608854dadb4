#include "statmcp/registry/schema.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <string>

namespace statmcp {
namespace {

constexpr std::array<std::string_view, 3> kCompositionKeywords = {"oneOf", "anyOf", "allOf"};

// Keywords whose object value maps arbitrary names to subschemas
constexpr std::array<std::string_view, 5> kNamedSchemaMaps = {
    "properties", "patternProperties", "$defs", "definitions", "dependentSchemas"
};

// Keywords whose value is instance data, never a schema
constexpr std::array<std::string_view, 4> kDataKeywords = {"enum", "const", "default", "examples"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& list, std::string_view key) {
    for (const auto& entry : list) {
        if (entry == key) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> find_composition_at(const Json& node, const std::string& path) {
    if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            if (auto found = find_composition_at(node[i], path + "/" + std::to_string(i))) {
                return found;
            }
        }
        return std::nullopt;
    }
    if (node.is_object() == false) {
        return std::nullopt;
    }

    for (const auto& [key, value] : node.items()) {
        const std::string child = path + "/" + escape_pointer_token(key);
        if (contains(kCompositionKeywords, key)) {
            return child;
        }
        if (contains(kDataKeywords, key)) {
            continue;
        }
        if (contains(kNamedSchemaMaps, key) && value.is_object()) {
            for (const auto& [name, subschema] : value.items()) {
                if (auto found = find_composition_at(subschema, child + "/" + escape_pointer_token(name))) {
                    return found;
                }
            }
            continue;
        }
        if (auto found = find_composition_at(value, child)) {
            return found;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

using Outcome = tl::expected<void, SchemaViolation>;

Outcome violation(const std::string& pointer, std::string message) {
    return tl::unexpected(SchemaViolation{pointer, std::move(message)});
}

std::string_view type_name(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:            return "null";
        case Json::value_t::boolean:         return "boolean";
        case Json::value_t::string:          return "string";
        case Json::value_t::array:           return "array";
        case Json::value_t::object:          return "object";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned: return "integer";
        case Json::value_t::number_float:    return "number";
        default:                             return "unknown";
    }
}

bool matches_type(const Json& value, std::string_view type) {
    if (type == "null") return value.is_null();
    if (type == "boolean") return value.is_boolean();
    if (type == "string") return value.is_string();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && (std::floor(d) == d);
        }
        return false;
    }
    return false;
}

// Non-negative integer keyword such as minItems
std::optional<std::size_t> count_keyword(const Json& schema, const char* key) {
    if ((schema.contains(key) == false) || (schema[key].is_number_integer() == false)) {
        return std::nullopt;
    }
    const auto value = schema[key].get<std::int64_t>();
    if (value < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(value);
}

std::size_t utf8_length(const std::string& s) {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

Outcome validate_at(const Json& schema, const Json& instance, const std::string& pointer);

Outcome check_type(const Json& schema, const Json& instance, const std::string& pointer) {
    if (schema.contains("type") == false) {
        return {};
    }
    const Json& type = schema["type"];
    if (type.is_string()) {
        if (matches_type(instance, type.get_ref<const std::string&>()) == false) {
            return violation(pointer, "expected " + type.get<std::string>() + ", got " +
                                      std::string(type_name(instance)));
        }
        return {};
    }
    if (type.is_array()) {
        for (const auto& candidate : type) {
            if (candidate.is_string() && matches_type(instance, candidate.get_ref<const std::string&>())) {
                return {};
            }
        }
        return violation(pointer, "expected one of " + type.dump() + ", got " +
                                  std::string(type_name(instance)));
    }
    return {};
}

Outcome check_enum(const Json& schema, const Json& instance, const std::string& pointer) {
    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == instance) {
                found = true;
                break;
            }
        }
        if (found == false) {
            return violation(pointer, "value must be one of " + schema["enum"].dump());
        }
    }
    if (schema.contains("const") && (schema["const"] != instance)) {
        return violation(pointer, "value must equal " + schema["const"].dump());
    }
    return {};
}

Outcome check_number(const Json& schema, const Json& instance, const std::string& pointer) {
    if (instance.is_number() == false) {
        return {};
    }
    const double value = instance.get<double>();
    if (schema.contains("minimum") && schema["minimum"].is_number() &&
        (value < schema["minimum"].get<double>())) {
        return violation(pointer, "must be >= " + schema["minimum"].dump());
    }
    if (schema.contains("maximum") && schema["maximum"].is_number() &&
        (value > schema["maximum"].get<double>())) {
        return violation(pointer, "must be <= " + schema["maximum"].dump());
    }
    if (schema.contains("exclusiveMinimum") && schema["exclusiveMinimum"].is_number() &&
        (value <= schema["exclusiveMinimum"].get<double>())) {
        return violation(pointer, "must be > " + schema["exclusiveMinimum"].dump());
    }
    if (schema.contains("exclusiveMaximum") && schema["exclusiveMaximum"].is_number() &&
        (value >= schema["exclusiveMaximum"].get<double>())) {
        return violation(pointer, "must be < " + schema["exclusiveMaximum"].dump());
    }
    return {};
}

Outcome check_string(const Json& schema, const Json& instance, const std::string& pointer) {
    if (instance.is_string() == false) {
        return {};
    }
    const std::size_t length = utf8_length(instance.get_ref<const std::string&>());
    if (const auto limit = count_keyword(schema, "minLength"); limit && (length < *limit)) {
        return violation(pointer, "must be at least " + schema["minLength"].dump() + " characters");
    }
    if (const auto limit = count_keyword(schema, "maxLength"); limit && (length > *limit)) {
        return violation(pointer, "must be at most " + schema["maxLength"].dump() + " characters");
    }
    return {};
}

Outcome check_array(const Json& schema, const Json& instance, const std::string& pointer) {
    if (instance.is_array() == false) {
        return {};
    }
    if (const auto limit = count_keyword(schema, "minItems"); limit && (instance.size() < *limit)) {
        return violation(pointer, "must have at least " + schema["minItems"].dump() + " items");
    }
    if (const auto limit = count_keyword(schema, "maxItems"); limit && (instance.size() > *limit)) {
        return violation(pointer, "must have at most " + schema["maxItems"].dump() + " items");
    }
    if (schema.contains("items") && (schema["items"].is_object() || schema["items"].is_boolean())) {
        for (std::size_t i = 0; i < instance.size(); ++i) {
            auto result = validate_at(schema["items"], instance[i], pointer + "/" + std::to_string(i));
            if (!result) {
                return result;
            }
        }
    }
    return {};
}

Outcome check_columnar(const Json& instance, const std::string& pointer) {
    std::optional<std::string> reference;
    std::size_t rows = 0;
    for (const auto& [name, column] : instance.items()) {
        if (column.is_array() == false) {
            continue;
        }
        if (reference.has_value() == false) {
            reference = name;
            rows = column.size();
            continue;
        }
        if (column.size() != rows) {
            return violation(pointer + "/" + escape_pointer_token(name),
                             "column '" + name + "' has " + std::to_string(column.size()) +
                             " values but column '" + *reference + "' has " + std::to_string(rows));
        }
    }
    return {};
}

// Properties marked "x-column-of": "<sibling>" name columns of that sibling
// data frame, either one name or an array of them
Outcome check_column_names(const Json& properties, const Json& instance, const std::string& pointer) {
    for (const auto& [name, property] : properties.items()) {
        if ((property.is_object() == false) || (instance.contains(name) == false)) {
            continue;
        }
        const auto keyword = property.find("x-column-of");
        if ((keyword == property.end()) || (keyword->is_string() == false)) {
            continue;
        }
        const std::string& frame_name = keyword->get_ref<const std::string&>();
        if ((instance.contains(frame_name) == false) || (instance[frame_name].is_object() == false)) {
            continue;
        }

        const Json& frame = instance[frame_name];
        const Json& value = instance[name];
        const std::string child = pointer + "/" + escape_pointer_token(name);
        auto known = [&](const Json& column, const std::string& at) -> Outcome {
            if (column.is_string() && (frame.contains(column.get_ref<const std::string&>()) == false)) {
                return violation(at, "'" + column.get<std::string>() + "' is not a column of '" + frame_name + "'");
            }
            return {};
        };

        if (value.is_array()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto result = known(value[i], child + "/" + std::to_string(i));
                if (!result) {
                    return result;
                }
            }
        } else {
            auto result = known(value, child);
            if (!result) {
                return result;
            }
        }
    }
    return {};
}

Outcome check_object(const Json& schema, const Json& instance, const std::string& pointer) {
    if (instance.is_object() == false) {
        return {};
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& name : schema["required"]) {
            if (name.is_string() && (instance.contains(name.get_ref<const std::string&>()) == false)) {
                return violation(pointer + "/" + escape_pointer_token(name.get_ref<const std::string&>()),
                                 "missing required property '" + name.get<std::string>() + "'");
            }
        }
    }

    if (const auto limit = count_keyword(schema, "minProperties"); limit && (instance.size() < *limit)) {
        return violation(pointer, "must have at least " + schema["minProperties"].dump() + " properties");
    }

    const Json empty = Json::object();
    const Json& properties = (schema.contains("properties") && schema["properties"].is_object())
        ? schema["properties"]
        : empty;

    for (const auto& [name, value] : instance.items()) {
        const std::string child = pointer + "/" + escape_pointer_token(name);
        if (properties.contains(name)) {
            auto result = validate_at(properties[name], value, child);
            if (!result) {
                return result;
            }
            continue;
        }
        if (schema.contains("additionalProperties")) {
            const Json& additional = schema["additionalProperties"];
            if (additional.is_boolean() && (additional.get<bool>() == false)) {
                return violation(child, "unexpected property '" + name + "'");
            }
            if (additional.is_object()) {
                auto result = validate_at(additional, value, child);
                if (!result) {
                    return result;
                }
            }
        }
    }

    if (auto names = check_column_names(properties, instance, pointer); !names) {
        return names;
    }

    if (schema.contains("x-columnar") && (schema["x-columnar"] == true)) {
        return check_columnar(instance, pointer);
    }
    return {};
}

Outcome validate_at(const Json& schema, const Json& instance, const std::string& pointer) {
    if (schema.is_boolean()) {
        if (schema.get<bool>() == false) {
            return violation(pointer, "no value is allowed here");
        }
        return {};
    }
    if (schema.is_object() == false) {
        return {};
    }

    for (auto check : {check_type, check_enum, check_number, check_string, check_array, check_object}) {
        auto result = check(schema, instance, pointer);
        if (!result) {
            return result;
        }
    }
    return {};
}

}  // namespace

std::string escape_pointer_token(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::optional<std::string> find_disallowed_composition(const Json& schema) {
    return find_composition_at(schema, "");
}

tl::expected<void, SchemaViolation> validate(const Json& schema, const Json& instance) {
    return validate_at(schema, instance, "");
}

}  // namespace statmcp
