#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// JSON Schema subset
// ═══════════════════════════════════════════════════════════════════════════
// Enough of JSON Schema to check tool arguments before a process is spawned:
//
//   type (string or array; "integer" accepts integral numbers), enum, const,
//   properties, required, additionalProperties, minProperties,
//   items, minItems, maxItems, minimum, maximum, exclusiveMinimum,
//   exclusiveMaximum, minLength, maxLength
//
// plus two vendor keywords for data frames:
//
//   "x-columnar": true        every array-valued property of the object must
//                             have the same length
//   "x-column-of": "<name>"   on a property: its string value (or each string
//                             in its array value) must be a key of the
//                             sibling object property <name>
//
// Composition keywords (oneOf, anyOf, allOf) are refused outright: many MCP
// clients cannot render them.

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace statmcp {

using Json = nlohmann::json;

struct SchemaViolation {
    std::string pointer;   // JSON pointer into the instance; "" is the root
    std::string message;
};

/// JSON pointer of the first oneOf/anyOf/allOf keyword in `schema`, if any.
/// Property names under properties, patternProperties, $defs, definitions
/// and dependentSchemas are names, not keywords.
[[nodiscard]] std::optional<std::string> find_disallowed_composition(const Json& schema);

/// Check `instance` against `schema`; reports the first violation found.
[[nodiscard]] tl::expected<void, SchemaViolation> validate(const Json& schema, const Json& instance);

/// Escape one reference token (RFC 6901)
[[nodiscard]] std::string escape_pointer_token(std::string_view token);

}  // namespace statmcp
