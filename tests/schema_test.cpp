#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "statmcp/registry/schema.hpp"
#include "statmcp/tools/statistical_tools.hpp"

using namespace statmcp;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Composition detection
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("find_disallowed_composition locates composition keywords", "[schema]") {
    SECTION("top level") {
        const json schema = {{"oneOf", json::array({json{{"type", "string"}}, json{{"type", "number"}}})}};
        REQUIRE(find_disallowed_composition(schema) == "/oneOf");
    }
    SECTION("nested in a property") {
        const json schema = {
            {"type", "object"},
            {"properties", {{"value", {{"anyOf", json::array({json{{"type", "string"}}})}}}}}
        };
        REQUIRE(find_disallowed_composition(schema) == "/properties/value/anyOf");
    }
    SECTION("inside array items") {
        const json schema = {{"type", "array"}, {"items", {{"allOf", json::array()}}}};
        REQUIRE(find_disallowed_composition(schema) == "/items/allOf");
    }
}

TEST_CASE("Property names and data values are not mistaken for keywords", "[schema]") {
    const json schema = {
        {"type", "object"},
        {"properties", {
            {"oneOf", {{"type", "string"}}},
            {"mode", {{"enum", json::array({"anyOf", "allOf"})}}}
        }},
        {"default", {{"allOf", 1}}}
    };
    REQUIRE_FALSE(find_disallowed_composition(schema).has_value());
    REQUIRE_FALSE(find_disallowed_composition(columnar_data_schema()).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("validate reports the pointer of the first violation", "[schema]") {
    const json schema = {
        {"type", "object"},
        {"properties", {
            {"variables", {{"type", "array"}, {"items", {{"type", "string"}}}, {"minItems", 2}}},
            {"method", {{"type", "string"}, {"enum", json::array({"pearson", "spearman"})}}}
        }},
        {"required", json::array({"variables"})},
        {"additionalProperties", false}
    };

    REQUIRE(validate(schema, json{{"variables", json::array({"a", "b"})}}).has_value());

    auto missing = validate(schema, json::object());
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().pointer == "/variables");

    auto short_list = validate(schema, json{{"variables", json::array({"a"})}});
    REQUIRE_FALSE(short_list.has_value());
    REQUIRE(short_list.error().pointer == "/variables");

    auto wrong_item = validate(schema, json{{"variables", json::array({"a", 3})}});
    REQUIRE_FALSE(wrong_item.has_value());
    REQUIRE(wrong_item.error().pointer == "/variables/1");

    auto bad_enum = validate(schema, json{{"variables", json::array({"a", "b"})}, {"method", "kendall"}});
    REQUIRE_FALSE(bad_enum.has_value());
    REQUIRE(bad_enum.error().pointer == "/method");

    auto extra = validate(schema, json{{"variables", json::array({"a", "b"})}, {"verbose", true}});
    REQUIRE_FALSE(extra.has_value());
    REQUIRE(extra.error().pointer == "/verbose");
}

TEST_CASE("integer accepts integral floats only", "[schema]") {
    const json schema = {{"type", "integer"}, {"minimum", 1}};

    REQUIRE(validate(schema, json(3)).has_value());
    REQUIRE(validate(schema, json(3.0)).has_value());
    REQUIRE_FALSE(validate(schema, json(3.5)).has_value());
    REQUIRE_FALSE(validate(schema, json(0)).has_value());
    REQUIRE_FALSE(validate(schema, json("3")).has_value());
}

TEST_CASE("Numeric bounds include exclusive limits", "[schema]") {
    const json schema = {{"type", "number"}, {"exclusiveMinimum", 0}, {"maximum", 1}};

    REQUIRE(validate(schema, json(0.5)).has_value());
    REQUIRE(validate(schema, json(1)).has_value());
    REQUIRE_FALSE(validate(schema, json(0)).has_value());
    REQUIRE_FALSE(validate(schema, json(1.01)).has_value());
}

TEST_CASE("String lengths count code points", "[schema]") {
    const json schema = {{"type", "string"}, {"minLength", 2}, {"maxLength", 3}};

    REQUIRE(validate(schema, json("\xC3\xA9\xC3\xA9")).has_value());  // two code points, four bytes
    REQUIRE_FALSE(validate(schema, json("a")).has_value());
    REQUIRE_FALSE(validate(schema, json("abcd")).has_value());
}

TEST_CASE("Type unions accept any listed type", "[schema]") {
    const json schema = {{"type", json::array({"number", "null"})}};

    REQUIRE(validate(schema, json(1.5)).has_value());
    REQUIRE(validate(schema, json(nullptr)).has_value());
    auto text = validate(schema, json("x"));
    REQUIRE_FALSE(text.has_value());
    REQUIRE_THAT(text.error().message, Catch::Matchers::ContainsSubstring("string"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Columnar data
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Columnar data frames must have equal-length columns", "[schema][columnar]") {
    const json schema = columnar_data_schema();

    const json frame = {
        {"income", json::array({50000, 60000, 70000})},
        {"region", json::array({"north", "south", nullptr})}
    };
    REQUIRE(validate(schema, frame).has_value());

    const json ragged = {
        {"income", json::array({50000, 60000, 70000})},
        {"spend", json::array({1, 2})}
    };
    auto result = validate(schema, ragged);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().pointer == "/spend");
    REQUIRE_THAT(result.error().message, Catch::Matchers::ContainsSubstring("income"));
}

TEST_CASE("Columnar data rejects nested values and empty frames", "[schema][columnar]") {
    const json schema = columnar_data_schema();

    auto nested = validate(schema, json{{"x", json::array({json::array({1})})}});
    REQUIRE_FALSE(nested.has_value());
    REQUIRE(nested.error().pointer == "/x/0");

    auto scalar_column = validate(schema, json{{"x", 3}});
    REQUIRE_FALSE(scalar_column.has_value());
    REQUIRE(scalar_column.error().pointer == "/x");

    REQUIRE_FALSE(validate(schema, json::object()).has_value());
}

TEST_CASE("Columnar data rejects empty columns", "[schema][columnar]") {
    const json schema = columnar_data_schema();

    auto empty = validate(schema, json{{"x", json::array()}, {"y", json::array()}});
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().pointer == "/x");
    REQUIRE_THAT(empty.error().message, Catch::Matchers::ContainsSubstring("at least 1"));
}

TEST_CASE("Numeric data frames accept only numbers", "[schema][columnar]") {
    const json schema = columnar_data_schema(ColumnValues::Numeric);

    REQUIRE(validate(schema, json{{"x", json::array({1, 2.5, -3})}}).has_value());

    auto text = validate(schema, json{{"x", json::array({1, "two", 3})}});
    REQUIRE_FALSE(text.has_value());
    REQUIRE(text.error().pointer == "/x/1");

    auto missing = validate(schema, json{{"x", json::array({1, nullptr})}});
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().pointer == "/x/1");
}

TEST_CASE("x-column-of names must be columns of the sibling frame", "[schema][columnar]") {
    const json schema = {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"variables", {{"type", "array"}, {"items", {{"type", "string"}}}, {"x-column-of", "data"}}},
            {"group", {{"type", "string"}, {"x-column-of", "data"}}}
        }}
    };
    const json frame = {{"income", json::array({1, 2})}, {"region", json::array({"n", "s"})}};

    REQUIRE(validate(schema, json{{"data", frame}, {"variables", json::array({"income"})}, {"group", "region"}}).has_value());

    auto unknown_item = validate(schema, json{{"data", frame}, {"variables", json::array({"income", "age"})}});
    REQUIRE_FALSE(unknown_item.has_value());
    REQUIRE(unknown_item.error().pointer == "/variables/1");
    REQUIRE_THAT(unknown_item.error().message, Catch::Matchers::ContainsSubstring("'age'"));

    auto unknown_name = validate(schema, json{{"data", frame}, {"group", "sex"}});
    REQUIRE_FALSE(unknown_name.has_value());
    REQUIRE(unknown_name.error().pointer == "/group");

    // Without the frame there is nothing to check against
    REQUIRE(validate(schema, json{{"group", "sex"}}).has_value());
}

TEST_CASE("escape_pointer_token follows RFC 6901", "[schema]") {
    REQUIRE(escape_pointer_token("a/b") == "a~1b");
    REQUIRE(escape_pointer_token("m~n") == "m~0n");
    REQUIRE(escape_pointer_token("plain") == "plain");
}
