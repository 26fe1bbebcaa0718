#include <catch2/catch.hpp>
#include "graph/TypeCompatibility.hpp"

using namespace conngraph::graph;

TEST_CASE("Exact type match is compatible", "[TypeCompatibility]") {
    const auto& table = TypeCompatibilityTable::instance();

    REQUIRE(table.isCompatible("string", "string"));
    REQUIRE(table.isCompatible("link", "link"));
    REQUIRE(table.isCompatible("Number", "number"));
}

TEST_CASE("Any is compatible in both directions", "[TypeCompatibility]") {
    const auto& table = TypeCompatibilityTable::instance();

    REQUIRE(table.isCompatible("any", "number"));
    REQUIRE(table.isCompatible("transition", "any"));
    REQUIRE(table.isCompatible("ANY", "object"));
}

TEST_CASE("Allow-listed conversions", "[TypeCompatibility]") {
    const auto& table = TypeCompatibilityTable::instance();

    REQUIRE(table.isCompatible("number", "string"));
    REQUIRE(table.isCompatible("string", "object"));
    REQUIRE(table.isCompatible("array", "object"));
    REQUIRE(table.isCompatible("object", "array"));
    REQUIRE(table.isCompatible("boolean", "number"));
    REQUIRE(table.isCompatible("boolean", "string"));
}

TEST_CASE("Type compatibility is not symmetric", "[TypeCompatibility]") {
    const auto& table = TypeCompatibilityTable::instance();

    REQUIRE(table.isCompatible("number", "string"));
    REQUIRE_FALSE(table.isCompatible("string", "number"));

    REQUIRE(table.isCompatible("boolean", "number"));
    REQUIRE_FALSE(table.isCompatible("number", "boolean"));

    REQUIRE(table.isCompatible("string", "object"));
    REQUIRE_FALSE(table.isCompatible("object", "string"));
}

TEST_CASE("Unlisted pairs are incompatible", "[TypeCompatibility]") {
    const auto& table = TypeCompatibilityTable::instance();

    REQUIRE_FALSE(table.isCompatible("link", "transition"));
    REQUIRE_FALSE(table.isCompatible("array", "string"));
    REQUIRE_FALSE(table.isCompatible("object", "number"));
}

TEST_CASE("Data flow color by port type", "[TypeCompatibility]") {
    REQUIRE(TypeCompatibilityTable::dataFlowColor("string") == colors::Green);
    REQUIRE(TypeCompatibilityTable::dataFlowColor("Number") == colors::Blue);
    REQUIRE(TypeCompatibilityTable::dataFlowColor("boolean") == colors::Orange);
    REQUIRE(TypeCompatibilityTable::dataFlowColor("object") == colors::Purple);
    REQUIRE(TypeCompatibilityTable::dataFlowColor("image") == colors::Pink);
    REQUIRE(TypeCompatibilityTable::dataFlowColor("something-else") == colors::Cyan);
}
