#include <catch2/catch.hpp>
#include "schema/ColumnSchema.hpp"
#include <stdexcept>

using namespace conngraph::schema;

namespace {

ColumnDefinition column(const std::string& name, const std::string& type) {
    return ColumnDefinition(name, type);
}

} // namespace

// =============================================================================
// Columns
// =============================================================================

TEST_CASE("ColumnSchema add assigns row ids", "[ColumnSchema]") {
    ColumnSchema schema;
    RowId first = schema.add(column("Id", "int")).id;
    RowId second = schema.add(column("Name", "string")).id;

    REQUIRE(schema.size() == 2);
    REQUIRE_FALSE(first.empty());
    REQUIRE_FALSE(second.empty());
    REQUIRE(schema.columns()[0].id != schema.columns()[1].id);
}

TEST_CASE("ColumnSchema add rejects duplicate row ids", "[ColumnSchema]") {
    ColumnSchema schema;
    ColumnDefinition first = column("Id", "int");
    first.id = "r1";
    schema.add(first);

    ColumnDefinition second = column("Other", "int");
    second.id = "r1";
    REQUIRE_THROWS_AS(schema.add(second), std::invalid_argument);
}

TEST_CASE("ColumnSchema generated ids skip explicit ones", "[ColumnSchema]") {
    ColumnSchema schema;
    ColumnDefinition explicitId = column("A", "int");
    explicitId.id = "col_1";
    schema.add(explicitId);

    RowId generated = schema.add(column("B", "int")).id;
    REQUIRE(generated != "col_1");
}

TEST_CASE("ColumnSchema lookups", "[ColumnSchema]") {
    ColumnSchema schema{column("CustomerId", "int"), column("Email", "string")};

    SECTION("findByName is case-insensitive") {
        const auto* c = schema.findByName("customerid");
        REQUIRE(c != nullptr);
        REQUIRE(c->name == "CustomerId");
        REQUIRE(schema.findByName("missing") == nullptr);
    }

    SECTION("findById") {
        RowId id = schema.columns()[1].id;
        const auto* c = schema.findById(id);
        REQUIRE(c != nullptr);
        REQUIRE(c->name == "Email");
        REQUIRE(schema.findById("nope") == nullptr);
    }
}

// =============================================================================
// JSON interchange
// =============================================================================

TEST_CASE("ColumnSchema toJson writes interchange fields", "[ColumnSchema]") {
    ColumnDefinition id = column("Id", "int");
    id.isPrimaryKey = true;
    id.isNullable = false;
    ColumnSchema schema{id};

    auto j = schema.toJson();

    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["name"] == "Id");
    REQUIRE(j[0]["dataType"] == "int");
    REQUIRE(j[0]["isPrimaryKey"] == true);
    REQUIRE(j[0]["isForeignKey"] == false);
    REQUIRE(j[0]["isNullable"] == false);
    REQUIRE_FALSE(j[0].contains("defaultValue"));
}

TEST_CASE("ColumnSchema fromString applies defaults", "[ColumnSchema]") {
    auto schema = ColumnSchema::fromString(R"([{"name": "Total"}])");

    REQUIRE(schema.size() == 1);
    const auto& c = schema.columns()[0];
    REQUIRE(c.name == "Total");
    REQUIRE(c.dataType == "string");
    REQUIRE_FALSE(c.isPrimaryKey);
    REQUIRE_FALSE(c.isForeignKey);
    REQUIRE(c.isNullable);
    REQUIRE_FALSE(c.id.empty());
}

TEST_CASE("ColumnSchema fromString accepts PascalCase keys", "[ColumnSchema]") {
    auto schema = ColumnSchema::fromString(
        R"([{"Name": "Id", "DataType": "int", "IsPrimaryKey": true, "IsNullable": false}])");

    const auto& c = schema.columns()[0];
    REQUIRE(c.name == "Id");
    REQUIRE(c.dataType == "int");
    REQUIRE(c.isPrimaryKey);
    REQUIRE_FALSE(c.isNullable);
}

TEST_CASE("ColumnSchema keeps explicit row ids through text", "[ColumnSchema]") {
    ColumnDefinition c = column("Id", "int");
    c.id = "row-7";
    c.defaultValue = "0";
    c.description = "surrogate key";
    ColumnSchema original{c};

    auto restored = ColumnSchema::fromString(original.toString());

    REQUIRE(restored == original);
    REQUIRE(restored.findById("row-7") != nullptr);
}

TEST_CASE("ColumnSchema rejects malformed payloads", "[ColumnSchema]") {
    REQUIRE_THROWS_AS(ColumnSchema::fromString(R"({"name": "Id"})"), std::runtime_error);
    REQUIRE_THROWS_AS(ColumnSchema::fromString(R"([{"dataType": "int"}])"), std::runtime_error);
    REQUIRE_THROWS_AS(ColumnSchema::fromString("not json"), std::runtime_error);
    REQUIRE_THROWS_AS(ColumnSchema::fromString(R"([{"id": "a", "name": "X"}, {"id": "a", "name": "Y"}])"),
                      std::runtime_error);
}

// =============================================================================
// Compatibility
// =============================================================================

TEST_CASE("schemasCompatible requires every expected column", "[ColumnSchema]") {
    ColumnSchema expected{column("Id", "int"), column("Name", "string")};

    SECTION("exact match") {
        ColumnSchema actual{column("Id", "int"), column("Name", "string")};
        REQUIRE(schemasCompatible(expected, actual));
    }

    SECTION("names and types compare case-insensitively") {
        ColumnSchema actual{column("ID", "INT"), column("name", "String")};
        REQUIRE(schemasCompatible(expected, actual));
    }

    SECTION("missing column") {
        ColumnSchema actual{column("Id", "int")};
        REQUIRE_FALSE(schemasCompatible(expected, actual));
    }

    SECTION("type mismatch") {
        ColumnSchema actual{column("Id", "string"), column("Name", "string")};
        REQUIRE_FALSE(schemasCompatible(expected, actual));
    }

    SECTION("unspecified type matches anything") {
        ColumnSchema actual{column("Id", ""), column("Name", "string")};
        REQUIRE(schemasCompatible(expected, actual));
    }
}

TEST_CASE("schemasCompatible ignores extra actual columns", "[ColumnSchema]") {
    ColumnSchema expected{column("Id", "int")};
    ColumnSchema actual{column("Id", "int")};
    REQUIRE(schemasCompatible(expected, actual));

    actual.add(column("Unrelated", "double"));
    REQUIRE(schemasCompatible(expected, actual));
}

TEST_CASE("schemasCompatible with empty expected schema", "[ColumnSchema]") {
    ColumnSchema expected;
    ColumnSchema actual;
    REQUIRE(schemasCompatible(expected, actual));
}

TEST_CASE("computeSchemaDiff reports each kind of difference", "[ColumnSchema]") {
    ColumnDefinition id = column("Id", "int");
    id.isNullable = false;
    ColumnDefinition status = column("Status", "string");
    status.defaultValue = "new";
    ColumnSchema expected{id, column("Name", "string"), status, column("Created", "datetime")};

    ColumnSchema actual{column("id", "bigint"), column("Name", "string"), column("Status", "string")};

    auto diff = computeSchemaDiff(expected, actual);

    REQUIRE(diff.hasDifferences());
    REQUIRE(diff.missingColumns == std::vector<std::string>{"Created"});
    REQUIRE(diff.typeDifferences.size() == 1);
    REQUIRE(diff.typeDifferences[0].name == "Id");
    REQUIRE(diff.typeDifferences[0].expectedType == "int");
    REQUIRE(diff.typeDifferences[0].actualType == "bigint");
    REQUIRE(diff.nullabilityDifferences.size() == 1);
    REQUIRE(diff.nullabilityDifferences[0].name == "Id");
    REQUIRE(diff.defaultDifferences.size() == 1);
    REQUIRE(diff.defaultDifferences[0].expectedDefault == "new");
    REQUIRE(diff.defaultDifferences[0].actualDefault.empty());
}

TEST_CASE("computeSchemaDiff of identical schemas is empty", "[ColumnSchema]") {
    ColumnSchema schema{column("Id", "int"), column("Name", "string")};
    REQUIRE_FALSE(computeSchemaDiff(schema, schema).hasDifferences());
}
