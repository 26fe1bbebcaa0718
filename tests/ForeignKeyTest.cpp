#include <catch2/catch.hpp>
#include "schema/ForeignKey.hpp"
#include <stdexcept>

using namespace conngraph::schema;

TEST_CASE("ForeignKeyDefinition maps is positional", "[ForeignKey]") {
    ForeignKeyDefinition fk;
    fk.name = "fk_order_line";
    fk.columns = {"OrderId", "LineNo"};
    fk.referencedEntity = "OrderLine";
    fk.referencedColumns = {"Id", "Number"};

    REQUIRE(fk.maps("OrderId", "OrderLine", "Id"));
    REQUIRE(fk.maps("lineno", "orderline", "NUMBER"));
    REQUIRE_FALSE(fk.maps("OrderId", "OrderLine", "Number"));
    REQUIRE_FALSE(fk.maps("OrderId", "Order", "Id"));
}

TEST_CASE("ForeignKeyDefinition maps ignores unmatched tail", "[ForeignKey]") {
    ForeignKeyDefinition fk;
    fk.columns = {"A", "B"};
    fk.referencedEntity = "T";
    fk.referencedColumns = {"X"};

    REQUIRE(fk.maps("A", "T", "X"));
    REQUIRE_FALSE(fk.maps("B", "T", "X"));
}

TEST_CASE("Foreign key JSON interchange", "[ForeignKey]") {
    std::string text = R"([{
        "name": "fk1",
        "columns": ["CustomerId"],
        "referencedEntity": "Customer",
        "referencedColumns": ["Id"],
        "onDelete": "CASCADE",
        "onUpdate": "NO ACTION"
    }])";

    auto fks = foreignKeysFromString(text);

    REQUIRE(fks.size() == 1);
    REQUIRE(fks[0].name == "fk1");
    REQUIRE(fks[0].columns == std::vector<std::string>{"CustomerId"});
    REQUIRE(fks[0].referencedEntity == "Customer");
    REQUIRE(fks[0].referencedColumns == std::vector<std::string>{"Id"});
    REQUIRE(fks[0].onDelete == "CASCADE");
    REQUIRE(fks[0].onUpdate == "NO ACTION");

    auto j = foreignKeysToJson(fks);
    REQUIRE(j[0]["referencedEntity"] == "Customer");
    REQUIRE(foreignKeysFromJson(j) == fks);
}

TEST_CASE("Foreign key JSON accepts PascalCase keys", "[ForeignKey]") {
    auto fks = foreignKeysFromString(R"([{
        "Name": "FK_Order_Customer",
        "Columns": ["CustomerId"],
        "ReferencedEntity": "Customer",
        "ReferencedColumns": ["Id"],
        "OnDelete": "CASCADE",
        "OnUpdate": ""
    }])");

    REQUIRE(fks.size() == 1);
    REQUIRE(fks[0].name == "FK_Order_Customer");
    REQUIRE(fks[0].columns == std::vector<std::string>{"CustomerId"});
    REQUIRE(fks[0].referencedEntity == "Customer");
    REQUIRE(fks[0].onDelete == "CASCADE");
    REQUIRE(fks[0].maps("CustomerId", "Customer", "Id"));
}

TEST_CASE("Foreign key optional fields default to empty", "[ForeignKey]") {
    auto fks = foreignKeysFromString(R"([{"name": "fk"}])");

    REQUIRE(fks.size() == 1);
    REQUIRE(fks[0].columns.empty());
    REQUIRE(fks[0].referencedColumns.empty());
    REQUIRE(fks[0].onDelete.empty());
}

TEST_CASE("Foreign key malformed payloads", "[ForeignKey]") {
    REQUIRE_THROWS_AS(foreignKeysFromString(R"({"name": "fk"})"), std::runtime_error);
    REQUIRE_THROWS_AS(foreignKeysFromString("[{"), std::runtime_error);
    REQUIRE_THROWS_AS(foreignKeysFromString(R"([{"columns": "CustomerId"}])"), std::runtime_error);
}
