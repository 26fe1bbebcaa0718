#include <catch2/catch.hpp>
#include "graph/PkFkValidator.hpp"
#include <memory>

using namespace conngraph::graph;
using conngraph::schema::ColumnDefinition;
using conngraph::schema::ColumnSchema;
using conngraph::schema::ForeignKeyDefinition;
using conngraph::schema::ForeignKeyList;

namespace {

ColumnDefinition keyColumn(const std::string& id, const std::string& name,
                           bool primary, bool foreign) {
    ColumnDefinition c(name, "int");
    c.id = id;
    c.isPrimaryKey = primary;
    c.isForeignKey = foreign;
    return c;
}

// Orders.CustomerId (row "o2") -> Customer.Id (row "c1")
class ErdFixture {
public:
    ErdFixture()
        : orders("orders")
        , customer("customer")
    {
        orders.setName("Orders");
        customer.setName("Customer");

        ordersOut = &orders.addOutput("any", std::string("o2"));
        customerIn = &customer.addInput("any", std::string("c1"));
    }

    void setColumns(bool ordersFkFlag, bool customerPkFlag) {
        orders.properties().set(keys::Columns, PropertyValue(ColumnSchema{
            keyColumn("o1", "Id", true, false),
            keyColumn("o2", "CustomerId", false, ordersFkFlag)}));
        customer.properties().set(keys::Columns, PropertyValue(ColumnSchema{
            keyColumn("c1", "Id", customerPkFlag, false)}));
    }

    std::shared_ptr<Edge> makeEdge() {
        auto edge = std::make_shared<Edge>(ordersOut, customerIn, EdgePolicy::Shared);
        edge->sourceRowId = ordersOut->rowId();
        edge->targetRowId = customerIn->rowId();
        return edge;
    }

    Node orders;
    Node customer;
    Port* ordersOut = nullptr;
    Port* customerIn = nullptr;
};

ForeignKeyDefinition customerFk() {
    ForeignKeyDefinition fk;
    fk.name = "fk1";
    fk.columns = {"CustomerId"};
    fk.referencedEntity = "Customer";
    fk.referencedColumns = {"Id"};
    return fk;
}

} // namespace

TEST_CASE("PK/FK flags make the link valid", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(true, true);
    auto edge = erd.makeEdge();

    REQUIRE(PkFkValidator::apply(*edge, colors::Amber) == PkFkVerdict::Valid);
    REQUIRE(edge->status == EdgeStatus::Normal);
    REQUIRE_FALSE(edge->showStatusIndicator);
}

TEST_CASE("Flags are accepted in either direction", "[PkFkValidator]") {
    ErdFixture erd;
    erd.orders.properties().set(keys::Columns, PropertyValue(ColumnSchema{
        keyColumn("o2", "Id", true, false)}));
    erd.customer.properties().set(keys::Columns, PropertyValue(ColumnSchema{
        keyColumn("c1", "OrderId", false, true)}));

    REQUIRE(PkFkValidator::check(*erd.makeEdge()) == PkFkVerdict::Valid);
}

TEST_CASE("Declared foreign key on the source makes the link valid", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    erd.orders.properties().set(keys::ForeignKeys, PropertyValue(ForeignKeyList{customerFk()}));
    auto edge = erd.makeEdge();

    REQUIRE(PkFkValidator::apply(*edge, colors::Amber) == PkFkVerdict::Valid);
    REQUIRE(edge->status == EdgeStatus::Normal);
}

TEST_CASE("Declared foreign key on the target matches in reverse", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);

    // Customer declares Id -> Orders.CustomerId
    ForeignKeyDefinition fk;
    fk.name = "fk_reverse";
    fk.columns = {"id"};
    fk.referencedEntity = "orders";
    fk.referencedColumns = {"customerid"};
    erd.customer.properties().set(keys::ForeignKeys, PropertyValue(ForeignKeyList{fk}));

    REQUIRE(PkFkValidator::check(*erd.makeEdge()) == PkFkVerdict::Valid);
}

TEST_CASE("Foreign key declared as interchange text", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    erd.orders.properties().set(keys::ForeignKeys,
        R"([{"name":"fk1","columns":["CustomerId"],"referencedEntity":"Customer","referencedColumns":["Id"]}])");

    REQUIRE(PkFkValidator::check(*erd.makeEdge()) == PkFkVerdict::Valid);
}

TEST_CASE("Foreign key to another entity does not count", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    ForeignKeyDefinition fk = customerFk();
    fk.referencedEntity = "Supplier";
    erd.orders.properties().set(keys::ForeignKeys, PropertyValue(ForeignKeyList{fk}));

    REQUIRE(PkFkValidator::check(*erd.makeEdge()) == PkFkVerdict::Invalid);
}

TEST_CASE("Unrelated columns get an amber warning", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    auto edge = erd.makeEdge();

    REQUIRE(PkFkValidator::apply(*edge, colors::Amber) == PkFkVerdict::Invalid);
    REQUIRE(edge->status == EdgeStatus::Warning);
    REQUIRE(edge->statusColor == colors::Amber);
    REQUIRE(edge->showStatusIndicator);
}

TEST_CASE("Edges without row ids are not checked", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    auto edge = erd.makeEdge();
    edge->targetRowId.reset();

    REQUIRE(PkFkValidator::apply(*edge, colors::Amber) == PkFkVerdict::NotApplicable);
    REQUIRE(edge->status == EdgeStatus::Normal);
}

TEST_CASE("Unknown row ids leave the edge untouched", "[PkFkValidator]") {
    ErdFixture erd;
    erd.setColumns(false, false);
    auto edge = erd.makeEdge();
    edge->sourceRowId = std::string("gone");

    REQUIRE(PkFkValidator::apply(*edge, colors::Amber) == PkFkVerdict::NotApplicable);
    REQUIRE(edge->status == EdgeStatus::Normal);
}
