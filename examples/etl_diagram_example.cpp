#include "config/EngineConfig.hpp"
#include "graph/ConnectionManager.hpp"
#include "graph/nodes/TransformNodes.hpp"
#include "serialization/DiagramSerializer.hpp"
#include <iostream>

using namespace conngraph;
using namespace conngraph::graph;
using schema::ColumnDefinition;
using schema::ColumnSchema;

namespace {

void printEdges(const ConnectionManager& manager) {
    for (const auto& edge : manager.edges()) {
        std::cout << "  " << edge->sourceNode().id() << " -> " << edge->targetNode().id()
                  << " [" << edgeStatusToString(edge->status) << "]";
        if (edge->schema) {
            std::cout << " schema=" << edge->schema->toString();
        }
        std::cout << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    config::EngineConfig cfg;
    if (argc > 1) {
        try {
            cfg = config::EngineConfig::fromFile(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    cfg.apply();

    ConnectionManager manager(cfg);
    int redraws = 0;
    manager.setRedrawCallback([&redraws]() { ++redraws; });

    std::cout << "=== ETL Diagram Example ===" << std::endl;

    // ===== SOURCES =====
    Node orders("orders");
    orders.setName("Orders");
    orders.addInput();
    orders.addOutput();
    orders.properties().set(keys::OutputSchema, PropertyValue(ColumnSchema{
        ColumnDefinition("Id", "int"),
        ColumnDefinition("CustomerId", "int"),
        ColumnDefinition("Amount", "decimal")}));

    Node customers("customers");
    customers.setName("Customers");
    customers.addInput();
    customers.addOutput();
    customers.properties().set(keys::OutputSchema,
        R"([{"name": "Id", "dataType": "int", "isPrimaryKey": true},
            {"name": "Region", "dataType": "string"}])");

    // ===== TRANSFORMS =====
    JoinNode join("join");
    join.properties().set(keys::JoinKeyLeft, "CustomerId");
    join.properties().set(keys::JoinKeyRight, "Id");

    AggregateNode aggregate("by_region");
    aggregate.properties().set(keys::GroupBy, "Region");
    aggregate.properties().set(keys::Aggregations,
        R"([{"column": "Amount", "function": "sum", "alias": "Revenue"},
            {"column": "*", "function": "count", "alias": "Orders"}])");

    Node report("report");
    report.addInput();
    report.addOutput();
    report.properties().set(keys::ExpectedSchema, PropertyValue(ColumnSchema{
        ColumnDefinition("Region", "string"),
        ColumnDefinition("Revenue", "decimal")}));

    PassThroughNode filter("filter", "Filter");

    manager.connect(&orders, &filter);
    manager.connect(&filter, &join);
    manager.connect(&customers, &join);
    manager.connect(&join, &aggregate);
    manager.connect(&aggregate, &report);

    std::cout << "\n=== Pipeline edges ===" << std::endl;
    printEdges(manager);

    // ===== ERD =====
    std::cout << "\n=== ERD relationship ===" << std::endl;
    Node customerTable("customer_table");
    customerTable.properties().set(keys::EntityName, "Customer");
    ColumnSchema customerColumns{ColumnDefinition("Id", "int")};
    customerTable.properties().set(keys::Columns, PropertyValue(customerColumns));
    customerTable.addOutput("any", customerColumns.columns()[0].id);

    Node orderTable("order_table");
    orderTable.properties().set(keys::EntityName, "Order");
    ColumnSchema orderColumns{ColumnDefinition("CustomerId", "int")};
    orderTable.properties().set(keys::Columns, PropertyValue(orderColumns));
    orderTable.properties().set(keys::ForeignKeys, PropertyValue(schema::ForeignKeyList{
        schema::ForeignKeyDefinition{"FK_Order_Customer", {"CustomerId"}, "Customer", {"Id"}, "CASCADE", ""}}));
    orderTable.addInput("any", orderColumns.columns()[0].id);

    manager.setNextEdgeMultiplicityPreset(Multiplicity::One, Multiplicity::ZeroOrMany);
    auto relation = manager.connect(&customerTable, &orderTable);
    if (relation) {
        std::cout << "  Customer.Id -> Order.CustomerId ["
                  << edgeStatusToString(relation->status) << "] "
                  << multiplicityToString(relation->startMultiplicity) << " : "
                  << multiplicityToString(relation->endMultiplicity) << std::endl;
    }

    // ===== UNDO / REDO =====
    std::cout << "\n=== Disconnect customers, then undo ===" << std::endl;
    manager.disconnect(&customers, &join);
    printEdges(manager);
    manager.undo();
    printEdges(manager);
    manager.redo();
    manager.undo();

    // ===== AUTOMATION =====
    std::cout << "\n=== Automation flow ===" << std::endl;
    Node trigger("on_schedule", NodeKind::Trigger, true);
    trigger.addOutput("object");
    Node fetch("fetch", NodeKind::Action, true);
    fetch.addInput("object");
    fetch.addInput("any");
    fetch.addOutput("array");
    Node notify("notify", NodeKind::Action, true);
    notify.addInput("object");
    notify.addOutput("string");

    Node retry("retry", NodeKind::Action, true);
    retry.addInput("any");
    retry.addOutput("object");

    manager.connect(&trigger, &fetch);
    manager.connect(&fetch, &notify);
    manager.connect(&notify, &retry);
    auto rejection = manager.validateAutomationConnect(retry, fetch);
    std::cout << "  retry -> fetch: " << connectRejectionToString(rejection) << std::endl;
    std::cout << "  fetch input 0 available: " << std::boolalpha
              << fetch.input(0)->isAvailable() << std::endl;

    // ===== SERIALIZATION =====
    std::cout << "\n=== Serialized edges ===" << std::endl;
    std::cout << serialization::DiagramSerializer::toString(manager.edges()) << std::endl;

    std::cout << "\nRedraw requests: " << redraws << std::endl;
    return 0;
}
