#include "graph/nodes/TransformNodes.hpp"
#include "util/StringUtil.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace conngraph {
namespace graph {

using schema::ColumnDefinition;
using schema::ColumnSchema;

// =============================================================================
// DerivedSchemaNode
// =============================================================================

DerivedSchemaNode::DerivedSchemaNode(std::string id, const std::string& kindName)
    : Node(std::move(id), NodeKind::Transform, false)
{
    setName(kindName);
    properties().set(keys::Kind, PropertyValue(kindName));
}

void DerivedSchemaNode::storeOutput(ColumnSchema output) {
    properties().set(keys::OutputSchema, PropertyValue(std::move(output)));
}

void DerivedSchemaNode::clearOutput() {
    properties().clear(keys::OutputSchema);
}

ColumnDefinition DerivedSchemaNode::detached(const ColumnDefinition& column) {
    ColumnDefinition copy = column;
    copy.id.clear();
    return copy;
}

// =============================================================================
// JoinNode
// =============================================================================

JoinNode::JoinNode(std::string id)
    : DerivedSchemaNode(std::move(id), "Join")
{
    addInput("any");
    addInput("any");
    addOutput("any");

    Property left;
    left.name = keys::JoinKeyLeft;
    left.type = PropertyType::String;
    left.defaultValue = std::string();
    left.description = "Join column of the left input";
    properties().declare(left);

    Property right;
    right.name = keys::JoinKeyRight;
    right.type = PropertyType::String;
    right.defaultValue = std::string();
    right.description = "Join column of the right input";
    properties().declare(right);
}

InferenceResult JoinNode::inferOutputSchema(const UpstreamSchemaLookup& upstream) {
    auto left = upstream(0);
    auto right = upstream(1);
    if (!left || !right) {
        clearOutput();
        return InferenceResult::success();
    }

    std::string leftKey = util::trim(properties().getString(keys::JoinKeyLeft).value_or(""));
    std::string rightKey = util::trim(properties().getString(keys::JoinKeyRight).value_or(""));

    if (!leftKey.empty() && !left->findByName(leftKey)) {
        return InferenceResult::failure("Join key '" + leftKey + "' not found in left input");
    }
    if (!rightKey.empty() && !right->findByName(rightKey)) {
        return InferenceResult::failure("Join key '" + rightKey + "' not found in right input");
    }

    ColumnSchema output;
    for (const auto& column : left->columns()) {
        output.add(detached(column));
    }
    for (const auto& column : right->columns()) {
        if (!rightKey.empty() && util::iequals(column.name, rightKey)) {
            continue;
        }
        ColumnDefinition copy = detached(column);
        if (output.findByName(copy.name)) {
            copy.name += "_right";
        }
        output.add(std::move(copy));
    }

    storeOutput(std::move(output));
    return InferenceResult::success();
}

// =============================================================================
// AggregateNode
// =============================================================================

namespace {

std::vector<std::string> splitNames(const std::string& text) {
    std::vector<std::string> names;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = util::trim(item);
        if (!item.empty()) {
            names.push_back(item);
        }
    }
    return names;
}

} // namespace

AggregateNode::AggregateNode(std::string id)
    : DerivedSchemaNode(std::move(id), "Aggregate")
{
    addInput("any");
    addOutput("any");

    Property groupBy;
    groupBy.name = keys::GroupBy;
    groupBy.type = PropertyType::String;
    groupBy.defaultValue = std::string();
    groupBy.description = "Comma-separated grouping columns";
    properties().declare(groupBy);

    Property aggregations;
    aggregations.name = keys::Aggregations;
    aggregations.type = PropertyType::String;
    aggregations.defaultValue = std::string("[]");
    aggregations.description = "JSON array of {column, function, alias}";
    properties().declare(aggregations);
}

InferenceResult AggregateNode::inferOutputSchema(const UpstreamSchemaLookup& upstream) {
    auto input = upstream(0);
    if (!input) {
        clearOutput();
        return InferenceResult::success();
    }

    ColumnSchema output;
    for (const auto& name : splitNames(properties().getString(keys::GroupBy).value_or(""))) {
        const auto* column = input->findByName(name);
        if (!column) {
            return InferenceResult::failure("Group-by column '" + name + "' not found upstream");
        }
        ColumnDefinition copy = detached(*column);
        copy.isForeignKey = false;
        output.add(std::move(copy));
    }

    std::string text = properties().getString(keys::Aggregations).value_or("");
    if (util::trim(text).empty()) {
        text = "[]";
    }

    nlohmann::json specs;
    try {
        specs = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return InferenceResult::failure(std::string("Malformed aggregations: ") + e.what());
    }
    if (!specs.is_array()) {
        return InferenceResult::failure("Aggregations must be a JSON array");
    }

    for (const auto& spec : specs) {
        if (!spec.is_object()) {
            return InferenceResult::failure("Aggregation entries must be objects");
        }
        std::string columnName = util::trim(spec.value("column", ""));
        std::string function = util::toLower(util::trim(spec.value("function", "")));
        std::string alias = util::trim(spec.value("alias", ""));

        ColumnDefinition result;
        if (function == "count") {
            if (!columnName.empty() && columnName != "*" && !input->findByName(columnName)) {
                return InferenceResult::failure("Aggregated column '" + columnName + "' not found upstream");
            }
            result.dataType = "int";
            result.isNullable = false;
        } else if (function == "sum" || function == "avg" || function == "min" || function == "max") {
            const auto* column = input->findByName(columnName);
            if (!column) {
                return InferenceResult::failure("Aggregated column '" + columnName + "' not found upstream");
            }
            result.dataType = function == "avg" ? "double" : column->dataType;
            result.isNullable = true;
        } else {
            return InferenceResult::failure("Unknown aggregate function '" + function + "'");
        }

        if (alias.empty()) {
            alias = (columnName.empty() || columnName == "*") ? function : function + "_" + columnName;
        }
        result.name = alias;
        output.add(std::move(result));
    }

    storeOutput(std::move(output));
    return InferenceResult::success();
}

// =============================================================================
// DerivedColumnNode
// =============================================================================

DerivedColumnNode::DerivedColumnNode(std::string id)
    : DerivedSchemaNode(std::move(id), "DerivedColumn")
{
    addInput("any");
    addOutput("any");

    Property derived;
    derived.name = keys::DerivedColumns;
    derived.type = PropertyType::Schema;
    derived.defaultValue = ColumnSchema();
    derived.description = "Columns computed by this step";
    properties().declare(derived);
}

InferenceResult DerivedColumnNode::inferOutputSchema(const UpstreamSchemaLookup& upstream) {
    auto input = upstream(0);
    if (!input) {
        clearOutput();
        return InferenceResult::success();
    }

    auto derived = properties().getSchema(keys::DerivedColumns).value_or(ColumnSchema());

    std::vector<ColumnDefinition> columns;
    for (const auto& column : input->columns()) {
        columns.push_back(detached(column));
    }
    for (const auto& column : derived.columns()) {
        bool replaced = false;
        for (auto& existing : columns) {
            if (util::iequals(existing.name, column.name)) {
                existing = detached(column);
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            columns.push_back(detached(column));
        }
    }

    ColumnSchema output;
    for (auto& column : columns) {
        output.add(std::move(column));
    }
    storeOutput(std::move(output));
    return InferenceResult::success();
}

// =============================================================================
// PassThroughNode
// =============================================================================

PassThroughNode::PassThroughNode(std::string id, const std::string& kindName)
    : DerivedSchemaNode(std::move(id), kindName)
{
    addInput("any");
    addOutput("any");
}

InferenceResult PassThroughNode::inferOutputSchema(const UpstreamSchemaLookup& upstream) {
    auto input = upstream(0);
    if (!input) {
        clearOutput();
        return InferenceResult::success();
    }
    storeOutput(*input);
    return InferenceResult::success();
}

} // namespace graph
} // namespace conngraph
