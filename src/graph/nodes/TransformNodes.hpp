#pragma once

#include "graph/Node.hpp"
#include "graph/SchemaInference.hpp"
#include <string>

namespace conngraph {
namespace graph {

/**
 * Base for ETL-style nodes whose output schema is derived from upstream.
 *
 * The derived schema is stored typed in the OutputSchema property, where
 * downstream edges pick it up. With no upstream schema the property is
 * cleared.
 */
class DerivedSchemaNode : public Node, public SchemaInference {
public:
    DerivedSchemaNode(std::string id, const std::string& kindName);

    SchemaInference* schemaInference() override { return this; }

protected:
    void storeOutput(schema::ColumnSchema output);
    void clearOutput();

    /**
     * Copy of a column detached from its source row id
     */
    static schema::ColumnDefinition detached(const schema::ColumnDefinition& column);
};

/**
 * Two-input join. Output is every left column followed by the right
 * columns except the right join key; right names that collide with an
 * output name get a "_right" suffix.
 *
 * Properties: Kind = "Join", JoinKeyLeft, JoinKeyRight.
 */
class JoinNode : public DerivedSchemaNode {
public:
    explicit JoinNode(std::string id);

    InferenceResult inferOutputSchema(const UpstreamSchemaLookup& upstream) override;
};

/**
 * Group-by aggregation.
 *
 * GroupBy: comma-separated upstream column names.
 * Aggregations: JSON array of {"column", "function", "alias"} with
 * function one of count, sum, avg, min, max. count yields int, avg yields
 * double, the others keep the source column type. count accepts "*".
 */
class AggregateNode : public DerivedSchemaNode {
public:
    explicit AggregateNode(std::string id);

    InferenceResult inferOutputSchema(const UpstreamSchemaLookup& upstream) override;
};

/**
 * Upstream columns plus the DerivedColumns schema; a derived column with
 * the name of an upstream column replaces it in place.
 */
class DerivedColumnNode : public DerivedSchemaNode {
public:
    explicit DerivedColumnNode(std::string id);

    InferenceResult inferOutputSchema(const UpstreamSchemaLookup& upstream) override;
};

/**
 * Row-level step that leaves the schema untouched (Filter, Sort)
 */
class PassThroughNode : public DerivedSchemaNode {
public:
    PassThroughNode(std::string id, const std::string& kindName);

    InferenceResult inferOutputSchema(const UpstreamSchemaLookup& upstream) override;
};

} // namespace graph
} // namespace conngraph
