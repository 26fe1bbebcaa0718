#pragma once

#include "schema/ColumnSchema.hpp"
#include <functional>
#include <optional>
#include <string>

namespace conngraph {
namespace graph {

/**
 * Outcome of a schema re-inference
 */
struct InferenceResult {
    bool ok = true;
    std::string errorMessage;

    static InferenceResult success() { return InferenceResult{}; }
    static InferenceResult failure(std::string message) {
        return InferenceResult{false, std::move(message)};
    }
};

/**
 * Returns the schema arriving on the i-th upstream input of a node,
 * nullopt when nothing with a schema is connected there.
 */
using UpstreamSchemaLookup = std::function<std::optional<schema::ColumnSchema>(size_t inputIndex)>;

/**
 * Capability of node kinds whose output schema derives from their upstream
 * edges (joins, aggregates, transforms).
 *
 * Nodes opt in by implementing this interface and returning themselves
 * from Node::schemaInference().
 */
class SchemaInference {
public:
    virtual ~SchemaInference() = default;

    /**
     * Recompute and store the node's own output schema.
     * Must report problems through the result instead of throwing.
     */
    virtual InferenceResult inferOutputSchema(const UpstreamSchemaLookup& upstream) = 0;
};

} // namespace graph
} // namespace conngraph
