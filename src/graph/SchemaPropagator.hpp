#pragma once

#include "graph/Edge.hpp"
#include "graph/SchemaInference.hpp"
#include <optional>

namespace conngraph {
namespace graph {

/**
 * Attaches schema metadata to edges and re-derives the output schema of
 * nodes that compute theirs from upstream edges.
 *
 * Semantic problems (expected schema mismatch, join key mismatch) only
 * mark edges Warning; nothing here blocks a mutation or throws.
 */
class SchemaPropagator {
public:
    explicit SchemaPropagator(const Color& warningColor = colors::Amber);

    /**
     * Automation edges: schema from the source's OutputSchema, expected
     * schema from the target's ExpectedSchema
     */
    void attachAutomation(Edge& edge) const;

    /**
     * Generic edges: either endpoint may supply the schema (source first)
     * and the expected schema (target first)
     */
    void attachGeneric(Edge& edge) const;

    /**
     * Run the node's SchemaInference capability, if any, then refresh the
     * schema on its outgoing edges and validate join keys.
     * Exceptions thrown by the capability are turned into a failure result.
     */
    InferenceResult reinfer(Node& node, const EdgeList& edges) const;

    /**
     * Edges ending at node, ordered by input port index (ties keep edge order)
     */
    static EdgeList incomingEdges(const EdgeList& edges, const Node& node);

    /**
     * Schema carried by the index-th incoming edge of node
     */
    static std::optional<schema::ColumnSchema> upstreamSchema(const EdgeList& edges,
                                                              const Node& node, size_t index);

private:
    void checkExpected(Edge& edge) const;
    void refreshOutgoing(const Node& node, const EdgeList& edges) const;
    void validateJoin(const Node& node, const EdgeList& edges) const;

    Color m_warningColor;
};

} // namespace graph
} // namespace conngraph
