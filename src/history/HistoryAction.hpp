#pragma once

#include "graph/Edge.hpp"
#include <optional>
#include <string>

namespace conngraph {
namespace history {

/**
 * Edge-set primitives the history actions replay against.
 *
 * Implementations keep port availability and derived schemas consistent
 * with the edge set on every call.
 */
class EdgeStore {
public:
    virtual ~EdgeStore() = default;

    virtual size_t edgeCount() const = 0;

    /**
     * Insert edge at position (clamped to the end). Single-use edges
     * consume their ports. False if the edge is already present.
     */
    virtual bool insertEdge(const graph::EdgePtr& edge, size_t position) = 0;

    /**
     * Remove edge and release its ports.
     * Returns the position it occupied, nullopt if it was not present.
     */
    virtual std::optional<size_t> removeEdge(const graph::Edge& edge) = 0;

    /**
     * Move edge onto new endpoints, releasing the old ports and consuming
     * the new ones for single-use edges. The edge's row ids already name
     * the new endpoints when this is called.
     */
    virtual bool rebindEdge(graph::Edge& edge, graph::Port* start, graph::Port* end) = 0;
};

/**
 * One reversible graph mutation
 */
class HistoryAction {
public:
    virtual ~HistoryAction() = default;

    virtual std::string name() const = 0;

    virtual bool apply(EdgeStore& store) = 0;

    virtual bool revert(EdgeStore& store) = 0;
};

} // namespace history
} // namespace conngraph
