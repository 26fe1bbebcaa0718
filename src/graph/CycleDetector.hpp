#pragma once

#include "graph/Edge.hpp"

namespace conngraph {
namespace graph {

/**
 * Reachability checks over the edge set, used to keep the automation
 * family acyclic. The edge set is only read.
 */
class CycleDetector {
public:
    /**
     * True if adding source -> target would close a loop, i.e. source is
     * reachable from target along existing edges (or source == target).
     * Depth-first search, O(V+E).
     */
    static bool wouldCreateCycle(const EdgeList& edges, const Node& source, const Node& target);

    /**
     * True if the whole edge set contains no directed cycle
     */
    static bool isAcyclic(const EdgeList& edges);
};

} // namespace graph
} // namespace conngraph
