#pragma once

#include "graph/Edge.hpp"

namespace conngraph {
namespace graph {

enum class PkFkVerdict {
    NotApplicable,  // no row ids on both ends, or a column could not be resolved
    Valid,
    Invalid
};

/**
 * Referential check for column-level edges between tabular entities.
 *
 * An edge linking column S (source) to column T (target) is valid when
 * one side is flagged primary key and the other foreign key, or when
 * either entity declares a foreign key mapping S to T (or T to S) at the
 * same position. Columns are resolved by row id from each node's Columns
 * property.
 */
class PkFkValidator {
public:
    static PkFkVerdict check(const Edge& edge);

    /**
     * Run check() and mark the edge Warning when the verdict is Invalid.
     * Never blocks the edge.
     */
    static PkFkVerdict apply(Edge& edge, const Color& warningColor);
};

} // namespace graph
} // namespace conngraph
