#include "graph/Edge.hpp"
#include <atomic>
#include <stdexcept>

namespace conngraph {
namespace graph {

namespace {

EdgeId nextEdgeId() {
    static std::atomic<EdgeId> counter{0};
    return ++counter;
}

} // namespace

Edge::Edge(Port* start, Port* end, EdgePolicy policy)
    : m_id(nextEdgeId())
    , m_start(start)
    , m_end(end)
    , m_policy(policy)
{
    validateEndpoints(start, end);
}

void Edge::validateEndpoints(const Port* start, const Port* end) {
    if (!start || !end) {
        throw std::invalid_argument("Edge endpoints cannot be null");
    }
    if (!start->isOutput() || !end->isInput()) {
        throw std::invalid_argument("Edge must run from an output port to an input port, got " +
                                    portDirectionToString(start->direction()) + " -> " +
                                    portDirectionToString(end->direction()));
    }
    if (&start->owner() == &end->owner()) {
        throw std::invalid_argument("Edge endpoints must be on different nodes");
    }
}

bool Edge::connects(const Node& a, const Node& b) const {
    const Node* src = &sourceNode();
    const Node* tgt = &targetNode();
    return (src == &a && tgt == &b) || (src == &b && tgt == &a);
}

void Edge::setEndpoints(Port* start, Port* end) {
    validateEndpoints(start, end);
    m_start = start;
    m_end = end;
}

void Edge::markStatus(EdgeStatus newStatus, const Color& color) {
    status = newStatus;
    statusColor = color;
    showStatusIndicator = true;
}

void Edge::resetStatus() {
    status = EdgeStatus::Normal;
    statusColor.reset();
    showStatusIndicator = false;
}

} // namespace graph
} // namespace conngraph
