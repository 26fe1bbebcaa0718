#include "history/EdgeActions.hpp"

namespace conngraph {
namespace history {

// =============================================================================
// ConnectAction
// =============================================================================

ConnectAction::ConnectAction(graph::EdgePtr edge)
    : m_edge(std::move(edge))
{
}

std::string ConnectAction::name() const {
    return "Connect";
}

bool ConnectAction::apply(EdgeStore& store) {
    if (!m_edge) return false;
    size_t position = m_position.value_or(store.edgeCount());
    return store.insertEdge(m_edge, position);
}

bool ConnectAction::revert(EdgeStore& store) {
    if (!m_edge) return false;
    m_position = store.removeEdge(*m_edge);
    return m_position.has_value();
}

// =============================================================================
// DisconnectAction
// =============================================================================

DisconnectAction::DisconnectAction(graph::EdgePtr edge)
    : m_edge(std::move(edge))
{
}

std::string DisconnectAction::name() const {
    return "Disconnect";
}

bool DisconnectAction::apply(EdgeStore& store) {
    if (!m_edge) return false;
    auto position = store.removeEdge(*m_edge);
    if (!position) return false;
    m_position = *position;
    return true;
}

bool DisconnectAction::revert(EdgeStore& store) {
    if (!m_edge) return false;
    return store.insertEdge(m_edge, m_position);
}

// =============================================================================
// MoveEdgeAction
// =============================================================================

MoveEdgeAction::MoveEdgeAction(graph::EdgePtr edge, graph::Port* newStart, graph::Port* newEnd)
    : m_edge(std::move(edge))
    , m_oldStart(m_edge ? m_edge->start() : nullptr)
    , m_oldEnd(m_edge ? m_edge->end() : nullptr)
    , m_newStart(newStart)
    , m_newEnd(newEnd)
{
    if (m_edge) {
        m_oldSourceRowId = m_edge->sourceRowId;
        m_oldTargetRowId = m_edge->targetRowId;
    }
}

std::string MoveEdgeAction::name() const {
    return "Move Edge";
}

bool MoveEdgeAction::apply(EdgeStore& store) {
    if (!m_edge) return false;

    auto sourceRowId = m_edge->sourceRowId;
    auto targetRowId = m_edge->targetRowId;
    if (m_newStart != m_oldStart) {
        m_edge->sourceRowId = m_newStart->rowId();
    }
    if (m_newEnd != m_oldEnd) {
        m_edge->targetRowId = m_newEnd->rowId();
    }

    if (!store.rebindEdge(*m_edge, m_newStart, m_newEnd)) {
        m_edge->sourceRowId = sourceRowId;
        m_edge->targetRowId = targetRowId;
        return false;
    }
    return true;
}

bool MoveEdgeAction::revert(EdgeStore& store) {
    if (!m_edge) return false;

    auto sourceRowId = m_edge->sourceRowId;
    auto targetRowId = m_edge->targetRowId;
    m_edge->sourceRowId = m_oldSourceRowId;
    m_edge->targetRowId = m_oldTargetRowId;

    if (!store.rebindEdge(*m_edge, m_oldStart, m_oldEnd)) {
        m_edge->sourceRowId = sourceRowId;
        m_edge->targetRowId = targetRowId;
        return false;
    }
    return true;
}

} // namespace history
} // namespace conngraph
