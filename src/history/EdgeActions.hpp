#pragma once

#include "history/HistoryAction.hpp"

namespace conngraph {
namespace history {

/**
 * Adds an edge; undo removes it and frees its ports
 */
class ConnectAction final : public HistoryAction {
public:
    explicit ConnectAction(graph::EdgePtr edge);

    std::string name() const override;
    bool apply(EdgeStore& store) override;
    bool revert(EdgeStore& store) override;

    const graph::EdgePtr& edge() const { return m_edge; }

private:
    graph::EdgePtr m_edge;
    std::optional<size_t> m_position;
};

/**
 * Removes an edge; undo puts the same edge, with all of its metadata,
 * back at its old position
 */
class DisconnectAction final : public HistoryAction {
public:
    explicit DisconnectAction(graph::EdgePtr edge);

    std::string name() const override;
    bool apply(EdgeStore& store) override;
    bool revert(EdgeStore& store) override;

private:
    graph::EdgePtr m_edge;
    size_t m_position = 0;
};

/**
 * Rebinds the endpoints of an edge. The old endpoints and row ids are
 * captured at construction.
 */
class MoveEdgeAction final : public HistoryAction {
public:
    MoveEdgeAction(graph::EdgePtr edge, graph::Port* newStart, graph::Port* newEnd);

    std::string name() const override;
    bool apply(EdgeStore& store) override;
    bool revert(EdgeStore& store) override;

private:
    graph::EdgePtr m_edge;
    graph::Port* m_oldStart;
    graph::Port* m_oldEnd;
    graph::Port* m_newStart;
    graph::Port* m_newEnd;
    std::optional<schema::RowId> m_oldSourceRowId;
    std::optional<schema::RowId> m_oldTargetRowId;
};

} // namespace history
} // namespace conngraph
