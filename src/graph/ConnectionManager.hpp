#pragma once

#include "config/EngineConfig.hpp"
#include "graph/ConnectionRules.hpp"
#include "graph/Edge.hpp"
#include "graph/PortRegistry.hpp"
#include "graph/SchemaPropagator.hpp"
#include "history/HistoryAction.hpp"
#include "history/HistoryLog.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace conngraph {
namespace graph {

/**
 * Per-call settings for connect().
 * An explicit multiplicity wins over the pending one-shot preset.
 */
struct ConnectOptions {
    std::optional<Multiplicity> startMultiplicity;
    std::optional<Multiplicity> endMultiplicity;
};

/**
 * Public entry point of the connection engine.
 *
 * Owns the edge set and the undo/redo history. Nodes stay owned by the
 * host; they are registered implicitly by connect() and must outlive the
 * manager or be passed to unregisterNode() before they are destroyed.
 *
 * Not thread-safe: the host serializes all calls.
 */
class ConnectionManager : public history::EdgeStore {
public:
    explicit ConnectionManager(config::EngineConfig config = config::EngineConfig());

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // === Mutations ===

    /**
     * Link a to b.
     *
     * Both automation nodes: single-use ports, type, node-kind, duplicate
     * and cycle checks. Otherwise: shared ports, PK/FK validation.
     * Returns the new edge, nullptr if the connect was refused.
     * Throws std::invalid_argument on a null node or a == b.
     */
    EdgePtr connect(Node* a, Node* b, const ConnectOptions& options = ConnectOptions());

    /**
     * Remove the first edge between a and b (either direction).
     * Returns false when there is none.
     * Throws std::invalid_argument on a null node.
     */
    bool disconnect(Node* a, Node* b);

    /**
     * Rebind one or both ends of an edge. A null port keeps that end.
     * Throws std::invalid_argument on a null edge; returns false when the
     * move is refused (unknown edge, wrong direction, same node, port in
     * use by a single-use edge, cycle).
     */
    bool moveEdge(const EdgePtr& edge, Port* newSource, Port* newTarget);

    /**
     * Multiplicity markers for the next created edge only
     */
    void setNextEdgeMultiplicityPreset(std::optional<Multiplicity> start,
                                       std::optional<Multiplicity> end);
    bool hasPendingMultiplicityPreset() const;

    /**
     * Re-run schema inference for one node on demand
     */
    InferenceResult inferSchema(Node& node);

    bool undo();
    bool redo();
    bool canUndo() const { return m_history.canUndo(); }
    bool canRedo() const { return m_history.canRedo(); }
    const history::HistoryLog& history() const { return m_history; }

    // === Queries ===

    const EdgeList& edges() const { return m_edges; }

    /**
     * First edge between a and b in either direction
     */
    EdgePtr findEdge(const Node& a, const Node& b) const;

    EdgeList edgesInto(const Node& node) const;
    EdgeList edgesFrom(const Node& node) const;

    Node* ownerOfPort(PortId id) const;

    /**
     * Run the automation connect checks without mutating anything
     */
    ConnectRejection validateAutomationConnect(const Node& a, const Node& b) const;

    // === Nodes ===

    void registerNode(Node& node);

    /**
     * Drop every edge touching node and forget it. History is cleared
     * since recorded actions may reference the node.
     */
    void unregisterNode(Node& node);

    const PortRegistry& ports() const { return m_registry; }
    const config::EngineConfig& config() const { return m_config; }

    void setRedrawCallback(std::function<void()> callback) { m_redraw = std::move(callback); }

    // === EdgeStore ===

    size_t edgeCount() const override { return m_edges.size(); }
    bool insertEdge(const EdgePtr& edge, size_t position) override;
    std::optional<size_t> removeEdge(const Edge& edge) override;
    bool rebindEdge(Edge& edge, Port* start, Port* end) override;

private:
    EdgePtr connectAutomation(Node& a, Node& b, const ConnectOptions& options);
    EdgePtr connectGeneric(Node& a, Node& b, const ConnectOptions& options);

    void applyMultiplicity(Edge& edge, const ConnectOptions& options);
    bool commit(std::unique_ptr<history::HistoryAction> action);

    static void bindPorts(Port* start, Port* end);
    static void releasePorts(Port* start, Port* end);

    std::optional<size_t> indexOf(const Edge& edge) const;
    void reinfer(const std::vector<Node*>& nodes);
    void requestRedraw();

    config::EngineConfig m_config;
    EdgeList m_edges;
    PortRegistry m_registry;
    SchemaPropagator m_propagator;
    history::HistoryLog m_history;

    struct MultiplicityPreset {
        std::optional<Multiplicity> start;
        std::optional<Multiplicity> end;
    };
    std::optional<MultiplicityPreset> m_preset;

    std::function<void()> m_redraw;
};

} // namespace graph
} // namespace conngraph
