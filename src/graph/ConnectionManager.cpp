#include "graph/ConnectionManager.hpp"
#include "graph/CycleDetector.hpp"
#include "graph/PkFkValidator.hpp"
#include "graph/TypeCompatibility.hpp"
#include "history/EdgeActions.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace conngraph {
namespace graph {

namespace {

std::string describe(const Node& a, const Node& b) {
    return a.id() + " -> " + b.id();
}

} // namespace

ConnectionManager::ConnectionManager(config::EngineConfig config)
    : m_config(std::move(config))
    , m_propagator(m_config.warningColor)
    , m_history(*this)
{
}

// =============================================================================
// Connect
// =============================================================================

EdgePtr ConnectionManager::connect(Node* a, Node* b, const ConnectOptions& options) {
    if (!a || !b) {
        throw std::invalid_argument("connect: node cannot be null");
    }
    if (a == b) {
        throw std::invalid_argument("connect: cannot connect node " + a->id() + " to itself");
    }

    registerNode(*a);
    registerNode(*b);

    if (a->isAutomation() && b->isAutomation()) {
        return connectAutomation(*a, *b, options);
    }
    return connectGeneric(*a, *b, options);
}

ConnectRejection ConnectionManager::validateAutomationConnect(const Node& a, const Node& b) const {
    Port* out = a.firstAvailableOutput();
    Port* in = b.firstAvailableInput();
    if (!out || !in) {
        return ConnectRejection::NoAvailablePort;
    }
    if (!isDirectionValid(*out, *in)) {
        return ConnectRejection::DirectionMismatch;
    }
    if (!TypeCompatibilityTable::instance().isCompatible(out->dataType(), in->dataType())) {
        return ConnectRejection::IncompatibleTypes;
    }
    if (!areNodeKindsCompatible(a.kind(), b.kind())) {
        return ConnectRejection::DisallowedNodeKinds;
    }
    if (findEdge(a, b)) {
        return ConnectRejection::AlreadyConnected;
    }
    if (CycleDetector::wouldCreateCycle(m_edges, a, b)) {
        return ConnectRejection::WouldCreateCycle;
    }
    return ConnectRejection::None;
}

EdgePtr ConnectionManager::connectAutomation(Node& a, Node& b, const ConnectOptions& options) {
    ConnectRejection rejection = validateAutomationConnect(a, b);
    if (rejection != ConnectRejection::None) {
        CG_LOG_DEBUG("Connect " + describe(a, b) + " rejected: " + connectRejectionToString(rejection));
        return nullptr;
    }

    Port* out = a.firstAvailableOutput();
    Port* in = b.firstAvailableInput();

    auto edge = std::make_shared<Edge>(out, in, EdgePolicy::SingleUse);
    edge->sourceRowId = out->rowId();
    edge->targetRowId = in->rowId();
    edge->flowDirection = m_config.defaultFlowDirection;
    edge->dataFlowAnimated = m_config.animateAutomationEdges;
    edge->dataFlowColor = TypeCompatibilityTable::dataFlowColor(out->dataType());
    edge->labels.dataType = out->dataType();

    m_propagator.attachAutomation(*edge);
    applyMultiplicity(*edge, options);

    if (!commit(std::make_unique<history::ConnectAction>(edge))) {
        return nullptr;
    }
    CG_LOG_DEBUG("Connected " + describe(a, b) + " (single use)");
    return edge;
}

EdgePtr ConnectionManager::connectGeneric(Node& a, Node& b, const ConnectOptions& options) {
    Port* out = a.output(0);
    Port* in = b.input(0);
    if (!out || !in) {
        CG_LOG_DEBUG("Connect " + describe(a, b) + " rejected: " +
                     connectRejectionToString(ConnectRejection::NoAvailablePort));
        return nullptr;
    }

    auto edge = std::make_shared<Edge>(out, in, EdgePolicy::Shared);
    edge->sourceRowId = out->rowId();
    edge->targetRowId = in->rowId();
    edge->flowDirection = m_config.defaultFlowDirection;
    edge->dataFlowAnimated = false;

    applyMultiplicity(*edge, options);
    m_propagator.attachGeneric(*edge);
    PkFkValidator::apply(*edge, m_config.warningColor);

    if (!commit(std::make_unique<history::ConnectAction>(edge))) {
        return nullptr;
    }
    CG_LOG_DEBUG("Connected " + describe(a, b) + " (shared)");
    return edge;
}

void ConnectionManager::applyMultiplicity(Edge& edge, const ConnectOptions& options) {
    std::optional<MultiplicityPreset> preset;
    preset.swap(m_preset);

    std::optional<Multiplicity> start = options.startMultiplicity;
    std::optional<Multiplicity> end = options.endMultiplicity;
    if (preset) {
        if (!start) start = preset->start;
        if (!end) end = preset->end;
    }

    if (start) edge.startMultiplicity = *start;
    if (end) edge.endMultiplicity = *end;
}

void ConnectionManager::setNextEdgeMultiplicityPreset(std::optional<Multiplicity> start,
                                                      std::optional<Multiplicity> end) {
    if (!start && !end) {
        m_preset.reset();
        return;
    }
    m_preset = MultiplicityPreset{start, end};
}

bool ConnectionManager::hasPendingMultiplicityPreset() const {
    return m_preset.has_value();
}

// =============================================================================
// Disconnect / move
// =============================================================================

bool ConnectionManager::disconnect(Node* a, Node* b) {
    if (!a || !b) {
        throw std::invalid_argument("disconnect: node cannot be null");
    }

    EdgePtr edge = findEdge(*a, *b);
    if (!edge) {
        CG_LOG_DEBUG("Disconnect " + describe(*a, *b) + ": no edge");
        return false;
    }

    if (!commit(std::make_unique<history::DisconnectAction>(edge))) {
        return false;
    }
    CG_LOG_DEBUG("Disconnected " + describe(edge->sourceNode(), edge->targetNode()));
    return true;
}

bool ConnectionManager::moveEdge(const EdgePtr& edge, Port* newSource, Port* newTarget) {
    if (!edge) {
        throw std::invalid_argument("moveEdge: edge cannot be null");
    }
    if (!indexOf(*edge) || (!newSource && !newTarget)) {
        return false;
    }

    Port* start = newSource ? newSource : edge->start();
    Port* end = newTarget ? newTarget : edge->end();
    if (start == edge->start() && end == edge->end()) {
        return false;
    }

    if (!isDirectionValid(*start, *end) || &start->owner() == &end->owner()) {
        CG_LOG_DEBUG("Move edge " + describe(edge->sourceNode(), edge->targetNode()) +
                     " rejected: " + connectRejectionToString(ConnectRejection::DirectionMismatch));
        return false;
    }

    if (edge->policy() == EdgePolicy::SingleUse) {
        bool startBusy = start != edge->start() && !start->isAvailable();
        bool endBusy = end != edge->end() && !end->isAvailable();
        if (startBusy || endBusy) {
            CG_LOG_DEBUG("Move edge rejected: " + connectRejectionToString(ConnectRejection::NoAvailablePort));
            return false;
        }

        EdgeList others;
        for (const auto& e : m_edges) {
            if (e != edge) others.push_back(e);
        }
        if (CycleDetector::wouldCreateCycle(others, start->owner(), end->owner())) {
            CG_LOG_DEBUG("Move edge rejected: " + connectRejectionToString(ConnectRejection::WouldCreateCycle));
            return false;
        }
    }

    registerNode(start->owner());
    registerNode(end->owner());

    if (!commit(std::make_unique<history::MoveEdgeAction>(edge, start, end))) {
        return false;
    }
    CG_LOG_DEBUG("Moved edge to " + describe(edge->sourceNode(), edge->targetNode()));
    return true;
}

// =============================================================================
// Inference / history
// =============================================================================

InferenceResult ConnectionManager::inferSchema(Node& node) {
    InferenceResult result = m_propagator.reinfer(node, m_edges);
    if (!result.ok) {
        CG_LOG_WARN("Schema inference failed for node " + node.id() + ": " + result.errorMessage);
    }
    requestRedraw();
    return result;
}

bool ConnectionManager::undo() {
    if (!m_history.undo()) {
        return false;
    }
    requestRedraw();
    return true;
}

bool ConnectionManager::redo() {
    if (!m_history.redo()) {
        return false;
    }
    requestRedraw();
    return true;
}

bool ConnectionManager::commit(std::unique_ptr<history::HistoryAction> action) {
    if (!m_history.execute(std::move(action))) {
        return false;
    }
    requestRedraw();
    return true;
}

// =============================================================================
// Queries
// =============================================================================

EdgePtr ConnectionManager::findEdge(const Node& a, const Node& b) const {
    for (const auto& edge : m_edges) {
        if (edge->connects(a, b)) {
            return edge;
        }
    }
    return nullptr;
}

EdgeList ConnectionManager::edgesInto(const Node& node) const {
    EdgeList result;
    for (const auto& edge : m_edges) {
        if (&edge->targetNode() == &node) result.push_back(edge);
    }
    return result;
}

EdgeList ConnectionManager::edgesFrom(const Node& node) const {
    EdgeList result;
    for (const auto& edge : m_edges) {
        if (&edge->sourceNode() == &node) result.push_back(edge);
    }
    return result;
}

Node* ConnectionManager::ownerOfPort(PortId id) const {
    return m_registry.ownerOf(id);
}

// =============================================================================
// Nodes
// =============================================================================

void ConnectionManager::registerNode(Node& node) {
    m_registry.registerNode(node);
}

void ConnectionManager::unregisterNode(Node& node) {
    std::vector<Node*> neighbours;
    for (auto it = m_edges.begin(); it != m_edges.end();) {
        Edge& edge = **it;
        Node* source = &edge.sourceNode();
        Node* target = &edge.targetNode();
        if (source != &node && target != &node) {
            ++it;
            continue;
        }
        if (edge.policy() == EdgePolicy::SingleUse) {
            releasePorts(edge.start(), edge.end());
        }
        neighbours.push_back(source == &node ? target : source);
        it = m_edges.erase(it);
    }

    m_registry.unregisterNode(node);
    m_history.clear();
    reinfer(neighbours);
    requestRedraw();
}

// =============================================================================
// EdgeStore
// =============================================================================

std::optional<size_t> ConnectionManager::indexOf(const Edge& edge) const {
    for (size_t i = 0; i < m_edges.size(); ++i) {
        if (m_edges[i].get() == &edge) return i;
    }
    return std::nullopt;
}

void ConnectionManager::bindPorts(Port* start, Port* end) {
    start->setAvailable(false);
    end->setAvailable(false);
    start->setConnection(end);
    end->setConnection(start);
}

void ConnectionManager::releasePorts(Port* start, Port* end) {
    start->setAvailable(true);
    end->setAvailable(true);
    start->setConnection(nullptr);
    end->setConnection(nullptr);
}

bool ConnectionManager::insertEdge(const EdgePtr& edge, size_t position) {
    if (!edge || indexOf(*edge)) {
        return false;
    }

    registerNode(edge->sourceNode());
    registerNode(edge->targetNode());

    if (edge->policy() == EdgePolicy::SingleUse) {
        bindPorts(edge->start(), edge->end());
    }

    position = std::min(position, m_edges.size());
    m_edges.insert(m_edges.begin() + static_cast<std::ptrdiff_t>(position), edge);

    reinfer({&edge->sourceNode(), &edge->targetNode()});
    return true;
}

std::optional<size_t> ConnectionManager::removeEdge(const Edge& edge) {
    auto position = indexOf(edge);
    if (!position) {
        return std::nullopt;
    }

    EdgePtr removed = m_edges[*position];
    m_edges.erase(m_edges.begin() + static_cast<std::ptrdiff_t>(*position));

    if (removed->policy() == EdgePolicy::SingleUse) {
        releasePorts(removed->start(), removed->end());
    }

    reinfer({&removed->sourceNode(), &removed->targetNode()});
    return position;
}

bool ConnectionManager::rebindEdge(Edge& edge, Port* start, Port* end) {
    if (!indexOf(edge) || !start || !end) {
        return false;
    }
    if (!isDirectionValid(*start, *end) || &start->owner() == &end->owner()) {
        return false;
    }

    std::vector<Node*> affected = {&edge.sourceNode(), &edge.targetNode(),
                                   &start->owner(), &end->owner()};

    if (edge.policy() == EdgePolicy::SingleUse) {
        releasePorts(edge.start(), edge.end());
        bindPorts(start, end);
    }
    edge.setEndpoints(start, end);

    edge.resetStatus();
    if (edge.policy() == EdgePolicy::SingleUse) {
        m_propagator.attachAutomation(edge);
    } else {
        m_propagator.attachGeneric(edge);
        PkFkValidator::apply(edge, m_config.warningColor);
    }

    reinfer(affected);
    return true;
}

void ConnectionManager::reinfer(const std::vector<Node*>& nodes) {
    std::vector<Node*> seen;
    for (Node* node : nodes) {
        if (!node || std::find(seen.begin(), seen.end(), node) != seen.end()) continue;
        seen.push_back(node);

        InferenceResult result = m_propagator.reinfer(*node, m_edges);
        if (!result.ok) {
            CG_LOG_WARN("Schema inference failed for node " + node->id() + ": " + result.errorMessage);
        }
    }
}

void ConnectionManager::requestRedraw() {
    if (m_redraw) {
        m_redraw();
    }
}

} // namespace graph
} // namespace conngraph
