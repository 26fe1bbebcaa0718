#pragma once

#include "graph/Node.hpp"
#include <unordered_map>
#include <vector>

namespace conngraph {
namespace graph {

/**
 * Index of the ports of every node known to the engine.
 *
 * Answers "which node owns port X". Ports added to a node after it was
 * registered are picked up on the first lookup that misses the index.
 */
class PortRegistry {
public:
    PortRegistry() = default;

    PortRegistry(const PortRegistry&) = delete;
    PortRegistry& operator=(const PortRegistry&) = delete;

    void registerNode(Node& node);
    void unregisterNode(const Node& node);

    bool contains(const Node& node) const;

    /**
     * Port by id, nullptr when no registered node owns it
     */
    Port* findPort(PortId id) const;

    /**
     * Owner of a port, nullptr when no registered node owns it
     */
    Node* ownerOf(PortId id) const;

    const std::vector<Node*>& nodes() const { return m_nodes; }
    size_t size() const { return m_nodes.size(); }

private:
    void index(Node& node) const;

    std::vector<Node*> m_nodes;
    mutable std::unordered_map<PortId, Port*> m_ports;
};

} // namespace graph
} // namespace conngraph
