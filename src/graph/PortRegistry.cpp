#include "graph/PortRegistry.hpp"
#include <algorithm>

namespace conngraph {
namespace graph {

void PortRegistry::index(Node& node) const {
    for (const auto& port : node.inputs()) {
        m_ports[port->id()] = port.get();
    }
    for (const auto& port : node.outputs()) {
        m_ports[port->id()] = port.get();
    }
}

void PortRegistry::registerNode(Node& node) {
    if (contains(node)) {
        index(node);
        return;
    }
    m_nodes.push_back(&node);
    index(node);
}

void PortRegistry::unregisterNode(const Node& node) {
    m_nodes.erase(std::remove(m_nodes.begin(), m_nodes.end(), &node), m_nodes.end());

    for (auto it = m_ports.begin(); it != m_ports.end();) {
        if (&it->second->owner() == &node) {
            it = m_ports.erase(it);
        } else {
            ++it;
        }
    }
}

bool PortRegistry::contains(const Node& node) const {
    return std::find(m_nodes.begin(), m_nodes.end(), &node) != m_nodes.end();
}

Port* PortRegistry::findPort(PortId id) const {
    auto it = m_ports.find(id);
    if (it != m_ports.end()) {
        return it->second;
    }

    for (Node* node : m_nodes) {
        if (Port* port = node->findPort(id)) {
            index(*node);
            return port;
        }
    }
    return nullptr;
}

Node* PortRegistry::ownerOf(PortId id) const {
    Port* port = findPort(id);
    return port ? &port->owner() : nullptr;
}

} // namespace graph
} // namespace conngraph
