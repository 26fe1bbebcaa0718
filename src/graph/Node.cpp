#include "graph/Node.hpp"
#include "util/StringUtil.hpp"
#include <atomic>

namespace conngraph {
namespace graph {

namespace {

PortId nextPortId() {
    static std::atomic<PortId> counter{0};
    return ++counter;
}

Port* firstAvailable(const std::vector<std::unique_ptr<Port>>& ports) {
    for (const auto& port : ports) {
        if (port->isAvailable()) {
            return port.get();
        }
    }
    return nullptr;
}

} // namespace

// =============================================================================
// Port
// =============================================================================

Port::Port(Node& owner, PortDirection direction, std::string dataType, size_t index)
    : m_id(nextPortId())
    , m_owner(&owner)
    , m_direction(direction)
    , m_dataType(std::move(dataType))
    , m_index(index)
{}

// =============================================================================
// Node
// =============================================================================

Node::Node(std::string id, NodeKind kind, bool automation)
    : m_id(std::move(id))
    , m_kind(kind)
    , m_automation(automation)
{}

Port& Node::addInput(const std::string& dataType, std::optional<schema::RowId> rowId) {
    m_inputs.push_back(std::make_unique<Port>(*this, PortDirection::Input, dataType, m_inputs.size()));
    m_inputs.back()->setRowId(std::move(rowId));
    return *m_inputs.back();
}

Port& Node::addOutput(const std::string& dataType, std::optional<schema::RowId> rowId) {
    m_outputs.push_back(std::make_unique<Port>(*this, PortDirection::Output, dataType, m_outputs.size()));
    m_outputs.back()->setRowId(std::move(rowId));
    return *m_outputs.back();
}

Port* Node::input(size_t index) const {
    return index < m_inputs.size() ? m_inputs[index].get() : nullptr;
}

Port* Node::output(size_t index) const {
    return index < m_outputs.size() ? m_outputs[index].get() : nullptr;
}

Port* Node::firstAvailableInput() const {
    return firstAvailable(m_inputs);
}

Port* Node::firstAvailableOutput() const {
    return firstAvailable(m_outputs);
}

Port* Node::findPort(PortId id) const {
    for (const auto& port : m_inputs) {
        if (port->id() == id) return port.get();
    }
    for (const auto& port : m_outputs) {
        if (port->id() == id) return port.get();
    }
    return nullptr;
}

std::string Node::entityName() const {
    auto entity = m_properties.getString(keys::EntityName);
    if (entity && !util::trim(*entity).empty()) {
        return *entity;
    }
    return m_name.empty() ? m_id : m_name;
}

} // namespace graph
} // namespace conngraph
