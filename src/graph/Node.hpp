#pragma once

#include "graph/Types.hpp"
#include "graph/Property.hpp"
#include "graph/SchemaInference.hpp"
#include "schema/ColumnSchema.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace conngraph {
namespace graph {

class Node;

using PortId = uint64_t;

/**
 * Typed attachment point on a node.
 *
 * A port is available until a single-use edge consumes it. Ports of tabular
 * nodes may carry the row id of the column they stand for.
 */
class Port {
public:
    Port(Node& owner, PortDirection direction, std::string dataType, size_t index);

    Port(const Port&) = delete;
    Port& operator=(const Port&) = delete;

    PortId id() const { return m_id; }
    Node& owner() const { return *m_owner; }
    PortDirection direction() const { return m_direction; }
    const std::string& dataType() const { return m_dataType; }
    size_t index() const { return m_index; }

    bool isInput() const { return m_direction == PortDirection::Input; }
    bool isOutput() const { return m_direction == PortDirection::Output; }

    bool isAvailable() const { return m_available; }
    void setAvailable(bool available) { m_available = available; }

    const std::optional<schema::RowId>& rowId() const { return m_rowId; }
    void setRowId(std::optional<schema::RowId> rowId) { m_rowId = std::move(rowId); }

    /**
     * Peer port while a single-use edge links the two, nullptr otherwise
     */
    Port* connection() const { return m_connection; }
    void setConnection(Port* peer) { m_connection = peer; }

private:
    PortId m_id;
    Node* m_owner;
    PortDirection m_direction;
    std::string m_dataType;
    size_t m_index;
    bool m_available = true;
    std::optional<schema::RowId> m_rowId;
    Port* m_connection = nullptr;
};

/**
 * A diagram component as seen by the connection engine.
 *
 * Nodes are owned by the host diagram; the engine only reads and writes
 * their ports and properties. Automation-family nodes get single-use ports
 * and acyclicity checks when both ends of a connect belong to the family.
 */
class Node {
public:
    explicit Node(std::string id, NodeKind kind = NodeKind::Generic, bool automation = false);
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& id() const { return m_id; }
    const std::string& name() const { return m_name; }
    void setName(std::string name) { m_name = std::move(name); }

    NodeKind kind() const { return m_kind; }
    bool isAutomation() const { return m_automation; }

    // === Ports ===

    Port& addInput(const std::string& dataType = "any",
                   std::optional<schema::RowId> rowId = std::nullopt);
    Port& addOutput(const std::string& dataType = "any",
                    std::optional<schema::RowId> rowId = std::nullopt);

    const std::vector<std::unique_ptr<Port>>& inputs() const { return m_inputs; }
    const std::vector<std::unique_ptr<Port>>& outputs() const { return m_outputs; }

    Port* input(size_t index) const;
    Port* output(size_t index) const;

    Port* firstAvailableInput() const;
    Port* firstAvailableOutput() const;

    /**
     * Find one of this node's ports by id, nullptr if not owned here
     */
    Port* findPort(PortId id) const;

    // === Properties ===

    PropertyBag& properties() { return m_properties; }
    const PropertyBag& properties() const { return m_properties; }

    /**
     * Entity name used for foreign-key matching:
     * EntityName property, else the display name, else the id
     */
    std::string entityName() const;

    // === Capabilities ===

    /**
     * Schema re-inference capability, nullptr when this kind has none
     */
    virtual SchemaInference* schemaInference() { return nullptr; }

private:
    std::string m_id;
    std::string m_name;
    NodeKind m_kind;
    bool m_automation;
    std::vector<std::unique_ptr<Port>> m_inputs;
    std::vector<std::unique_ptr<Port>> m_outputs;
    PropertyBag m_properties;
};

} // namespace graph
} // namespace conngraph
