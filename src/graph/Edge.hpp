#pragma once

#include "graph/Types.hpp"
#include "graph/Node.hpp"
#include "schema/ColumnSchema.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace conngraph {
namespace graph {

using EdgeId = uint64_t;

/**
 * Free-text labels shown along an edge
 */
struct EdgeLabels {
    std::string start;
    std::string middle;
    std::string end;
    std::string dataType;
};

/**
 * Directed link from one output port to one input port of another node.
 *
 * Endpoints are only rebound by the ConnectionManager. Annotation fields
 * (status, schema, markers, labels) are set by the validators and may be
 * edited by the host.
 */
class Edge {
public:
    /**
     * Throws std::invalid_argument unless start is an Output port,
     * end is an Input port, and both are on different nodes.
     */
    Edge(Port* start, Port* end, EdgePolicy policy);

    Edge(const Edge&) = delete;
    Edge& operator=(const Edge&) = delete;

    EdgeId id() const { return m_id; }
    Port* start() const { return m_start; }
    Port* end() const { return m_end; }
    Node& sourceNode() const { return m_start->owner(); }
    Node& targetNode() const { return m_end->owner(); }
    EdgePolicy policy() const { return m_policy; }

    bool connects(const Node& a, const Node& b) const;

    /**
     * Replace the endpoints (same validation as the constructor)
     */
    void setEndpoints(Port* start, Port* end);

    /**
     * Set status together with its indicator color
     */
    void markStatus(EdgeStatus newStatus, const Color& color);
    void resetStatus();

    // === Annotations ===

    EdgeStatus status = EdgeStatus::Normal;
    std::optional<Color> statusColor;
    bool showStatusIndicator = false;

    std::optional<schema::ColumnSchema> schema;
    std::optional<schema::ColumnSchema> expectedSchema;

    std::optional<schema::RowId> sourceRowId;
    std::optional<schema::RowId> targetRowId;

    Multiplicity startMultiplicity = Multiplicity::Unspecified;
    Multiplicity endMultiplicity = Multiplicity::Unspecified;

    FlowDirection flowDirection = FlowDirection::None;
    bool dataFlowAnimated = false;
    std::optional<Color> dataFlowColor;

    EdgeLabels labels;

private:
    static void validateEndpoints(const Port* start, const Port* end);

    EdgeId m_id;
    Port* m_start;
    Port* m_end;
    EdgePolicy m_policy;
};

using EdgePtr = std::shared_ptr<Edge>;
using EdgeList = std::vector<EdgePtr>;

} // namespace graph
} // namespace conngraph
