#pragma once

#include "graph/ConnectionManager.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace conngraph {
namespace serialization {

using json = nlohmann::json;

/**
 * Resolves a node id to a host node, nullptr if unknown
 */
using NodeLookup = std::function<graph::Node*(const std::string& nodeId)>;

/**
 * Serialization of the edge set of a diagram.
 *
 * JSON format:
 * {
 *   "edges": [
 *     {"from": "orders", "fromPort": 0, "to": "customers", "toPort": 0,
 *      "policy": "shared", "status": "warning", "statusColor": "#FF9800",
 *      "showStatusIndicator": true,
 *      "schema": [...], "expectedSchema": [...],
 *      "sourceRowId": "col_2", "targetRowId": "col_1",
 *      "startMultiplicity": "zero_or_many", "endMultiplicity": "one_only",
 *      "flowDirection": "forward", "animated": false, "dataFlowColor": "#00FF00",
 *      "labels": {"start": "", "middle": "places", "end": "", "dataType": ""}}
 *   ]
 * }
 * Nodes are not part of the payload; the host owns and restores them.
 */
class DiagramSerializer {
public:
    // === Serialization ===

    static json toJson(const graph::EdgeList& edges);
    static std::string toString(const graph::EdgeList& edges, int indent = 2);

    // === Deserialization ===

    /**
     * Rebuild the edges into manager, bypassing connect checks and history.
     * Returns the number of edges restored.
     * Throws std::runtime_error on missing fields, unknown nodes or port
     * indices out of range, std::invalid_argument on unknown enum or
     * color text. Edges restored before the error are kept.
     */
    static size_t restore(const json& j, graph::ConnectionManager& manager, const NodeLookup& lookup);
    static size_t restoreFromString(const std::string& str, graph::ConnectionManager& manager,
                                    const NodeLookup& lookup);

    static json edgeToJson(const graph::Edge& edge);

private:
    static graph::EdgePtr jsonToEdge(const json& j, const NodeLookup& lookup);
};

} // namespace serialization
} // namespace conngraph
