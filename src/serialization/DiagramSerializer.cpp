#include "serialization/DiagramSerializer.hpp"
#include "util/Logger.hpp"
#include <stdexcept>

namespace conngraph {
namespace serialization {

using graph::Color;
using graph::Edge;
using graph::EdgePtr;

json DiagramSerializer::toJson(const graph::EdgeList& edges) {
    json edgesArray = json::array();
    for (const auto& edge : edges) {
        edgesArray.push_back(edgeToJson(*edge));
    }

    json result;
    result["edges"] = edgesArray;
    return result;
}

std::string DiagramSerializer::toString(const graph::EdgeList& edges, int indent) {
    return toJson(edges).dump(indent);
}

json DiagramSerializer::edgeToJson(const Edge& edge) {
    json result;
    result["from"] = edge.sourceNode().id();
    result["fromPort"] = edge.start()->index();
    result["to"] = edge.targetNode().id();
    result["toPort"] = edge.end()->index();
    result["policy"] = graph::edgePolicyToString(edge.policy());
    result["status"] = graph::edgeStatusToString(edge.status);
    if (edge.statusColor) {
        result["statusColor"] = edge.statusColor->toHex();
    }
    result["showStatusIndicator"] = edge.showStatusIndicator;

    if (edge.schema) {
        result["schema"] = edge.schema->toJson();
    }
    if (edge.expectedSchema) {
        result["expectedSchema"] = edge.expectedSchema->toJson();
    }
    if (edge.sourceRowId) {
        result["sourceRowId"] = *edge.sourceRowId;
    }
    if (edge.targetRowId) {
        result["targetRowId"] = *edge.targetRowId;
    }

    result["startMultiplicity"] = graph::multiplicityToString(edge.startMultiplicity);
    result["endMultiplicity"] = graph::multiplicityToString(edge.endMultiplicity);
    result["flowDirection"] = graph::flowDirectionToString(edge.flowDirection);
    result["animated"] = edge.dataFlowAnimated;
    if (edge.dataFlowColor) {
        result["dataFlowColor"] = edge.dataFlowColor->toHex();
    }

    result["labels"] = {
        {"start", edge.labels.start},
        {"middle", edge.labels.middle},
        {"end", edge.labels.end},
        {"dataType", edge.labels.dataType}
    };
    return result;
}

EdgePtr DiagramSerializer::jsonToEdge(const json& j, const NodeLookup& lookup) {
    if (!j.contains("from") || !j.contains("fromPort") ||
        !j.contains("to") || !j.contains("toPort")) {
        throw std::runtime_error("Invalid edge: missing required fields");
    }

    std::string fromId = j["from"].get<std::string>();
    std::string toId = j["to"].get<std::string>();
    graph::Node* from = lookup(fromId);
    graph::Node* to = lookup(toId);
    if (!from) throw std::runtime_error("Invalid edge: unknown node " + fromId);
    if (!to) throw std::runtime_error("Invalid edge: unknown node " + toId);

    size_t fromPort = j["fromPort"].get<size_t>();
    size_t toPort = j["toPort"].get<size_t>();
    graph::Port* start = from->output(fromPort);
    graph::Port* end = to->input(toPort);
    if (!start || !end) {
        throw std::runtime_error("Invalid edge: port index out of range for " + fromId + " -> " + toId);
    }

    graph::EdgePolicy policy = graph::stringToEdgePolicy(j.value("policy", std::string("shared")));
    EdgePtr edge;
    try {
        edge = std::make_shared<Edge>(start, end, policy);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid edge: ") + e.what());
    }

    edge->status = graph::stringToEdgeStatus(j.value("status", std::string("normal")));
    if (j.contains("statusColor")) {
        edge->statusColor = Color::fromHex(j["statusColor"].get<std::string>());
    }
    edge->showStatusIndicator = j.value("showStatusIndicator", edge->status != graph::EdgeStatus::Normal);

    if (j.contains("schema")) {
        edge->schema = schema::ColumnSchema::fromJson(j["schema"]);
    }
    if (j.contains("expectedSchema")) {
        edge->expectedSchema = schema::ColumnSchema::fromJson(j["expectedSchema"]);
    }
    if (j.contains("sourceRowId")) {
        edge->sourceRowId = j["sourceRowId"].get<std::string>();
    }
    if (j.contains("targetRowId")) {
        edge->targetRowId = j["targetRowId"].get<std::string>();
    }

    edge->startMultiplicity = graph::stringToMultiplicity(j.value("startMultiplicity", std::string("unspecified")));
    edge->endMultiplicity = graph::stringToMultiplicity(j.value("endMultiplicity", std::string("unspecified")));
    edge->flowDirection = graph::stringToFlowDirection(j.value("flowDirection", std::string("none")));
    edge->dataFlowAnimated = j.value("animated", false);
    if (j.contains("dataFlowColor")) {
        edge->dataFlowColor = Color::fromHex(j["dataFlowColor"].get<std::string>());
    }

    if (j.contains("labels") && j["labels"].is_object()) {
        const auto& labels = j["labels"];
        edge->labels.start = labels.value("start", "");
        edge->labels.middle = labels.value("middle", "");
        edge->labels.end = labels.value("end", "");
        edge->labels.dataType = labels.value("dataType", "");
    }

    return edge;
}

size_t DiagramSerializer::restore(const json& j, graph::ConnectionManager& manager,
                                  const NodeLookup& lookup) {
    if (!j.contains("edges") || !j["edges"].is_array()) {
        throw std::runtime_error("Invalid diagram: missing edges array");
    }

    size_t restored = 0;
    for (const auto& edgeJson : j["edges"]) {
        EdgePtr edge = jsonToEdge(edgeJson, lookup);
        if (edge->policy() == graph::EdgePolicy::SingleUse &&
            (!edge->start()->isAvailable() || !edge->end()->isAvailable())) {
            throw std::runtime_error("Invalid edge: single-use port " + edge->sourceNode().id() +
                                     " -> " + edge->targetNode().id() + " is already in use");
        }
        if (manager.insertEdge(edge, manager.edgeCount())) {
            ++restored;
        }
    }

    CG_LOG_INFO("Restored " + std::to_string(restored) + " edges");
    return restored;
}

size_t DiagramSerializer::restoreFromString(const std::string& str, graph::ConnectionManager& manager,
                                            const NodeLookup& lookup) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid diagram JSON: ") + e.what());
    }
    return restore(j, manager, lookup);
}

} // namespace serialization
} // namespace conngraph
