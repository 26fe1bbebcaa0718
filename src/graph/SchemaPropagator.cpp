#include "graph/SchemaPropagator.hpp"
#include "util/Logger.hpp"
#include "util/StringUtil.hpp"
#include <algorithm>
#include <exception>

namespace conngraph {
namespace graph {

SchemaPropagator::SchemaPropagator(const Color& warningColor)
    : m_warningColor(warningColor)
{
}

void SchemaPropagator::attachAutomation(Edge& edge) const {
    edge.schema = edge.sourceNode().properties().getSchema(keys::OutputSchema);
    edge.expectedSchema = edge.targetNode().properties().getSchema(keys::ExpectedSchema);
    checkExpected(edge);
}

void SchemaPropagator::attachGeneric(Edge& edge) const {
    const PropertyBag& source = edge.sourceNode().properties();
    const PropertyBag& target = edge.targetNode().properties();

    edge.schema = source.getSchema(keys::OutputSchema);
    if (!edge.schema) {
        edge.schema = target.getSchema(keys::OutputSchema);
    }

    edge.expectedSchema = target.getSchema(keys::ExpectedSchema);
    if (!edge.expectedSchema) {
        edge.expectedSchema = source.getSchema(keys::ExpectedSchema);
    }

    checkExpected(edge);
}

void SchemaPropagator::checkExpected(Edge& edge) const {
    if (!edge.schema || !edge.expectedSchema) {
        return;
    }
    if (!schema::schemasCompatible(*edge.expectedSchema, *edge.schema)) {
        edge.markStatus(EdgeStatus::Warning, m_warningColor);
        CG_LOG_INFO("Edge " + edge.sourceNode().id() + " -> " + edge.targetNode().id() +
                    ": schema does not match the expected schema");
    }
}

EdgeList SchemaPropagator::incomingEdges(const EdgeList& edges, const Node& node) {
    EdgeList incoming;
    for (const auto& edge : edges) {
        if (&edge->targetNode() == &node) {
            incoming.push_back(edge);
        }
    }
    std::stable_sort(incoming.begin(), incoming.end(),
        [](const EdgePtr& a, const EdgePtr& b) {
            return a->end()->index() < b->end()->index();
        });
    return incoming;
}

std::optional<schema::ColumnSchema> SchemaPropagator::upstreamSchema(const EdgeList& edges,
                                                                     const Node& node,
                                                                     size_t index) {
    EdgeList incoming = incomingEdges(edges, node);
    if (index >= incoming.size()) {
        return std::nullopt;
    }
    return incoming[index]->schema;
}

InferenceResult SchemaPropagator::reinfer(Node& node, const EdgeList& edges) const {
    InferenceResult result = InferenceResult::success();

    if (SchemaInference* capability = node.schemaInference()) {
        UpstreamSchemaLookup lookup = [&edges, &node](size_t index) {
            return upstreamSchema(edges, node, index);
        };
        try {
            result = capability->inferOutputSchema(lookup);
        } catch (const std::exception& e) {
            result = InferenceResult::failure(e.what());
        } catch (...) {
            result = InferenceResult::failure("unknown inference error");
        }

        if (result.ok) {
            refreshOutgoing(node, edges);
        }
    }

    validateJoin(node, edges);
    return result;
}

void SchemaPropagator::refreshOutgoing(const Node& node, const EdgeList& edges) const {
    auto output = node.properties().getSchema(keys::OutputSchema);
    for (const auto& edge : edges) {
        if (&edge->sourceNode() != &node) continue;
        edge->schema = output;
        checkExpected(*edge);
    }
}

void SchemaPropagator::validateJoin(const Node& node, const EdgeList& edges) const {
    auto kind = node.properties().getString(keys::Kind);
    if (!kind || !util::iequals(util::trim(*kind), "Join")) {
        return;
    }

    auto left = upstreamSchema(edges, node, 0);
    auto right = upstreamSchema(edges, node, 1);
    if (!left || !right) {
        return;
    }

    std::string leftKey = util::trim(node.properties().getString(keys::JoinKeyLeft).value_or(""));
    std::string rightKey = util::trim(node.properties().getString(keys::JoinKeyRight).value_or(""));

    const auto* lc = leftKey.empty() ? nullptr : left->findByName(leftKey);
    const auto* rc = rightKey.empty() ? nullptr : right->findByName(rightKey);

    bool keysFound = lc && rc;
    bool typesAgree = keysFound &&
        (lc->dataType.empty() || rc->dataType.empty() || util::iequals(lc->dataType, rc->dataType));
    if (keysFound && typesAgree) {
        return;
    }

    CG_LOG_INFO("Join node " + node.id() + ": join keys '" + leftKey + "' / '" + rightKey +
                "' are missing upstream or have different types");

    for (const auto& edge : edges) {
        if (&edge->targetNode() == &node || &edge->sourceNode() == &node) {
            edge->markStatus(EdgeStatus::Warning, m_warningColor);
        }
    }
}

} // namespace graph
} // namespace conngraph
