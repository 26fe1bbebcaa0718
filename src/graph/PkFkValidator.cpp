#include "graph/PkFkValidator.hpp"
#include "util/Logger.hpp"

namespace conngraph {
namespace graph {

namespace {

bool declaresMapping(const Node& declaring, const std::string& localColumn,
                     const Node& referenced, const std::string& referencedColumn) {
    const std::string entity = referenced.entityName();
    for (const auto& fk : declaring.properties().getForeignKeys(keys::ForeignKeys)) {
        if (fk.maps(localColumn, entity, referencedColumn)) {
            return true;
        }
    }
    return false;
}

} // namespace

PkFkVerdict PkFkValidator::check(const Edge& edge) {
    if (!edge.sourceRowId || !edge.targetRowId) {
        return PkFkVerdict::NotApplicable;
    }

    const Node& source = edge.sourceNode();
    const Node& target = edge.targetNode();

    auto sourceColumns = source.properties().getSchema(keys::Columns);
    auto targetColumns = target.properties().getSchema(keys::Columns);
    if (!sourceColumns || !targetColumns) {
        return PkFkVerdict::NotApplicable;
    }

    const auto* s = sourceColumns->findById(*edge.sourceRowId);
    const auto* t = targetColumns->findById(*edge.targetRowId);
    if (!s || !t) {
        return PkFkVerdict::NotApplicable;
    }

    bool flagged = (s->isForeignKey && t->isPrimaryKey) || (s->isPrimaryKey && t->isForeignKey);
    if (flagged) {
        return PkFkVerdict::Valid;
    }

    if (declaresMapping(source, s->name, target, t->name) ||
        declaresMapping(target, t->name, source, s->name)) {
        return PkFkVerdict::Valid;
    }

    return PkFkVerdict::Invalid;
}

PkFkVerdict PkFkValidator::apply(Edge& edge, const Color& warningColor) {
    PkFkVerdict verdict = check(edge);
    if (verdict == PkFkVerdict::Invalid) {
        edge.markStatus(EdgeStatus::Warning, warningColor);
        CG_LOG_INFO("Edge " + edge.sourceNode().id() + " -> " + edge.targetNode().id() +
                    ": no primary/foreign key relationship between the linked columns");
    }
    return verdict;
}

} // namespace graph
} // namespace conngraph
