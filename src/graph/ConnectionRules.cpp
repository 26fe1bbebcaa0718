#include "graph/ConnectionRules.hpp"
#include <set>
#include <utility>

namespace conngraph {
namespace graph {

std::string connectRejectionToString(ConnectRejection rejection) {
    switch (rejection) {
        case ConnectRejection::None: return "none";
        case ConnectRejection::NoAvailablePort: return "no available port";
        case ConnectRejection::DirectionMismatch: return "direction mismatch";
        case ConnectRejection::IncompatibleTypes: return "incompatible types";
        case ConnectRejection::DisallowedNodeKinds: return "disallowed node kinds";
        case ConnectRejection::AlreadyConnected: return "already connected";
        case ConnectRejection::WouldCreateCycle: return "would create cycle";
    }
    return "unknown";
}

bool isDirectionValid(const Port& source, const Port& target) {
    return source.isOutput() && target.isInput();
}

bool areNodeKindsCompatible(NodeKind source, NodeKind target) {
    static const std::set<std::pair<NodeKind, NodeKind>> disallowed = {
        {NodeKind::Trigger, NodeKind::Trigger},
        {NodeKind::DataSource, NodeKind::DataSource},
    };
    return disallowed.find({source, target}) == disallowed.end();
}

} // namespace graph
} // namespace conngraph
