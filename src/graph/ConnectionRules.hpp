#pragma once

#include "graph/Node.hpp"
#include <string>

namespace conngraph {
namespace graph {

/**
 * Why a structural connect was refused
 */
enum class ConnectRejection {
    None,
    NoAvailablePort,
    DirectionMismatch,
    IncompatibleTypes,
    DisallowedNodeKinds,
    AlreadyConnected,
    WouldCreateCycle
};

std::string connectRejectionToString(ConnectRejection rejection);

/**
 * Source must be an Output port and target an Input port
 */
bool isDirectionValid(const Port& source, const Port& target);

/**
 * False for the node-kind pairs that may never be linked directly
 * (two triggers, two data sources)
 */
bool areNodeKindsCompatible(NodeKind source, NodeKind target);

} // namespace graph
} // namespace conngraph
