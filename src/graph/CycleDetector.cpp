#include "graph/CycleDetector.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace conngraph {
namespace graph {

namespace {

using Adjacency = std::unordered_map<const Node*, std::vector<const Node*>>;

Adjacency buildAdjacency(const EdgeList& edges) {
    Adjacency adjacency;
    for (const auto& edge : edges) {
        adjacency[&edge->sourceNode()].push_back(&edge->targetNode());
    }
    return adjacency;
}

// Returns true when the walk from node meets a node still on the stack
// or reaches goal (when goal is set).
bool dfs(const Adjacency& adjacency, const Node* node, const Node* goal,
         std::unordered_set<const Node*>& visited,
         std::unordered_set<const Node*>& stack) {
    if (node == goal) {
        return true;
    }
    if (stack.count(node)) {
        return goal == nullptr;
    }
    if (visited.count(node)) {
        return false;
    }

    visited.insert(node);
    stack.insert(node);

    auto it = adjacency.find(node);
    if (it != adjacency.end()) {
        for (const Node* next : it->second) {
            if (dfs(adjacency, next, goal, visited, stack)) {
                return true;
            }
        }
    }

    stack.erase(node);
    return false;
}

} // namespace

bool CycleDetector::wouldCreateCycle(const EdgeList& edges, const Node& source, const Node& target) {
    if (&source == &target) {
        return true;
    }

    Adjacency adjacency = buildAdjacency(edges);
    std::unordered_set<const Node*> visited;
    std::unordered_set<const Node*> stack;
    return dfs(adjacency, &target, &source, visited, stack);
}

bool CycleDetector::isAcyclic(const EdgeList& edges) {
    Adjacency adjacency = buildAdjacency(edges);
    std::unordered_set<const Node*> visited;

    for (const auto& entry : adjacency) {
        if (visited.count(entry.first)) {
            continue;
        }
        std::unordered_set<const Node*> stack;
        if (dfs(adjacency, entry.first, nullptr, visited, stack)) {
            return false;
        }
    }
    return true;
}

} // namespace graph
} // namespace conngraph
