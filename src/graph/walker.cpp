// src/graph/walker.cpp
#include "cwlslice/graph/walker.h"

namespace cwlslice {

bool VisitedSet::insert(const NodeId& id) {
    if (!members_.insert(id).second) {
        return false;
    }
    order_.push_back(id);
    return true;
}

void visit_subgraph(const NodeId& current,
                    const NodeRegistry& nodes,
                    VisitedSet& visited,
                    Direction direction) {
    if (!visited.insert(current)) {
        return;
    }
    const GraphNode& node = nodes.at(current);
    const auto& next = direction == Direction::DOWNSTREAM ? node.down : node.up;
    for (const auto& n : next) {
        visit_subgraph(n, nodes, visited, direction);
    }
}

VisitedSet walk_from_roots(const std::vector<NodeId>& roots, const NodeRegistry& nodes) {
    VisitedSet visited;
    for (const auto& root : roots) {
        const GraphNode& node = nodes.at(root);
        Direction direction = node.kind == NodeKind::OUTPUT ? Direction::UPSTREAM : Direction::DOWNSTREAM;
        visit_subgraph(root, nodes, visited, direction);
    }
    return visited;
}

} // namespace cwlslice
