// cwlslice/graph/walker.h
#ifndef CWLSLICE_GRAPH_WALKER_H
#define CWLSLICE_GRAPH_WALKER_H

#include "cwlslice/common/types.h"
#include "cwlslice/graph/node_registry.h"
#include <cstddef>
#include <unordered_set>
#include <vector>

namespace cwlslice {

// Set of node ids that remembers the order of insertion.
class VisitedSet {
public:
    // false if already present
    bool insert(const NodeId& id);
    bool contains(const NodeId& id) const { return members_.count(id) > 0; }

    const std::vector<NodeId>& order() const { return order_; }
    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    std::unordered_set<NodeId> members_;
    std::vector<NodeId> order_;
};

// Depth-first visit of everything reachable from current in one direction.
// Nodes already in visited are not entered again.
void visit_subgraph(const NodeId& current,
                    const NodeRegistry& nodes,
                    VisitedSet& visited,
                    Direction direction);

// OUTPUT roots walk upstream (what computes them), every other root walks
// downstream (what it feeds). All walks share one visited set.
// Throws UnknownNodeError for a root that is not in the registry.
VisitedSet walk_from_roots(const std::vector<NodeId>& roots, const NodeRegistry& nodes);

} // namespace cwlslice

#endif // CWLSLICE_GRAPH_WALKER_H
