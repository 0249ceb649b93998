// cwlslice/graph/node_registry.h
#ifndef CWLSLICE_GRAPH_NODE_REGISTRY_H
#define CWLSLICE_GRAPH_NODE_REGISTRY_H

#include "cwlslice/common/types.h"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace cwlslice {

struct GraphNode {
    std::vector<NodeId> up;   // dependencies
    std::vector<NodeId> down; // dependents
    NodeKind kind = NodeKind::UNCLASSIFIED;
};

// Dependency graph of one workflow, built fresh for every extraction.
class NodeRegistry {
public:
    /**
     * Lookup-or-insert. An existing node only takes the given kind while it
     * is still UNCLASSIFIED; INPUT, OUTPUT and STEP are never overwritten.
     * The returned reference stays valid while the registry lives.
     */
    GraphNode& declare_node(const NodeId& id, NodeKind kind = NodeKind::UNCLASSIFIED);

    // Throws UnknownNodeError
    const GraphNode& at(const NodeId& id) const;
    const GraphNode* find(const NodeId& id) const;

    bool contains(const NodeId& id) const { return nodes_.count(id) > 0; }
    size_t size() const { return nodes_.size(); }

private:
    std::unordered_map<NodeId, GraphNode> nodes_;
};

// One pass over a workflow document's inputs, outputs and steps.
NodeRegistry build_graph(const Document& workflow);

} // namespace cwlslice

#endif // CWLSLICE_GRAPH_NODE_REGISTRY_H
