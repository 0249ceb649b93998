// cwlslice/subgraph/boundary_rewriter.h
#ifndef CWLSLICE_SUBGRAPH_BOUNDARY_REWRITER_H
#define CWLSLICE_SUBGRAPH_BOUNDARY_REWRITER_H

#include "cwlslice/common/config.h"
#include "cwlslice/common/types.h"
#include "cwlslice/core/process.h"
#include "cwlslice/graph/node_registry.h"
#include "cwlslice/graph/walker.h"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cwlslice {

struct RewireEntry {
    std::string new_id; // synthetic top-level input
    Document type;
};

// Dangling upstream id -> synthetic input, iterated in insertion order.
class RewireTable {
public:
    using value_type = std::pair<NodeId, RewireEntry>;

    // Keeps the first entry recorded for an id; returns false if one existed.
    bool insert(const NodeId& original, RewireEntry entry);
    const RewireEntry* find(const NodeId& original) const;
    bool contains(const NodeId& original) const { return positions_.count(original) > 0; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<value_type>::const_iterator begin() const { return entries_.begin(); }
    std::vector<value_type>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<value_type> entries_;
    std::unordered_map<NodeId, size_t> positions_;
};

struct BoundaryResult {
    VisitedSet visited; // nodes kept in the extracted document
    RewireTable rewire;
};

/**
 * Close the reached set over its inputs.
 *
 * Every reached node is kept. For each upstream u of a reached STEP or
 * OUTPUT: u is kept if it was reached; an unreached INPUT is kept as well;
 * any other u dangles. A dangling u feeding a step is recorded in the rewire
 * table under flatten_fragment_id(u), typed by the first input port of that
 * step whose source names u.
 *
 * Throws UnresolvableRewireError when such a step has no step record.
 */
BoundaryResult rewire_boundaries(const NodeRegistry& nodes,
                                 const VisitedSet& reached,
                                 const Workflow& workflow,
                                 const LoadingContext& context);

} // namespace cwlslice

#endif // CWLSLICE_SUBGRAPH_BOUNDARY_REWRITER_H
