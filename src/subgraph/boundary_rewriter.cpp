// src/subgraph/boundary_rewriter.cpp
#include "cwlslice/subgraph/boundary_rewriter.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/subgraph/step_locator.h"
#include <algorithm>
#include <iostream>
#include <optional>

namespace cwlslice {

bool RewireTable::insert(const NodeId& original, RewireEntry entry) {
    if (positions_.count(original) > 0) {
        return false;
    }
    positions_[original] = entries_.size();
    entries_.emplace_back(original, std::move(entry));
    return true;
}

const RewireEntry* RewireTable::find(const NodeId& original) const {
    auto it = positions_.find(original);
    return it == positions_.end() ? nullptr : &entries_[it->second].second;
}

namespace {

// First input port of the step whose source names dangling, or nullptr
const Document* find_port_for_source(const Document& step_tool, const NodeId& dangling) {
    if (!step_tool.contains("inputs")) return nullptr;
    for (const auto& inp : step_tool["inputs"]) {
        if (!inp.is_object() || !inp.contains("source")) continue;
        auto sources = as_string_list(inp["source"]);
        if (std::find(sources.begin(), sources.end(), dangling) != sources.end()) {
            return &inp;
        }
    }
    return nullptr;
}

} // namespace

BoundaryResult rewire_boundaries(const NodeRegistry& nodes,
                                 const VisitedSet& reached,
                                 const Workflow& workflow,
                                 const LoadingContext& context) {
    BoundaryResult result;

    for (const auto& v : reached.order()) {
        result.visited.insert(v);
        const GraphNode& node = nodes.at(v);
        if (node.kind != NodeKind::STEP && node.kind != NodeKind::OUTPUT) continue;

        std::optional<StepMatch> owner;
        for (const auto& u : node.up) {
            if (reached.contains(u)) continue;

            // a surviving step keeps its bindings to workflow inputs
            if (nodes.at(u).kind == NodeKind::INPUT) {
                result.visited.insert(u);
                continue;
            }

            if (node.kind != NodeKind::STEP) {
                if (context.debug) {
                    std::cout << "[DEBUG] Output " << v << " keeps unreached "
                              << to_string(nodes.at(u).kind) << " source " << u << std::endl;
                }
                continue;
            }

            if (!owner) {
                owner = find_step(workflow.steps(), v, context);
                if (!owner) {
                    throw UnresolvableRewireError(v);
                }
            }
            if (result.rewire.contains(u)) continue;

            const Document* port = find_port_for_source(owner->raw, u);
            if (port == nullptr) continue;

            RewireEntry entry{flatten_fragment_id(u), port->value("type", Document("Any"))};
            if (context.debug) {
                std::cout << "[DEBUG] Rewire " << to_string(nodes.at(u).kind) << " " << u
                          << " of " << to_string(node.kind) << " " << v << " -> " << entry.new_id
                          << " (" << entry.type.dump() << ")" << std::endl;
            }
            result.rewire.insert(u, std::move(entry));
        }
    }

    return result;
}

} // namespace cwlslice
