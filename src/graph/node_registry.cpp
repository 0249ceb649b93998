// src/graph/node_registry.cpp
#include "cwlslice/graph/node_registry.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include <string>

namespace cwlslice {

GraphNode& NodeRegistry::declare_node(const NodeId& id, NodeKind kind) {
    auto [it, inserted] = nodes_.try_emplace(id);
    GraphNode& node = it->second;
    if (inserted || node.kind == NodeKind::UNCLASSIFIED) {
        node.kind = kind;
    }
    return node;
}

const GraphNode& NodeRegistry::at(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw UnknownNodeError(id);
    }
    return it->second;
}

const GraphNode* NodeRegistry::find(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

namespace {

std::string record_id(const Document& record) {
    if (record.is_object() && record.contains("id") && record["id"].is_string()) {
        return record["id"].get<std::string>();
    }
    return {};
}

} // namespace

NodeRegistry build_graph(const Document& workflow) {
    NodeRegistry nodes;

    for (const auto& inp : as_list(workflow.value("inputs", Document()))) {
        std::string id = record_id(inp);
        if (!id.empty()) nodes.declare_node(id, NodeKind::INPUT);
    }

    for (const auto& out : as_list(workflow.value("outputs", Document()))) {
        std::string out_id = record_id(out);
        if (out_id.empty()) continue;
        GraphNode& output = nodes.declare_node(out_id, NodeKind::OUTPUT);
        for (const auto& src : as_string_list(out.value("outputSource", Document()))) {
            // source is upstream from output (dependency)
            output.up.push_back(src);
            // output is downstream from source
            nodes.declare_node(src).down.push_back(out_id);
        }
    }

    for (const auto& st : as_list(workflow.value("steps", Document()))) {
        std::string step_id = record_id(st);
        if (step_id.empty()) continue;
        GraphNode& step = nodes.declare_node(step_id, NodeKind::STEP);

        for (const auto& port : as_list(st.value("in", Document()))) {
            // unconnected ports use their defaults
            if (!port.is_object() || !port.contains("source")) continue;
            for (const auto& src : as_string_list(port["source"])) {
                step.up.push_back(src);
                nodes.declare_node(src).down.push_back(step_id);
            }
        }

        for (const auto& out : as_list(st.value("out", Document()))) {
            std::string out_id = out.is_string() ? out.get<std::string>() : record_id(out);
            if (out_id.empty()) continue;
            // step is upstream from its output ports
            step.down.push_back(out_id);
            nodes.declare_node(out_id).up.push_back(step_id);
        }
    }

    return nodes;
}

} // namespace cwlslice
