// src/subgraph/extractor.cpp
#include "cwlslice/subgraph/extractor.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/graph/node_registry.h"
#include "cwlslice/graph/walker.h"
#include "cwlslice/loader/loader.h"
#include "cwlslice/subgraph/boundary_rewriter.h"
#include "cwlslice/subgraph/step_locator.h"
#include <iostream>

namespace cwlslice {

namespace {

bool is_graph_field(const std::string& field) {
    return field == "steps" || field == "inputs" || field == "outputs";
}

// Copy of a step record with its port sources rewired. A list source keeps
// only the elements that have a replacement.
Document rewire_step(const Document& record, const RewireTable& rewire) {
    Document step = record;
    if (!step.contains("in")) return step;
    for (auto& port : step["in"]) {
        if (!port.is_object() || !port.contains("source")) continue;
        Document& source = port["source"];
        if (source.is_array()) {
            Document replaced = Document::array();
            for (const auto& s : source) {
                if (!s.is_string()) continue;
                if (const RewireEntry* entry = rewire.find(s.get<std::string>())) {
                    replaced.push_back(entry->new_id);
                }
            }
            source = std::move(replaced);
        } else if (source.is_string()) {
            if (const RewireEntry* entry = rewire.find(source.get<std::string>())) {
                source = entry->new_id;
            }
        }
    }
    return step;
}

std::string port_id(const Document& port) {
    if (port.is_string()) return port.get<std::string>();
    if (port.is_object() && port.contains("id") && port["id"].is_string()) {
        return port["id"].get<std::string>();
    }
    return {};
}

} // namespace

Document get_subgraph(const std::vector<NodeId>& roots,
                      const Process& tool,
                      const LoadingContext& context) {
    if (tool.process_class() != "Workflow") {
        throw InvalidRootClassError(tool.process_class());
    }
    const auto* workflow = dynamic_cast<const Workflow*>(&tool);
    if (workflow == nullptr) {
        throw InvalidRootClassError(tool.process_class() + " (not loaded as a workflow)");
    }

    NodeRegistry nodes = build_graph(tool.tool());
    VisitedSet reached = walk_from_roots(roots, nodes);
    if (context.debug) {
        std::cout << "[DEBUG] " << roots.size() << " root(s) reach " << reached.size()
                  << " of " << nodes.size() << " nodes" << std::endl;
    }

    BoundaryResult boundary = rewire_boundaries(nodes, reached, *workflow, context);

    Document extracted = Document::object();
    for (auto it = tool.tool().begin(); it != tool.tool().end(); ++it) {
        const std::string& field = it.key();
        if (!is_graph_field(field)) {
            extracted[field] = it.value();
            continue;
        }
        Document kept = Document::array();
        for (const auto& record : as_list(it.value())) {
            const std::string id = port_id(record);
            if (id.empty() || !boundary.visited.contains(id)) continue;
            kept.push_back(field == "steps" ? rewire_step(record, boundary.rewire) : record);
        }
        extracted[field] = std::move(kept);
    }

    if (!extracted.contains("inputs")) {
        extracted["inputs"] = Document::array();
    }
    for (const auto& item : boundary.rewire) {
        const RewireEntry& entry = item.second;
        extracted["inputs"].push_back(Document{{"id", entry.new_id}, {"type", entry.type}});
    }
    return extracted;
}

Document get_step(const Workflow& tool,
                  const std::string& step_id,
                  const LoadingContext& context) {
    auto match = find_step(tool.steps(), step_id, context);
    if (!match) {
        throw StepNotFoundError(step_id);
    }

    const std::string& full_id = match->step->id();
    auto hash = full_id.rfind('#');
    if (hash == std::string::npos) {
        throw SliceError("Step id " + full_id + " has no fragment to split");
    }
    const std::string new_id = full_id.substr(0, hash);
    const std::string step_name = full_id.substr(hash + 1);

    Document step = match->step->record();
    Document inputs = Document::array();
    Document outputs = Document::array();

    if (step.contains("in")) {
        for (auto& in_port : step["in"]) {
            const std::string id = port_id(in_port);
            if (id.empty()) continue;
            const std::string name = "#" + shortname(id);
            Document inp{{"id", name}, {"type", "Any"}};
            if (in_port.contains("default")) {
                inp["default"] = in_port["default"];
            }
            inputs.push_back(std::move(inp));
            in_port["source"] = name;
            // a single pass-through source has nothing to merge
            in_port.erase("linkMerge");
        }
    }

    for (const auto& out_port : as_list(step.value("out", Document()))) {
        const std::string id = port_id(out_port);
        if (id.empty()) continue;
        const std::string name = shortname(id);
        outputs.push_back(Document{
            {"id", name},
            {"type", "Any"},
            {"outputSource", new_id + "#" + step_name + "/" + name}
        });
    }

    Document extracted = Document::object();
    extracted["steps"] = Document::array();
    extracted["steps"].push_back(std::move(step));
    extracted["inputs"] = std::move(inputs);
    extracted["outputs"] = std::move(outputs);

    for (auto it = tool.tool().begin(); it != tool.tool().end(); ++it) {
        if (!is_graph_field(it.key())) {
            extracted[it.key()] = it.value();
        }
    }
    extracted["id"] = new_id;
    if (!extracted.contains("cwlVersion")) {
        extracted["cwlVersion"] = tool.metadata().value("cwlVersion", Document(context.cwl_version));
    }
    return extracted;
}

ResolvedProcess get_process(const Workflow& tool,
                            const std::string& step_id,
                            const LoadingContext& context) {
    if (!context.loader) {
        throw MissingLoaderError("cannot resolve the process of step " + step_id);
    }
    auto match = find_step(tool.steps(), step_id, context);
    if (!match) {
        throw StepNotFoundError(step_id);
    }

    const RunRef& run = match->step->run();
    if (const auto* ref = std::get_if<ExternalRef>(&run)) {
        const Document* doc = context.loader->index_lookup(ref->location);
        if (doc == nullptr) {
            context.loader->resolve(ref->location, context);
            doc = context.loader->index_lookup(ref->location);
        }
        if (doc == nullptr) {
            throw DocumentLoadError(ref->location, "not in the loader index");
        }
        return {*doc, match->step};
    }
    if (const auto* embedded = std::get_if<EmbeddedDocument>(&run)) {
        return {embedded->document, match->step};
    }
    return {std::get<InlineProcess>(run).process->tool(), match->step};
}

} // namespace cwlslice
