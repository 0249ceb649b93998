// src/loader/normalizer.cpp
#include "cwlslice/loader/normalizer.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include <yaml-cpp/yaml.h>

namespace cwlslice {

namespace {

std::string resolve_local(const std::string& scope, const std::string& ref) {
    if (is_absolute_reference(ref)) return ref;
    if (!ref.empty() && ref[0] == '#') return split_fragment(scope).first + ref;
    return join_scope(scope, ref);
}

Document resolve_sources(const Document& sources, const std::string& scope) {
    if (sources.is_string()) {
        return resolve_local(scope, sources.get<std::string>());
    }
    if (sources.is_array()) {
        Document out = Document::array();
        for (const auto& s : sources) {
            out.push_back(s.is_string() ? Document(resolve_local(scope, s.get<std::string>())) : s);
        }
        return out;
    }
    return sources;
}

// List form is kept; map form {name: value} becomes [{id: name, ...}],
// a non-map value landing in shorthand_field.
Document to_record_list(const Document& field, const char* shorthand_field) {
    if (field.is_array()) return field;
    Document out = Document::array();
    if (!field.is_object()) return out;
    for (auto it = field.begin(); it != field.end(); ++it) {
        Document record = Document::object();
        record["id"] = it.key();
        if (it.value().is_object()) {
            for (auto inner = it.value().begin(); inner != it.value().end(); ++inner) {
                if (inner.key() != "id") record[inner.key()] = inner.value();
            }
        } else {
            record[shorthand_field] = it.value();
        }
        out.push_back(std::move(record));
    }
    return out;
}

void resolve_record_id(Document& record, const std::string& scope) {
    if (record.is_object() && record.contains("id") && record["id"].is_string()) {
        record["id"] = resolve_local(scope, record["id"].get<std::string>());
    }
}

Document normalize_parameters(const Document& field, const std::string& scope, bool is_output) {
    Document params = to_record_list(field, "type");
    for (auto& param : params) {
        resolve_record_id(param, scope);
        if (is_output && param.is_object() && param.contains("outputSource")) {
            param["outputSource"] = resolve_sources(param["outputSource"], scope);
        }
    }
    return params;
}

Document normalize_step(const Document& raw_step, const std::string& scope, const std::string& base_uri) {
    Document step = raw_step;
    resolve_record_id(step, scope);
    if (!step.contains("id") || !step["id"].is_string()) {
        return step;
    }
    const std::string step_id = step["id"].get<std::string>();

    if (step.contains("in")) {
        Document ports = to_record_list(step["in"], "source");
        for (auto& port : ports) {
            resolve_record_id(port, step_id);
            if (port.is_object() && port.contains("source")) {
                port["source"] = resolve_sources(port["source"], scope);
            }
        }
        step["in"] = std::move(ports);
    }

    if (step.contains("out")) {
        Document outs = Document::array();
        for (const auto& out : as_list(step["out"])) {
            if (out.is_string()) {
                outs.push_back(resolve_local(step_id, out.get<std::string>()));
            } else {
                Document record = out;
                resolve_record_id(record, step_id);
                outs.push_back(std::move(record));
            }
        }
        step["out"] = std::move(outs);
    }

    if (step.contains("run")) {
        const Document& run = step["run"];
        if (run.is_string()) {
            step["run"] = resolve_reference(base_uri, run.get<std::string>());
        } else if (run.is_object()) {
            step["run"] = normalize_process(run, base_uri, step_id + "/run");
        }
    }
    return step;
}

} // namespace

Document normalize_process(const Document& raw, const std::string& base_uri, const std::string& default_id) {
    Document doc = raw;
    if (!doc.is_object()) return doc;

    if (doc.contains("$graph")) {
        Document graph = Document::array();
        for (const auto& entry : as_list(doc["$graph"])) {
            graph.push_back(normalize_process(entry, base_uri));
        }
        doc["$graph"] = std::move(graph);
        return doc;
    }

    std::string process_id;
    if (doc.contains("id") && doc["id"].is_string()) {
        std::string id = doc["id"].get<std::string>();
        if (is_absolute_reference(id)) {
            process_id = id;
        } else {
            if (!id.empty() && id[0] == '#') id.erase(0, 1);
            process_id = split_fragment(base_uri).first + "#" + id;
        }
    } else {
        process_id = default_id.empty() ? base_uri : default_id;
    }
    doc["id"] = process_id;

    if (doc.contains("inputs")) {
        doc["inputs"] = normalize_parameters(doc["inputs"], process_id, false);
    }
    if (doc.contains("outputs")) {
        doc["outputs"] = normalize_parameters(doc["outputs"], process_id, true);
    }
    if (doc.contains("steps")) {
        Document steps = Document::array();
        for (const auto& step : to_record_list(doc["steps"], "run")) {
            steps.push_back(normalize_step(step, process_id, base_uri));
        }
        doc["steps"] = std::move(steps);
    }
    return doc;
}

Document parse_document(const std::string& text, const std::string& base_uri) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw DocumentLoadError(base_uri, std::string("YAML parse error: ") + e.what());
    }
    Document doc = yaml_to_json(root);
    if (!doc.is_object()) {
        throw DocumentLoadError(base_uri, "top level is not a map");
    }
    return normalize_process(doc, base_uri);
}

Document select_process(const Document& doc, const std::string& location) {
    if (!doc.is_object() || !doc.contains("$graph")) {
        return doc;
    }
    auto [url, fragment] = split_fragment(location);
    const std::string wanted = url + "#" + (fragment.empty() ? std::string("main") : fragment);
    for (const auto& entry : as_list(doc["$graph"])) {
        if (entry.is_object() && entry.value("id", std::string()) == wanted) {
            return entry;
        }
    }
    throw DocumentLoadError(location, "no process '" + wanted + "' in $graph");
}

} // namespace cwlslice
