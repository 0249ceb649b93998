// src/core/process.cpp
#include "cwlslice/core/process.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/loader/loader.h"
#include <utility>

namespace cwlslice {

Process::Process(Document tool, Document metadata)
    : tool_(std::move(tool)), metadata_(std::move(metadata)) {
    if (!metadata_.is_object()) {
        metadata_ = Document::object();
    }
    if (!metadata_.contains("cwlVersion") && tool_.contains("cwlVersion")) {
        metadata_["cwlVersion"] = tool_["cwlVersion"];
    }
}

std::string Process::id() const {
    if (tool_.contains("id") && tool_["id"].is_string()) {
        return tool_["id"].get<std::string>();
    }
    return {};
}

std::string Process::process_class() const {
    if (tool_.contains("class") && tool_["class"].is_string()) {
        return tool_["class"].get<std::string>();
    }
    return {};
}

WorkflowStep::WorkflowStep(Document record, const LoadingContext& context)
    : record_(std::move(record)) {
    if (!record_.is_object() || !record_.contains("id") || !record_["id"].is_string()) {
        throw SliceError("Workflow step without a string 'id': " + record_.dump());
    }
    id_ = record_["id"].get<std::string>();

    const Document run = record_.value("run", Document());
    if (run.is_string()) {
        run_ = ExternalRef{run.get<std::string>()};
    } else if (run.is_object()) {
        run_ = EmbeddedDocument{run};
    } else {
        throw SliceError("Step " + id_ + " has no 'run'");
    }

    // a reference back to a document still loading finds it in the index
    if (const auto* ref = std::get_if<ExternalRef>(&run_)) {
        if (context.loader && !context.loader->is_loading(ref->location)) {
            context.loader->resolve(ref->location, context);
        }
    }
    derive_parameters(context);
}

void WorkflowStep::set_run(std::shared_ptr<Process> process, const LoadingContext& context) {
    if (!process) {
        throw SliceError("Step " + id_ + ": cannot run a null process");
    }
    record_["run"] = process->tool();
    run_ = InlineProcess{std::move(process)};
    derive_parameters(context);
}

const Document* WorkflowStep::run_document(const LoadingContext& context) const {
    if (const auto* inline_run = std::get_if<InlineProcess>(&run_)) {
        return &inline_run->process->tool();
    }
    if (const auto* embedded = std::get_if<EmbeddedDocument>(&run_)) {
        return &embedded->document;
    }
    const auto& ref = std::get<ExternalRef>(run_);
    return context.loader ? context.loader->index_lookup(ref.location) : nullptr;
}

void WorkflowStep::derive_parameters(const LoadingContext& context) {
    const Document* run_doc = run_document(context);

    // Type of the run process's parameter with the same short name
    auto lookup_type = [run_doc](const char* field, const std::string& port_id) -> Document {
        if (run_doc == nullptr || !run_doc->contains(field)) {
            return "Any";
        }
        const Document& params = (*run_doc)[field];
        const std::string name = shortname(port_id);
        if (params.is_object()) {
            // map form: {name: type} or {name: {type: ...}}
            for (auto it = params.begin(); it != params.end(); ++it) {
                if (it.key() != name) continue;
                if (it.value().is_object()) return it.value().value("type", Document("Any"));
                return it.value();
            }
            return "Any";
        }
        for (const auto& param : as_list(params)) {
            if (param.is_object() && param.contains("id") && param["id"].is_string() &&
                shortname(param["id"].get<std::string>()) == name) {
                return param.value("type", Document("Any"));
            }
        }
        return "Any";
    };

    Document inputs = Document::array();
    for (const auto& port : as_list(record_.value("in", Document()))) {
        if (!port.is_object() || !port.contains("id") || !port["id"].is_string()) continue;
        Document param = port;
        if (!param.contains("type")) {
            param["type"] = lookup_type("inputs", port["id"].get<std::string>());
        }
        inputs.push_back(std::move(param));
    }

    Document outputs = Document::array();
    for (const auto& port : as_list(record_.value("out", Document()))) {
        std::string out_id;
        if (port.is_object() && port.contains("id") && port["id"].is_string()) {
            out_id = port["id"].get<std::string>();
        } else if (port.is_string()) {
            out_id = port.get<std::string>();
        }
        if (out_id.empty()) continue;
        outputs.push_back(Document{{"id", out_id}, {"type", lookup_type("outputs", out_id)}});
    }

    tool_ = record_;
    tool_["inputs"] = std::move(inputs);
    tool_["outputs"] = std::move(outputs);
}

Workflow::Workflow(Document tool, const LoadingContext& context, Document metadata)
    : Process(std::move(tool), std::move(metadata)) {
    if (!tool_.contains("steps")) return;
    for (const auto& step : as_list(tool_["steps"])) {
        steps_.push_back(std::make_shared<WorkflowStep>(step, context));
    }
}

std::shared_ptr<Process> make_process(const Document& tool,
                                      const LoadingContext& context,
                                      Document metadata) {
    if (tool.is_object() && tool.value("class", std::string()) == "Workflow") {
        return std::make_shared<Workflow>(tool, context, std::move(metadata));
    }
    return std::make_shared<Process>(tool, std::move(metadata));
}

} // namespace cwlslice
