// src/subgraph/step_locator.cpp
#include "cwlslice/subgraph/step_locator.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/loader/loader.h"
#include <iostream>

namespace cwlslice {

namespace {

// Remainder of step_id after "<prefix_id>/" or "<prefix_id>#", or nullopt
std::optional<std::string> nested_suffix(const std::string& step_id, const std::string& prefix_id) {
    if (step_id.size() <= prefix_id.size() + 1) return std::nullopt;
    if (step_id.compare(0, prefix_id.size(), prefix_id) != 0) return std::nullopt;
    char sep = step_id[prefix_id.size()];
    if (sep != '/' && sep != '#') return std::nullopt;
    return step_id.substr(prefix_id.size() + 1);
}

std::optional<StepMatch> find_in_workflow(const Workflow& workflow,
                                          const std::string& suffix,
                                          const LoadingContext& context) {
    const std::string adjusted = rebase_step_id(workflow.id(), suffix);
    if (context.debug) {
        std::cout << "[DEBUG] Looking for " << adjusted << " in " << workflow.id() << std::endl;
    }
    return find_step(workflow.steps(), adjusted, context);
}

std::optional<StepMatch> find_in_run(const WorkflowStep& st,
                                     const std::string& suffix,
                                     const LoadingContext& context) {
    const RunRef& run = st.run();

    if (const auto* inline_run = std::get_if<InlineProcess>(&run)) {
        const auto* nested = dynamic_cast<const Workflow*>(inline_run->process.get());
        if (nested == nullptr) return std::nullopt;
        if (auto found = find_step(nested->steps(), suffix, context)) {
            return found;
        }
        return find_in_workflow(*nested, suffix, context);
    }

    if (const auto* embedded = std::get_if<EmbeddedDocument>(&run)) {
        if (embedded->document.value("class", std::string()) != "Workflow") return std::nullopt;
        auto process = make_process(embedded->document, context);
        const auto* nested = dynamic_cast<const Workflow*>(process.get());
        if (nested == nullptr) return std::nullopt;
        return find_in_workflow(*nested, suffix, context);
    }

    const auto& ref = std::get<ExternalRef>(run);
    if (!context.loader) {
        throw MissingLoaderError("step " + st.id() + " runs external document " + ref.location);
    }
    auto process = context.loader->resolve(ref.location, context);
    const auto* nested = dynamic_cast<const Workflow*>(process.get());
    if (nested == nullptr) return std::nullopt;
    return find_in_workflow(*nested, suffix, context);
}

} // namespace

std::string rebase_step_id(const std::string& workflow_id, const std::string& suffix) {
    const char* sep = workflow_id.find('#') != std::string::npos ? "/" : "#";
    return workflow_id + sep + suffix;
}

std::optional<StepMatch> find_step(const std::vector<std::shared_ptr<WorkflowStep>>& steps,
                                   const std::string& step_id,
                                   const LoadingContext& context) {
    for (const auto& st : steps) {
        if (st->id() == step_id) {
            return StepMatch{st->tool(), st};
        }
    }

    for (const auto& st : steps) {
        auto suffix = nested_suffix(step_id, st->id());
        if (!suffix) continue;
        if (auto found = find_in_run(*st, *suffix, context)) {
            return found;
        }
    }
    return std::nullopt;
}

} // namespace cwlslice
