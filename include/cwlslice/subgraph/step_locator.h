// cwlslice/subgraph/step_locator.h
#ifndef CWLSLICE_SUBGRAPH_STEP_LOCATOR_H
#define CWLSLICE_SUBGRAPH_STEP_LOCATOR_H

#include "cwlslice/common/config.h"
#include "cwlslice/common/types.h"
#include "cwlslice/core/process.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cwlslice {

struct StepMatch {
    Document raw;                       // the step's tool(): record plus derived inputs/outputs
    std::shared_ptr<WorkflowStep> step; // keeps nested workflows' steps alive past the lookup
};

/**
 * Find a step by id, descending into nested workflows.
 *
 * A step whose id is a proper prefix of step_id (followed by '/' or '#') is
 * searched through its "run": an inline workflow with the bare remainder of
 * the id, then with the re-based id; an embedded workflow map or an external
 * reference with the re-based id only. Re-basing joins the nested workflow's
 * own id and the remainder (see rebase_step_id), since every nested workflow
 * names its steps in its own namespace.
 *
 * Throws MissingLoaderError when an external reference has to be followed
 * without a loader in the context.
 */
std::optional<StepMatch> find_step(const std::vector<std::shared_ptr<WorkflowStep>>& steps,
                                   const std::string& step_id,
                                   const LoadingContext& context);

// "wf.cwl" + "inner" -> "wf.cwl#inner"; "wf.cwl#sub" + "inner" -> "wf.cwl#sub/inner"
std::string rebase_step_id(const std::string& workflow_id, const std::string& suffix);

} // namespace cwlslice

#endif // CWLSLICE_SUBGRAPH_STEP_LOCATOR_H
