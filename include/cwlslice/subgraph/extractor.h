// cwlslice/subgraph/extractor.h
#ifndef CWLSLICE_SUBGRAPH_EXTRACTOR_H
#define CWLSLICE_SUBGRAPH_EXTRACTOR_H

#include "cwlslice/common/config.h"
#include "cwlslice/common/types.h"
#include "cwlslice/core/process.h"
#include <memory>
#include <string>
#include <vector>

namespace cwlslice {

/**
 * Extract the part of a workflow reachable from roots as a self-contained
 * workflow document.
 *
 * Only the steps, inputs and outputs that survive are copied (in their
 * original order); dependencies on dropped nodes are replaced with new
 * top-level inputs appended after the original ones. All other top-level
 * fields are copied verbatim. The workflow itself is not modified.
 *
 * Throws InvalidRootClassError, UnknownNodeError, UnresolvableRewireError.
 */
Document get_subgraph(const std::vector<NodeId>& roots,
                      const Process& tool,
                      const LoadingContext& context);

/**
 * Extract one step, possibly nested, as a one-step workflow.
 *
 * Every input port becomes a top-level input of type Any ("#<port>"), every
 * output port a top-level output pointing at "<parent>#<step>/<port>".
 * The document's id is the part of the step id before its last '#'.
 *
 * Throws StepNotFoundError.
 */
Document get_step(const Workflow& tool,
                  const std::string& step_id,
                  const LoadingContext& context);

struct ResolvedProcess {
    Document process;
    std::shared_ptr<WorkflowStep> step;
};

/**
 * The process a step runs: for an external reference the document the
 * loader indexed under that exact reference, otherwise the run value itself.
 *
 * Throws MissingLoaderError, StepNotFoundError, DocumentLoadError.
 */
ResolvedProcess get_process(const Workflow& tool,
                            const std::string& step_id,
                            const LoadingContext& context);

} // namespace cwlslice

#endif // CWLSLICE_SUBGRAPH_EXTRACTOR_H
