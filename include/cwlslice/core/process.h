// cwlslice/core/process.h
#ifndef CWLSLICE_CORE_PROCESS_H
#define CWLSLICE_CORE_PROCESS_H

#include "cwlslice/common/config.h"
#include "cwlslice/common/types.h"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace cwlslice {

class Process;

// The three shapes a step's "run" field takes.
struct InlineProcess {
    std::shared_ptr<Process> process; // live object, already constructed
};

struct EmbeddedDocument {
    Document document; // process or workflow map written inside the step
};

struct ExternalRef {
    std::string location; // resolved by the DocumentLoader
};

using RunRef = std::variant<InlineProcess, EmbeddedDocument, ExternalRef>;

// A parsed CWL process document (CommandLineTool, ExpressionTool, Workflow, ...)
class Process {
public:
    explicit Process(Document tool, Document metadata = Document::object());
    virtual ~Process() = default;

    const Document& tool() const { return tool_; }
    const Document& metadata() const { return metadata_; }

    std::string id() const;
    std::string process_class() const;

protected:
    Document tool_;
    Document metadata_; // top-level document fields, e.g. cwlVersion
};

/**
 * One step of a workflow.
 *
 * record() is the step exactly as written in the workflow ("in", "out",
 * "run", ...). tool() is the same record plus "inputs"/"outputs" parameter
 * lists derived from "in"/"out"; each parameter carries a "type" taken from
 * the matching parameter of the process the step runs, or "Any" when that
 * process is not available.
 *
 * With a loader in the context, an external "run" reference is resolved on
 * construction (DocumentLoadError if it cannot be fetched).
 */
class WorkflowStep {
public:
    WorkflowStep(Document record, const LoadingContext& context);

    const std::string& id() const { return id_; }
    const Document& record() const { return record_; }
    const Document& tool() const { return tool_; }
    const RunRef& run() const { return run_; }

    // Replace "run" with a live process object.
    void set_run(std::shared_ptr<Process> process, const LoadingContext& context);

private:
    void derive_parameters(const LoadingContext& context);
    const Document* run_document(const LoadingContext& context) const;

    std::string id_;
    Document record_;
    Document tool_;
    RunRef run_;
};

class Workflow : public Process {
public:
    Workflow(Document tool, const LoadingContext& context, Document metadata = Document::object());

    const std::vector<std::shared_ptr<WorkflowStep>>& steps() const { return steps_; }

private:
    std::vector<std::shared_ptr<WorkflowStep>> steps_;
};

// Workflow for "class: Workflow", plain Process for everything else.
// Without explicit metadata, the document's own cwlVersion is recorded.
std::shared_ptr<Process> make_process(const Document& tool,
                                      const LoadingContext& context,
                                      Document metadata = Document::object());

} // namespace cwlslice

#endif // CWLSLICE_CORE_PROCESS_H
