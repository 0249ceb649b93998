// tests/test_locator.cpp
#include <catch2/catch_test_macros.hpp>
#include "cwlslice/common/errors.h"
#include "cwlslice/loader/loader.h"
#include "cwlslice/loader/normalizer.h"
#include "cwlslice/subgraph/step_locator.h"
#include "test_helpers.h"
#include <memory>
#include <string>

using namespace cwlslice;
using cwlslice_test::load_workflow;

namespace {

const std::string WF = "file:///wf.cwl";
const std::string SUB = "file:///sub.cwl";

const char* SUB_WORKFLOW = R"(
class: Workflow
inputs:
  msg: string
outputs:
  out:
    type: File
    outputSource: inner/out
steps:
  inner:
    run: echo.cwl
    in: {msg: msg}
    out: [out]
)";

const char* ECHO_TOOL = R"(
class: CommandLineTool
baseCommand: echo
inputs:
  msg: string
outputs:
  out: stdout
)";

const char* OUTER_WORKFLOW = R"(
class: Workflow
inputs:
  msg: string
outputs:
  result:
    type: File
    outputSource: outer/out
steps:
  outer:
    run: sub.cwl
    in: {msg: msg}
    out: [out]
)";

} // namespace

TEST_CASE("Top-level steps are found by exact id", "[locator]") {
    auto wf = load_workflow(OUTER_WORKFLOW, WF);
    LoadingContext context;

    auto match = find_step(wf->steps(), WF + "#outer", context);
    REQUIRE(match.has_value());
    REQUIRE(match->step->id() == WF + "#outer");
    REQUIRE(match->raw == match->step->tool());
    REQUIRE(match->raw["inputs"][0]["source"] == WF + "#msg");
}

TEST_CASE("Nested steps are found the same way whatever the run holds", "[locator]") {
    const Document sub_doc = parse_document(SUB_WORKFLOW, SUB);
    const std::string target = WF + "#outer/inner";

    auto loader = std::make_shared<InMemoryDocumentLoader>();
    loader->add_document(SUB, sub_doc);
    loader->add_text("file:///echo.cwl", ECHO_TOOL);
    LoadingContext context;
    context.loader = loader;

    // external reference through the loader
    auto external_wf = load_workflow(OUTER_WORKFLOW, WF, context);
    auto external = find_step(external_wf->steps(), target, context);

    // the same workflow written inside the step
    Document embedded_doc = parse_document(OUTER_WORKFLOW, WF);
    embedded_doc["steps"][0]["run"] = sub_doc;
    auto embedded_wf = std::dynamic_pointer_cast<Workflow>(make_process(embedded_doc, context));
    REQUIRE(embedded_wf != nullptr);
    auto embedded = find_step(embedded_wf->steps(), target, context);

    // a live workflow object
    auto inline_wf = load_workflow(OUTER_WORKFLOW, WF);
    inline_wf->steps()[0]->set_run(make_process(sub_doc, context), context);
    auto inlined = find_step(inline_wf->steps(), target, context);

    REQUIRE(external.has_value());
    REQUIRE(embedded.has_value());
    REQUIRE(inlined.has_value());

    REQUIRE(external->step->id() == SUB + "#inner");
    REQUIRE(embedded->step->id() == SUB + "#inner");
    REQUIRE(inlined->step->id() == SUB + "#inner");

    REQUIRE(external->raw == embedded->raw);
    REQUIRE(embedded->raw == inlined->raw);
    REQUIRE(external->raw["run"] == "file:///echo.cwl");
    REQUIRE(external->raw["inputs"][0]["type"] == "string");
}

TEST_CASE("Embedded workflows without an id are searched under the step", "[locator]") {
    auto wf = load_workflow(R"(
class: Workflow
inputs: {}
outputs: {}
steps:
  outer:
    run:
      class: Workflow
      inputs: {}
      outputs: {}
      steps:
        inner:
          run: echo.cwl
          in: {}
          out: [out]
    in: {}
    out: []
)", WF);
    LoadingContext context;

    auto match = find_step(wf->steps(), WF + "#outer/inner", context);
    REQUIRE(match.has_value());
    REQUIRE(match->step->id() == WF + "#outer/run/inner");
}

TEST_CASE("Nested steps outlive the workflow built to find them", "[locator]") {
    auto wf = load_workflow(OUTER_WORKFLOW, WF);
    auto loader = std::make_shared<InMemoryDocumentLoader>();
    loader->add_text(SUB, SUB_WORKFLOW);
    loader->add_text("file:///echo.cwl", ECHO_TOOL);
    LoadingContext context;
    context.loader = loader;

    std::shared_ptr<WorkflowStep> step;
    {
        auto match = find_step(wf->steps(), WF + "#outer/inner", context);
        REQUIRE(match.has_value());
        step = match->step;
    }
    REQUIRE(step->id() == SUB + "#inner");
    REQUIRE(std::holds_alternative<ExternalRef>(step->run()));
}

TEST_CASE("Exact ids win over nested ones", "[locator]") {
    auto wf = load_workflow(R"(
class: Workflow
inputs: []
outputs: []
steps:
  outer:
    run: sub.cwl
    in: []
    out: []
  outer/inner:
    run: tool.cwl
    in: []
    out: []
)", WF);
    LoadingContext context;

    // no loader needed: the nested search is never entered
    auto match = find_step(wf->steps(), WF + "#outer/inner", context);
    REQUIRE(match.has_value());
    REQUIRE(match->step->record()["run"] == "file:///tool.cwl");
}

TEST_CASE("Missing steps yield nothing", "[locator]") {
    LoadingContext context;
    Document doc = parse_document(OUTER_WORKFLOW, WF);
    doc["steps"][0]["run"] = parse_document(SUB_WORKFLOW, SUB);
    auto wf = std::dynamic_pointer_cast<Workflow>(make_process(doc, context));
    REQUIRE(wf != nullptr);

    REQUIRE_FALSE(find_step(wf->steps(), WF + "#nothing", context).has_value());
    REQUIRE_FALSE(find_step(wf->steps(), WF + "#outer/nothing", context).has_value());
    // "outerx" is not nested under "outer"
    REQUIRE_FALSE(find_step(wf->steps(), WF + "#outerx", context).has_value());
}

TEST_CASE("Following an external reference needs a loader", "[locator]") {
    auto wf = load_workflow(OUTER_WORKFLOW, WF);
    LoadingContext context;
    REQUIRE_THROWS_AS(find_step(wf->steps(), WF + "#outer/inner", context), MissingLoaderError);
}

TEST_CASE("Nested ids are re-based on the nested workflow", "[locator]") {
    REQUIRE(rebase_step_id(SUB, "inner") == SUB + "#inner");
    REQUIRE(rebase_step_id(WF + "#outer/run", "inner") == WF + "#outer/run/inner");
    REQUIRE(rebase_step_id(SUB, "a/b") == SUB + "#a/b");
}
