// tests/test_loader.cpp
#include <catch2/catch_test_macros.hpp>
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/loader/loader.h"
#include "cwlslice/loader/normalizer.h"
#include "cwlslice/subgraph/extractor.h"
#include "test_helpers.h"
#include <filesystem>
#include <memory>
#include <string>

using namespace cwlslice;
using cwlslice_test::TempDir;
namespace fs = std::filesystem;

namespace {

const char* WORKFLOW = R"(
cwlVersion: v1.2
class: Workflow
inputs:
  msg: string
outputs:
  out:
    type: File
    outputSource: say/out
steps:
  say:
    run: tools/echo.cwl
    in: {msg: msg}
    out: [out]
)";

const char* ECHO_TOOL = R"(
cwlVersion: v1.2
class: CommandLineTool
id: echo
baseCommand: echo
inputs:
  msg: string
outputs:
  out: stdout
)";

const char* PACKED = R"(
cwlVersion: v1.2
$graph:
  - id: echo
    class: CommandLineTool
    baseCommand: echo
    inputs:
      msg: string
    outputs:
      out: stdout
  - id: main
    class: Workflow
    inputs:
      msg: string
    outputs: []
    steps:
      say:
        run: "#echo"
        in: {msg: msg}
        out: [out]
)";

} // namespace

TEST_CASE("File loader normalizes ids against the file URI", "[loader]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("wf.cwl", WORKFLOW);
    files.write("tools/echo.cwl", ECHO_TOOL);
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;
    context.loader = loader;

    auto process = loader->load(path, context);
    const std::string uri = file_uri(path);

    auto wf = std::dynamic_pointer_cast<Workflow>(process);
    REQUIRE(wf != nullptr);
    REQUIRE(process->id() == uri);
    REQUIRE(process->metadata()["cwlVersion"] == "v1.2");

    const Document& tool = process->tool();
    REQUIRE(tool["inputs"][0]["id"] == uri + "#msg");
    REQUIRE(tool["outputs"][0]["outputSource"] == uri + "#say/out");
    REQUIRE(tool["steps"][0]["id"] == uri + "#say");
    REQUIRE(tool["steps"][0]["in"][0]["id"] == uri + "#say/msg");
    REQUIRE(tool["steps"][0]["in"][0]["source"] == uri + "#msg");
    REQUIRE(tool["steps"][0]["out"][0] == uri + "#say/out");
    REQUIRE(tool["steps"][0]["run"] == file_uri((files.dir / "tools" / "echo.cwl").string()));
}

TEST_CASE("Step run references are loaded with the workflow", "[loader]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("wf.cwl", WORKFLOW);
    const std::string echo_path = files.write("tools/echo.cwl", ECHO_TOOL);
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;
    context.loader = loader;

    auto wf = std::dynamic_pointer_cast<Workflow>(loader->load(path, context));
    REQUIRE(wf != nullptr);

    REQUIRE(loader->index_lookup(file_uri(echo_path)) != nullptr);
    const Document& step = wf->steps()[0]->tool();
    REQUIRE(step["inputs"][0]["type"] == "string");
    REQUIRE(step["outputs"][0]["type"] == "stdout");

    SECTION("a missing run reference fails the load") {
        auto fresh = std::make_shared<FileDocumentLoader>();
        LoadingContext fresh_context;
        fresh_context.loader = fresh;
        fs::remove(echo_path);
        REQUIRE_THROWS_AS(fresh->load(path, fresh_context), DocumentLoadError);
        REQUIRE_FALSE(fresh->is_loading(file_uri(path)));
    }
}

TEST_CASE("A workflow that runs itself loads once", "[loader]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("loop.cwl", R"(
class: Workflow
inputs:
  n: int
outputs: []
steps:
  again:
    run: loop.cwl
    in: {n: n}
    out: []
)");
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;
    context.loader = loader;

    auto wf = std::dynamic_pointer_cast<Workflow>(loader->load(path, context));
    REQUIRE(wf != nullptr);
    REQUIRE(wf->steps()[0]->record()["run"] == file_uri(path));
    REQUIRE(wf->steps()[0]->tool()["inputs"][0]["type"] == "int");
    REQUIRE_FALSE(loader->is_loading(file_uri(path)));
    REQUIRE(loader->load(path, context) == wf);
}

TEST_CASE("Resolved processes are cached and indexed", "[loader]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("echo.cwl", ECHO_TOOL);
    const std::string uri = file_uri(path);
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;

    auto first = loader->resolve(uri, context);
    fs::remove(path);
    auto second = loader->resolve(uri, context);

    REQUIRE(first == second);
    REQUIRE(first->id() == uri + "#echo");
    REQUIRE(loader->index_lookup(uri) != nullptr);
    REQUIRE(loader->index_lookup(uri + "#echo") != nullptr);
    REQUIRE(*loader->index_lookup(uri) == first->tool());
    REQUIRE(loader->index().size() == 2);
}

TEST_CASE("Unreadable documents are reported", "[loader]") {
    TempDir files("cwlslice_test_loader");
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;

    SECTION("missing file") {
        REQUIRE_THROWS_AS(loader->load((files.dir / "absent.cwl").string(), context), DocumentLoadError);
    }

    SECTION("broken YAML") {
        const std::string path = files.write("broken.cwl", "class: [Workflow\n");
        REQUIRE_THROWS_AS(loader->load(path, context), DocumentLoadError);
    }

    SECTION("top level is not a map") {
        const std::string path = files.write("list.cwl", "- a\n- b\n");
        try {
            loader->load(path, context);
            FAIL("expected DocumentLoadError");
        } catch (const DocumentLoadError& e) {
            REQUIRE(e.location() == file_uri(path));
        }
    }
}

TEST_CASE("Packed documents select their entry by fragment", "[loader]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("packed.cwl", PACKED);
    const std::string uri = file_uri(path);
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;
    context.loader = loader;

    auto main = loader->resolve(uri, context);
    REQUIRE(main->id() == uri + "#main");
    REQUIRE(main->process_class() == "Workflow");
    REQUIRE_FALSE(main->tool().contains("cwlVersion"));
    REQUIRE(main->metadata()["cwlVersion"] == "v1.2");

    auto echo = loader->resolve(uri + "#echo", context);
    REQUIRE(echo->id() == uri + "#echo");
    REQUIRE(echo->process_class() == "CommandLineTool");

    REQUIRE_THROWS_AS(loader->resolve(uri + "#missing", context), DocumentLoadError);
}

TEST_CASE("Process resolution loads references on demand", "[loader][process]") {
    TempDir files("cwlslice_test_loader");
    const std::string path = files.write("packed.cwl", PACKED);
    const std::string uri = file_uri(path);
    auto loader = std::make_shared<FileDocumentLoader>();
    LoadingContext context;
    context.loader = loader;

    // built without a loader, so "#echo" is not fetched yet
    auto wf = std::dynamic_pointer_cast<Workflow>(loader->resolve(uri, LoadingContext{}));
    REQUIRE(wf != nullptr);
    REQUIRE(wf->steps()[0]->record()["run"] == uri + "#echo");
    REQUIRE(loader->index_lookup(uri + "#echo") == nullptr);

    ResolvedProcess resolved = get_process(*wf, uri + "#main/say", context);

    REQUIRE(resolved.process["baseCommand"] == "echo");
    REQUIRE(loader->index_lookup(uri + "#echo") != nullptr);
}

TEST_CASE("In-memory loader serves documents by location", "[loader]") {
    auto loader = std::make_shared<InMemoryDocumentLoader>();
    LoadingContext context;
    loader->add_text("file:///echo.cwl", ECHO_TOOL);

    REQUIRE(loader->index_lookup("file:///echo.cwl") != nullptr);
    auto process = loader->resolve("file:///echo.cwl", context);
    REQUIRE(process->id() == "file:///echo.cwl#echo");
    REQUIRE(std::dynamic_pointer_cast<Workflow>(process) == nullptr);
    REQUIRE(loader->resolve("file:///echo.cwl", context) == process);
    REQUIRE_THROWS_AS(loader->resolve("file:///other.cwl", context), DocumentLoadError);
}

TEST_CASE("Map-form fields become record lists", "[loader][normalize]") {
    Document raw = yaml_to_json(YAML::Load(R"(
class: Workflow
id: "#top"
inputs:
  a: string
  b:
    type: int
    default: 3
outputs:
  both:
    type: string[]
    outputSource: [step/x, "#a"]
steps:
  step:
    run: tool.cwl
    in:
      x: a
      y: {source: [a, b], linkMerge: merge_flattened}
    out: [x, {id: z}]
)"));

    Document doc = normalize_process(raw, "file:///dir/wf.cwl");

    REQUIRE(doc["id"] == "file:///dir/wf.cwl#top");
    REQUIRE(doc["inputs"][0] == Document{{"id", "file:///dir/wf.cwl#top/a"}, {"type", "string"}});
    REQUIRE(doc["inputs"][1]["id"] == "file:///dir/wf.cwl#top/b");
    REQUIRE(doc["inputs"][1]["default"] == 3);
    REQUIRE(doc["outputs"][0]["outputSource"] ==
            Document::array({"file:///dir/wf.cwl#top/step/x", "file:///dir/wf.cwl#a"}));

    const Document& step = doc["steps"][0];
    REQUIRE(step["id"] == "file:///dir/wf.cwl#top/step");
    REQUIRE(step["run"] == "file:///dir/tool.cwl");
    REQUIRE(step["in"][0]["source"] == "file:///dir/wf.cwl#top/a");
    REQUIRE(step["in"][1]["id"] == "file:///dir/wf.cwl#top/step/y");
    REQUIRE(step["in"][1]["source"] ==
            Document::array({"file:///dir/wf.cwl#top/a", "file:///dir/wf.cwl#top/b"}));
    REQUIRE(step["in"][1]["linkMerge"] == "merge_flattened");
    REQUIRE(step["out"][0] == "file:///dir/wf.cwl#top/step/x");
    REQUIRE(step["out"][1]["id"] == "file:///dir/wf.cwl#top/step/z");
}

TEST_CASE("Absolute ids are kept as written", "[loader][normalize]") {
    Document raw = yaml_to_json(YAML::Load(R"(
class: Workflow
id: "http://example.com/wf.cwl"
inputs:
  - id: "http://example.com/wf.cwl#a"
    type: string
outputs: []
steps: []
)"));

    Document doc = normalize_process(raw, "file:///dir/wf.cwl");

    REQUIRE(doc["id"] == "http://example.com/wf.cwl");
    REQUIRE(doc["inputs"][0]["id"] == "http://example.com/wf.cwl#a");
}
