// main.cpp
#include "cwlslice/common/config.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/core/process.h"
#include "cwlslice/loader/loader.h"
#include "cwlslice/subgraph/extractor.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <workflow.cwl> [options]\n"
              << "  --subgraph <id>        extract the part reachable from <id> (repeatable)\n"
              << "  --single-step <id>     extract one step as a one-step workflow\n"
              << "  --single-process <id>  print the process a step runs\n"
              << "  --config <file>        loading configuration (JSON)\n"
              << "  --json                 print JSON instead of YAML\n";
}

// Ids on the command line may be relative to the workflow ("step1", "#step1")
std::string qualify(const std::string& id, const std::string& workflow_id) {
    if (cwlslice::is_absolute_reference(id)) return id;
    if (!id.empty() && id[0] == '#') return cwlslice::split_fragment(workflow_id).first + id;
    return cwlslice::join_scope(workflow_id, id);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string workflow_path = argv[1];
    std::vector<std::string> subgraph_roots;
    std::optional<std::string> single_step;
    std::optional<std::string> single_process;
    std::string config_path = "cwlslice.json";
    bool as_json = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--subgraph" && has_value) {
            subgraph_roots.push_back(argv[++i]);
        } else if (arg == "--single-step" && has_value) {
            single_step = argv[++i];
        } else if (arg == "--single-process" && has_value) {
            single_process = argv[++i];
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            as_json = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        cwlslice::LoadingContext context = cwlslice::load_loading_config(config_path);
        auto loader = std::make_shared<cwlslice::FileDocumentLoader>();
        context.loader = loader;

        auto process = loader->load(workflow_path, context);
        auto workflow = std::dynamic_pointer_cast<cwlslice::Workflow>(process);

        cwlslice::Document result;
        if (!subgraph_roots.empty()) {
            for (auto& root : subgraph_roots) {
                root = qualify(root, process->id());
            }
            result = cwlslice::get_subgraph(subgraph_roots, *process, context);
        } else if (single_step || single_process) {
            if (!workflow) {
                std::cerr << "[ERROR] " << workflow_path << " is not a workflow" << std::endl;
                return 1;
            }
            if (single_step) {
                result = cwlslice::get_step(*workflow, qualify(*single_step, workflow->id()), context);
            } else {
                result = cwlslice::get_process(*workflow, qualify(*single_process, workflow->id()), context).process;
            }
        } else {
            result = process->tool();
        }

        if (as_json) {
            std::cout << result.dump(2) << std::endl;
        } else {
            std::cout << cwlslice::dump_yaml(result) << std::endl;
        }
    } catch (const cwlslice::SliceError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
