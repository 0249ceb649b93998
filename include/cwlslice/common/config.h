// cwlslice/common/config.h
#ifndef CWLSLICE_COMMON_CONFIG_H
#define CWLSLICE_COMMON_CONFIG_H

#include <memory>
#include <string>

namespace cwlslice {

class DocumentLoader;

// Everything a lookup or extraction needs besides the workflow itself.
struct LoadingContext {
    std::shared_ptr<DocumentLoader> loader; // resolves external "run" references
    std::string base_uri;                   // base for relative references, e.g. "file:///work/"
    std::string cwl_version = "v1.2";       // used when neither document nor metadata carry one
    bool debug = false;                     // [DEBUG] lines on stdout
};

// Reads an optional JSON file with "base_dir", "cwl_version" and "debug".
// A missing file yields the defaults; the loader is left unset.
LoadingContext load_loading_config(const std::string& config_path = "cwlslice.json");

} // namespace cwlslice

#endif // CWLSLICE_COMMON_CONFIG_H
