// src/common/config.cpp
#include "cwlslice/common/config.h"
#include "cwlslice/common/utils.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace cwlslice {

namespace {

std::string directory_uri(const std::string& dir) {
    std::string uri = file_uri(dir);
    if (uri.back() != '/') uri += '/';
    return uri;
}

} // namespace

LoadingContext load_loading_config(const std::string& config_path) {
    namespace fs = std::filesystem;

    LoadingContext config;
    config.base_uri = directory_uri(fs::current_path().string());

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("base_dir") && j["base_dir"].is_string()) {
            // Relative to the config file's directory
            fs::path config_dir = fs::path(config_path).parent_path();
            if (config_dir.empty()) config_dir = ".";
            fs::path base_dir = config_dir / j["base_dir"].get<std::string>();
            config.base_uri = directory_uri(base_dir.string());
        }
        if (j.contains("cwl_version") && j["cwl_version"].is_string()) {
            config.cwl_version = j["cwl_version"].get<std::string>();
        }
        if (j.contains("debug") && j["debug"].is_boolean()) {
            config.debug = j["debug"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WARNING] Ignoring malformed config '" << config_path << "': " << e.what() << std::endl;
    }

    return config;
}

} // namespace cwlslice
