// src/loader/loader.cpp
#include "cwlslice/loader/loader.h"
#include "cwlslice/common/errors.h"
#include "cwlslice/common/utils.h"
#include "cwlslice/loader/normalizer.h"
#include <fstream>
#include <iostream>
#include <sstream>

namespace cwlslice {

std::shared_ptr<Process> DocumentLoader::resolve(const std::string& location, const LoadingContext& context) {
    auto cached = cache_.find(location);
    if (cached != cache_.end()) {
        if (context.debug) {
            std::cout << "[DEBUG] Loader cache hit: " << location << std::endl;
        }
        return cached->second;
    }

    if (is_loading(location)) {
        throw DocumentLoadError(location, "circular reference while loading");
    }

    if (context.debug) {
        std::cout << "[DEBUG] Loading " << location << std::endl;
    }
    loading_.insert(location);
    std::shared_ptr<Process> process;
    try {
        FetchedDocument fetched = fetch(location);

        index_document(location, fetched.process);
        if (fetched.process.contains("id") && fetched.process["id"].is_string()) {
            index_document(fetched.process["id"].get<std::string>(), fetched.process);
        }

        // steps of a workflow resolve their own run references here
        process = make_process(fetched.process, context, std::move(fetched.metadata));
    } catch (...) {
        loading_.erase(location);
        throw;
    }
    loading_.erase(location);

    cache_[location] = process;
    return process;
}

const Document* DocumentLoader::index_lookup(const std::string& reference) const {
    auto it = index_.find(reference);
    return it == index_.end() ? nullptr : &it->second;
}

void DocumentLoader::index_document(const std::string& key, const Document& doc) {
    index_[key] = doc;
}

void InMemoryDocumentLoader::add_document(const std::string& location, Document doc) {
    index_document(location, doc);
    documents_[location] = std::move(doc);
}

void InMemoryDocumentLoader::add_text(const std::string& location, const std::string& text) {
    add_document(location, parse_document(text, location));
}

DocumentLoader::FetchedDocument InMemoryDocumentLoader::fetch(const std::string& location) {
    auto it = documents_.find(location);
    if (it == documents_.end()) {
        it = documents_.find(split_fragment(location).first);
    }
    if (it == documents_.end()) {
        throw DocumentLoadError(location, "no such in-memory document");
    }

    FetchedDocument fetched;
    fetched.process = select_process(it->second, location);
    fetched.metadata = Document::object();
    if (it->second.contains("cwlVersion")) {
        fetched.metadata["cwlVersion"] = it->second["cwlVersion"];
    }
    return fetched;
}

std::shared_ptr<Process> FileDocumentLoader::load(const std::string& path, const LoadingContext& context) {
    return resolve(file_uri(path), context);
}

DocumentLoader::FetchedDocument FileDocumentLoader::fetch(const std::string& location) {
    const std::string path = uri_to_path(location);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DocumentLoadError(location, "cannot open file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    const std::string base_uri = split_fragment(location).first;
    Document doc = parse_document(buffer.str(), base_uri);

    FetchedDocument fetched;
    fetched.process = select_process(doc, location);
    fetched.metadata = Document::object();
    if (doc.contains("cwlVersion")) {
        fetched.metadata["cwlVersion"] = doc["cwlVersion"];
    }
    return fetched;
}

} // namespace cwlslice
