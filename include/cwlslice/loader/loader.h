// cwlslice/loader/loader.h
#ifndef CWLSLICE_LOADER_LOADER_H
#define CWLSLICE_LOADER_LOADER_H

#include "cwlslice/common/config.h"
#include "cwlslice/common/types.h"
#include "cwlslice/core/process.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace cwlslice {

/**
 * Turns external "run" references into live processes.
 *
 * Every document the loader fetches is recorded in an identifier index,
 * keyed by the location it was fetched from and by its own "id". Resolved
 * processes are cached per location, so a reference is fetched at most once
 * per loader. A location is never entered again while it is being resolved;
 * resolving it from inside itself throws DocumentLoadError.
 *
 * No internal synchronization.
 */
class DocumentLoader {
public:
    virtual ~DocumentLoader() = default;

    std::shared_ptr<Process> resolve(const std::string& location, const LoadingContext& context);

    // True while location is being fetched or its process built
    bool is_loading(const std::string& location) const { return loading_.count(location) > 0; }

    // Already-loaded document for a reference, or nullptr
    const Document* index_lookup(const std::string& reference) const;
    const std::unordered_map<std::string, Document>& index() const { return index_; }

protected:
    struct FetchedDocument {
        Document process;  // normalized process document
        Document metadata; // fields of the enclosing file, e.g. cwlVersion
    };

    virtual FetchedDocument fetch(const std::string& location) = 0;

    void index_document(const std::string& key, const Document& doc);

private:
    std::unordered_map<std::string, Document> index_;
    std::unordered_map<std::string, std::shared_ptr<Process>> cache_;
    std::unordered_set<std::string> loading_;
};

// Documents handed over already parsed, keyed by location.
class InMemoryDocumentLoader : public DocumentLoader {
public:
    // Stores the document as given; ids must already be absolute.
    void add_document(const std::string& location, Document doc);
    // Parses YAML/JSON text and normalizes ids against the location.
    void add_text(const std::string& location, const std::string& text);

protected:
    FetchedDocument fetch(const std::string& location) override;

private:
    std::unordered_map<std::string, Document> documents_;
};

// YAML or JSON files on the local filesystem, addressed by "file://" URIs
// or plain paths.
class FileDocumentLoader : public DocumentLoader {
public:
    // Loads a file given by path and returns its process.
    std::shared_ptr<Process> load(const std::string& path, const LoadingContext& context);

protected:
    FetchedDocument fetch(const std::string& location) override;
};

} // namespace cwlslice

#endif // CWLSLICE_LOADER_LOADER_H
