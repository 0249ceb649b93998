// cwlslice/common/utils.h
#ifndef CWLSLICE_COMMON_UTILS_H
#define CWLSLICE_COMMON_UTILS_H

#include "cwlslice/common/types.h"
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace cwlslice {

// YAML::Node -> ordered JSON, typing plain scalars (bool, null, int, float)
Document yaml_to_json(const YAML::Node& node);

// Ordered JSON -> YAML::Node, and the emitted text of it
YAML::Node json_to_yaml(const Document& doc);
std::string dump_yaml(const Document& doc);

// null -> [], array -> its elements, anything else -> [value]
std::vector<Document> as_list(const Document& value);

// Same as as_list but keeps only string elements
std::vector<std::string> as_string_list(const Document& value);

// "file:///wf.cwl#step/out" -> {"file:///wf.cwl", "step/out"}; no '#' -> {uri, ""}
std::pair<std::string, std::string> split_fragment(const std::string& uri);

// "file:///wf.cwl#step/out" -> "file:///wf.cwl#step_out"
std::string flatten_fragment_id(const std::string& id);

// Child identifier inside a scope: "scope#name" if the scope has no fragment yet, else "scope/name"
std::string join_scope(const std::string& scope, const std::string& name);

// Last path segment of the fragment: "file:///wf.cwl#step/in1" -> "in1"
std::string shortname(const std::string& id);

// Absolute URIs ("file://...", "http://...") and blank nodes ("_:...")
bool is_absolute_reference(const std::string& ref);

// Resolve a relative document reference against a base document URI.
std::string resolve_reference(const std::string& base_uri, const std::string& ref);

// "file://" URI of a filesystem path (made absolute)
std::string file_uri(const std::string& path);

// Filesystem path of a "file://" URI, fragment dropped
std::string uri_to_path(const std::string& uri);

} // namespace cwlslice

#endif // CWLSLICE_COMMON_UTILS_H
