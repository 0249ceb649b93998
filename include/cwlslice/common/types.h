// cwlslice/common/types.h
#ifndef CWLSLICE_COMMON_TYPES_H
#define CWLSLICE_COMMON_TYPES_H

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace cwlslice {

// Parsed CWL documents keep the field order of their source.
using Document = nlohmann::ordered_json;

// Global node identifier, e.g. "file:///work/wf.cwl#step1/output"
using NodeId = std::string;

// Role of a node in the dependency graph.
// UNCLASSIFIED marks intermediate data links (step output ports etc.)
enum class NodeKind : uint8_t {
    UNCLASSIFIED,
    INPUT,
    OUTPUT,
    STEP
};

enum class Direction : uint8_t {
    UPSTREAM,
    DOWNSTREAM
};

inline const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::INPUT:  return "input";
        case NodeKind::OUTPUT: return "output";
        case NodeKind::STEP:   return "step";
        default:               return "unclassified";
    }
}

} // namespace cwlslice

#endif // CWLSLICE_COMMON_TYPES_H
