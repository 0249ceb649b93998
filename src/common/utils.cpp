// src/common/utils.cpp
#include "cwlslice/common/utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cwlslice {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Integers, decimals and scientific notation; the whole string must be consumed
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

} // namespace

Document yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();

            // Quoted scalars carry the non-specific tag "!" and stay strings
            if (node.Tag() == "!") return s;

            if (s == "true")  return true;
            if (s == "false") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // too large for a number, keep the text
                } catch (const std::invalid_argument&) {
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            Document arr = Document::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Document obj = Document::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

YAML::Node json_to_yaml(const Document& doc) {
    if (doc.is_object()) {
        YAML::Node node(YAML::NodeType::Map);
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            node[it.key()] = json_to_yaml(it.value());
        }
        return node;
    }
    if (doc.is_array()) {
        YAML::Node node(YAML::NodeType::Sequence);
        for (const auto& item : doc) {
            node.push_back(json_to_yaml(item));
        }
        return node;
    }
    if (doc.is_null()) return YAML::Node(YAML::NodeType::Null);
    if (doc.is_string()) return YAML::Node(doc.get<std::string>());
    if (doc.is_boolean()) return YAML::Node(doc.get<bool>());
    if (doc.is_number_integer()) return YAML::Node(doc.get<long long>());
    return YAML::Node(doc.get<double>());
}

std::string dump_yaml(const Document& doc) {
    YAML::Emitter out;
    out << json_to_yaml(doc);
    return out.c_str();
}

std::vector<Document> as_list(const Document& value) {
    if (value.is_null()) return {};
    if (value.is_array()) {
        return std::vector<Document>(value.begin(), value.end());
    }
    return {value};
}

std::vector<std::string> as_string_list(const Document& value) {
    std::vector<std::string> out;
    for (const auto& item : as_list(value)) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::pair<std::string, std::string> split_fragment(const std::string& uri) {
    auto hash = uri.find('#');
    if (hash == std::string::npos) {
        return {uri, ""};
    }
    return {uri.substr(0, hash), uri.substr(hash + 1)};
}

std::string flatten_fragment_id(const std::string& id) {
    auto [url, fragment] = split_fragment(id);
    std::replace(fragment.begin(), fragment.end(), '/', '_');
    return url + "#" + fragment;
}

std::string join_scope(const std::string& scope, const std::string& name) {
    if (scope.find('#') != std::string::npos) {
        return scope + "/" + name;
    }
    return scope + "#" + name;
}

std::string shortname(const std::string& id) {
    auto [url, fragment] = split_fragment(id);
    const std::string& tail = fragment.empty() ? url : fragment;
    auto slash = tail.rfind('/');
    return slash == std::string::npos ? tail : tail.substr(slash + 1);
}

bool is_absolute_reference(const std::string& ref) {
    return ref.find("://") != std::string::npos || ref.rfind("_:", 0) == 0;
}

std::string resolve_reference(const std::string& base_uri, const std::string& ref) {
    if (ref.empty()) return base_uri;
    if (is_absolute_reference(ref)) return ref;

    std::string base = split_fragment(base_uri).first;
    if (ref[0] == '#') return base + ref;

    // "scheme://authority" stays untouched, only the path is joined
    std::string root;
    std::string path = base;
    auto scheme_end = base.find("://");
    if (scheme_end != std::string::npos) {
        auto path_start = base.find('/', scheme_end + 3);
        root = base.substr(0, path_start == std::string::npos ? base.size() : path_start);
        path = path_start == std::string::npos ? "/" : base.substr(path_start);
    }

    auto [ref_path, ref_fragment] = split_fragment(ref);
    std::string joined;
    if (ref_path[0] == '/') {
        joined = ref_path;
    } else {
        auto slash = path.rfind('/');
        joined = (slash == std::string::npos ? std::string() : path.substr(0, slash + 1)) + ref_path;
    }
    joined = std::filesystem::path(joined).lexically_normal().generic_string();

    std::string resolved = root + joined;
    if (ref.find('#') != std::string::npos) {
        resolved += "#" + ref_fragment;
    }
    return resolved;
}

std::string file_uri(const std::string& path) {
    namespace fs = std::filesystem;
    return "file://" + fs::absolute(fs::path(path)).lexically_normal().generic_string();
}

std::string uri_to_path(const std::string& uri) {
    std::string location = split_fragment(uri).first;
    if (location.rfind("file://", 0) == 0) {
        return location.substr(7);
    }
    return location;
}

} // namespace cwlslice
