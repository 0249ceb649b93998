// cwlslice/common/errors.h
#ifndef CWLSLICE_COMMON_ERRORS_H
#define CWLSLICE_COMMON_ERRORS_H

#include <stdexcept>
#include <string>

namespace cwlslice {

// Base of every error raised by the extraction core and its loaders.
class SliceError : public std::runtime_error {
public:
    explicit SliceError(const std::string& msg) : std::runtime_error(msg) {}
};

// Subgraph extraction requested on something that is not a Workflow.
class InvalidRootClassError : public SliceError {
public:
    explicit InvalidRootClassError(const std::string& process_class)
        : SliceError("Can only extract subgraph from workflow, got class '" + process_class + "'") {}
};

// A step owning a dangling dependency has no matching step record.
class UnresolvableRewireError : public SliceError {
public:
    explicit UnresolvableRewireError(const std::string& step_id)
        : SliceError("Could not find step " + step_id), step_id_(step_id) {}

    const std::string& step_id() const noexcept { return step_id_; }

private:
    std::string step_id_;
};

class StepNotFoundError : public SliceError {
public:
    explicit StepNotFoundError(const std::string& step_id)
        : SliceError("Step " + step_id + " was not found"), step_id_(step_id) {}

    const std::string& step_id() const noexcept { return step_id_; }

private:
    std::string step_id_;
};

class MissingLoaderError : public SliceError {
public:
    explicit MissingLoaderError(const std::string& what)
        : SliceError("No document loader available: " + what) {}
};

class UnknownNodeError : public SliceError {
public:
    explicit UnknownNodeError(const std::string& node_id)
        : SliceError("Node " + node_id + " is not part of the workflow graph"), node_id_(node_id) {}

    const std::string& node_id() const noexcept { return node_id_; }

private:
    std::string node_id_;
};

class DocumentLoadError : public SliceError {
public:
    DocumentLoadError(const std::string& location, const std::string& reason)
        : SliceError("Cannot load '" + location + "': " + reason), location_(location) {}

    const std::string& location() const noexcept { return location_; }

private:
    std::string location_;
};

} // namespace cwlslice

#endif // CWLSLICE_COMMON_ERRORS_H
