#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace assetcat {

// Resolved path escapes the volume's mount root. Fatal to that file only.
class PathTraversalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Container or format with no reader. Scanner counts it as skipped.
class UnsupportedFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Format-specific structural failure. missing() lists unresolved companions, if any.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what, std::vector<std::string> missing = {})
        : std::runtime_error(what), missing_(std::move(missing)) {}

    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

// Unreadable file or failed read inside an archive.
class IOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Volume mount is unreachable; operations against it are unavailable.
class VolumeOfflineError : public std::runtime_error {
public:
    VolumeOfflineError(const std::string& what, long long volume_id)
        : std::runtime_error(what), volume_id_(volume_id) {}

    long long volume_id() const { return volume_id_; }

private:
    long long volume_id_ = 0;
};

// Render exceeded its per-item deadline; the asset is requeued on a later cycle.
class RenderTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A renderer backend failed; the daemon advances to the next one in the chain.
class RenderBackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// error_type_name returns the short tag stored in job_errors.error_type.
template <typename E>
constexpr const char* error_type_name();

template <> constexpr const char* error_type_name<PathTraversalError>() { return "path_traversal"; }
template <> constexpr const char* error_type_name<UnsupportedFormatError>() { return "unsupported_format"; }
template <> constexpr const char* error_type_name<ValidationError>() { return "validation"; }
template <> constexpr const char* error_type_name<IOError>() { return "io"; }
template <> constexpr const char* error_type_name<VolumeOfflineError>() { return "volume_offline"; }

} // namespace assetcat
