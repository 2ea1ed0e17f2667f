#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace assetcat::volume {

enum class Status { Online, Offline, Error, Disabled };

// Volume is a registered storage root. All catalog paths are relative to mount_path.
struct Volume {
    int64_t id = 0;
    std::string label;
    std::string mount_path;
    bool is_readonly = false;
    Status status = Status::Online;
    std::string last_seen_at;
    std::string last_indexed_at;
};

const char* status_name(Status s);

// parse_status throws std::runtime_error for unknown names.
Status parse_status(const std::string& name);

// to_slash converts backslashes to forward slashes and trims leading "./" and "/".
std::string to_slash(std::string p);

// resolve returns path relative to the volume's mount root using '/' separators.
// Throws PathTraversalError if the path (or its symlink target) lies outside the root.
std::string resolve(const Volume& v, const std::filesystem::path& path);

// absolute maps a relative path back onto the mount root.
// Throws PathTraversalError if the result escapes the root (e.g. "../x").
std::filesystem::path absolute(const Volume& v, const std::string& relative_path);

// folder_path returns the parent directory of a relative path, "" at the root.
// Archive members take their container's folder:
// "a/b.stl" -> "a", "b.stl" -> "", "x/y.zip::sub/m.stl" -> "x".
std::string folder_path(const std::string& relative_path);

// is_within reports whether rel lies inside folder ("" is the volume root).
// With recursive=false only direct children qualify.
bool is_within(const std::string& rel, const std::string& folder, bool recursive);

// find_volume_for_path picks the enabled volume whose mount root is the longest
// prefix of path. Returns nullptr if none contains it.
const Volume* find_volume_for_path(const std::vector<Volume>& volumes,
                                   const std::filesystem::path& path);

// file_mtime returns a file's modification time in unix seconds.
// Throws std::filesystem::filesystem_error.
int64_t file_mtime(const std::filesystem::path& file);

// probe_mount reports Online when the mount root exists and is a directory.
Status probe_mount(const Volume& v);

} // namespace assetcat::volume
