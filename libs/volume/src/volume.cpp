#include "assetcat/volume.h"
#include "assetcat/errors.h"

#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace assetcat::volume {

const char* status_name(Status s) {
    switch (s) {
        case Status::Online: return "online";
        case Status::Offline: return "offline";
        case Status::Error: return "error";
        case Status::Disabled: return "disabled";
    }
    return "error";
}

Status parse_status(const std::string& name) {
    if (name == "online") return Status::Online;
    if (name == "offline") return Status::Offline;
    if (name == "error") return Status::Error;
    if (name == "disabled") return Status::Disabled;
    throw std::runtime_error(std::format("volume: unknown status '{}'", name));
}

std::string to_slash(std::string p) {
    std::replace(p.begin(), p.end(), '\\', '/');
    while (p.starts_with("./")) p.erase(0, 2);
    while (!p.empty() && p[0] == '/') p.erase(0, 1);
    return p;
}

// Normalized absolute mount root without a trailing separator.
static fs::path mount_root(const Volume& v) {
    if (v.mount_path.empty())
        throw std::runtime_error(std::format("volume {}: empty mount path", v.id));
    fs::path root = fs::absolute(fs::path(v.mount_path)).lexically_normal();
    if (!root.has_filename() && root != root.root_path())
        root = root.parent_path();
    return root;
}

// Component-wise containment; both paths must already be normalized.
static bool contains(const fs::path& root, const fs::path& p) {
    auto rel = p.lexically_relative(root);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || *first != "..";
}

std::string resolve(const Volume& v, const fs::path& path) {
    const fs::path root = mount_root(v);
    const fs::path p = fs::absolute(path).lexically_normal();

    if (!contains(root, p))
        throw PathTraversalError(std::format("{} is outside volume '{}' ({})",
                                             path.string(), v.label, root.string()));

    // A symlink inside the root may still point elsewhere.
    std::error_code ec;
    if (fs::exists(fs::symlink_status(p, ec)) && !ec) {
        fs::path canon_root = fs::weakly_canonical(root, ec);
        if (ec) canon_root = root;
        fs::path canon_p = fs::weakly_canonical(p, ec);
        if (!ec && !contains(canon_root, canon_p))
            throw PathTraversalError(std::format("{} resolves to {} outside volume '{}'",
                                                 path.string(), canon_p.string(), v.label));
    }

    std::string rel = p.lexically_relative(root).generic_string();
    if (rel == ".") return "";
    return to_slash(rel);
}

fs::path absolute(const Volume& v, const std::string& relative_path) {
    const fs::path root = mount_root(v);
    std::string rel = relative_path;
    std::replace(rel.begin(), rel.end(), '\\', '/');
    if (!rel.empty() && rel[0] == '/')
        throw PathTraversalError(std::format("relative path '{}' is absolute", relative_path));

    fs::path p = (root / fs::path(rel)).lexically_normal();
    if (!p.has_filename() && p != p.root_path())
        p = p.parent_path();
    if (!contains(root, p))
        throw PathTraversalError(std::format("relative path '{}' escapes volume '{}'",
                                             relative_path, v.label));
    return p;
}

std::string folder_path(const std::string& relative_path) {
    // Archive members live in the folder of their container.
    auto container = relative_path.substr(0, relative_path.find("::"));
    auto pos = container.rfind('/');
    return pos == std::string::npos ? "" : container.substr(0, pos);
}

bool is_within(const std::string& rel, const std::string& folder, bool recursive) {
    std::string container = rel.substr(0, rel.find("::"));

    if (!recursive) return folder_path(container) == folder;
    if (folder.empty()) return true;
    return container.size() > folder.size() &&
           container.compare(0, folder.size(), folder) == 0 &&
           container[folder.size()] == '/';
}

const Volume* find_volume_for_path(const std::vector<Volume>& volumes, const fs::path& path) {
    const fs::path p = fs::absolute(path).lexically_normal();
    const Volume* best = nullptr;
    size_t best_len = 0;
    for (const auto& v : volumes) {
        if (v.status == Status::Disabled || v.mount_path.empty()) continue;
        fs::path root = mount_root(v);
        if (!contains(root, p)) continue;
        size_t len = root.native().size();
        if (!best || len > best_len) {
            best = &v;
            best_len = len;
        }
    }
    return best;
}

int64_t file_mtime(const fs::path& file) {
    auto sys = std::chrono::file_clock::to_sys(fs::last_write_time(file));
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

Status probe_mount(const Volume& v) {
    std::error_code ec;
    if (v.mount_path.empty()) return Status::Offline;
    return fs::is_directory(fs::path(v.mount_path), ec) && !ec ? Status::Online : Status::Offline;
}

} // namespace assetcat::volume
