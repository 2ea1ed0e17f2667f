#include "assetcat/thumbd_store.h"
#include "assetcat/archive.h"
#include "assetcat/errors.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace assetcat::thumbd {

const char* storage_mode_name(StorageMode m) {
    switch (m) {
    case StorageMode::Central: return "central";
    case StorageMode::Auto: return "auto";
    }
    return "central";
}

StorageMode parse_storage_mode(std::string_view s) {
    if (s == "central") return StorageMode::Central;
    if (s == "auto") return StorageMode::Auto;
    throw std::runtime_error(std::format("unknown thumbnail storage mode '{}'", s));
}

ThumbStore::ThumbStore(fs::path central_dir, StorageMode mode)
    : central_dir_(std::move(central_dir)), mode_(mode) {}

std::string ThumbStore::safe_stem(std::string_view s, size_t max) {
    std::string out;
    out.reserve(std::min(s.size(), max));
    for (char c : s) {
        if (out.size() >= max) break;
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '.' || c == '_' || c == '-';
        out += keep ? c : '_';
    }
    return out;
}

Location ThumbStore::central(const catalog::PendingThumb& p, formats::ThumbCategory category) const {
    const auto& a = p.asset;
    std::string name = a.partial_hash.empty()
        ? std::format("{}-{}", formats::kind_name(p.kind), a.id)
        : a.partial_hash;
    std::string rel = std::format("{}/{}.png", formats::category_name(category), name);
    return {.storage = "central", .absolute = central_dir_ / rel, .stored_path = rel};
}

static bool writable_dir(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir, ec) && access(dir.c_str(), W_OK) == 0;
}

std::optional<Location> ThumbStore::sidecar(const catalog::PendingThumb& p) const {
    if (p.volume.is_readonly) return std::nullopt;
    const auto& a = p.asset;
    auto [container, member] = archive::split_virtual_path(a.relative_path);

    fs::path source;
    try {
        source = volume::absolute(p.volume, container);
    } catch (const PathTraversalError&) {
        return std::nullopt;
    }
    const fs::path dir = source.parent_path();
    if (!writable_dir(dir)) return std::nullopt;

    const std::string folder = a.folder_path.empty() ? "" : a.folder_path + "/";
    if (member.empty()) {
        std::string name = "." + source.filename().string() + ".thumb.png";
        return Location{.storage = "sidecar", .absolute = dir / name, .stored_path = folder + name};
    }

    std::string stem = safe_stem(fs::path(member).stem().string(), 40);
    std::string hash8 = a.partial_hash.substr(0, 8);
    std::string rel = std::format(".{}.dam/thumbs/{}_{}.thumb.png", source.filename().string(),
                                  stem, hash8);
    return Location{.storage = "sidecar", .absolute = dir / rel, .stored_path = folder + rel};
}

Location ThumbStore::location(const catalog::PendingThumb& p, formats::ThumbCategory category) const {
    if (mode_ == StorageMode::Auto) {
        if (auto loc = sidecar(p)) return *loc;
    }
    return central(p, category);
}

std::optional<fs::path> ThumbStore::resolve(const volume::Volume& v, const catalog::Asset& a) const {
    if (!a.thumb_path || !a.thumb_storage) return std::nullopt;
    if (*a.thumb_storage == "central") return central_dir_ / *a.thumb_path;
    try {
        return volume::absolute(v, *a.thumb_path);
    } catch (const PathTraversalError&) {
        return std::nullopt;
    }
}

} // namespace assetcat::thumbd
