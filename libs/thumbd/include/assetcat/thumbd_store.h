#pragma once

#include "assetcat/catalog.h"
#include "assetcat/formats.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace assetcat::thumbd {

enum class StorageMode { Central, Auto };

const char* storage_mode_name(StorageMode m);
// Throws std::runtime_error for anything but "central" and "auto".
StorageMode parse_storage_mode(std::string_view s);

// Location is where one row's thumbnail is written.
struct Location {
    std::string storage;                 // "central" or "sidecar"
    std::filesystem::path absolute;
    std::string stored_path;             // relative to central_dir or the volume mount
};

// ThumbStore maps rows to thumbnail files.
//
// central: <central_dir>/<3d|pdf|other>/<partial_hash>.png (the row id when the
// hash is unknown), shared by rows with the same content.
// auto: a sidecar next to the source, ".<filename>.thumb.png", or for archive
// members ".<archive>.dam/thumbs/<stem>_<hash8>.thumb.png" beside the archive.
// Read-only volumes and unwritable folders fall back to central.
class ThumbStore {
public:
    ThumbStore(std::filesystem::path central_dir, StorageMode mode);

    const std::filesystem::path& central_dir() const { return central_dir_; }
    StorageMode mode() const { return mode_; }

    Location location(const catalog::PendingThumb& p, formats::ThumbCategory category) const;

    // resolve maps a recorded thumbnail back to a file. nullopt when the row has
    // none or its path cannot be placed.
    std::optional<std::filesystem::path> resolve(const volume::Volume& v,
                                                 const catalog::Asset& a) const;

    // safe_stem keeps [A-Za-z0-9._-], replaces the rest with '_', and cuts to max.
    static std::string safe_stem(std::string_view s, size_t max);

private:
    Location central(const catalog::PendingThumb& p, formats::ThumbCategory category) const;
    std::optional<Location> sidecar(const catalog::PendingThumb& p) const;

    std::filesystem::path central_dir_;
    StorageMode mode_ = StorageMode::Central;
};

} // namespace assetcat::thumbd
