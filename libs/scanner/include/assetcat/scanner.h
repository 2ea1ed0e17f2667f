#pragma once

#include "assetcat/catalog.h"
#include "assetcat/dedup.h"
#include "assetcat/formats.h"
#include "assetcat/volume.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace assetcat::scanner {

// Action is the outcome of one item passing through the scan state machine.
enum class Action {
    New,
    Unchanged,
    Update,
    Moved,
    Duplicate,    // reject policy: content already catalogued, no row written
    NewDuplicate, // warn policy: row written with is_duplicate=1
    Missing,      // reindex of a row whose file is gone
    Error,
    Skip,
};

const char* action_name(Action a);

struct ScanRequest {
    std::filesystem::path path;
    bool recursive = true;
    bool force = false;
    dedup::Policy duplicate_policy = dedup::Policy::Merge;
    int64_t volume_id = 0; // 0 = pick the volume containing path
};

// ScanResult holds counts from one scan. UNCHANGED items count as skipped,
// warn-policy duplicates as added.
struct ScanResult {
    int added = 0;
    int updated = 0;
    int moved = 0;
    int duplicates = 0;
    int skipped = 0;
    int missing = 0;
    int errors = 0;
    int total = 0;
    int64_t job_id = 0;
    bool cancelled = false;
};

struct VerifyResult {
    int verified = 0;
    int found = 0;
    int still_missing = 0;
    int64_t job_id = 0;
};

using ProgressFunc = std::function<void(const catalog::JobProgress&)>;

struct ScannerOptions {
    // Compare full hashes before merging or rejecting on a partial-hash match.
    bool verify_full_hash = true;
    // Job progress is written to the catalog every N items.
    int progress_every = 25;
    // Polled once per item; set from another thread to stop the scan.
    std::atomic<bool>* cancel = nullptr;
};

// Descriptor holds the searchable fields derived from a relative path.
struct Descriptor {
    std::string filename;
    std::string title;
    std::string collection;
    std::string creator;
};

// describe derives display metadata from a relative path:
// "Studio/Dragons/red_dragon.stl" -> title "red dragon", collection "Dragons",
// creator "Studio". Archive members use the archive stem as their collection.
Descriptor describe(const std::string& relative_path);

// asset_full_hash computes the SHA-256 of a row's content, extracting archive
// members as needed. Throws IOError when the file cannot be read.
std::string asset_full_hash(const volume::Volume& v, const catalog::Asset& a);

class Scanner {
public:
    Scanner(catalog::Catalog& cat, const formats::Registry& registry, ScannerOptions opts = {});

    // scan indexes a directory, a single file or a single archive.
    // Throws VolumeOfflineError when the volume mount is unreachable and
    // std::runtime_error when no registered volume contains the path.
    ScanResult scan(const ScanRequest& req, const ProgressFunc& progress = nullptr);

    // verify_volume re-checks the volume's missing and offline rows.
    VerifyResult verify_volume(int64_t volume_id);

    // check_volume probes the mount and records the result. When offline, the
    // volume's indexed rows become offline.
    volume::Status check_volume(int64_t volume_id);

    // reindex_asset re-runs the state machine for one row's path.
    Action reindex_asset(catalog::AssetKind kind, int64_t id, bool force);

    // full_hash_reader reads content of any row, resolving its volume on demand.
    dedup::FullHashReader full_hash_reader() const;

private:
    struct Item;
    struct Run;

    Action process(Run& run, const Item& item);
    Action guarded(Run& run, const std::string& path, const formats::FormatInfo* format,
                   const std::function<Action()>& body);
    void report(Run& run, const char* phase, size_t current, size_t total,
                const std::string& item);
    void record_failure(Run& run, const std::string& path, const formats::FormatInfo* format,
                        const char* type, const std::string& message);
    void discover(Run& run, const std::filesystem::path& target);
    void expand_archive(Run& run, const std::filesystem::path& file, const std::string& rel);
    void detect_missing(Run& run);
    bool cancelled(const Run& run) const;
    // row_full_hash returns the row's stored full hash or reads it from disk.
    // nullopt when the content cannot be read.
    std::optional<std::string> row_full_hash(const Run& run, const catalog::Asset& row) const;

    catalog::Catalog& cat_;
    const formats::Registry& registry_;
    ScannerOptions opts_;
};

} // namespace assetcat::scanner
