#pragma once

#include "assetcat/formats.h"
#include "assetcat/volume.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace assetcat::catalog {

using formats::AssetKind;

enum class IndexStatus { Indexed, Missing, Offline, Error };

const char* index_status_name(IndexStatus s);
IndexStatus parse_index_status(const std::string& s);

// now_iso returns the current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string now_iso();
// now_unix returns the current time in whole seconds.
int64_t now_unix();

// Asset is one row of the documents or models table.
struct Asset {
    int64_t id = 0;
    int64_t volume_id = 0;
    std::string relative_path;   // '/' separated; "a.zip::member" for archive members
    std::string filename;
    std::string format;
    std::string title;
    std::string collection;
    std::string creator;
    int64_t file_size = 0;
    int64_t file_mtime = 0;      // unix seconds
    std::string partial_hash;
    std::optional<std::string> full_hash;
    std::optional<std::string> archive_path;
    std::optional<std::string> archive_member;
    std::string folder_path;
    IndexStatus index_status = IndexStatus::Indexed;
    std::string last_seen_at;
    std::string last_indexed_at;
    std::optional<std::string> missing_since;
    std::optional<std::string> thumb_storage; // "central" or "sidecar"
    std::optional<std::string> thumb_path;
    std::optional<int64_t> thumb_rendered_at;
    std::optional<int64_t> thumb_source_mtime;
    bool force_rerender = false;
    bool is_duplicate = false;
    std::optional<int64_t> duplicate_of_id;
};

// ThumbUpdate holds the four thumbnail columns written together.
struct ThumbUpdate {
    std::string storage;
    std::string path;
    int64_t rendered_at = 0;
    int64_t source_mtime = 0;
};

// PendingThumb is a row that needs a (re)render, with its owning volume.
struct PendingThumb {
    AssetKind kind = AssetKind::Model;
    Asset asset;
    volume::Volume volume;
};

struct SearchHit {
    AssetKind kind = AssetKind::Model;
    int64_t id = 0;
    int64_t volume_id = 0;
    std::string relative_path;
    std::string filename;
    std::string title;
    std::string collection;
    std::string creator;
    double rank = 0;
};

struct CollisionGroup {
    std::string partial_hash;
    std::vector<Asset> rows; // ordered by id
};

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

enum class JobType { Scan, Verify, Reindex, Dedup };
enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

const char* job_type_name(JobType t);
JobType parse_job_type(const std::string& s);
const char* job_status_name(JobStatus s);
JobStatus parse_job_status(const std::string& s);

struct JobSpec {
    JobType type = JobType::Scan;
    std::string target_path;
    int64_t volume_id = 0; // 0 = none
    bool force = false;
    bool recursive = true;
    std::string duplicate_policy = "merge";
};

struct JobProgress {
    std::string phase;
    int64_t current = 0;
    int64_t total = 0;
    std::string current_item;
};

struct JobCounters {
    int64_t processed = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
    int64_t missing = 0;
};

struct ScanJob {
    int64_t id = 0;
    JobType type = JobType::Scan;
    std::string target_path;
    std::optional<int64_t> volume_id;
    bool force = false;
    bool recursive = true;
    std::string duplicate_policy;
    JobStatus status = JobStatus::Pending;
    JobProgress progress;
    JobCounters counters;
    std::string created_at;
    std::string started_at;
    std::string completed_at;
    std::string error_message;
};

struct JobError {
    int64_t id = 0;
    int64_t job_id = 0;
    std::string asset_kind;      // "model", "document" or "" when unknown
    std::optional<int64_t> asset_id;
    std::string file_path;
    std::string error_type;
    std::string error_message;
    std::string created_at;
};

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

struct KindStats {
    int64_t total = 0;
    int64_t indexed = 0;
    int64_t missing = 0;
    int64_t offline = 0;
    int64_t error = 0;
    int64_t duplicates = 0;
    int64_t with_thumbnail = 0;
    int64_t total_size = 0;
};

struct Stats {
    std::string schema_version;
    std::string created_at;
    int64_t volumes = 0;
    KindStats models;
    KindStats documents;
    int64_t jobs = 0;
};

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

// Catalog wraps one SQLite connection. All calls are serialised by an internal
// mutex, so one object may be shared between threads.
class Catalog {
public:
    ~Catalog();
    Catalog(Catalog&& other) noexcept;
    Catalog& operator=(Catalog&& other) noexcept;

    // open creates a new catalog at path, or validates an existing one.
    // The first open in a process also runs smoke_test().
    static Catalog open(const std::string& path);

    // smoke_test builds the schema in a fresh in-memory database and prepares
    // every statement the catalog uses. Throws std::runtime_error on failure.
    static void smoke_test();

    const std::string& path() const;

    // transaction runs fn inside BEGIN IMMEDIATE / COMMIT, rolling back if it throws.
    // Nested calls join the outer transaction.
    void transaction(const std::function<void()>& fn);

    // --- volumes ---

    int64_t add_volume(const std::string& label, const std::string& mount_path, bool readonly);
    std::optional<volume::Volume> get_volume(int64_t id) const;
    std::vector<volume::Volume> list_volumes() const;
    void set_volume_status(int64_t id, volume::Status status);
    // touch_volume records a successful online check.
    void touch_volume(int64_t id);
    void mark_volume_indexed(int64_t id);
    void disable_volume(int64_t id);
    // remove_volume deletes a volume no asset references.
    // Throws std::runtime_error naming the asset count otherwise.
    void remove_volume(int64_t id);
    // set_volume_assets_status moves every row of the volume in status from to to.
    int64_t set_volume_assets_status(int64_t volume_id, IndexStatus from, IndexStatus to);

    // --- assets ---

    // find_by_path prefers the canonical row when a duplicate shares the path.
    std::optional<Asset> find_by_path(AssetKind kind, int64_t volume_id,
                                      const std::string& relative_path) const;
    // find_hash_match returns the non-duplicate row with this partial hash seen most
    // recently (ties: highest id), excluding the row at (volume_id, relative_path).
    std::optional<Asset> find_hash_match(AssetKind kind, const std::string& partial_hash,
                                         int64_t volume_id,
                                         const std::string& relative_path) const;
    std::optional<Asset> get(AssetKind kind, int64_t id) const;
    // insert stamps last_seen_at and last_indexed_at and returns the new id.
    int64_t insert(AssetKind kind, const Asset& a);
    // update rewrites every column of row a.id and stamps both timestamps.
    void update(AssetKind kind, const Asset& a);
    // touch_seen records a sighting and restores a missing/offline/error row to indexed.
    void touch_seen(AssetKind kind, int64_t id);
    void set_index_status(AssetKind kind, int64_t id, IndexStatus status);
    // mark_missing sets index_status=missing and keeps the first missing_since.
    int64_t mark_missing(AssetKind kind, const std::vector<int64_t>& ids);
    std::vector<Asset> list_in_volume(AssetKind kind, int64_t volume_id,
                                      std::optional<IndexStatus> status = std::nullopt) const;
    int64_t count(AssetKind kind) const;
    // search runs an FTS5 MATCH over filename, title, collection and creator.
    std::vector<SearchHit> search(const std::string& query, int limit = 50) const;

    // --- thumbnails ---

    // pending_thumbnails lists indexed rows on online volumes whose thumbnail is
    // absent or stale, or that carry force_rerender. At most limit rows per kind.
    std::vector<PendingThumb> pending_thumbnails(int limit) const;
    // apply_thumbnail writes the four thumbnail columns and clears force_rerender.
    void apply_thumbnail(AssetKind kind, int64_t id, const ThumbUpdate& t);
    // request_rerender sets force_rerender. Returns false if the row does not exist.
    bool request_rerender(AssetKind kind, int64_t id);

    // --- dedup ---

    std::vector<CollisionGroup> partial_hash_collisions(AssetKind kind) const;
    void set_full_hash(AssetKind kind, int64_t id, const std::string& full_hash);
    // mark_duplicate flags id as a duplicate of canonical and re-points rows that
    // referenced id.
    void mark_duplicate(AssetKind kind, int64_t id, int64_t canonical);
    // duplicates_of lists the rows whose duplicate_of_id is canonical, by id.
    std::vector<Asset> duplicates_of(AssetKind kind, int64_t canonical) const;
    // promote_duplicates makes ids.front() a canonical row and points the rest
    // of ids at it, in one transaction.
    void promote_duplicates(AssetKind kind, const std::vector<int64_t>& ids);

    // --- jobs ---

    int64_t create_job(const JobSpec& spec);
    void start_job(int64_t id);
    void update_job_progress(int64_t id, const JobProgress& p);
    void finish_job(int64_t id, JobStatus status, const JobCounters& c,
                    const std::string& error_message = {});
    // cancel_job flags a pending or running job. Returns false if it already ended.
    bool cancel_job(int64_t id);
    std::optional<JobStatus> job_status(int64_t id) const;
    std::optional<ScanJob> get_job(int64_t id) const;
    std::vector<ScanJob> list_jobs(int limit = 50) const;
    void add_job_error(const JobError& e);
    std::vector<JobError> list_job_errors(int64_t job_id) const;

    Stats stats() const;

private:
    Catalog();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace assetcat::catalog
