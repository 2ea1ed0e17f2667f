#include "assetcat/catalog.h"
#include "assetcat/log.h"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace assetcat::catalog {

// ---------------------------------------------------------------------------
// Names and time
// ---------------------------------------------------------------------------

const char* index_status_name(IndexStatus s) {
    switch (s) {
        case IndexStatus::Indexed: return "indexed";
        case IndexStatus::Missing: return "missing";
        case IndexStatus::Offline: return "offline";
        case IndexStatus::Error: return "error";
    }
    return "error";
}

IndexStatus parse_index_status(const std::string& s) {
    if (s == "indexed") return IndexStatus::Indexed;
    if (s == "missing") return IndexStatus::Missing;
    if (s == "offline") return IndexStatus::Offline;
    if (s == "error") return IndexStatus::Error;
    throw std::runtime_error(std::format("catalog: unknown index status '{}'", s));
}

const char* job_type_name(JobType t) {
    switch (t) {
        case JobType::Scan: return "scan";
        case JobType::Verify: return "verify";
        case JobType::Reindex: return "reindex";
        case JobType::Dedup: return "dedup";
    }
    return "scan";
}

JobType parse_job_type(const std::string& s) {
    if (s == "scan") return JobType::Scan;
    if (s == "verify") return JobType::Verify;
    if (s == "reindex") return JobType::Reindex;
    if (s == "dedup") return JobType::Dedup;
    throw std::runtime_error(std::format("catalog: unknown job type '{}'", s));
}

const char* job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Running: return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

JobStatus parse_job_status(const std::string& s) {
    if (s == "pending") return JobStatus::Pending;
    if (s == "running") return JobStatus::Running;
    if (s == "completed") return JobStatus::Completed;
    if (s == "failed") return JobStatus::Failed;
    if (s == "cancelled") return JobStatus::Cancelled;
    throw std::runtime_error(std::format("catalog: unknown job status '{}'", s));
}

static bool gmtime_utc(std::time_t tt, std::tm& tm_val) {
    return gmtime_r(&tt, &tm_val) != nullptr;
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_val{};
    if (!gmtime_utc(tt, tm_val))
        throw std::runtime_error("catalog: gmtime failed");
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                       tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec, ms);
}

int64_t now_unix() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static constexpr const char* schema_sql = R"SQL(
CREATE TABLE meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE volumes (
    id INTEGER PRIMARY KEY,
    label TEXT NOT NULL,
    mount_path TEXT NOT NULL UNIQUE,
    is_readonly INTEGER NOT NULL DEFAULT 0,
    status TEXT NOT NULL DEFAULT 'online'
        CHECK (status IN ('online', 'offline', 'error', 'disabled')),
    last_seen_at TEXT,
    last_indexed_at TEXT,
    created_at TEXT NOT NULL
);
CREATE TABLE scan_jobs (
    id INTEGER PRIMARY KEY,
    job_type TEXT NOT NULL CHECK (job_type IN ('scan', 'verify', 'reindex', 'dedup')),
    target_path TEXT NOT NULL DEFAULT '',
    volume_id INTEGER REFERENCES volumes(id) ON DELETE SET NULL,
    force_mode INTEGER NOT NULL DEFAULT 0,
    recursive INTEGER NOT NULL DEFAULT 1,
    duplicate_policy TEXT NOT NULL DEFAULT 'merge',
    status TEXT NOT NULL DEFAULT 'pending'
        CHECK (status IN ('pending', 'running', 'completed', 'failed', 'cancelled')),
    phase TEXT NOT NULL DEFAULT '',
    progress_current INTEGER NOT NULL DEFAULT 0,
    progress_total INTEGER NOT NULL DEFAULT 0,
    current_item TEXT NOT NULL DEFAULT '',
    items_processed INTEGER NOT NULL DEFAULT 0,
    items_skipped INTEGER NOT NULL DEFAULT 0,
    items_failed INTEGER NOT NULL DEFAULT 0,
    items_missing INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL,
    started_at TEXT,
    completed_at TEXT,
    error_message TEXT
);
CREATE TABLE job_errors (
    id INTEGER PRIMARY KEY,
    job_id INTEGER NOT NULL REFERENCES scan_jobs(id) ON DELETE CASCADE,
    asset_kind TEXT NOT NULL DEFAULT '',
    asset_id INTEGER,
    file_path TEXT NOT NULL,
    error_type TEXT NOT NULL,
    error_message TEXT NOT NULL,
    created_at TEXT NOT NULL
);
CREATE INDEX idx_job_errors_job ON job_errors(job_id);
)SQL";

// Documents and models share one shape; {0} is the table name.
static constexpr const char* asset_table_sql = R"SQL(
CREATE TABLE {0} (
    id INTEGER PRIMARY KEY,
    volume_id INTEGER NOT NULL REFERENCES volumes(id),
    relative_path TEXT NOT NULL,
    filename TEXT NOT NULL,
    format TEXT NOT NULL,
    title TEXT NOT NULL DEFAULT '',
    collection TEXT NOT NULL DEFAULT '',
    creator TEXT NOT NULL DEFAULT '',
    file_size INTEGER NOT NULL DEFAULT 0,
    file_mtime INTEGER NOT NULL DEFAULT 0,
    partial_hash TEXT NOT NULL,
    full_hash TEXT,
    archive_path TEXT,
    archive_member TEXT,
    folder_path TEXT NOT NULL DEFAULT '',
    index_status TEXT NOT NULL DEFAULT 'indexed'
        CHECK (index_status IN ('indexed', 'missing', 'offline', 'error')),
    last_seen_at TEXT NOT NULL,
    last_indexed_at TEXT NOT NULL,
    missing_since TEXT,
    thumb_storage TEXT,
    thumb_path TEXT,
    thumb_rendered_at INTEGER,
    thumb_source_mtime INTEGER,
    force_rerender INTEGER NOT NULL DEFAULT 0,
    is_duplicate INTEGER NOT NULL DEFAULT 0,
    duplicate_of_id INTEGER REFERENCES {0}(id),
    CHECK (is_duplicate = 0 OR duplicate_of_id IS NOT NULL)
);
CREATE UNIQUE INDEX idx_{0}_volume_path ON {0}(volume_id, relative_path)
    WHERE is_duplicate = 0 AND archive_member IS NULL;
CREATE INDEX idx_{0}_path ON {0}(volume_id, relative_path);
CREATE INDEX idx_{0}_partial_hash ON {0}(partial_hash);
CREATE INDEX idx_{0}_status ON {0}(volume_id, index_status);
CREATE INDEX idx_{0}_thumb ON {0}(force_rerender, thumb_rendered_at);

CREATE VIRTUAL TABLE {0}_fts USING fts5(
    filename, title, collection, creator,
    content='{0}', content_rowid='id'
);
CREATE TRIGGER {0}_ai AFTER INSERT ON {0} BEGIN
    INSERT INTO {0}_fts(rowid, filename, title, collection, creator)
    VALUES (new.id, new.filename, new.title, new.collection, new.creator);
END;
CREATE TRIGGER {0}_ad AFTER DELETE ON {0} BEGIN
    INSERT INTO {0}_fts({0}_fts, rowid, filename, title, collection, creator)
    VALUES ('delete', old.id, old.filename, old.title, old.collection, old.creator);
END;
CREATE TRIGGER {0}_au AFTER UPDATE OF filename, title, collection, creator ON {0} BEGIN
    INSERT INTO {0}_fts({0}_fts, rowid, filename, title, collection, creator)
    VALUES ('delete', old.id, old.filename, old.title, old.collection, old.creator);
    INSERT INTO {0}_fts(rowid, filename, title, collection, creator)
    VALUES (new.id, new.filename, new.title, new.collection, new.creator);
END;
)SQL";

static constexpr const char* schema_version = "1";

static constexpr AssetKind all_kinds[] = {AssetKind::Model, AssetKind::Document};

// ---------------------------------------------------------------------------
// SQLite helpers
// ---------------------------------------------------------------------------

class SqliteStmt {
public:
    SqliteStmt() = default;
    SqliteStmt(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
            throw std::runtime_error(
                std::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
    }
    ~SqliteStmt() { if (stmt_) sqlite3_finalize(stmt_); }
    SqliteStmt(const SqliteStmt&) = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;
    SqliteStmt(SqliteStmt&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    SqliteStmt& operator=(SqliteStmt&& o) noexcept {
        if (this != &o) { if (stmt_) sqlite3_finalize(stmt_); stmt_ = o.stmt_; o.stmt_ = nullptr; }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

    void reset() { sqlite3_reset(stmt_); sqlite3_clear_bindings(stmt_); }

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_int(int idx, int v) { sqlite3_bind_int(stmt_, idx, v); }
    void bind_int64(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
    void bind_double(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }
    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    void bind_opt_text(int idx, const std::optional<std::string>& v) {
        if (v) bind_text(idx, *v); else bind_null(idx);
    }
    void bind_opt_int64(int idx, const std::optional<int64_t>& v) {
        if (v) bind_int64(idx, *v); else bind_null(idx);
    }

    int step() { return sqlite3_step(stmt_); }

    // next steps once and returns true on a row, false when done.
    bool next() {
        int rc = step();
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(
            std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

    void exec() {
        int rc = step();
        if (rc != SQLITE_DONE && rc != SQLITE_ROW)
            throw std::runtime_error(
                std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Resets a cached statement on entry and exit so read locks are released.
class StmtScope {
public:
    explicit StmtScope(SqliteStmt& s) : s_(s) { s_.reset(); }
    ~StmtScope() { s_.reset(); }
    StmtScope(const StmtScope&) = delete;
    StmtScope& operator=(const StmtScope&) = delete;

private:
    SqliteStmt& s_;
};

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::format("sqlite3_exec: {}", msg));
    }
}

static sqlite3* open_db_handle(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error(std::format("sqlite3_open_v2({}): {}", path, msg));
    }
    return db;
}

static bool table_has_column(sqlite3* db, const char* table, const char* column) {
    std::string sql = std::format("PRAGMA table_info({})", table);
    SqliteStmt stmt(db, sql.c_str());
    while (stmt.step() == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(
            sqlite3_column_text(stmt.get(), 1));
        if (name && std::strcmp(name, column) == 0)
            return true;
    }
    return false;
}

static bool table_exists(sqlite3* db, const char* table) {
    SqliteStmt stmt(db,
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1");
    stmt.bind_text(1, table);
    return stmt.step() == SQLITE_ROW;
}

static int64_t table_count(sqlite3* db) {
    SqliteStmt stmt(db, "SELECT COUNT(*) FROM sqlite_master");
    stmt.next();
    return sqlite3_column_int64(stmt.get(), 0);
}

static std::string col_text(sqlite3_stmt* s, int i) {
    const char* v = reinterpret_cast<const char*>(sqlite3_column_text(s, i));
    return v ? v : "";
}

static std::optional<std::string> col_opt_text(sqlite3_stmt* s, int i) {
    if (sqlite3_column_type(s, i) == SQLITE_NULL) return std::nullopt;
    return col_text(s, i);
}

static std::optional<int64_t> col_opt_int64(sqlite3_stmt* s, int i) {
    if (sqlite3_column_type(s, i) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(s, i);
}

static void create_schema(sqlite3* db) {
    exec_sql(db, schema_sql);
    for (auto kind : all_kinds) {
        std::string_view table = formats::table_name(kind);
        auto sql = std::vformat(asset_table_sql, std::make_format_args(table));
        exec_sql(db, sql.c_str());
    }
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

// QueryDef is one statement of the catalog. Per-kind statements are expanded
// with {0} = table name and {1} = the asset column list.
struct QueryDef {
    const char* sql;
    bool per_kind;
};

static constexpr const char* asset_columns =
    "id, volume_id, relative_path, filename, format, title, collection, creator, "
    "file_size, file_mtime, partial_hash, full_hash, archive_path, archive_member, "
    "folder_path, index_status, last_seen_at, last_indexed_at, missing_since, "
    "thumb_storage, thumb_path, thumb_rendered_at, thumb_source_mtime, "
    "force_rerender, is_duplicate, duplicate_of_id";

// meta
static constexpr QueryDef q_meta_insert{
    "INSERT OR REPLACE INTO meta (key, value) VALUES (?1, ?2)", false};
static constexpr QueryDef q_meta_get{
    "SELECT value FROM meta WHERE key = ?1", false};

// volumes
static constexpr QueryDef q_volume_insert{
    "INSERT INTO volumes (label, mount_path, is_readonly, status, created_at) "
    "VALUES (?1, ?2, ?3, 'online', ?4)", false};
static constexpr QueryDef q_volume_get{
    "SELECT id, label, mount_path, is_readonly, status, last_seen_at, last_indexed_at "
    "FROM volumes WHERE id = ?1", false};
static constexpr QueryDef q_volume_list{
    "SELECT id, label, mount_path, is_readonly, status, last_seen_at, last_indexed_at "
    "FROM volumes ORDER BY id", false};
static constexpr QueryDef q_volume_set_status{
    "UPDATE volumes SET status = ?2 WHERE id = ?1", false};
static constexpr QueryDef q_volume_touch{
    "UPDATE volumes SET status = 'online', last_seen_at = ?2 "
    "WHERE id = ?1 AND status != 'disabled'", false};
static constexpr QueryDef q_volume_indexed{
    "UPDATE volumes SET last_indexed_at = ?2 WHERE id = ?1", false};
static constexpr QueryDef q_volume_delete{
    "DELETE FROM volumes WHERE id = ?1", false};
static constexpr QueryDef q_volume_count{
    "SELECT COUNT(*) FROM volumes", false};

// assets
static constexpr QueryDef q_asset_by_path{
    "SELECT {1} FROM {0} WHERE volume_id = ?1 AND relative_path = ?2 "
    "ORDER BY is_duplicate, id LIMIT 1", true};
static constexpr QueryDef q_asset_hash_match{
    "SELECT {1} FROM {0} WHERE partial_hash = ?1 AND is_duplicate = 0 "
    "AND NOT (volume_id = ?2 AND relative_path = ?3) "
    "ORDER BY last_seen_at DESC, id DESC LIMIT 1", true};
static constexpr QueryDef q_asset_get{
    "SELECT {1} FROM {0} WHERE id = ?1", true};
static constexpr QueryDef q_asset_insert{
    "INSERT INTO {0} (volume_id, relative_path, filename, format, title, collection, "
    "creator, file_size, file_mtime, partial_hash, full_hash, archive_path, "
    "archive_member, folder_path, index_status, last_seen_at, last_indexed_at, "
    "missing_since, thumb_storage, thumb_path, thumb_rendered_at, thumb_source_mtime, "
    "force_rerender, is_duplicate, duplicate_of_id) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, "
    "?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19, ?20, ?21, ?22, ?23, ?24, ?25)",
    true};
static constexpr QueryDef q_asset_update{
    "UPDATE {0} SET volume_id = ?2, relative_path = ?3, filename = ?4, format = ?5, "
    "title = ?6, collection = ?7, creator = ?8, file_size = ?9, file_mtime = ?10, "
    "partial_hash = ?11, full_hash = ?12, archive_path = ?13, archive_member = ?14, "
    "folder_path = ?15, index_status = ?16, last_seen_at = ?17, last_indexed_at = ?18, "
    "missing_since = ?19, thumb_storage = ?20, thumb_path = ?21, thumb_rendered_at = ?22, "
    "thumb_source_mtime = ?23, force_rerender = ?24, is_duplicate = ?25, "
    "duplicate_of_id = ?26 WHERE id = ?1", true};
static constexpr QueryDef q_asset_touch{
    "UPDATE {0} SET last_seen_at = ?2, index_status = 'indexed', missing_since = NULL "
    "WHERE id = ?1", true};
static constexpr QueryDef q_asset_set_status{
    "UPDATE {0} SET index_status = ?2 WHERE id = ?1", true};
static constexpr QueryDef q_asset_mark_missing{
    "UPDATE {0} SET index_status = 'missing', missing_since = COALESCE(missing_since, ?2) "
    "WHERE id = ?1", true};
static constexpr QueryDef q_asset_volume_status{
    "UPDATE {0} SET index_status = ?3 WHERE volume_id = ?1 AND index_status = ?2", true};
static constexpr QueryDef q_asset_list_volume{
    "SELECT {1} FROM {0} WHERE volume_id = ?1 AND (?2 IS NULL OR index_status = ?2) "
    "ORDER BY relative_path, id", true};
static constexpr QueryDef q_asset_count{
    "SELECT COUNT(*) FROM {0}", true};
static constexpr QueryDef q_asset_count_volume{
    "SELECT COUNT(*) FROM {0} WHERE volume_id = ?1", true};
static constexpr QueryDef q_asset_search{
    "SELECT {0}.id, {0}.volume_id, {0}.relative_path, {0}.filename, {0}.title, "
    "{0}.collection, {0}.creator, bm25({0}_fts) AS score "
    "FROM {0}_fts JOIN {0} ON {0}.id = {0}_fts.rowid "
    "WHERE {0}_fts MATCH ?1 AND {0}.is_duplicate = 0 "
    "ORDER BY score LIMIT ?2", true};
static constexpr QueryDef q_asset_stats{
    "SELECT COUNT(*), SUM(index_status = 'indexed'), SUM(index_status = 'missing'), "
    "SUM(index_status = 'offline'), SUM(index_status = 'error'), SUM(is_duplicate), "
    "SUM(thumb_path IS NOT NULL), COALESCE(SUM(file_size), 0) FROM {0}", true};

// thumbnails
static constexpr QueryDef q_thumb_pending{
    "SELECT {1} FROM {0} WHERE index_status = 'indexed' "
    "AND volume_id IN (SELECT id FROM volumes WHERE status = 'online') "
    "AND (thumb_rendered_at IS NULL OR thumb_source_mtime IS NULL "
    "OR thumb_source_mtime != file_mtime OR thumb_rendered_at < thumb_source_mtime "
    "OR force_rerender = 1) "
    "ORDER BY force_rerender DESC, id LIMIT ?1", true};
static constexpr QueryDef q_thumb_apply{
    "UPDATE {0} SET thumb_storage = ?2, thumb_path = ?3, thumb_rendered_at = ?4, "
    "thumb_source_mtime = ?5, force_rerender = 0 WHERE id = ?1", true};
static constexpr QueryDef q_thumb_force{
    "UPDATE {0} SET force_rerender = 1 WHERE id = ?1", true};

// dedup
static constexpr QueryDef q_dedup_hashes{
    "SELECT partial_hash FROM {0} WHERE is_duplicate = 0 AND index_status = 'indexed' "
    "GROUP BY partial_hash HAVING COUNT(*) > 1 ORDER BY partial_hash", true};
static constexpr QueryDef q_dedup_group{
    "SELECT {1} FROM {0} WHERE partial_hash = ?1 AND is_duplicate = 0 "
    "AND index_status = 'indexed' ORDER BY id", true};
static constexpr QueryDef q_dedup_full_hash{
    "UPDATE {0} SET full_hash = ?2 WHERE id = ?1", true};
static constexpr QueryDef q_dedup_mark{
    "UPDATE {0} SET is_duplicate = 1, duplicate_of_id = ?2 WHERE id = ?1", true};
static constexpr QueryDef q_dedup_repoint{
    "UPDATE {0} SET duplicate_of_id = ?2 WHERE duplicate_of_id = ?1", true};
static constexpr QueryDef q_dedup_dependents{
    "SELECT {1} FROM {0} WHERE duplicate_of_id = ?1 ORDER BY id", true};
static constexpr QueryDef q_dedup_clear{
    "UPDATE {0} SET is_duplicate = 0, duplicate_of_id = NULL WHERE id = ?1", true};

// jobs
static constexpr QueryDef q_job_insert{
    "INSERT INTO scan_jobs (job_type, target_path, volume_id, force_mode, recursive, "
    "duplicate_policy, status, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, 'pending', ?7)",
    false};
static constexpr QueryDef q_job_start{
    "UPDATE scan_jobs SET status = 'running', started_at = ?2 "
    "WHERE id = ?1 AND status = 'pending'", false};
static constexpr QueryDef q_job_progress{
    "UPDATE scan_jobs SET phase = ?2, progress_current = ?3, progress_total = ?4, "
    "current_item = ?5 WHERE id = ?1", false};
static constexpr QueryDef q_job_finish{
    "UPDATE scan_jobs SET status = CASE WHEN status = 'cancelled' THEN 'cancelled' ELSE ?2 END, "
    "phase = 'done', items_processed = ?3, items_skipped = ?4, items_failed = ?5, "
    "items_missing = ?6, completed_at = ?7, error_message = ?8 WHERE id = ?1", false};
static constexpr QueryDef q_job_cancel{
    "UPDATE scan_jobs SET status = 'cancelled' "
    "WHERE id = ?1 AND status IN ('pending', 'running')", false};
static constexpr QueryDef q_job_status{
    "SELECT status FROM scan_jobs WHERE id = ?1", false};
static constexpr QueryDef q_job_get{
    "SELECT id, job_type, target_path, volume_id, force_mode, recursive, duplicate_policy, "
    "status, phase, progress_current, progress_total, current_item, items_processed, "
    "items_skipped, items_failed, items_missing, created_at, started_at, completed_at, "
    "error_message FROM scan_jobs WHERE id = ?1", false};
static constexpr QueryDef q_job_list{
    "SELECT id, job_type, target_path, volume_id, force_mode, recursive, duplicate_policy, "
    "status, phase, progress_current, progress_total, current_item, items_processed, "
    "items_skipped, items_failed, items_missing, created_at, started_at, completed_at, "
    "error_message FROM scan_jobs ORDER BY id DESC LIMIT ?1", false};
static constexpr QueryDef q_job_count{
    "SELECT COUNT(*) FROM scan_jobs", false};
static constexpr QueryDef q_job_error_insert{
    "INSERT INTO job_errors (job_id, asset_kind, asset_id, file_path, error_type, "
    "error_message, created_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)", false};
static constexpr QueryDef q_job_error_list{
    "SELECT id, job_id, asset_kind, asset_id, file_path, error_type, error_message, "
    "created_at FROM job_errors WHERE job_id = ?1 ORDER BY id", false};

static constexpr const QueryDef* all_queries[] = {
    &q_meta_insert, &q_meta_get,
    &q_volume_insert, &q_volume_get, &q_volume_list, &q_volume_set_status,
    &q_volume_touch, &q_volume_indexed, &q_volume_delete, &q_volume_count,
    &q_asset_by_path, &q_asset_hash_match, &q_asset_get, &q_asset_insert,
    &q_asset_update, &q_asset_touch, &q_asset_set_status, &q_asset_mark_missing,
    &q_asset_volume_status, &q_asset_list_volume, &q_asset_count, &q_asset_count_volume,
    &q_asset_search, &q_asset_stats,
    &q_thumb_pending, &q_thumb_apply, &q_thumb_force,
    &q_dedup_hashes, &q_dedup_group, &q_dedup_full_hash, &q_dedup_mark, &q_dedup_repoint,
    &q_dedup_dependents, &q_dedup_clear,
    &q_job_insert, &q_job_start, &q_job_progress, &q_job_finish, &q_job_cancel,
    &q_job_status, &q_job_get, &q_job_list, &q_job_count,
    &q_job_error_insert, &q_job_error_list,
};

static std::string render_query(const QueryDef& q, AssetKind kind) {
    if (!q.per_kind) return q.sql;
    std::string_view table = formats::table_name(kind);
    std::string_view cols = asset_columns;
    return std::vformat(q.sql, std::make_format_args(table, cols));
}

// ---------------------------------------------------------------------------
// Row mapping
// ---------------------------------------------------------------------------

static Asset read_asset(sqlite3_stmt* s) {
    Asset a;
    a.id = sqlite3_column_int64(s, 0);
    a.volume_id = sqlite3_column_int64(s, 1);
    a.relative_path = col_text(s, 2);
    a.filename = col_text(s, 3);
    a.format = col_text(s, 4);
    a.title = col_text(s, 5);
    a.collection = col_text(s, 6);
    a.creator = col_text(s, 7);
    a.file_size = sqlite3_column_int64(s, 8);
    a.file_mtime = sqlite3_column_int64(s, 9);
    a.partial_hash = col_text(s, 10);
    a.full_hash = col_opt_text(s, 11);
    a.archive_path = col_opt_text(s, 12);
    a.archive_member = col_opt_text(s, 13);
    a.folder_path = col_text(s, 14);
    a.index_status = parse_index_status(col_text(s, 15));
    a.last_seen_at = col_text(s, 16);
    a.last_indexed_at = col_text(s, 17);
    a.missing_since = col_opt_text(s, 18);
    a.thumb_storage = col_opt_text(s, 19);
    a.thumb_path = col_opt_text(s, 20);
    a.thumb_rendered_at = col_opt_int64(s, 21);
    a.thumb_source_mtime = col_opt_int64(s, 22);
    a.force_rerender = sqlite3_column_int(s, 23) != 0;
    a.is_duplicate = sqlite3_column_int(s, 24) != 0;
    a.duplicate_of_id = col_opt_int64(s, 25);
    return a;
}

// Binds every asset column except id, starting at parameter first.
static void bind_asset(SqliteStmt& s, const Asset& a, int first) {
    int i = first;
    s.bind_int64(i++, a.volume_id);
    s.bind_text(i++, a.relative_path);
    s.bind_text(i++, a.filename);
    s.bind_text(i++, a.format);
    s.bind_text(i++, a.title);
    s.bind_text(i++, a.collection);
    s.bind_text(i++, a.creator);
    s.bind_int64(i++, a.file_size);
    s.bind_int64(i++, a.file_mtime);
    s.bind_text(i++, a.partial_hash);
    s.bind_opt_text(i++, a.full_hash);
    s.bind_opt_text(i++, a.archive_path);
    s.bind_opt_text(i++, a.archive_member);
    s.bind_text(i++, a.folder_path);
    s.bind_text(i++, index_status_name(a.index_status));
    s.bind_text(i++, a.last_seen_at);
    s.bind_text(i++, a.last_indexed_at);
    s.bind_opt_text(i++, a.missing_since);
    s.bind_opt_text(i++, a.thumb_storage);
    s.bind_opt_text(i++, a.thumb_path);
    s.bind_opt_int64(i++, a.thumb_rendered_at);
    s.bind_opt_int64(i++, a.thumb_source_mtime);
    s.bind_int(i++, a.force_rerender ? 1 : 0);
    s.bind_int(i++, a.is_duplicate ? 1 : 0);
    s.bind_opt_int64(i++, a.duplicate_of_id);
}

static volume::Volume read_volume(sqlite3_stmt* s) {
    volume::Volume v;
    v.id = sqlite3_column_int64(s, 0);
    v.label = col_text(s, 1);
    v.mount_path = col_text(s, 2);
    v.is_readonly = sqlite3_column_int(s, 3) != 0;
    v.status = volume::parse_status(col_text(s, 4));
    v.last_seen_at = col_text(s, 5);
    v.last_indexed_at = col_text(s, 6);
    return v;
}

static ScanJob read_job(sqlite3_stmt* s) {
    ScanJob j;
    j.id = sqlite3_column_int64(s, 0);
    j.type = parse_job_type(col_text(s, 1));
    j.target_path = col_text(s, 2);
    j.volume_id = col_opt_int64(s, 3);
    j.force = sqlite3_column_int(s, 4) != 0;
    j.recursive = sqlite3_column_int(s, 5) != 0;
    j.duplicate_policy = col_text(s, 6);
    j.status = parse_job_status(col_text(s, 7));
    j.progress.phase = col_text(s, 8);
    j.progress.current = sqlite3_column_int64(s, 9);
    j.progress.total = sqlite3_column_int64(s, 10);
    j.progress.current_item = col_text(s, 11);
    j.counters.processed = sqlite3_column_int64(s, 12);
    j.counters.skipped = sqlite3_column_int64(s, 13);
    j.counters.failed = sqlite3_column_int64(s, 14);
    j.counters.missing = sqlite3_column_int64(s, 15);
    j.created_at = col_text(s, 16);
    j.started_at = col_text(s, 17);
    j.completed_at = col_text(s, 18);
    j.error_message = col_text(s, 19);
    return j;
}

// Quotes each whitespace-separated term so user input never reaches the
// FTS5 query grammar; a trailing '*' on a term keeps prefix matching.
static std::string fts_query(const std::string& query) {
    std::istringstream in(query);
    std::string term;
    std::string out;
    while (in >> term) {
        bool prefix = term.size() > 1 && term.back() == '*';
        if (prefix) term.pop_back();
        std::string quoted = "\"";
        for (char c : term) {
            if (c == '"') quoted += "\"\"";
            else quoted += c;
        }
        quoted += '"';
        if (prefix) quoted += '*';
        if (!out.empty()) out += ' ';
        out += quoted;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct Catalog::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::recursive_mutex mu;
    int tx_depth = 0;
    std::map<std::pair<const QueryDef*, int>, SqliteStmt> cache;

    ~Impl() {
        cache.clear();
        if (db) sqlite3_close(db);
    }

    SqliteStmt& stmt(const QueryDef& q, AssetKind kind = AssetKind::Model) {
        auto key = std::make_pair(&q, q.per_kind ? static_cast<int>(kind) : -1);
        auto it = cache.find(key);
        if (it != cache.end()) return it->second;
        auto sql = render_query(q, kind);
        auto ins = cache.emplace(key, SqliteStmt(db, sql.c_str()));
        return ins.first->second;
    }

    int64_t changes() const { return sqlite3_changes64(db); }
};

Catalog::Catalog() : impl_(std::make_unique<Impl>()) {}
Catalog::~Catalog() = default;
Catalog::Catalog(Catalog&& other) noexcept = default;
Catalog& Catalog::operator=(Catalog&& other) noexcept = default;

const std::string& Catalog::path() const { return impl_->path; }

// ---------------------------------------------------------------------------
// Open / smoke test
// ---------------------------------------------------------------------------

void Catalog::smoke_test() {
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db(
        open_db_handle(":memory:", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE),
        &sqlite3_close);
    exec_sql(db.get(), "PRAGMA foreign_keys=ON");
    create_schema(db.get());

    int prepared = 0;
    for (const QueryDef* q : all_queries) {
        for (auto kind : all_kinds) {
            auto sql = render_query(*q, kind);
            try {
                SqliteStmt s(db.get(), sql.c_str());
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(
                    std::format("catalog smoke test: {}\n  in: {}", e.what(), sql));
            }
            ++prepared;
            if (!q->per_kind) break;
        }
    }
    log::write(log::Level::Debug, "catalog smoke test prepared", prepared, "statements");
}

static void validate_schema(sqlite3* db) {
    if (!table_exists(db, "meta"))
        throw std::runtime_error("catalog: not a valid database (no meta table)");

    {
        SqliteStmt stmt(db, "SELECT value FROM meta WHERE key = 'schema_version'");
        if (stmt.step() != SQLITE_ROW)
            throw std::runtime_error("catalog: database missing schema_version");
        const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        if (!ver || std::strcmp(ver, schema_version) != 0)
            throw std::runtime_error(
                std::format("catalog: schema version mismatch: expected {}, got {}",
                            schema_version, ver ? ver : "(null)"));
    }

    const char* required_tables[] = {
        "volumes", "documents", "models", "documents_fts", "models_fts",
        "scan_jobs", "job_errors",
    };
    for (const char* tbl : required_tables) {
        if (!table_exists(db, tbl))
            throw std::runtime_error(std::format("catalog: missing required table '{}'", tbl));
    }

    const char* asset_key_columns[] = {
        "partial_hash", "folder_path", "archive_member", "thumb_source_mtime",
        "force_rerender", "is_duplicate",
    };
    for (auto kind : all_kinds) {
        for (const char* col : asset_key_columns) {
            if (!table_has_column(db, formats::table_name(kind), col))
                throw std::runtime_error(
                    std::format("catalog: incompatible schema: '{}' table missing '{}' column",
                                formats::table_name(kind), col));
        }
    }
    if (!table_has_column(db, "scan_jobs", "phase"))
        throw std::runtime_error("catalog: incompatible schema: 'scan_jobs' table missing 'phase' column");
}

Catalog Catalog::open(const std::string& path) {
    static std::once_flag smoke_once;
    std::call_once(smoke_once, &Catalog::smoke_test);

    Catalog c;
    c.impl_->path = path;
    c.impl_->db = open_db_handle(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3* db = c.impl_->db;

    sqlite3_busy_timeout(db, 5000);
    exec_sql(db, "PRAGMA journal_mode=WAL");
    exec_sql(db, "PRAGMA synchronous=NORMAL");
    exec_sql(db, "PRAGMA foreign_keys=ON");

    if (table_count(db) == 0) {
        exec_sql(db, "BEGIN IMMEDIATE");
        try {
            create_schema(db);
            auto& meta = c.impl_->stmt(q_meta_insert);
            const std::pair<std::string, std::string> rows[] = {
                {"schema_version", schema_version},
                {"created_at", now_iso()},
            };
            for (const auto& [key, value] : rows) {
                StmtScope scope(meta);
                meta.bind_text(1, key);
                meta.bind_text(2, value);
                meta.exec();
            }
            exec_sql(db, "COMMIT");
        } catch (...) {
            exec_sql(db, "ROLLBACK");
            throw;
        }
        LOGI("catalog: created", path);
    } else {
        validate_schema(db);
    }
    return c;
}

void Catalog::transaction(const std::function<void()>& fn) {
    std::lock_guard lock(impl_->mu);
    if (impl_->tx_depth > 0) {
        ++impl_->tx_depth;
        try {
            fn();
        } catch (...) {
            --impl_->tx_depth;
            throw;
        }
        --impl_->tx_depth;
        return;
    }

    exec_sql(impl_->db, "BEGIN IMMEDIATE");
    impl_->tx_depth = 1;
    try {
        fn();
        exec_sql(impl_->db, "COMMIT");
        impl_->tx_depth = 0;
    } catch (...) {
        impl_->tx_depth = 0;
        exec_sql(impl_->db, "ROLLBACK");
        throw;
    }
}

// ---------------------------------------------------------------------------
// Volumes
// ---------------------------------------------------------------------------

static std::string normalize_mount(const std::string& mount_path) {
    fs::path p = fs::absolute(fs::path(mount_path)).lexically_normal();
    auto s = p.generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

int64_t Catalog::add_volume(const std::string& label, const std::string& mount_path,
                            bool readonly) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_insert);
    StmtScope scope(s);
    s.bind_text(1, label);
    s.bind_text(2, normalize_mount(mount_path));
    s.bind_int(3, readonly ? 1 : 0);
    s.bind_text(4, now_iso());
    s.exec();
    return sqlite3_last_insert_rowid(impl_->db);
}

std::optional<volume::Volume> Catalog::get_volume(int64_t id) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_get);
    StmtScope scope(s);
    s.bind_int64(1, id);
    if (!s.next()) return std::nullopt;
    return read_volume(s.get());
}

std::vector<volume::Volume> Catalog::list_volumes() const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_list);
    StmtScope scope(s);
    std::vector<volume::Volume> out;
    while (s.next()) out.push_back(read_volume(s.get()));
    return out;
}

void Catalog::set_volume_status(int64_t id, volume::Status status) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_set_status);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, volume::status_name(status));
    s.exec();
}

void Catalog::touch_volume(int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_touch);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, now_iso());
    s.exec();
}

void Catalog::mark_volume_indexed(int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_volume_indexed);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, now_iso());
    s.exec();
}

void Catalog::disable_volume(int64_t id) {
    if (!get_volume(id))
        throw std::runtime_error(std::format("catalog: no volume with id {}", id));
    set_volume_status(id, volume::Status::Disabled);
}

void Catalog::remove_volume(int64_t id) {
    std::lock_guard lock(impl_->mu);
    if (!get_volume(id))
        throw std::runtime_error(std::format("catalog: no volume with id {}", id));

    int64_t refs = 0;
    for (auto kind : all_kinds) {
        auto& s = impl_->stmt(q_asset_count_volume, kind);
        StmtScope scope(s);
        s.bind_int64(1, id);
        if (s.next()) refs += sqlite3_column_int64(s.get(), 0);
    }
    if (refs > 0)
        throw std::runtime_error(
            std::format("catalog: volume {} is referenced by {} asset(s); disable it instead", id, refs));

    auto& s = impl_->stmt(q_volume_delete);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.exec();
}

int64_t Catalog::set_volume_assets_status(int64_t volume_id, IndexStatus from, IndexStatus to) {
    std::lock_guard lock(impl_->mu);
    int64_t total = 0;
    transaction([&] {
        for (auto kind : all_kinds) {
            auto& s = impl_->stmt(q_asset_volume_status, kind);
            StmtScope scope(s);
            s.bind_int64(1, volume_id);
            s.bind_text(2, index_status_name(from));
            s.bind_text(3, index_status_name(to));
            s.exec();
            total += impl_->changes();
        }
    });
    return total;
}

// ---------------------------------------------------------------------------
// Assets
// ---------------------------------------------------------------------------

std::optional<Asset> Catalog::find_by_path(AssetKind kind, int64_t volume_id,
                                           const std::string& relative_path) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_by_path, kind);
    StmtScope scope(s);
    s.bind_int64(1, volume_id);
    s.bind_text(2, relative_path);
    if (!s.next()) return std::nullopt;
    return read_asset(s.get());
}

std::optional<Asset> Catalog::find_hash_match(AssetKind kind, const std::string& partial_hash,
                                              int64_t volume_id,
                                              const std::string& relative_path) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_hash_match, kind);
    StmtScope scope(s);
    s.bind_text(1, partial_hash);
    s.bind_int64(2, volume_id);
    s.bind_text(3, relative_path);
    if (!s.next()) return std::nullopt;
    return read_asset(s.get());
}

std::optional<Asset> Catalog::get(AssetKind kind, int64_t id) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_get, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    if (!s.next()) return std::nullopt;
    return read_asset(s.get());
}

int64_t Catalog::insert(AssetKind kind, const Asset& a) {
    std::lock_guard lock(impl_->mu);
    Asset row = a;
    row.last_seen_at = now_iso();
    row.last_indexed_at = row.last_seen_at;
    auto& s = impl_->stmt(q_asset_insert, kind);
    StmtScope scope(s);
    bind_asset(s, row, 1);
    s.exec();
    return sqlite3_last_insert_rowid(impl_->db);
}

void Catalog::update(AssetKind kind, const Asset& a) {
    std::lock_guard lock(impl_->mu);
    Asset row = a;
    row.last_seen_at = now_iso();
    row.last_indexed_at = row.last_seen_at;
    auto& s = impl_->stmt(q_asset_update, kind);
    StmtScope scope(s);
    s.bind_int64(1, row.id);
    bind_asset(s, row, 2);
    s.exec();
    if (impl_->changes() == 0)
        throw std::runtime_error(std::format("catalog: no {} with id {}",
                                             formats::kind_name(kind), row.id));
}

void Catalog::touch_seen(AssetKind kind, int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_touch, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, now_iso());
    s.exec();
}

void Catalog::set_index_status(AssetKind kind, int64_t id, IndexStatus status) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_set_status, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, index_status_name(status));
    s.exec();
}

int64_t Catalog::mark_missing(AssetKind kind, const std::vector<int64_t>& ids) {
    std::lock_guard lock(impl_->mu);
    int64_t marked = 0;
    if (ids.empty()) return 0;
    auto now = now_iso();
    transaction([&] {
        auto& s = impl_->stmt(q_asset_mark_missing, kind);
        for (int64_t id : ids) {
            StmtScope scope(s);
            s.bind_int64(1, id);
            s.bind_text(2, now);
            s.exec();
            marked += impl_->changes();
        }
    });
    return marked;
}

std::vector<Asset> Catalog::list_in_volume(AssetKind kind, int64_t volume_id,
                                           std::optional<IndexStatus> status) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_list_volume, kind);
    StmtScope scope(s);
    s.bind_int64(1, volume_id);
    if (status) s.bind_text(2, index_status_name(*status));
    else s.bind_null(2);
    std::vector<Asset> out;
    while (s.next()) out.push_back(read_asset(s.get()));
    return out;
}

int64_t Catalog::count(AssetKind kind) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_asset_count, kind);
    StmtScope scope(s);
    return s.next() ? sqlite3_column_int64(s.get(), 0) : 0;
}

std::vector<SearchHit> Catalog::search(const std::string& query, int limit) const {
    std::lock_guard lock(impl_->mu);
    std::vector<SearchHit> hits;
    auto match = fts_query(query);
    if (match.empty() || limit <= 0) return hits;

    for (auto kind : all_kinds) {
        auto& s = impl_->stmt(q_asset_search, kind);
        StmtScope scope(s);
        s.bind_text(1, match);
        s.bind_int(2, limit);
        while (s.next()) {
            auto* st = s.get();
            hits.push_back(SearchHit{
                .kind = kind,
                .id = sqlite3_column_int64(st, 0),
                .volume_id = sqlite3_column_int64(st, 1),
                .relative_path = col_text(st, 2),
                .filename = col_text(st, 3),
                .title = col_text(st, 4),
                .collection = col_text(st, 5),
                .creator = col_text(st, 6),
                .rank = sqlite3_column_double(st, 7),
            });
        }
    }
    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        return a.rank < b.rank;
    });
    if (hits.size() > static_cast<size_t>(limit)) hits.resize(static_cast<size_t>(limit));
    return hits;
}

// ---------------------------------------------------------------------------
// Thumbnails
// ---------------------------------------------------------------------------

std::vector<PendingThumb> Catalog::pending_thumbnails(int limit) const {
    std::lock_guard lock(impl_->mu);
    std::vector<PendingThumb> out;
    std::unordered_map<int64_t, volume::Volume> volumes;
    for (const auto& v : list_volumes()) volumes.emplace(v.id, v);

    for (auto kind : all_kinds) {
        auto& s = impl_->stmt(q_thumb_pending, kind);
        StmtScope scope(s);
        s.bind_int(1, limit);
        while (s.next()) {
            auto a = read_asset(s.get());
            auto it = volumes.find(a.volume_id);
            if (it == volumes.end()) continue;
            out.push_back(PendingThumb{.kind = kind, .asset = std::move(a), .volume = it->second});
        }
    }
    return out;
}

void Catalog::apply_thumbnail(AssetKind kind, int64_t id, const ThumbUpdate& t) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_thumb_apply, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, t.storage);
    s.bind_text(3, t.path);
    s.bind_int64(4, t.rendered_at);
    s.bind_int64(5, t.source_mtime);
    s.exec();
}

bool Catalog::request_rerender(AssetKind kind, int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_thumb_force, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.exec();
    return impl_->changes() > 0;
}

// ---------------------------------------------------------------------------
// Dedup
// ---------------------------------------------------------------------------

std::vector<CollisionGroup> Catalog::partial_hash_collisions(AssetKind kind) const {
    std::lock_guard lock(impl_->mu);
    std::vector<std::string> hashes;
    {
        auto& s = impl_->stmt(q_dedup_hashes, kind);
        StmtScope scope(s);
        while (s.next()) hashes.push_back(col_text(s.get(), 0));
    }

    std::vector<CollisionGroup> groups;
    auto& s = impl_->stmt(q_dedup_group, kind);
    for (auto& h : hashes) {
        StmtScope scope(s);
        s.bind_text(1, h);
        CollisionGroup g{.partial_hash = h, .rows = {}};
        while (s.next()) g.rows.push_back(read_asset(s.get()));
        if (g.rows.size() > 1) groups.push_back(std::move(g));
    }
    return groups;
}

void Catalog::set_full_hash(AssetKind kind, int64_t id, const std::string& full_hash) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_dedup_full_hash, kind);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, full_hash);
    s.exec();
}

void Catalog::mark_duplicate(AssetKind kind, int64_t id, int64_t canonical) {
    if (id == canonical)
        throw std::runtime_error(std::format("catalog: {} {} cannot duplicate itself",
                                             formats::kind_name(kind), id));
    std::lock_guard lock(impl_->mu);
    transaction([&] {
        {
            auto& s = impl_->stmt(q_dedup_mark, kind);
            StmtScope scope(s);
            s.bind_int64(1, id);
            s.bind_int64(2, canonical);
            s.exec();
        }
        auto& s = impl_->stmt(q_dedup_repoint, kind);
        StmtScope scope(s);
        s.bind_int64(1, id);
        s.bind_int64(2, canonical);
        s.exec();
    });
}

std::vector<Asset> Catalog::duplicates_of(AssetKind kind, int64_t canonical) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_dedup_dependents, kind);
    StmtScope scope(s);
    s.bind_int64(1, canonical);
    std::vector<Asset> out;
    while (s.next()) out.push_back(read_asset(s.get()));
    return out;
}

void Catalog::promote_duplicates(AssetKind kind, const std::vector<int64_t>& ids) {
    if (ids.empty()) return;
    std::lock_guard lock(impl_->mu);
    transaction([&] {
        {
            auto& s = impl_->stmt(q_dedup_clear, kind);
            StmtScope scope(s);
            s.bind_int64(1, ids.front());
            s.exec();
        }
        auto& s = impl_->stmt(q_dedup_mark, kind);
        for (size_t i = 1; i < ids.size(); ++i) {
            StmtScope scope(s);
            s.bind_int64(1, ids[i]);
            s.bind_int64(2, ids.front());
            s.exec();
        }
    });
}

// ---------------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------------

int64_t Catalog::create_job(const JobSpec& spec) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_insert);
    StmtScope scope(s);
    s.bind_text(1, job_type_name(spec.type));
    s.bind_text(2, spec.target_path);
    if (spec.volume_id > 0) s.bind_int64(3, spec.volume_id);
    else s.bind_null(3);
    s.bind_int(4, spec.force ? 1 : 0);
    s.bind_int(5, spec.recursive ? 1 : 0);
    s.bind_text(6, spec.duplicate_policy);
    s.bind_text(7, now_iso());
    s.exec();
    return sqlite3_last_insert_rowid(impl_->db);
}

void Catalog::start_job(int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_start);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, now_iso());
    s.exec();
}

void Catalog::update_job_progress(int64_t id, const JobProgress& p) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_progress);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, p.phase);
    s.bind_int64(3, p.current);
    s.bind_int64(4, p.total);
    s.bind_text(5, p.current_item);
    s.exec();
}

void Catalog::finish_job(int64_t id, JobStatus status, const JobCounters& c,
                         const std::string& error_message) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_finish);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.bind_text(2, job_status_name(status));
    s.bind_int64(3, c.processed);
    s.bind_int64(4, c.skipped);
    s.bind_int64(5, c.failed);
    s.bind_int64(6, c.missing);
    s.bind_text(7, now_iso());
    if (error_message.empty()) s.bind_null(8);
    else s.bind_text(8, error_message);
    s.exec();
}

bool Catalog::cancel_job(int64_t id) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_cancel);
    StmtScope scope(s);
    s.bind_int64(1, id);
    s.exec();
    return impl_->changes() > 0;
}

std::optional<JobStatus> Catalog::job_status(int64_t id) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_status);
    StmtScope scope(s);
    s.bind_int64(1, id);
    if (!s.next()) return std::nullopt;
    return parse_job_status(col_text(s.get(), 0));
}

std::optional<ScanJob> Catalog::get_job(int64_t id) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_get);
    StmtScope scope(s);
    s.bind_int64(1, id);
    if (!s.next()) return std::nullopt;
    return read_job(s.get());
}

std::vector<ScanJob> Catalog::list_jobs(int limit) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_list);
    StmtScope scope(s);
    s.bind_int(1, limit);
    std::vector<ScanJob> out;
    while (s.next()) out.push_back(read_job(s.get()));
    return out;
}

void Catalog::add_job_error(const JobError& e) {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_error_insert);
    StmtScope scope(s);
    s.bind_int64(1, e.job_id);
    s.bind_text(2, e.asset_kind);
    if (e.asset_id) s.bind_int64(3, *e.asset_id);
    else s.bind_null(3);
    s.bind_text(4, e.file_path);
    s.bind_text(5, e.error_type);
    s.bind_text(6, e.error_message);
    s.bind_text(7, e.created_at.empty() ? now_iso() : e.created_at);
    s.exec();
}

std::vector<JobError> Catalog::list_job_errors(int64_t job_id) const {
    std::lock_guard lock(impl_->mu);
    auto& s = impl_->stmt(q_job_error_list);
    StmtScope scope(s);
    s.bind_int64(1, job_id);
    std::vector<JobError> out;
    while (s.next()) {
        auto* st = s.get();
        out.push_back(JobError{
            .id = sqlite3_column_int64(st, 0),
            .job_id = sqlite3_column_int64(st, 1),
            .asset_kind = col_text(st, 2),
            .asset_id = col_opt_int64(st, 3),
            .file_path = col_text(st, 4),
            .error_type = col_text(st, 5),
            .error_message = col_text(st, 6),
            .created_at = col_text(st, 7),
        });
    }
    return out;
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

Stats Catalog::stats() const {
    std::lock_guard lock(impl_->mu);
    Stats st;

    auto meta = [&](const char* key) {
        auto& s = impl_->stmt(q_meta_get);
        StmtScope scope(s);
        s.bind_text(1, key);
        return s.next() ? col_text(s.get(), 0) : std::string();
    };
    st.schema_version = meta("schema_version");
    st.created_at = meta("created_at");

    {
        auto& s = impl_->stmt(q_volume_count);
        StmtScope scope(s);
        if (s.next()) st.volumes = sqlite3_column_int64(s.get(), 0);
    }
    {
        auto& s = impl_->stmt(q_job_count);
        StmtScope scope(s);
        if (s.next()) st.jobs = sqlite3_column_int64(s.get(), 0);
    }

    for (auto kind : all_kinds) {
        auto& s = impl_->stmt(q_asset_stats, kind);
        StmtScope scope(s);
        if (!s.next()) continue;
        auto* r = s.get();
        KindStats& k = kind == AssetKind::Model ? st.models : st.documents;
        k.total = sqlite3_column_int64(r, 0);
        k.indexed = sqlite3_column_int64(r, 1);
        k.missing = sqlite3_column_int64(r, 2);
        k.offline = sqlite3_column_int64(r, 3);
        k.error = sqlite3_column_int64(r, 4);
        k.duplicates = sqlite3_column_int64(r, 5);
        k.with_thumbnail = sqlite3_column_int64(r, 6);
        k.total_size = sqlite3_column_int64(r, 7);
    }
    return st;
}

} // namespace assetcat::catalog
