#include "assetcat/scanner.h"
#include "assetcat/archive.h"
#include "assetcat/errors.h"
#include "assetcat/hasher.h"
#include "assetcat/log.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace assetcat::scanner {

using catalog::AssetKind;
using catalog::IndexStatus;

const char* action_name(Action a) {
    switch (a) {
    case Action::New: return "new";
    case Action::Unchanged: return "unchanged";
    case Action::Update: return "update";
    case Action::Moved: return "moved";
    case Action::Duplicate: return "duplicate";
    case Action::NewDuplicate: return "new-duplicate";
    case Action::Missing: return "missing";
    case Action::Error: return "error";
    case Action::Skip: return "skip";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Path metadata
// ---------------------------------------------------------------------------

static std::string titleize(const std::string& stem) {
    std::string out;
    bool space = false;
    for (char c : stem) {
        if (c == '_' || c == '-' || c == ' ') {
            space = !out.empty();
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += c;
    }
    return out.empty() ? stem : out;
}

static std::vector<std::string> split_folder(const std::string& folder) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < folder.size()) {
        size_t end = folder.find('/', start);
        if (end == std::string::npos) end = folder.size();
        if (end > start) parts.push_back(folder.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

Descriptor describe(const std::string& relative_path) {
    auto [container, member] = archive::split_virtual_path(relative_path);
    const fs::path p(member.empty() ? container : member);

    Descriptor d;
    d.filename = p.filename().string();
    d.title = titleize(p.stem().string());

    auto parts = split_folder(volume::folder_path(relative_path));
    if (!member.empty()) {
        d.collection = fs::path(container).stem().string();
        if (!parts.empty()) d.creator = parts.front();
    } else {
        if (!parts.empty()) d.collection = parts.back();
        if (parts.size() >= 2) d.creator = parts.front();
    }
    return d;
}

// ---------------------------------------------------------------------------
// Content access
// ---------------------------------------------------------------------------

static std::ifstream open_container(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in)
        throw IOError(std::format("{}: cannot open archive", file.string()));
    return in;
}

// Members are hashed as they inflate; none is held in memory whole.
static std::string member_partial_hash(const fs::path& file, const archive::Member& m) {
    auto in = open_container(file);
    hasher::PartialHasher h(m.size);
    archive::extract_each(in, m, [&](const char* data, size_t n) { h.update(data, n); });
    return h.finish();
}

static std::string member_full_hash(const fs::path& file, const archive::Member& m) {
    auto in = open_container(file);
    hasher::FullHasher h;
    archive::extract_each(in, m, [&](const char* data, size_t n) { h.update(data, n); });
    return h.finish();
}

std::string asset_full_hash(const volume::Volume& v, const catalog::Asset& a) {
    auto [container, member] = archive::split_virtual_path(a.relative_path);
    const fs::path file = volume::absolute(v, container);
    if (member.empty()) return hasher::full_hash(file);

    auto arc = archive::list(file);
    for (const auto& m : arc.members) {
        if (m.is_dir || m.name != member) continue;
        return member_full_hash(file, m);
    }
    throw IOError(std::format("{}: member '{}' not found", file.string(), member));
}

namespace {

// SpillStream reads a member extracted to a scratch file and removes the file
// when destroyed.
class SpillStream : public std::ifstream {
public:
    explicit SpillStream(fs::path path) : path_(std::move(path)) {}
    ~SpillStream() override {
        close();
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace

// open_member yields a member's whole content. Small members are inflated into
// memory, larger ones spill to a scratch file.
static std::unique_ptr<std::istream> open_member(const fs::path& file, const archive::Member& m) {
    auto in = open_container(file);
    if (m.size <= formats::max_validation_bytes) {
        auto bytes = archive::extract_head(in, m, static_cast<size_t>(m.size));
        return std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()));
    }

    std::random_device rd;
    auto spill = std::make_unique<SpillStream>(
        fs::temp_directory_path() / std::format("assetcat-scan-{}{}", rd(),
                                                fs::path(m.name).extension().string()));
    {
        std::ofstream out(spill->path(), std::ios::binary);
        if (!out)
            throw IOError(std::format("{}: cannot create", spill->path().string()));
        archive::extract_to(in, m, out);
        out.close();
        if (!out)
            throw IOError(std::format("{}: write failed", spill->path().string()));
    }
    spill->open(spill->path(), std::ios::binary);
    if (!*spill)
        throw IOError(std::format("{}: cannot reopen", spill->path().string()));
    return spill;
}

// Members named with an absolute path or a ".." component would escape the
// archive's namespace.
static bool unsafe_member_name(const std::string& name) {
    if (name.starts_with('/')) return true;
    for (const auto& part : split_folder(name))
        if (part == "..") return true;
    return false;
}

// Dot-leading components and macOS resource forks are not assets.
static bool hidden_member(const std::string& name) {
    for (const auto& part : split_folder(name))
        if (part.starts_with('.') || part == "__MACOSX") return true;
    return false;
}

// ---------------------------------------------------------------------------
// Scan state
// ---------------------------------------------------------------------------

struct Scanner::Item {
    std::string rel;
    fs::path file;                 // on-disk file; the container for archive members
    const formats::FormatInfo* format = nullptr;
    uint64_t size = 0;
    int64_t mtime = 0;
    std::shared_ptr<const archive::Archive> container;
    const archive::Member* member = nullptr;
    std::string archive_rel;
};

enum class Scope { Directory, File, Gone };

struct Scanner::Run {
    volume::Volume vol;
    int64_t job_id = 0;
    bool force = false;
    bool recursive = true;
    dedup::Policy policy = dedup::Policy::Merge;
    std::string target_rel;
    Scope scope = Scope::Directory;
    std::vector<Item> items;
    std::set<std::pair<AssetKind, int64_t>> seen;
    ScanResult result;
    ProgressFunc progress;

    void mark_seen(AssetKind kind, int64_t id) { seen.emplace(kind, id); }
    bool was_seen(AssetKind kind, int64_t id) const { return seen.contains({kind, id}); }

    bool in_scope(const catalog::Asset& a) const {
        switch (scope) {
        case Scope::Directory:
            return volume::is_within(a.relative_path, target_rel, recursive);
        case Scope::File:
            return a.relative_path == target_rel || a.archive_path == target_rel;
        case Scope::Gone:
            return a.relative_path == target_rel || a.archive_path == target_rel ||
                   volume::is_within(a.relative_path, target_rel, true);
        }
        return false;
    }
};

static catalog::JobCounters counters_of(const ScanResult& r) {
    return {
        .processed = r.total,
        .skipped = r.skipped + r.duplicates,
        .failed = r.errors,
        .missing = r.missing,
    };
}

static void count(ScanResult& r, Action a) {
    switch (a) {
    case Action::New:
    case Action::NewDuplicate: r.added++; break;
    case Action::Update: r.updated++; break;
    case Action::Moved: r.moved++; break;
    case Action::Duplicate: r.duplicates++; break;
    case Action::Unchanged:
    case Action::Skip: r.skipped++; break;
    case Action::Missing: r.missing++; break;
    case Action::Error: break; // counted by record_failure
    }
}

static void describe_into(catalog::Asset& a, const std::string& rel, const formats::FormatInfo& f,
                          uint64_t size, int64_t mtime, const std::string& archive_rel,
                          const archive::Member* member) {
    auto d = describe(rel);
    a.relative_path = rel;
    a.filename = d.filename;
    a.title = d.title;
    a.collection = d.collection;
    a.creator = d.creator;
    a.format = f.id;
    a.file_size = static_cast<int64_t>(size);
    a.file_mtime = mtime;
    a.folder_path = volume::folder_path(rel);
    if (member) {
        a.archive_path = archive_rel;
        a.archive_member = member->name;
    } else {
        a.archive_path.reset();
        a.archive_member.reset();
    }
    a.index_status = IndexStatus::Indexed;
    a.missing_since.reset();
}

// ---------------------------------------------------------------------------
// Scanner
// ---------------------------------------------------------------------------

Scanner::Scanner(catalog::Catalog& cat, const formats::Registry& registry, ScannerOptions opts)
    : cat_(cat), registry_(registry), opts_(opts) {}

dedup::FullHashReader Scanner::full_hash_reader() const {
    return [this](const catalog::Asset& a) {
        auto v = cat_.get_volume(a.volume_id);
        if (!v)
            throw IOError(std::format("volume {} not found", a.volume_id));
        return asset_full_hash(*v, a);
    };
}

bool Scanner::cancelled(const Run& run) const {
    if (opts_.cancel && opts_.cancel->load()) return true;
    return cat_.job_status(run.job_id) == catalog::JobStatus::Cancelled;
}

void Scanner::report(Run& run, const char* phase, size_t current, size_t total,
                     const std::string& item) {
    catalog::JobProgress p{
        .phase = phase,
        .current = static_cast<int64_t>(current),
        .total = static_cast<int64_t>(total),
        .current_item = item,
    };
    if (run.progress) run.progress(p);
    const size_t every = static_cast<size_t>(std::max(1, opts_.progress_every));
    if (current % every == 0 || current == total)
        cat_.update_job_progress(run.job_id, p);
}

void Scanner::record_failure(Run& run, const std::string& path, const formats::FormatInfo* format,
                             const char* type, const std::string& message) {
    LOGW("scan:", type, path, "-", message);
    run.result.errors++;

    catalog::JobError e{
        .job_id = run.job_id,
        .asset_kind = format ? formats::kind_name(format->kind) : "",
        .file_path = path,
        .error_type = type,
        .error_message = message,
    };
    if (format) {
        // A known row that can no longer be read is kept, flagged, and not
        // reported missing.
        if (auto row = cat_.find_by_path(format->kind, run.vol.id, path)) {
            cat_.set_index_status(format->kind, row->id, IndexStatus::Error);
            run.mark_seen(format->kind, row->id);
            e.asset_id = row->id;
        }
    }
    cat_.add_job_error(e);
}

Action Scanner::guarded(Run& run, const std::string& path, const formats::FormatInfo* format,
                        const std::function<Action()>& body) {
    try {
        return body();
    } catch (const UnsupportedFormatError& e) {
        LOGI("scan: skipping", path, "-", e.what());
        return Action::Skip;
    } catch (const PathTraversalError& e) {
        record_failure(run, path, format, error_type_name<PathTraversalError>(), e.what());
    } catch (const ValidationError& e) {
        record_failure(run, path, format, error_type_name<ValidationError>(), e.what());
    } catch (const IOError& e) {
        record_failure(run, path, format, error_type_name<IOError>(), e.what());
    } catch (const fs::filesystem_error& e) {
        record_failure(run, path, format, error_type_name<IOError>(), e.what());
    }
    return Action::Error;
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

void Scanner::expand_archive(Run& run, const fs::path& file, const std::string& rel) {
    std::shared_ptr<archive::Archive> arc;
    int64_t mtime = 0;

    auto keep_members = [&](const char* type, const std::string& message) {
        run.result.total++;
        record_failure(run, rel, nullptr, type, message);
        for (auto kind : {AssetKind::Model, AssetKind::Document}) {
            for (const auto& a : cat_.list_in_volume(kind, run.vol.id)) {
                if (a.archive_path != rel) continue;
                cat_.set_index_status(kind, a.id, IndexStatus::Error);
                run.mark_seen(kind, a.id);
            }
        }
    };

    try {
        mtime = volume::file_mtime(file);
        arc = std::make_shared<archive::Archive>(archive::list(file));
    } catch (const UnsupportedFormatError& e) {
        LOGI("scan: skipping archive", rel, "-", e.what());
        run.result.total++;
        run.result.skipped++;
        return;
    } catch (const IOError& e) {
        keep_members(error_type_name<IOError>(), e.what());
        return;
    } catch (const fs::filesystem_error& e) {
        keep_members(error_type_name<IOError>(), e.what());
        return;
    }

    for (const auto& m : arc->members) {
        if (m.is_dir || hidden_member(m.name)) continue;
        const auto* fmt = registry_.for_path(m.name);
        if (!fmt || !fmt->allowed_in_archive) continue;

        auto vpath = archive::virtual_path(rel, m.name);
        if (unsafe_member_name(m.name)) {
            run.result.total++;
            record_failure(run, vpath, fmt, error_type_name<PathTraversalError>(),
                           std::format("archive member '{}' escapes its container", m.name));
            continue;
        }
        run.items.push_back(Item{
            .rel = std::move(vpath),
            .file = file,
            .format = fmt,
            .size = m.size,
            .mtime = mtime,
            .container = arc,
            .member = &m,
            .archive_rel = rel,
        });
    }
}

void Scanner::discover(Run& run, const fs::path& target) {
    std::vector<fs::path> files;
    if (run.scope == Scope::File) {
        files.push_back(target);
    } else {
        const auto opts = fs::directory_options::skip_permission_denied;
        std::error_code ec;
        auto consider = [&](const fs::directory_entry& entry) {
            if (entry.path().filename().string().starts_with('.')) return false;
            if (entry.is_regular_file(ec)) files.push_back(entry.path());
            return true;
        };
        if (run.recursive) {
            fs::recursive_directory_iterator it(target, opts), end;
            for (; it != end; ++it) {
                if (!consider(*it) && it->is_directory(ec)) it.disable_recursion_pending();
            }
        } else {
            for (const auto& entry : fs::directory_iterator(target, opts)) consider(entry);
        }
        std::sort(files.begin(), files.end());
    }

    for (const auto& f : files) {
        std::string rel;
        try {
            rel = volume::resolve(run.vol, f);
        } catch (const PathTraversalError& e) {
            run.result.total++;
            record_failure(run, f.string(), registry_.for_path(f),
                           error_type_name<PathTraversalError>(), e.what());
            continue;
        }

        if (registry_.is_archive(f)) {
            expand_archive(run, f, rel);
            continue;
        }
        const auto* fmt = registry_.for_path(f);
        if (!fmt) continue;

        Item item{.rel = rel, .file = f, .format = fmt};
        try {
            item.size = fs::file_size(f);
            item.mtime = volume::file_mtime(f);
        } catch (const fs::filesystem_error& e) {
            run.result.total++;
            record_failure(run, rel, fmt, error_type_name<IOError>(), e.what());
            continue;
        }
        run.items.push_back(std::move(item));
    }

    std::sort(run.items.begin(), run.items.end(),
              [](const Item& a, const Item& b) { return a.rel < b.rel; });
}

// ---------------------------------------------------------------------------
// State machine
// ---------------------------------------------------------------------------

static formats::ValidationInput member_input(const archive::Archive& arc, const fs::path& file,
                                             const archive::Member& m) {
    formats::ValidationInput in;
    in.name = fs::path(m.name).filename().string();
    in.read = [&file, &m](size_t max) {
        auto container = open_container(file);
        return archive::extract_head(container, m, max);
    };
    in.open = [&file, &m]() { return open_member(file, m); };
    in.companion_exists = [&arc, dir = fs::path(m.name).parent_path()](const std::string& rel) {
        auto want = (dir / fs::path(rel)).lexically_normal().generic_string();
        return std::any_of(arc.members.begin(), arc.members.end(),
                           [&](const archive::Member& o) { return !o.is_dir && o.name == want; });
    };
    return in;
}

std::optional<std::string> Scanner::row_full_hash(const Run& run, const catalog::Asset& row) const {
    if (row.full_hash) return row.full_hash;
    // The row's file may already be gone (the usual move case); callers then
    // let the partial match stand.
    auto v = row.volume_id == run.vol.id ? std::optional(run.vol) : cat_.get_volume(row.volume_id);
    if (!v || v->status != volume::Status::Online) return std::nullopt;
    try {
        return asset_full_hash(*v, row);
    } catch (const std::runtime_error& e) {
        LOGD("scan: cannot verify", row.relative_path, "-", e.what());
        return std::nullopt;
    }
}

Action Scanner::process(Run& run, const Item& item) {
    const auto kind = item.format->kind;
    auto existing = cat_.find_by_path(kind, run.vol.id, item.rel);

    if (existing && !run.force && existing->file_size == static_cast<int64_t>(item.size) &&
        existing->file_mtime == item.mtime) {
        cat_.touch_seen(kind, existing->id);
        run.mark_seen(kind, existing->id);
        return Action::Unchanged;
    }

    if (item.member) {
        registry_.require_valid(*item.format, member_input(*item.container, item.file, *item.member));
    } else {
        registry_.require_valid(*item.format, formats::file_input(item.file));
    }

    const std::string partial = item.member ? member_partial_hash(item.file, *item.member)
                                            : hasher::partial_hash(item.file);

    std::optional<std::string> own_full;
    auto item_full_hash = [&]() -> const std::string& {
        if (!own_full)
            own_full = item.member ? member_full_hash(item.file, *item.member)
                                   : hasher::full_hash(item.file);
        return *own_full;
    };
    // Equal partial hashes count as equal content unless full hashes say otherwise.
    auto same_content = [&](const catalog::Asset& other) {
        if (other.partial_hash != partial) return false;
        if (!opts_.verify_full_hash) return true;
        auto theirs = row_full_hash(run, other);
        return !theirs || *theirs == item_full_hash();
    };

    if (existing) {
        auto a = *existing;
        describe_into(a, item.rel, *item.format, item.size, item.mtime, item.archive_rel, item.member);
        a.partial_hash = partial;
        a.force_rerender = true;

        // Duplicate links are re-resolved against the new content. Rows that
        // pointed here and no longer match are released; a row that now matches
        // another takes its remaining duplicates along.
        std::vector<int64_t> released;
        if (!a.is_duplicate) {
            for (const auto& dep : cat_.duplicates_of(kind, a.id)) {
                if (!same_content(dep)) released.push_back(dep.id);
            }
        }
        auto match = cat_.find_hash_match(kind, partial, run.vol.id, item.rel);
        if (match && (match->id == a.id || !same_content(*match))) match.reset();
        a.is_duplicate = false;
        a.duplicate_of_id.reset();
        // A changed size or mtime can hide an edit outside the sampled ranges;
        // only a full hash read during this pass is kept.
        a.full_hash = own_full;

        cat_.transaction([&] {
            cat_.update(kind, a);
            cat_.promote_duplicates(kind, released);
            if (match) cat_.mark_duplicate(kind, a.id, match->id);
        });
        run.mark_seen(kind, a.id);
        if (!released.empty())
            LOGI("scan:", item.rel, "changed;", released.size(), "former duplicates now stand alone");
        if (match)
            LOGW("scan:", item.rel, "now duplicates", match->relative_path);
        LOGD("scan: updated", item.rel);
        return Action::Update;
    }

    auto match = cat_.find_hash_match(kind, partial, run.vol.id, item.rel);
    dedup::Candidate cand{.partial_hash = partial};
    std::optional<dedup::Match> m;
    bool match_hash_computed = false;
    if (match) {
        m = dedup::Match{.id = match->id, .partial_hash = match->partial_hash,
                         .full_hash = match->full_hash};
        if (opts_.verify_full_hash && run.policy != dedup::Policy::Warn) {
            cand.full_hash = item_full_hash();
            if (!m->full_hash) {
                m->full_hash = row_full_hash(run, *match);
                match_hash_computed = m->full_hash.has_value();
            }
        }
    }

    auto res = dedup::resolve(cand, m, run.policy);
    if (match_hash_computed && res.action != dedup::Action::Moved)
        cat_.set_full_hash(kind, match->id, *m->full_hash);

    auto fresh = [&] {
        catalog::Asset a;
        a.volume_id = run.vol.id;
        describe_into(a, item.rel, *item.format, item.size, item.mtime, item.archive_rel, item.member);
        a.partial_hash = partial;
        a.full_hash = cand.full_hash;
        return a;
    };

    switch (res.action) {
    case dedup::Action::New: {
        auto id = cat_.insert(kind, fresh());
        run.mark_seen(kind, id);
        LOGD("scan: new", item.rel, "id", id);
        return Action::New;
    }
    case dedup::Action::Moved: {
        auto a = *match;
        const std::string from = a.relative_path;
        a.volume_id = run.vol.id;
        describe_into(a, item.rel, *item.format, item.size, item.mtime, item.archive_rel, item.member);
        if (cand.full_hash) a.full_hash = cand.full_hash;
        if (a.thumb_storage == "sidecar") a.force_rerender = true;
        cat_.update(kind, a);
        run.mark_seen(kind, a.id);
        LOGI("scan: moved", from, "->", item.rel);
        return Action::Moved;
    }
    case dedup::Action::Duplicate:
        LOGI("scan: rejected", item.rel, "- duplicate of", match->relative_path);
        return Action::Duplicate;
    case dedup::Action::NewDuplicate: {
        auto a = fresh();
        a.is_duplicate = true;
        a.duplicate_of_id = res.target_id;
        auto id = cat_.insert(kind, a);
        run.mark_seen(kind, id);
        LOGW("scan:", item.rel, "duplicates", match->relative_path);
        return Action::NewDuplicate;
    }
    }
    return Action::Error;
}

void Scanner::detect_missing(Run& run) {
    report(run, "missing", run.items.size(), run.items.size(), run.target_rel);
    for (auto kind : {AssetKind::Model, AssetKind::Document}) {
        std::vector<int64_t> ids;
        for (const auto& a : cat_.list_in_volume(kind, run.vol.id, IndexStatus::Indexed)) {
            if (!run.was_seen(kind, a.id) && run.in_scope(a)) ids.push_back(a.id);
        }
        if (ids.empty()) continue;
        auto n = cat_.mark_missing(kind, ids);
        run.result.missing += static_cast<int>(n);
        LOGI("scan:", n, formats::table_name(kind), "marked missing");
    }
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------

ScanResult Scanner::scan(const ScanRequest& req, const ProgressFunc& progress) {
    Run run;
    if (req.volume_id != 0) {
        auto v = cat_.get_volume(req.volume_id);
        if (!v)
            throw std::runtime_error(std::format("volume {} not found", req.volume_id));
        run.vol = *v;
    } else {
        auto volumes = cat_.list_volumes();
        const auto* v = volume::find_volume_for_path(volumes, req.path);
        if (!v)
            throw std::runtime_error(std::format("{} is not inside any registered volume",
                                                 req.path.string()));
        run.vol = *v;
    }
    if (run.vol.status == volume::Status::Disabled)
        throw std::runtime_error(std::format("volume '{}' is disabled", run.vol.label));

    run.force = req.force;
    run.recursive = req.recursive;
    run.policy = req.duplicate_policy;
    run.progress = progress;
    run.job_id = cat_.create_job({
        .type = catalog::JobType::Scan,
        .target_path = fs::absolute(req.path).lexically_normal().string(),
        .volume_id = run.vol.id,
        .force = req.force,
        .recursive = req.recursive,
        .duplicate_policy = dedup::policy_name(req.duplicate_policy),
    });
    run.result.job_id = run.job_id;
    cat_.start_job(run.job_id);

    try {
        if (check_volume(run.vol.id) != volume::Status::Online)
            throw VolumeOfflineError(std::format("volume '{}' is offline ({})", run.vol.label,
                                                 run.vol.mount_path),
                                     run.vol.id);

        run.target_rel = volume::resolve(run.vol, req.path);
        std::error_code ec;
        auto st = fs::status(req.path, ec);
        run.scope = fs::is_directory(st) ? Scope::Directory
                  : fs::exists(st)       ? Scope::File
                                         : Scope::Gone;

        report(run, "discovery", 0, 0, run.target_rel);
        if (run.scope != Scope::Gone) discover(run, req.path);

        const size_t n = run.items.size();
        for (size_t i = 0; i < n; ++i) {
            if (cancelled(run)) {
                run.result.cancelled = true;
                break;
            }
            const auto& item = run.items[i];
            report(run, "scanning", i, n, item.rel);
            run.result.total++;
            auto action = guarded(run, item.rel, item.format, [&] { return process(run, item); });
            count(run.result, action);
        }

        if (!run.result.cancelled) {
            detect_missing(run);
            cat_.mark_volume_indexed(run.vol.id);
        }
        report(run, "done", n, n, "");
        cat_.finish_job(run.job_id,
                        run.result.cancelled ? catalog::JobStatus::Cancelled
                                             : catalog::JobStatus::Completed,
                        counters_of(run.result));
    } catch (const std::exception& e) {
        cat_.finish_job(run.job_id, catalog::JobStatus::Failed, counters_of(run.result), e.what());
        throw;
    }

    const auto& r = run.result;
    LOGI("scan:", run.target_rel.empty() ? run.vol.mount_path : run.target_rel, "-", r.total,
         "items,", r.added, "new,", r.updated, "updated,", r.moved, "moved,", r.duplicates,
         "duplicates,", r.skipped, "skipped,", r.missing, "missing,", r.errors, "errors",
         r.cancelled ? "(cancelled)" : "");
    return run.result;
}

volume::Status Scanner::check_volume(int64_t volume_id) {
    auto v = cat_.get_volume(volume_id);
    if (!v)
        throw std::runtime_error(std::format("volume {} not found", volume_id));
    if (v->status == volume::Status::Disabled) return volume::Status::Disabled;

    auto status = volume::probe_mount(*v);
    if (status == volume::Status::Online) {
        cat_.touch_volume(volume_id);
        return status;
    }
    cat_.set_volume_status(volume_id, volume::Status::Offline);
    auto n = cat_.set_volume_assets_status(volume_id, IndexStatus::Indexed, IndexStatus::Offline);
    LOGW("volume", v->label, "is offline;", n, "rows marked offline");
    return volume::Status::Offline;
}

static bool row_present(const volume::Volume& v, const catalog::Asset& a) {
    try {
        auto [container, member] = archive::split_virtual_path(a.relative_path);
        std::error_code ec;
        return fs::is_regular_file(volume::absolute(v, container), ec);
    } catch (const PathTraversalError& e) {
        LOGW("verify:", a.relative_path, "-", e.what());
        return false;
    }
}

VerifyResult Scanner::verify_volume(int64_t volume_id) {
    auto v = cat_.get_volume(volume_id);
    if (!v)
        throw std::runtime_error(std::format("volume {} not found", volume_id));

    VerifyResult r;
    r.job_id = cat_.create_job({
        .type = catalog::JobType::Verify,
        .target_path = v->mount_path,
        .volume_id = volume_id,
    });
    cat_.start_job(r.job_id);

    try {
        const bool online = check_volume(volume_id) == volume::Status::Online;
        for (auto kind : {AssetKind::Model, AssetKind::Document}) {
            for (auto status : {IndexStatus::Missing, IndexStatus::Offline}) {
                for (const auto& a : cat_.list_in_volume(kind, volume_id, status)) {
                    r.verified++;
                    if (online && row_present(*v, a)) {
                        cat_.touch_seen(kind, a.id);
                        r.found++;
                        continue;
                    }
                    r.still_missing++;
                    if (!online)
                        cat_.set_index_status(kind, a.id, IndexStatus::Offline);
                    else
                        cat_.mark_missing(kind, {a.id});
                }
            }
        }
        cat_.finish_job(r.job_id, catalog::JobStatus::Completed,
                        {.processed = r.verified, .missing = r.still_missing});
    } catch (const std::exception& e) {
        cat_.finish_job(r.job_id, catalog::JobStatus::Failed,
                        {.processed = r.verified, .missing = r.still_missing}, e.what());
        throw;
    }

    LOGI("verify:", v->label, "-", r.verified, "checked,", r.found, "found,", r.still_missing,
         "still missing");
    return r;
}

Action Scanner::reindex_asset(AssetKind kind, int64_t id, bool force) {
    auto row = cat_.get(kind, id);
    if (!row)
        throw std::runtime_error(std::format("{} {} not found", formats::kind_name(kind), id));
    auto v = cat_.get_volume(row->volume_id);
    if (!v)
        throw std::runtime_error(std::format("volume {} not found", row->volume_id));
    const auto* fmt = registry_.find(row->format);
    if (!fmt)
        throw std::runtime_error(std::format("{}: format '{}' is not registered",
                                             row->relative_path, row->format));

    Run run;
    run.vol = *v;
    run.force = force;
    run.scope = Scope::File;
    run.target_rel = row->relative_path;
    run.job_id = cat_.create_job({
        .type = catalog::JobType::Reindex,
        .target_path = row->relative_path,
        .volume_id = row->volume_id,
        .force = force,
        .recursive = false,
    });
    cat_.start_job(run.job_id);

    Action action = Action::Error;
    try {
        if (check_volume(v->id) != volume::Status::Online)
            throw VolumeOfflineError(std::format("volume '{}' is offline", v->label), v->id);

        const auto parts = archive::split_virtual_path(row->relative_path);
        const std::string& container = parts.first;
        const std::string& member = parts.second;
        action = guarded(run, row->relative_path, fmt, [&] {
            const fs::path file = volume::absolute(run.vol, container);
            std::error_code ec;
            if (!fs::is_regular_file(file, ec)) {
                cat_.mark_missing(kind, {id});
                return Action::Missing;
            }
            Item item{.rel = row->relative_path, .file = file, .format = fmt,
                      .mtime = volume::file_mtime(file)};
            if (member.empty()) {
                item.size = fs::file_size(file);
                return process(run, item);
            }
            auto arc = std::make_shared<archive::Archive>(archive::list(file));
            auto it = std::find_if(arc->members.begin(), arc->members.end(),
                                   [&](const archive::Member& m) { return !m.is_dir && m.name == member; });
            if (it == arc->members.end()) {
                cat_.mark_missing(kind, {id});
                return Action::Missing;
            }
            item.size = it->size;
            item.container = arc;
            item.member = &*it;
            item.archive_rel = container;
            return process(run, item);
        });
        count(run.result, action);
        run.result.total = 1;
        cat_.finish_job(run.job_id, catalog::JobStatus::Completed, counters_of(run.result));
    } catch (const std::exception& e) {
        cat_.finish_job(run.job_id, catalog::JobStatus::Failed, counters_of(run.result), e.what());
        throw;
    }

    LOGI("reindex:", row->relative_path, "->", action_name(action));
    return action;
}

} // namespace assetcat::scanner
