#include "assetcat/catalog.h"
#include "assetcat/dedup.h"
#include "assetcat/errors.h"
#include "assetcat/log.h"
#include "assetcat/scanner.h"
#include "assetcat/settings.h"
#include "assetcat/thumbd.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using namespace assetcat;

namespace {

constexpr int exit_error = 1;
constexpr int exit_usage = 2;
constexpr int exit_offline = 3;

std::atomic<bool> g_cancel{false};

extern "C" void on_interrupt(int) {
    g_cancel.store(true);
}

struct Options {
    std::string mode;
    std::vector<std::string> args;
    std::string config_path;
    std::string db;
    std::string policy;
    bool force = false;
    bool recursive = true;
    bool readonly = false;
    bool pretty = false;
    int verbosity = -1;
};

void stderr_progress(const catalog::JobProgress& p) {
    if (p.phase == "discovery") {
        std::cerr << "Discovered " << p.total << " files\n";
    } else if (p.phase == "scanning") {
        int width = static_cast<int>(std::to_string(p.total).size());
        std::cerr << std::format("\r[{:>{}}/{:d}] {}\033[K", p.current, width, p.total, p.current_item);
    } else if (p.phase == "missing") {
        std::cerr << "\nChecking for missing files...\n";
    }
}

int64_t parse_id(const std::string& s) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used == s.size() && v > 0) return v;
    } catch (const std::logic_error&) {
    }
    throw std::runtime_error(std::format("invalid id '{}'", s));
}

json hit_json(const catalog::SearchHit& h) {
    return {
        {"kind", formats::kind_name(h.kind)},
        {"id", h.id},
        {"volume_id", h.volume_id},
        {"relative_path", h.relative_path},
        {"filename", h.filename},
        {"title", h.title},
        {"collection", h.collection},
        {"creator", h.creator},
        {"rank", h.rank},
    };
}

json job_json(const catalog::ScanJob& j) {
    json out = {
        {"id", j.id},
        {"type", catalog::job_type_name(j.type)},
        {"status", catalog::job_status_name(j.status)},
        {"target_path", j.target_path},
        {"duplicate_policy", j.duplicate_policy},
        {"force", j.force},
        {"recursive", j.recursive},
        {"phase", j.progress.phase},
        {"current", j.progress.current},
        {"total", j.progress.total},
        {"processed", j.counters.processed},
        {"skipped", j.counters.skipped},
        {"failed", j.counters.failed},
        {"missing", j.counters.missing},
        {"created_at", j.created_at},
        {"started_at", j.started_at},
        {"completed_at", j.completed_at},
    };
    if (j.volume_id) out["volume_id"] = *j.volume_id;
    if (!j.error_message.empty()) out["error_message"] = j.error_message;
    return out;
}

json job_error_json(const catalog::JobError& e) {
    json out = {
        {"id", e.id},
        {"file_path", e.file_path},
        {"error_type", e.error_type},
        {"error_message", e.error_message},
        {"created_at", e.created_at},
    };
    if (!e.asset_kind.empty()) out["asset_kind"] = e.asset_kind;
    if (e.asset_id) out["asset_id"] = *e.asset_id;
    return out;
}

void print_json(const json& j, bool pretty) {
    if (pretty) std::cout << std::setw(2) << j << '\n';
    else std::cout << j << '\n';
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------

int do_scan(catalog::Catalog& cat, const settings::AppConfig& cfg, const Options& o) {
    auto opts = settings::scanner_options(cfg);
    opts.cancel = &g_cancel;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    auto registry = formats::Registry::with_builtins();
    scanner::Scanner s(cat, registry, opts);
    scanner::ScanRequest req{
        .path = fs::absolute(o.args[0]),
        .recursive = o.recursive,
        .force = o.force,
        .duplicate_policy = dedup::parse_policy(o.policy.empty() ? cfg.scan.duplicate_policy : o.policy),
    };

    auto r = s.scan(req, stderr_progress);
    std::cerr << '\n';
    std::cout << std::format("Job {}: {} files, {} added, {} updated, {} moved, {} duplicates, "
                             "{} skipped, {} missing, {} errors{}\n",
                             r.job_id, r.total, r.added, r.updated, r.moved, r.duplicates,
                             r.skipped, r.missing, r.errors, r.cancelled ? " (cancelled)" : "");
    if (r.errors > 0)
        std::cerr << std::format("See: assetcat -job-errors {}\n", r.job_id);
    return 0;
}

int do_volumes(catalog::Catalog& cat) {
    auto vols = cat.list_volumes();
    for (const auto& v : vols) {
        std::cout << std::format("{:>4}  {:<8} {:<3} {:<16} {}\n", v.id, volume::status_name(v.status),
                                 v.is_readonly ? "ro" : "rw", v.label, v.mount_path);
        if (!v.last_indexed_at.empty())
            std::cout << std::format("      last indexed {}\n", v.last_indexed_at);
    }
    std::cerr << vols.size() << " volume(s)\n";
    return 0;
}

int do_info(catalog::Catalog& cat) {
    auto st = cat.stats();
    std::error_code ec;
    auto size = fs::file_size(cat.path(), ec);

    std::cout << "Database:       " << cat.path() << '\n';
    if (!ec)
        std::cout << std::format("Size:           {:.1f} MB\n", static_cast<double>(size) / 1024 / 1024);
    std::cout << "Schema version: " << st.schema_version << '\n';
    std::cout << "Created:        " << st.created_at << '\n';
    std::cout << "Volumes:        " << st.volumes << '\n';
    std::cout << "Jobs:           " << st.jobs << '\n';
    for (auto [name, k] : {std::pair{"Models", &st.models}, std::pair{"Documents", &st.documents}}) {
        std::cout << std::format("{:<16}{} ({} indexed, {} missing, {} offline, {} error)\n",
                                 std::string(name) + ":", k->total, k->indexed, k->missing,
                                 k->offline, k->error);
        std::cout << std::format("  duplicates:   {}\n", k->duplicates);
        std::cout << std::format("  thumbnails:   {}\n", k->with_thumbnail);
        std::cout << std::format("  total data:   {:.1f} MB\n", static_cast<double>(k->total_size) / 1024 / 1024);
    }
    return 0;
}

int do_selftest(const settings::AppConfig& cfg) {
    catalog::Catalog::smoke_test();
    std::cout << "Catalog statements: ok\n";

    auto registry = formats::Registry::with_builtins();
    for (const auto* f : registry.formats()) {
        std::string exts;
        for (const auto& e : f->extensions) exts += (exts.empty() ? "" : " ") + e;
        std::cout << std::format("  {:<6} {:<9} {:<6} {}\n", f->id, formats::kind_name(f->kind),
                                 formats::category_name(f->category), exts);
    }

    thumbd::RendererRegistry renderers;
    settings::register_renderers(renderers, cfg);
    std::cout << "Renderers:\n";
    for (const auto& r : renderers.renderers()) {
        std::cout << std::format("  {:<14} {:<8} score {:>3}  {}\n", r.renderer->id(), r.source,
                                 r.probe.score, r.probe.available ? "available" : r.probe.reason);
    }
    return 0;
}

int do_dedup(catalog::Catalog& cat, const Options& o) {
    auto registry = formats::Registry::with_builtins();
    scanner::Scanner s(cat, registry);
    std::vector<catalog::AssetKind> kinds{catalog::AssetKind::Model, catalog::AssetKind::Document};
    if (!o.args.empty()) kinds = {formats::parse_kind(o.args[0])};

    for (auto kind : kinds) {
        auto r = dedup::verify_collisions(cat, kind, s.full_hash_reader());
        std::cout << std::format("{}: {} group(s), {} row(s) checked, {} duplicate(s) marked, "
                                 "{} false positive(s), {} error(s)\n",
                                 formats::table_name(kind), r.groups, r.rows_checked,
                                 r.duplicates_marked, r.false_positives, r.errors);
    }
    return 0;
}

int do_rerender(catalog::Catalog& cat, const settings::AppConfig& cfg, const Options& o) {
    auto kind = formats::parse_kind(o.args[0]);
    auto id = parse_id(o.args[1]);
    if (!cat.get(kind, id))
        throw std::runtime_error(std::format("{} {} not found", formats::kind_name(kind), id));

    auto registry = formats::Registry::with_builtins();
    thumbd::RendererRegistry renderers;
    auto dcfg = settings::daemon_config(cfg);
    // Only used to decide staleness; the pools stay idle.
    dcfg.fast_workers = 1;
    dcfg.slow_workers = 1;
    thumbd::ThumbnailDaemon daemon(cat, registry, renderers, dcfg);
    if (daemon.request_rerender(kind, id, o.force))
        std::cout << std::format("{} {} queued for rendering\n", formats::kind_name(kind), id);
    else
        std::cout << std::format("{} {} thumbnail is current (use -force)\n", formats::kind_name(kind), id);
    return 0;
}

void print_usage() {
    std::cerr << "Usage: assetcat [flags] <mode>\n\n"
              << "Indexes 3D models and documents on registered volumes into a SQLite catalog.\n\n"
              << "Volumes:\n"
              << "  -add-volume <label> <mount> [-readonly]\n"
              << "  -volumes                    List volumes\n"
              << "  -check-volume <id>          Probe the mount and record online/offline\n"
              << "  -verify-volume <id>         Re-check missing and offline rows\n"
              << "  -disable-volume <id>\n"
              << "  -remove-volume <id>         Only when no asset references it\n\n"
              << "Scans and jobs:\n"
              << "  -scan <path>                Index a directory, file or archive\n"
              << "      -policy reject|warn|merge\n"
              << "      -force                  Recompute unchanged files\n"
              << "      -norecursive\n"
              << "  -reindex <models|documents> <id> [-force]\n"
              << "  -jobs                       Recent jobs (JSON)\n"
              << "  -job-errors <job id>        Errors of one job (JSON)\n"
              << "  -cancel-job <id>\n\n"
              << "Catalog:\n"
              << "  -dedup [models|documents]   Confirm partial-hash groups with full hashes\n"
              << "  -search <query>             Full-text search (JSON)\n"
              << "  -rerender <models|documents> <id> [-force]\n"
              << "  -info                       Catalog statistics\n"
              << "  -selftest                   Check statements, formats and renderers\n"
              << "  -init-config <path>         Write a default config file\n\n"
              << "Flags:\n"
              << "  -db <path>                  Catalog path\n"
              << "  -config <path>              Config file (JSON)\n"
              << "  --pretty                    Pretty-print JSON output\n"
              << "  -v, -vv                     Verbose / debug logging\n";
}

// Number of positional arguments each mode takes (min, max).
std::optional<std::pair<size_t, size_t>> mode_arity(const std::string& mode) {
    static const std::vector<std::pair<std::string, std::pair<size_t, size_t>>> modes = {
        {"-add-volume", {2, 2}}, {"-volumes", {0, 0}}, {"-check-volume", {1, 1}},
        {"-verify-volume", {1, 1}}, {"-disable-volume", {1, 1}}, {"-remove-volume", {1, 1}},
        {"-scan", {1, 1}}, {"-reindex", {2, 2}}, {"-jobs", {0, 0}}, {"-job-errors", {1, 1}},
        {"-cancel-job", {1, 1}}, {"-dedup", {0, 1}}, {"-search", {1, 1}}, {"-rerender", {2, 2}},
        {"-info", {0, 0}}, {"-selftest", {0, 0}}, {"-init-config", {1, 1}},
    };
    for (const auto& [name, arity] : modes) {
        if (name == mode) return arity;
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    Options o;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0 && i + 1 < argc) o.config_path = argv[++i];
        else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) o.db = argv[++i];
        else if (std::strcmp(argv[i], "-policy") == 0 && i + 1 < argc) o.policy = argv[++i];
        else if (std::strcmp(argv[i], "-force") == 0) o.force = true;
        else if (std::strcmp(argv[i], "-norecursive") == 0) o.recursive = false;
        else if (std::strcmp(argv[i], "-readonly") == 0) o.readonly = true;
        else if (std::strcmp(argv[i], "--pretty") == 0) o.pretty = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            o.verbosity = std::min(std::max(o.verbosity, 0) + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) o.verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (mode_arity(argv[i])) {
            if (!o.mode.empty()) {
                std::cerr << "Error: " << o.mode << " and " << argv[i] << " cannot be combined\n";
                return exit_usage;
            }
            o.mode = argv[i];
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (o.mode.empty()) {
        print_usage();
        return exit_usage;
    }
    auto [min_args, max_args] = *mode_arity(o.mode);
    if (positional.size() < min_args || positional.size() > max_args) {
        std::cerr << "Error: " << o.mode << " expects "
                  << (min_args == max_args ? std::to_string(min_args)
                                           : std::format("{} to {}", min_args, max_args))
                  << " argument(s)\n";
        return exit_usage;
    }
    o.args = positional;

    settings::AppConfig cfg;
    try {
        cfg = settings::load_config(o.config_path.empty() ? settings::config_path() : fs::path(o.config_path));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return exit_error;
    }
    if (!o.db.empty()) cfg.db = o.db;
    log::set_verbosity(o.verbosity >= 0 ? o.verbosity : cfg.verbosity);

    if (o.mode == "-init-config") {
        try {
            settings::save_config(o.args[0], cfg);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << '\n';
            return exit_error;
        }
        std::cerr << "Wrote " << o.args[0] << '\n';
        return 0;
    }
    if (o.mode == "-selftest") {
        try {
            return do_selftest(cfg);
        } catch (const std::exception& e) {
            std::cerr << "Error: self-test failed: " << e.what() << '\n';
            return exit_error;
        }
    }

    const std::string db_path = settings::db_path(cfg);
    try {
        if (fs::path(db_path).has_parent_path())
            fs::create_directories(fs::path(db_path).parent_path());
        auto cat = catalog::Catalog::open(db_path);
        LOGI("catalog", db_path);

        if (o.mode == "-scan") return do_scan(cat, cfg, o);
        if (o.mode == "-volumes") return do_volumes(cat);
        if (o.mode == "-info") return do_info(cat);
        if (o.mode == "-dedup") return do_dedup(cat, o);
        if (o.mode == "-rerender") return do_rerender(cat, cfg, o);

        if (o.mode == "-add-volume") {
            auto id = cat.add_volume(o.args[0], fs::absolute(o.args[1]).lexically_normal().string(), o.readonly);
            std::cout << std::format("Added volume {} ({})\n", id, o.args[0]);
        } else if (o.mode == "-check-volume") {
            auto registry = formats::Registry::with_builtins();
            scanner::Scanner s(cat, registry);
            auto status = s.check_volume(parse_id(o.args[0]));
            std::cout << volume::status_name(status) << '\n';
            return status == volume::Status::Offline ? exit_offline : 0;
        } else if (o.mode == "-verify-volume") {
            auto registry = formats::Registry::with_builtins();
            scanner::Scanner s(cat, registry, settings::scanner_options(cfg));
            auto r = s.verify_volume(parse_id(o.args[0]));
            std::cout << std::format("Job {}: {} checked, {} found, {} still missing\n", r.job_id,
                                     r.verified, r.found, r.still_missing);
        } else if (o.mode == "-disable-volume") {
            cat.disable_volume(parse_id(o.args[0]));
        } else if (o.mode == "-remove-volume") {
            cat.remove_volume(parse_id(o.args[0]));
        } else if (o.mode == "-reindex") {
            auto registry = formats::Registry::with_builtins();
            scanner::Scanner s(cat, registry, settings::scanner_options(cfg));
            auto action = s.reindex_asset(formats::parse_kind(o.args[0]), parse_id(o.args[1]), o.force);
            std::cout << scanner::action_name(action) << '\n';
        } else if (o.mode == "-jobs") {
            json arr = json::array();
            for (const auto& j : cat.list_jobs()) arr.push_back(job_json(j));
            print_json(arr, o.pretty);
        } else if (o.mode == "-job-errors") {
            json arr = json::array();
            for (const auto& e : cat.list_job_errors(parse_id(o.args[0]))) arr.push_back(job_error_json(e));
            print_json(arr, o.pretty);
        } else if (o.mode == "-cancel-job") {
            if (!cat.cancel_job(parse_id(o.args[0]))) {
                std::cerr << "Job " << o.args[0] << " is not pending or running\n";
                return exit_error;
            }
        } else if (o.mode == "-search") {
            auto hits = cat.search(o.args[0]);
            json arr = json::array();
            for (const auto& h : hits) arr.push_back(hit_json(h));
            print_json(arr, o.pretty);
            std::cerr << "Found " << hits.size() << " matches\n";
        }
    } catch (const VolumeOfflineError& e) {
        std::cerr << "\nVolume offline: " << e.what() << '\n';
        return exit_offline;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << '\n';
        return exit_error;
    }
    return 0;
}
