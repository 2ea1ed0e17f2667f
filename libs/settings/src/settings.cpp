#include "assetcat/settings.h"
#include "assetcat/dedup.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace assetcat::settings {

namespace {

fs::path executable_dir() {
    std::error_code ec;
    auto link_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return link_path.parent_path();
    return fs::current_path();
}

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return {};
}

// read_key reads an optional key, naming it in the error on a type mismatch.
template <typename T>
void read_key(const json& j, const char* key, T& out, std::string_view section = {}) {
    if (!j.contains(key)) return;
    try {
        j.at(key).get_to(out);
    } catch (const json::exception& e) {
        std::string name = section.empty() ? key : std::format("{}.{}", section, key);
        throw std::runtime_error(std::format("config: {}: {}", name, e.what()));
    }
}

void from_json(const json& j, RendererSpec& r) {
    read_key(j, "id", r.id, "thumbd.renderers");
    read_key(j, "command", r.command, "thumbd.renderers");
    read_key(j, "formats", r.formats, "thumbd.renderers");
    read_key(j, "score", r.score, "thumbd.renderers");
}

void to_json(json& j, const RendererSpec& r) {
    j = json{{"id", r.id}, {"command", r.command}, {"formats", r.formats}, {"score", r.score}};
}

void read_scan(const json& j, ScanDefaults& s) {
    read_key(j, "duplicate_policy", s.duplicate_policy, "scan");
    read_key(j, "recursive", s.recursive, "scan");
    read_key(j, "verify_full_hash", s.verify_full_hash, "scan");
    read_key(j, "progress_every", s.progress_every, "scan");
}

void read_thumbd(const json& j, ThumbdDefaults& t) {
    read_key(j, "size_threshold_mb", t.size_threshold_mb, "thumbd");
    read_key(j, "fast_workers", t.fast_workers, "thumbd");
    read_key(j, "slow_workers", t.slow_workers, "thumbd");
    read_key(j, "fast_queue", t.fast_queue, "thumbd");
    read_key(j, "slow_queue", t.slow_queue, "thumbd");
    read_key(j, "fast_timeout_s", t.fast_timeout_s, "thumbd");
    read_key(j, "slow_timeout_s", t.slow_timeout_s, "thumbd");
    read_key(j, "poll_interval_ms", t.poll_interval_ms, "thumbd");
    read_key(j, "poll_limit", t.poll_limit, "thumbd");
    read_key(j, "thumb_size", t.thumb_size, "thumbd");
    read_key(j, "storage_mode", t.storage_mode, "thumbd");
    read_key(j, "placeholder", t.placeholder, "thumbd");
    read_key(j, "use_xvfb", t.use_xvfb, "thumbd");
    read_key(j, "temp_dir", t.temp_dir, "thumbd");
    if (j.contains("renderers")) {
        const auto& list = j.at("renderers");
        if (!list.is_array())
            throw std::runtime_error("config: thumbd.renderers: expected an array");
        t.renderers.clear();
        for (const auto& item : list) {
            RendererSpec r;
            from_json(item, r);
            t.renderers.push_back(std::move(r));
        }
    }
}

void require_range(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi)
        throw std::runtime_error(std::format("config: {}: {} is outside {}..{}", key, value, lo, hi));
}

} // namespace

fs::path config_path() {
    const char* override_path = std::getenv("ASSETCAT_CONFIG");
    if (override_path && override_path[0] != '\0') return fs::path(override_path);

    const auto beside_exe = executable_dir() / "config.json";
    if (fs::exists(beside_exe)) return beside_exe;

    auto home = home_dir();
    if (!home.empty()) return home / ".config" / "assetcat" / "config.json";
    return beside_exe;
}

fs::path data_dir() {
    auto home = home_dir();
    if (!home.empty()) return home / ".local" / "share" / "assetcat";
    return fs::current_path();
}

AppConfig load_config(const fs::path& path) {
    AppConfig cfg;
    std::ifstream stream(path);
    if (!stream.is_open()) return cfg;

    json j;
    try {
        j = json::parse(stream);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("config: {}: {}", path.string(), e.what()));
    }
    if (!j.is_object())
        throw std::runtime_error(std::format("config: {}: expected a JSON object", path.string()));

    read_key(j, "db", cfg.db);
    read_key(j, "central_dir", cfg.central_dir);
    read_key(j, "verbosity", cfg.verbosity);
    if (j.contains("scan")) read_scan(j.at("scan"), cfg.scan);
    if (j.contains("thumbd")) read_thumbd(j.at("thumbd"), cfg.thumbd);

    validate(cfg);
    return cfg;
}

void validate(const AppConfig& cfg) {
    require_range("verbosity", cfg.verbosity, 0, 2);
    try {
        dedup::parse_policy(cfg.scan.duplicate_policy);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("config: scan.duplicate_policy: {}", e.what()));
    }
    try {
        thumbd::parse_storage_mode(cfg.thumbd.storage_mode);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::format("config: thumbd.storage_mode: {}", e.what()));
    }
    require_range("scan.progress_every", cfg.scan.progress_every, 1, 1000000);

    const auto& t = cfg.thumbd;
    require_range("thumbd.size_threshold_mb", t.size_threshold_mb, 1, 1024 * 1024);
    require_range("thumbd.fast_workers", t.fast_workers, 1, 256);
    require_range("thumbd.slow_workers", t.slow_workers, 1, 256);
    require_range("thumbd.fast_queue", t.fast_queue, 1, 100000);
    require_range("thumbd.slow_queue", t.slow_queue, 1, 100000);
    require_range("thumbd.fast_timeout_s", t.fast_timeout_s, 1, 86400);
    require_range("thumbd.slow_timeout_s", t.slow_timeout_s, 1, 86400);
    require_range("thumbd.poll_interval_ms", t.poll_interval_ms, 10, 3600000);
    require_range("thumbd.poll_limit", t.poll_limit, 1, 100000);
    require_range("thumbd.thumb_size", t.thumb_size, 16, 4096);
    for (const auto& r : t.renderers) {
        if (r.id.empty())
            throw std::runtime_error("config: thumbd.renderers: renderer without an id");
        if (r.command.empty())
            throw std::runtime_error(std::format("config: thumbd.renderers: '{}' has no command", r.id));
    }
}

void save_config(const fs::path& path, const AppConfig& cfg) {
    json j;
    j["db"] = cfg.db;
    j["central_dir"] = cfg.central_dir;
    j["verbosity"] = cfg.verbosity;
    j["scan"] = {
        {"duplicate_policy", cfg.scan.duplicate_policy},
        {"recursive", cfg.scan.recursive},
        {"verify_full_hash", cfg.scan.verify_full_hash},
        {"progress_every", cfg.scan.progress_every},
    };

    const auto& t = cfg.thumbd;
    json renderers = json::array();
    for (const auto& r : t.renderers) {
        json item;
        to_json(item, r);
        renderers.push_back(std::move(item));
    }
    j["thumbd"] = {
        {"size_threshold_mb", t.size_threshold_mb},
        {"fast_workers", t.fast_workers},
        {"slow_workers", t.slow_workers},
        {"fast_queue", t.fast_queue},
        {"slow_queue", t.slow_queue},
        {"fast_timeout_s", t.fast_timeout_s},
        {"slow_timeout_s", t.slow_timeout_s},
        {"poll_interval_ms", t.poll_interval_ms},
        {"poll_limit", t.poll_limit},
        {"thumb_size", t.thumb_size},
        {"storage_mode", t.storage_mode},
        {"placeholder", t.placeholder},
        {"use_xvfb", t.use_xvfb},
        {"temp_dir", t.temp_dir},
        {"renderers", renderers},
    };

    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream stream(path);
    if (!stream.is_open())
        throw std::runtime_error(std::format("cannot write {}", path.string()));
    stream << j.dump(2) << "\n";
    if (!stream)
        throw std::runtime_error(std::format("write failed: {}", path.string()));
}

std::string db_path(const AppConfig& cfg) {
    if (!cfg.db.empty()) return cfg.db;
    return (data_dir() / "catalog.db").string();
}

fs::path central_dir(const AppConfig& cfg) {
    if (!cfg.central_dir.empty()) return cfg.central_dir;
    return data_dir() / "thumbnails";
}

scanner::ScannerOptions scanner_options(const AppConfig& cfg) {
    scanner::ScannerOptions opts;
    opts.verify_full_hash = cfg.scan.verify_full_hash;
    opts.progress_every = cfg.scan.progress_every;
    return opts;
}

thumbd::DaemonConfig daemon_config(const AppConfig& cfg) {
    const auto& t = cfg.thumbd;
    thumbd::DaemonConfig d;
    d.central_dir = central_dir(cfg);
    d.storage = thumbd::parse_storage_mode(t.storage_mode);
    d.size_threshold = static_cast<int64_t>(t.size_threshold_mb) * 1024 * 1024;
    d.fast_workers = t.fast_workers;
    d.fast_queue = static_cast<size_t>(t.fast_queue);
    d.fast_timeout = std::chrono::seconds(t.fast_timeout_s);
    d.slow_workers = t.slow_workers;
    d.slow_queue = static_cast<size_t>(t.slow_queue);
    d.slow_timeout = std::chrono::seconds(t.slow_timeout_s);
    d.poll_interval = std::chrono::milliseconds(t.poll_interval_ms);
    d.poll_limit = t.poll_limit;
    d.thumb_size = t.thumb_size;
    d.temp_dir = t.temp_dir;
    return d;
}

void register_renderers(thumbd::RendererRegistry& registry, const AppConfig& cfg) {
    thumbd::register_builtin_renderers(registry, {.use_xvfb = cfg.thumbd.use_xvfb,
                                                  .placeholder = cfg.thumbd.placeholder});
    for (const auto& r : cfg.thumbd.renderers) {
        registry.add(std::make_shared<thumbd::ExternalRenderer>(r.id, r.command, r.formats, r.score),
                     "config");
    }
}

} // namespace assetcat::settings
