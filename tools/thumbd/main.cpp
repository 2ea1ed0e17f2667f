#include "assetcat/catalog.h"
#include "assetcat/log.h"
#include "assetcat/settings.h"
#include "assetcat/thumbd.h"

#include <algorithm>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace assetcat;

namespace {

void print_usage() {
    std::cerr << "Usage: thumbd [flags]\n\n"
              << "Renders thumbnails for catalog rows whose thumbnail is missing or stale.\n"
              << "Small files go to the fast lane, large ones to the slow lane.\n\n"
              << "Flags:\n"
              << "  -config <path>        Config file (JSON)\n"
              << "  -db <path>            Catalog path\n"
              << "  -central <dir>        Central thumbnail directory\n"
              << "  -storage central|auto Thumbnail placement\n"
              << "  -once                 Render one batch, wait for it, exit\n"
              << "  -threshold-mb <n>     Slow lane size threshold (default 30)\n"
              << "  -fast-workers <n>     Fast lane workers (default 12)\n"
              << "  -slow-workers <n>     Slow lane workers (default 2)\n"
              << "  -fast-timeout <s>     Per-item fast lane timeout (default 120)\n"
              << "  -slow-timeout <s>     Per-item slow lane timeout (default 600)\n"
              << "  -poll-ms <n>          Poll interval (default 5000)\n"
              << "  -xvfb                 Run f3d under xvfb-run\n"
              << "  -no-placeholder       Do not fall back to placeholder images\n"
              << "  -v, -vv               Debug logging\n";
}

int parse_int(const char* flag, const char* value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == std::strlen(value)) return v;
    } catch (const std::logic_error&) {
    }
    throw std::runtime_error(std::format("{}: invalid number '{}'", flag, value));
}

void log_renderers(const thumbd::RendererRegistry& renderers, const formats::Registry& registry) {
    for (const auto& r : renderers.renderers()) {
        if (r.probe.available)
            LOGI("renderer", r.renderer->id(), "score", r.probe.score, "(" + r.source + ")");
        else
            LOGI("renderer", r.renderer->id(), "unavailable:", r.probe.reason);
    }
    for (const auto* f : registry.formats()) {
        std::string ids;
        for (const auto* r : renderers.chain(f->id)) ids += (ids.empty() ? "" : " -> ") + r->id();
        if (ids.empty())
            LOGW("no renderer for", f->id);
        else
            LOGI("chain", f->id + ":", ids);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string db_flag;
    std::string central_flag;
    std::string storage_flag;
    bool once = false;
    int verbosity = -1;
    settings::AppConfig cfg;

    std::vector<std::pair<std::string, std::string>> int_flags;
    bool xvfb = false;
    bool no_placeholder = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0 && i + 1 < argc) config_path = argv[++i];
        else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) db_flag = argv[++i];
        else if (std::strcmp(argv[i], "-central") == 0 && i + 1 < argc) central_flag = argv[++i];
        else if (std::strcmp(argv[i], "-storage") == 0 && i + 1 < argc) storage_flag = argv[++i];
        else if (std::strcmp(argv[i], "-once") == 0) once = true;
        else if (std::strcmp(argv[i], "-xvfb") == 0) xvfb = true;
        else if (std::strcmp(argv[i], "-no-placeholder") == 0) no_placeholder = true;
        else if ((std::strcmp(argv[i], "-threshold-mb") == 0 || std::strcmp(argv[i], "-fast-workers") == 0 ||
                  std::strcmp(argv[i], "-slow-workers") == 0 || std::strcmp(argv[i], "-fast-timeout") == 0 ||
                  std::strcmp(argv[i], "-slow-timeout") == 0 || std::strcmp(argv[i], "-poll-ms") == 0) &&
                 i + 1 < argc) {
            int_flags.emplace_back(argv[i], argv[i + 1]);
            ++i;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(std::max(verbosity, 1) + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            std::cerr << "Error: unknown flag " << argv[i] << "\n";
            print_usage();
            return 2;
        }
    }

    try {
        cfg = settings::load_config(config_path.empty() ? settings::config_path() : fs::path(config_path));
        if (!db_flag.empty()) cfg.db = db_flag;
        if (!central_flag.empty()) cfg.central_dir = central_flag;
        if (!storage_flag.empty()) cfg.thumbd.storage_mode = storage_flag;
        if (xvfb) cfg.thumbd.use_xvfb = true;
        if (no_placeholder) cfg.thumbd.placeholder = false;
        for (const auto& [flag, value] : int_flags) {
            int v = parse_int(flag.c_str(), value.c_str());
            if (flag == "-threshold-mb") cfg.thumbd.size_threshold_mb = v;
            else if (flag == "-fast-workers") cfg.thumbd.fast_workers = v;
            else if (flag == "-slow-workers") cfg.thumbd.slow_workers = v;
            else if (flag == "-fast-timeout") cfg.thumbd.fast_timeout_s = v;
            else if (flag == "-slow-timeout") cfg.thumbd.slow_timeout_s = v;
            else if (flag == "-poll-ms") cfg.thumbd.poll_interval_ms = v;
        }
        settings::validate(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    // The daemon reports at INFO by default.
    log::set_verbosity(verbosity >= 0 ? verbosity : std::max(cfg.verbosity, 1));
    log::set_timestamps(true);

    // Signals are taken by a dedicated thread; every other thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        const auto db_path = settings::db_path(cfg);
        auto cat = catalog::Catalog::open(db_path);
        auto registry = formats::Registry::with_builtins();
        thumbd::RendererRegistry renderers;
        settings::register_renderers(renderers, cfg);

        auto dcfg = settings::daemon_config(cfg);
        fs::create_directories(dcfg.central_dir);
        LOGI("thumbd: catalog", db_path, "thumbnails", dcfg.central_dir.string(),
             "storage", thumbd::storage_mode_name(dcfg.storage));
        log_renderers(renderers, registry);

        thumbd::ThumbnailDaemon daemon(cat, registry, renderers, dcfg);

        std::thread watcher([&]() {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0 && !once)
                LOGI("thumbd: caught", sig == SIGINT ? "SIGINT" : "SIGTERM", ", stopping");
            daemon.stop();
        });
        // Wakes the watcher when the daemon finished on its own.
        auto release_watcher = [&]() {
            kill(getpid(), SIGTERM);
            watcher.join();
        };

        try {
            if (once) {
                int dispatched = daemon.run_cycle();
                daemon.wait_idle();
                auto p = daemon.progress();
                std::cout << std::format("{} dispatched, {} rendered, {} failed\n", dispatched,
                                         p.rendered_total, p.failed_total);
                release_watcher();
                return p.failed_total > 0 ? 1 : 0;
            }
            daemon.run();
        } catch (const std::exception&) {
            release_watcher();
            throw;
        }
        watcher.join();
    } catch (const std::exception& e) {
        LOGE("thumbd:", e.what());
        return 1;
    }
    return 0;
}
