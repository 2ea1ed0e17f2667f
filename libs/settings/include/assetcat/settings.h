#pragma once

#include "assetcat/scanner.h"
#include "assetcat/thumbd.h"

#include <filesystem>
#include <string>
#include <vector>

namespace assetcat::settings {

// RendererSpec declares an extra external renderer (or overrides a built-in one
// with the same id).
struct RendererSpec {
    std::string id;
    std::vector<std::string> command; // argv template, see thumbd::expand_template
    std::vector<std::string> formats; // empty = every format
    int score = 50;
};

struct ScanDefaults {
    std::string duplicate_policy = "merge";
    bool recursive = true;
    bool verify_full_hash = true;
    int progress_every = 25;
};

struct ThumbdDefaults {
    int size_threshold_mb = 30;
    int fast_workers = 12;
    int slow_workers = 2;
    int fast_queue = 100;
    int slow_queue = 10;
    int fast_timeout_s = 120;
    int slow_timeout_s = 600;
    int poll_interval_ms = 5000;
    int poll_limit = 500;
    int thumb_size = 512;
    std::string storage_mode = "central";
    bool placeholder = true;
    bool use_xvfb = false;
    std::string temp_dir;
    std::vector<RendererSpec> renderers;
};

struct AppConfig {
    std::string db;           // empty = <data dir>/catalog.db
    std::string central_dir;  // empty = <data dir>/thumbnails
    int verbosity = 0;
    ScanDefaults scan;
    ThumbdDefaults thumbd;
};

// config_path: $ASSETCAT_CONFIG, then config.json beside the executable, then
// ~/.config/assetcat/config.json.
std::filesystem::path config_path();

// data_dir is ~/.local/share/assetcat (or the working directory without $HOME).
std::filesystem::path data_dir();

// load_config returns defaults when the file does not exist. Malformed JSON, a
// wrong type or an out-of-range value throws std::runtime_error naming the key.
AppConfig load_config(const std::filesystem::path& path);

// validate checks the values load_config cannot type-check. Throws std::runtime_error.
void validate(const AppConfig& cfg);

// save_config writes pretty JSON, creating parent directories.
void save_config(const std::filesystem::path& path, const AppConfig& cfg);

std::string db_path(const AppConfig& cfg);
std::filesystem::path central_dir(const AppConfig& cfg);

scanner::ScannerOptions scanner_options(const AppConfig& cfg);
thumbd::DaemonConfig daemon_config(const AppConfig& cfg);

// register_renderers adds the built-ins, then the configured renderers.
void register_renderers(thumbd::RendererRegistry& registry, const AppConfig& cfg);

} // namespace assetcat::settings
