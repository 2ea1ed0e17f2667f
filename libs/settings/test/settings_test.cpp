#include "assetcat/settings.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using namespace assetcat;
using namespace assetcat::settings;

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* name, const std::string& value) : name_(name) {
        if (const char* original = std::getenv(name)) {
            had_original_ = true;
            original_value_ = original;
        }
        setenv(name_.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (had_original_)
            setenv(name_.c_str(), original_value_.c_str(), 1);
        else
            unsetenv(name_.c_str());
    }

private:
    std::string name_;
    bool had_original_ = false;
    std::string original_value_;
};

struct TempDir {
    fs::path path;
    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("assetcat-settings-" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write(const fs::path& p, const std::string& body) {
    std::ofstream out(p);
    out << body;
}

} // namespace

TEST(Settings, EnvironmentOverridesConfigPath) {
    ScopedEnvVar env("ASSETCAT_CONFIG", "/tmp/elsewhere/assetcat.json");
    EXPECT_EQ(config_path(), fs::path("/tmp/elsewhere/assetcat.json"));
}

TEST(Settings, MissingFileGivesDefaults) {
    TempDir tmp;
    auto cfg = load_config(tmp.path / "absent.json");
    EXPECT_EQ(cfg.scan.duplicate_policy, "merge");
    EXPECT_EQ(cfg.thumbd.fast_workers, 12);
    EXPECT_EQ(cfg.thumbd.slow_queue, 10);

    auto d = daemon_config(cfg);
    EXPECT_EQ(d.size_threshold, 30ll * 1024 * 1024);
    EXPECT_EQ(d.fast_timeout, std::chrono::seconds(120));
    EXPECT_EQ(d.slow_timeout, std::chrono::seconds(600));
    EXPECT_EQ(d.storage, thumbd::StorageMode::Central);
}

TEST(Settings, ReadsNestedSections) {
    TempDir tmp;
    auto path = tmp.path / "config.json";
    write(path, R"({
        "db": "/data/catalog.db",
        "central_dir": "/data/thumbs",
        "scan": {"duplicate_policy": "warn", "progress_every": 5},
        "thumbd": {
            "fast_workers": 4,
            "size_threshold_mb": 8,
            "storage_mode": "auto",
            "renderers": [
                {"id": "blender", "command": ["blender", "-b", "{input}"], "formats": ["blend"], "score": 70}
            ]
        }
    })");

    auto cfg = load_config(path);
    EXPECT_EQ(db_path(cfg), "/data/catalog.db");
    EXPECT_EQ(central_dir(cfg), fs::path("/data/thumbs"));
    EXPECT_EQ(cfg.scan.duplicate_policy, "warn");
    EXPECT_EQ(scanner_options(cfg).progress_every, 5);
    EXPECT_TRUE(cfg.scan.recursive);

    auto d = daemon_config(cfg);
    EXPECT_EQ(d.fast_workers, 4);
    EXPECT_EQ(d.slow_workers, 2);
    EXPECT_EQ(d.size_threshold, 8ll * 1024 * 1024);
    EXPECT_EQ(d.storage, thumbd::StorageMode::Auto);

    ASSERT_EQ(cfg.thumbd.renderers.size(), 1u);
    EXPECT_EQ(cfg.thumbd.renderers[0].id, "blender");
    EXPECT_EQ(cfg.thumbd.renderers[0].command.size(), 3u);
    EXPECT_EQ(cfg.thumbd.renderers[0].score, 70);
}

TEST(Settings, BadValuesNameTheKey) {
    TempDir tmp;
    auto path = tmp.path / "config.json";

    write(path, R"({"scan": {"duplicate_policy": "keep"}})");
    try {
        load_config(path);
        FAIL() << "expected an error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("scan.duplicate_policy"), std::string::npos);
    }

    write(path, R"({"thumbd": {"fast_workers": "many"}})");
    try {
        load_config(path);
        FAIL() << "expected an error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("thumbd.fast_workers"), std::string::npos);
    }

    write(path, R"({"thumbd": {"slow_workers": 0}})");
    EXPECT_THROW(load_config(path), std::runtime_error);

    write(path, R"({"thumbd": {"storage_mode": "sidecar"}})");
    EXPECT_THROW(load_config(path), std::runtime_error);

    write(path, R"({"thumbd": {"renderers": [{"id": "x"}]}})");
    EXPECT_THROW(load_config(path), std::runtime_error);

    write(path, "{ not json");
    EXPECT_THROW(load_config(path), std::runtime_error);
}

TEST(Settings, SaveThenLoad) {
    TempDir tmp;
    auto path = tmp.path / "nested" / "config.json";

    AppConfig cfg;
    cfg.db = "/srv/catalog.db";
    cfg.verbosity = 1;
    cfg.scan.duplicate_policy = "reject";
    cfg.scan.recursive = false;
    cfg.thumbd.slow_timeout_s = 900;
    cfg.thumbd.placeholder = false;
    cfg.thumbd.renderers.push_back({.id = "cp", .command = {"cp", "{input}", "{output}"}, .formats = {}, .score = 5});
    save_config(path, cfg);

    auto loaded = load_config(path);
    EXPECT_EQ(loaded.db, cfg.db);
    EXPECT_EQ(loaded.verbosity, 1);
    EXPECT_EQ(loaded.scan.duplicate_policy, "reject");
    EXPECT_FALSE(loaded.scan.recursive);
    EXPECT_EQ(loaded.thumbd.slow_timeout_s, 900);
    EXPECT_FALSE(loaded.thumbd.placeholder);
    ASSERT_EQ(loaded.thumbd.renderers.size(), 1u);
    EXPECT_EQ(loaded.thumbd.renderers[0].command[2], "{output}");
}

TEST(Settings, ConfiguredRenderersOverrideBuiltins) {
    AppConfig cfg;
    cfg.thumbd.placeholder = false;
    cfg.thumbd.renderers.push_back({.id = "f3d", .command = {"sh", "-c", "true"}, .formats = {"stl"}, .score = 99});

    thumbd::RendererRegistry reg;
    register_renderers(reg, cfg);

    int f3d = 0;
    for (const auto& r : reg.renderers()) {
        EXPECT_NE(r.renderer->id(), "placeholder");
        if (r.renderer->id() == "f3d") {
            f3d++;
            EXPECT_EQ(r.source, "config");
        }
    }
    EXPECT_EQ(f3d, 1);
    auto chain = reg.chain("stl");
    ASSERT_FALSE(chain.empty());
    EXPECT_EQ(chain[0]->id(), "f3d");
}
