#include "assetcat/errors.h"
#include "assetcat/scanner.h"
#include "assetcat/thumbd.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace assetcat;
using catalog::AssetKind;
using namespace std::chrono_literals;

namespace {

// Gate holds back renders of large inputs until opened.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
};

class BlockingRenderer : public thumbd::Renderer {
public:
    BlockingRenderer(Gate& gate, int64_t threshold) : gate_(gate), threshold_(threshold) {}

    const std::string& id() const override { return id_; }
    thumbd::ProbeResult probe() const override { return {.available = true, .score = 100}; }
    bool supports(const std::string&) const override { return true; }

    void render(const thumbd::RenderRequest& req) const override {
        if (static_cast<int64_t>(fs::file_size(req.input)) >= threshold_) {
            std::unique_lock<std::mutex> lock(gate_.mutex);
            while (!gate_.open) {
                if (req.abort && req.abort->load()) throw RenderBackendError("blocking: aborted");
                if (std::chrono::steady_clock::now() >= req.deadline)
                    throw RenderTimeoutError("blocking: timed out");
                gate_.cv.wait_for(lock, 20ms);
            }
        }
        thumbd::PlaceholderRenderer().render(req);
    }

private:
    Gate& gate_;
    int64_t threshold_ = 0;
    std::string id_ = "blocking";
};

// wait_for polls pred until it holds or the timeout passes.
bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

class DaemonScenario : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        tmp = fs::temp_directory_path() / ("assetcat-daemon-" + std::to_string(rd()));
        root = tmp / "library";
        fs::create_directories(root);
        cat = std::make_unique<catalog::Catalog>(catalog::Catalog::open((tmp / "catalog.db").string()));
        volume_id = cat->add_volume("library", root.string(), false);

        cfg.central_dir = tmp / "thumbs";
        cfg.thumb_size = 32;
        cfg.fast_workers = 4;
        cfg.slow_workers = 2;
    }

    void TearDown() override {
        cat.reset();
        std::error_code ec;
        fs::remove_all(tmp, ec);
    }

    void write(const std::string& rel, const std::string& body) {
        auto p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << body;
    }

    scanner::ScanResult scan() {
        scanner::Scanner s(*cat, registry);
        return s.scan({.path = root});
    }

    std::optional<catalog::Asset> row(const std::string& rel) {
        return cat->find_by_path(AssetKind::Model, volume_id, rel);
    }

    fs::path tmp;
    fs::path root;
    std::unique_ptr<catalog::Catalog> cat;
    formats::Registry registry = formats::Registry::with_builtins();
    thumbd::DaemonConfig cfg;
    int64_t volume_id = 0;
};

void expect_rendered(const catalog::Asset& a) {
    ASSERT_TRUE(a.thumb_storage) << a.relative_path;
    ASSERT_TRUE(a.thumb_path) << a.relative_path;
    ASSERT_TRUE(a.thumb_rendered_at) << a.relative_path;
    ASSERT_TRUE(a.thumb_source_mtime) << a.relative_path;
    EXPECT_EQ(*a.thumb_source_mtime, a.file_mtime) << a.relative_path;
    EXPECT_GE(*a.thumb_rendered_at, *a.thumb_source_mtime) << a.relative_path;
    EXPECT_FALSE(a.force_rerender) << a.relative_path;
}

} // namespace

TEST_F(DaemonScenario, SlowLaneDoesNotHoldBackSmallFiles) {
    for (int i = 0; i < 100; ++i) write("small/s" + std::to_string(i) + ".stl", "solid s" + std::to_string(i));
    for (int i = 0; i < 5; ++i) {
        auto p = root / "large" / ("l" + std::to_string(i) + ".stl");
        fs::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << "solid large";
        // Sparse, and a distinct size each so the fingerprints differ.
        fs::resize_file(p, 31ull * 1024 * 1024 + static_cast<uintmax_t>(i));
    }
    ASSERT_EQ(scan().added, 105);

    Gate gate;
    thumbd::RendererRegistry renderers;
    renderers.add(std::make_shared<BlockingRenderer>(gate, cfg.size_threshold), "builtin");
    cfg.fast_queue = 200;

    thumbd::ThumbnailDaemon d(*cat, registry, renderers, cfg);
    ASSERT_EQ(d.run_cycle(), 105);

    EXPECT_TRUE(wait_for([&]() {
        auto p = d.progress();
        return p.rendered_total >= 100 && p.pending_fast == 0;
    }, 30s));
    auto p = d.progress();
    EXPECT_EQ(p.rendered_total, 100);
    EXPECT_EQ(p.pending_fast, 0u);
    EXPECT_EQ(p.pending_slow, 5u);

    gate.release();
    d.wait_idle();
    EXPECT_EQ(d.progress().rendered_total, 105);
    EXPECT_EQ(d.progress().failed_total, 0);
    EXPECT_EQ(d.state(), thumbd::State::Idle);

    auto rows = cat->list_in_volume(AssetKind::Model, volume_id);
    ASSERT_EQ(rows.size(), 105u);
    for (const auto& a : rows) expect_rendered(a);
    EXPECT_TRUE(cat->pending_thumbnails(500).empty());
}

TEST_F(DaemonScenario, TimedOutRowIsRetriedNextCycle) {
    write("minis/orc.stl", "solid orc");
    scan();

    thumbd::RendererRegistry renderers;
    renderers.add(std::make_shared<thumbd::ExternalRenderer>(
                      "sleeper", std::vector<std::string>{"sh", "-c", "sleep 5"},
                      std::vector<std::string>{}, 100),
                  "config");
    cfg.fast_timeout = 1s;

    thumbd::ThumbnailDaemon d(*cat, registry, renderers, cfg);
    auto started = std::chrono::steady_clock::now();
    ASSERT_EQ(d.run_cycle(), 1);
    d.wait_idle();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
    EXPECT_EQ(d.progress().failed_total, 1);
    EXPECT_EQ(d.progress().rendered_total, 0);

    auto a = row("minis/orc.stl");
    ASSERT_TRUE(a);
    EXPECT_FALSE(a->thumb_path);
    EXPECT_FALSE(a->thumb_rendered_at);
    EXPECT_FALSE(a->thumb_source_mtime);

    // Nothing is left behind in the thumbnail directory.
    std::error_code ec;
    for (const auto& e : fs::recursive_directory_iterator(cfg.central_dir, ec))
        EXPECT_FALSE(e.is_regular_file()) << e.path();

    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();
    EXPECT_EQ(d.progress().failed_total, 2);
}

TEST_F(DaemonScenario, AutoStorageWritesSidecars) {
    write("minis/orc.stl", "solid orc");
    scan();

    thumbd::RendererRegistry renderers;
    renderers.add(std::make_shared<thumbd::PlaceholderRenderer>(), "builtin");
    cfg.storage = thumbd::StorageMode::Auto;

    thumbd::ThumbnailDaemon d(*cat, registry, renderers, cfg);
    ASSERT_EQ(d.run_cycle(), 1);
    d.wait_idle();

    auto a = row("minis/orc.stl");
    ASSERT_TRUE(a);
    expect_rendered(*a);
    EXPECT_EQ(a->thumb_storage, "sidecar");
    EXPECT_EQ(a->thumb_path, "minis/.orc.stl.thumb.png");
    EXPECT_TRUE(fs::exists(root / "minis" / ".orc.stl.thumb.png"));
    EXPECT_FALSE(fs::exists(cfg.central_dir / "3d"));

    // A forced rerender of a current sidecar renders over it.
    EXPECT_TRUE(d.request_rerender(AssetKind::Model, a->id, true));
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();
    EXPECT_EQ(d.progress().rendered_total, 2);
    EXPECT_FALSE(row("minis/orc.stl")->force_rerender);
}

TEST_F(DaemonScenario, RunLoopWakesOnRerenderRequest) {
    write("minis/orc.stl", "solid orc");
    scan();
    auto id = row("minis/orc.stl")->id;

    thumbd::RendererRegistry renderers;
    renderers.add(std::make_shared<thumbd::PlaceholderRenderer>(), "builtin");
    cfg.poll_interval = 60s;

    thumbd::ThumbnailDaemon d(*cat, registry, renderers, cfg);
    std::thread loop([&]() { d.run(); });

    EXPECT_TRUE(wait_for([&]() {
        auto a = cat->get(AssetKind::Model, id);
        return a && a->thumb_path.has_value();
    }, 10s));
    EXPECT_EQ(d.progress().rendered_total, 1);

    // The next poll is a minute away; the request must not wait for it.
    EXPECT_FALSE(d.request_rerender(AssetKind::Model, id, false));
    EXPECT_TRUE(d.request_rerender(AssetKind::Model, id, true));
    EXPECT_TRUE(wait_for([&]() {
        auto a = cat->get(AssetKind::Model, id);
        return d.progress().rendered_total >= 2 && a && !a->force_rerender;
    }, 10s));

    d.stop();
    loop.join();
    EXPECT_EQ(d.state(), thumbd::State::Stopped);
    expect_rendered(*cat->get(AssetKind::Model, id));
}
