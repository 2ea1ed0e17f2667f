#include "assetcat/thumbd.h"
#include "assetcat/errors.h"
#include "assetcat/thumbd_png.h"
#include "assetcat/thumbd_process.h"

#include <gtest/gtest.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <random>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace assetcat;
using namespace assetcat::thumbd;
using catalog::AssetKind;
using namespace std::chrono_literals;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("assetcat-thumbd-" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// FakeRenderer either fails or draws a placeholder, counting calls.
class FakeRenderer : public Renderer {
public:
    FakeRenderer(std::string id, int score, bool fail, std::vector<std::string> formats = {})
        : id_(std::move(id)), score_(score), fail_(fail), formats_(std::move(formats)) {}

    const std::string& id() const override { return id_; }
    ProbeResult probe() const override { return {.available = true, .score = score_}; }
    bool supports(const std::string& format) const override {
        return formats_.empty() || std::find(formats_.begin(), formats_.end(), format) != formats_.end();
    }
    void render(const RenderRequest& req) const override {
        calls++;
        if (fail_) throw RenderBackendError(id_ + ": broken");
        PlaceholderRenderer().render(req);
    }

    mutable std::atomic<int> calls{0};

private:
    std::string id_;
    int score_ = 0;
    bool fail_ = false;
    std::vector<std::string> formats_;
};

class TimeoutRenderer : public Renderer {
public:
    const std::string& id() const override { return id_; }
    ProbeResult probe() const override { return {.available = true, .score = 100}; }
    bool supports(const std::string&) const override { return true; }
    void render(const RenderRequest&) const override { throw RenderTimeoutError("slow: timed out"); }

private:
    std::string id_ = "slow";
};

void set_mtime(const fs::path& p, int64_t unix_seconds) {
    auto sys = std::chrono::sys_seconds(std::chrono::seconds(unix_seconds));
    fs::last_write_time(p, std::chrono::file_clock::from_sys(sys));
}

void put16(std::string& s, uint16_t v) { s.append(reinterpret_cast<const char*>(&v), 2); }
void put32(std::string& s, uint32_t v) { s.append(reinterpret_cast<const char*>(&v), 4); }

// Stored-only ZIP holding a single member.
std::string stored_zip(const std::string& name, const std::string& data) {
    auto crc = static_cast<uint32_t>(
        crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
    auto size = static_cast<uint32_t>(data.size());
    auto name_len = static_cast<uint16_t>(name.size());

    std::string out;
    put32(out, 0x04034b50);
    put16(out, 20); put16(out, 0); put16(out, 0); put16(out, 0); put16(out, 0);
    put32(out, crc); put32(out, size); put32(out, size);
    put16(out, name_len); put16(out, 0);
    out += name;
    out += data;

    std::string central;
    put32(central, 0x02014b50);
    put16(central, 20); put16(central, 20); put16(central, 0); put16(central, 0);
    put16(central, 0); put16(central, 0);
    put32(central, crc); put32(central, size); put32(central, size);
    put16(central, name_len);
    put16(central, 0); put16(central, 0); put16(central, 0); put16(central, 0);
    put32(central, 0);
    put32(central, 0);
    central += name;

    auto cd_offset = static_cast<uint32_t>(out.size());
    out += central;
    put32(out, 0x06054b50);
    put16(out, 0); put16(out, 0); put16(out, 1); put16(out, 1);
    put32(out, static_cast<uint32_t>(central.size()));
    put32(out, cd_offset);
    put16(out, 0);
    return out;
}

catalog::PendingThumb pending(const volume::Volume& v, const std::string& rel, const std::string& hash) {
    catalog::PendingThumb p;
    p.kind = AssetKind::Model;
    p.volume = v;
    p.asset.id = 7;
    p.asset.volume_id = v.id;
    p.asset.relative_path = rel;
    p.asset.filename = fs::path(rel).filename().string();
    p.asset.partial_hash = hash;
    p.asset.folder_path = volume::folder_path(rel);
    return p;
}

} // namespace

// ---------------------------------------------------------------------------
// Child processes
// ---------------------------------------------------------------------------

TEST(ChildProcess, ReportsExitCode) {
    ChildProcess child;
    ASSERT_TRUE(child.launch("sh", {"-c", "exit 3"}));
    EXPECT_TRUE(child.wait_until(std::chrono::steady_clock::now() + 5s));
    EXPECT_FALSE(child.running());
    EXPECT_EQ(child.exit_code(), 3);
}

TEST(ChildProcess, MissingProgramExits127) {
    ChildProcess child;
    ASSERT_TRUE(child.launch("assetcat-no-such-program", {}));
    EXPECT_TRUE(child.wait_until(std::chrono::steady_clock::now() + 5s));
    EXPECT_EQ(child.exit_code(), 127);
}

TEST(ChildProcess, StopKillsPastDeadline) {
    ChildProcess child;
    ASSERT_TRUE(child.launch("sleep", {"5"}));
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(child.wait_until(start + 100ms));
    child.stop();
    EXPECT_FALSE(child.running());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

TEST(ChildProcess, AbortFlagEndsWait) {
    ChildProcess child;
    ASSERT_TRUE(child.launch("sleep", {"5"}));
    std::atomic<bool> abort{true};
    EXPECT_FALSE(child.wait_until(std::chrono::steady_clock::now() + 5s, &abort));
}

TEST(ChildProcess, OnPath) {
    EXPECT_TRUE(on_path("sh"));
    EXPECT_TRUE(on_path("/bin/sh"));
    EXPECT_FALSE(on_path("assetcat-no-such-program"));
}

// ---------------------------------------------------------------------------
// Renderers
// ---------------------------------------------------------------------------

TEST(Renderer, ExpandTemplate) {
    RenderRequest req{.input = "/v/a b.stl", .output = "/t/x.partial.png", .size = 256};
    EXPECT_EQ(expand_template("{input}", req), "/v/a b.stl");
    EXPECT_EQ(expand_template("--out={output}", req), "--out=/t/x.partial.png");
    EXPECT_EQ(expand_template("{output_stem}", req), "/t/x.partial");
    EXPECT_EQ(expand_template("{size}x{size}", req), "256x256");
    EXPECT_EQ(expand_template("-a", req), "-a");
}

TEST(Renderer, AvailabilityFollowsPath) {
    ExternalRenderer missing("x", {"assetcat-no-such-program", "{input}"}, {}, 50);
    EXPECT_FALSE(missing.probe().available);
    EXPECT_FALSE(missing.probe().reason.empty());

    ExternalRenderer wrapped("w", {"xvfb-run", "-a", "assetcat-no-such-program"}, {}, 50);
    EXPECT_FALSE(wrapped.probe().available);

    ExternalRenderer sh("sh", {"sh", "-c", "true"}, {"stl"}, 50);
    EXPECT_TRUE(sh.probe().available);
    EXPECT_EQ(sh.probe().score, 50);
    EXPECT_TRUE(sh.supports("stl"));
    EXPECT_FALSE(sh.supports("pdf"));
}

TEST(Renderer, ChainOrdersByScoreThenId) {
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("b", 50, false), "config");
    reg.add(std::make_shared<FakeRenderer>("a", 50, false), "config");
    reg.add(std::make_shared<FakeRenderer>("top", 90, false, std::vector<std::string>{"stl"}), "builtin");
    reg.add(std::make_shared<ExternalRenderer>("gone", std::vector<std::string>{"assetcat-no-such-program"},
                                               std::vector<std::string>{}, 100),
            "config");

    auto stl = reg.chain("stl");
    ASSERT_EQ(stl.size(), 3u);
    EXPECT_EQ(stl[0]->id(), "top");
    EXPECT_EQ(stl[1]->id(), "a");
    EXPECT_EQ(stl[2]->id(), "b");

    auto pdf = reg.chain("pdf");
    ASSERT_EQ(pdf.size(), 2u);
    EXPECT_EQ(pdf[0]->id(), "a");
}

TEST(Renderer, SameIdReplacesEarlierRecord) {
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("f3d", 90, false), "builtin");
    reg.add(std::make_shared<FakeRenderer>("f3d", 10, false), "config");
    ASSERT_EQ(reg.renderers().size(), 1u);
    EXPECT_EQ(reg.renderers()[0].source, "config");
    EXPECT_EQ(reg.renderers()[0].probe.score, 10);
}

TEST(Renderer, BuiltinsAlwaysIncludePlaceholder) {
    RendererRegistry reg;
    register_builtin_renderers(reg, {});
    auto chain = reg.chain("stl");
    ASSERT_FALSE(chain.empty());
    EXPECT_EQ(chain.back()->id(), "placeholder");

    RendererRegistry bare;
    register_builtin_renderers(bare, {.placeholder = false});
    for (const auto& r : bare.renderers()) EXPECT_NE(r.renderer->id(), "placeholder");
}

TEST(Renderer, PlaceholderWritesPng) {
    TempDir tmp;
    RenderRequest req{.output = tmp.path / "p.png", .category = formats::ThumbCategory::Pdf, .size = 64};
    PlaceholderRenderer().render(req);
    EXPECT_TRUE(is_png(req.output));

    req.size = 0;
    EXPECT_THROW(PlaceholderRenderer().render(req), RenderBackendError);
}

TEST(Png, WritesWholeImages) {
    TempDir tmp;
    Image rgba(3, 2, 4);
    for (int y = 0; y < 2; ++y)
        for (int x = 0; x < 3; ++x) rgba.at(x, y)[3] = 255;
    write_png(tmp.path / "rgba.png", rgba);
    EXPECT_TRUE(is_png(tmp.path / "rgba.png"));

    Image short_rows(4, 4, 3);
    short_rows.pixels.pop_back();
    EXPECT_THROW(write_png(tmp.path / "bad.png", short_rows), RenderBackendError);
    EXPECT_THROW(write_png(tmp.path / "bad.png", Image(4, 4, 2)), RenderBackendError);
    EXPECT_THROW(write_png(tmp.path / "no-such-dir" / "x.png", Image(2, 2, 3)), IOError);

    {
        std::ofstream out(tmp.path / "fake.png", std::ios::binary);
        out << "\x89PNG but not really";
    }
    EXPECT_FALSE(is_png(tmp.path / "fake.png"));
    EXPECT_FALSE(is_png(tmp.path / "missing.png"));
}

TEST(Renderer, PlaceholderReportsUnwritableOutputAsBackendError) {
    TempDir tmp;
    RenderRequest req{.output = tmp.path / "no-such-dir" / "p.png", .size = 16};
    EXPECT_THROW(PlaceholderRenderer().render(req), RenderBackendError);
}

TEST(Renderer, ChainFallsThroughBackendErrors) {
    TempDir tmp;
    FakeRenderer broken("broken", 90, true);
    FakeRenderer good("good", 10, false);
    RenderRequest req{.output = tmp.path / "t.png", .format = "stl", .size = 32};

    EXPECT_EQ(render_with_chain({&broken, &good}, req), "good");
    EXPECT_EQ(broken.calls.load(), 1);
    EXPECT_TRUE(is_png(req.output));

    EXPECT_THROW(render_with_chain({&broken}, req), RenderBackendError);
    EXPECT_THROW(render_with_chain({}, req), RenderBackendError);
}

TEST(Renderer, TimeoutStopsTheChain) {
    TempDir tmp;
    TimeoutRenderer slow;
    FakeRenderer good("good", 10, false);
    RenderRequest req{.output = tmp.path / "t.png", .size = 32};
    EXPECT_THROW(render_with_chain({&slow, &good}, req), RenderTimeoutError);
    EXPECT_EQ(good.calls.load(), 0);
}

TEST(Renderer, ExternalCommandProducesThumbnail) {
    TempDir tmp;
    PlaceholderRenderer().render({.output = tmp.path / "src.png", .size = 16});

    ExternalRenderer cp("cp", {"cp", "{input}", "{output}"}, {}, 50);
    RenderRequest req{.input = tmp.path / "src.png", .output = tmp.path / "out.png",
                      .deadline = std::chrono::steady_clock::now() + 10s};
    cp.render(req);
    EXPECT_TRUE(is_png(req.output));

    ExternalRenderer fails("false", {"sh", "-c", "exit 2"}, {}, 50);
    EXPECT_THROW(fails.render(req), RenderBackendError);

    ExternalRenderer nothing("true", {"sh", "-c", "true"}, {}, 50);
    req.output = tmp.path / "never.png";
    EXPECT_THROW(nothing.render(req), RenderBackendError);
}

TEST(Renderer, ExternalCommandTimesOut) {
    ExternalRenderer sleeper("sleep", {"sleep", "5"}, {}, 50);
    RenderRequest req{.output = "/nonexistent/x.png",
                      .deadline = std::chrono::steady_clock::now() + 200ms};
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(sleeper.render(req), RenderTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

// ---------------------------------------------------------------------------
// Worker pool
// ---------------------------------------------------------------------------

TEST(WorkerPool, RejectsWhenQueueIsFull) {
    std::promise<void> started;
    auto started_f = started.get_future();
    std::promise<void> release;
    auto gate = release.get_future().share();

    WorkerPool pool("test", 1, 1, 10s);
    ASSERT_TRUE(pool.try_submit([&](WorkerPool::Clock::time_point) {
        started.set_value();
        gate.wait();
    }));
    started_f.wait();

    EXPECT_TRUE(pool.try_submit([](WorkerPool::Clock::time_point) {}));
    EXPECT_FALSE(pool.try_submit([](WorkerPool::Clock::time_point) {}));
    EXPECT_EQ(pool.pending(), 2u);

    release.set_value();
    pool.wait_idle();
    EXPECT_EQ(pool.pending(), 0u);

    pool.stop();
    EXPECT_FALSE(pool.try_submit([](WorkerPool::Clock::time_point) {}));
}

TEST(WorkerPool, TaskReceivesDeadline) {
    WorkerPool pool("test", 2, 4, 30s);
    std::promise<WorkerPool::Clock::time_point> got;
    auto f = got.get_future();
    auto before = WorkerPool::Clock::now();
    ASSERT_TRUE(pool.try_submit([&](WorkerPool::Clock::time_point deadline) { got.set_value(deadline); }));
    auto deadline = f.get();
    EXPECT_GE(deadline, before + 30s);
    EXPECT_LT(deadline, before + 40s);
}

TEST(WorkerPool, RejectsBadSizes) {
    EXPECT_THROW(WorkerPool("x", 0, 1, 1s), std::invalid_argument);
    EXPECT_THROW(WorkerPool("x", 1, 0, 1s), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Store
// ---------------------------------------------------------------------------

TEST(ThumbStore, CentralLayout) {
    ThumbStore store("/thumbs", StorageMode::Central);
    volume::Volume v{.id = 1, .mount_path = "/vol"};

    auto loc = store.location(pending(v, "minis/orc.stl", "abc123"), formats::ThumbCategory::Model3D);
    EXPECT_EQ(loc.storage, "central");
    EXPECT_EQ(loc.stored_path, "3d/abc123.png");
    EXPECT_EQ(loc.absolute, fs::path("/thumbs/3d/abc123.png"));

    auto unhashed = store.location(pending(v, "doc.pdf", ""), formats::ThumbCategory::Pdf);
    EXPECT_EQ(unhashed.stored_path, "pdf/model-7.png");

    EXPECT_EQ(ThumbStore::safe_stem("a b/c:d.e", 5), "a_b_c");
}

TEST(ThumbStore, SidecarBesideWritableSource) {
    TempDir tmp;
    fs::create_directories(tmp.path / "minis");
    volume::Volume v{.id = 1, .mount_path = tmp.path.string()};
    ThumbStore store(tmp.path / "central", StorageMode::Auto);

    auto loc = store.location(pending(v, "minis/orc.stl", "abc123"), formats::ThumbCategory::Model3D);
    EXPECT_EQ(loc.storage, "sidecar");
    EXPECT_EQ(loc.stored_path, "minis/.orc.stl.thumb.png");
    EXPECT_EQ(loc.absolute, tmp.path / "minis" / ".orc.stl.thumb.png");

    auto member = store.location(pending(v, "minis/pack.zip::inner/big orc.obj", "0123456789ab"),
                                 formats::ThumbCategory::Model3D);
    EXPECT_EQ(member.stored_path, "minis/.pack.zip.dam/thumbs/big_orc_01234567.thumb.png");

    catalog::Asset a;
    a.thumb_storage = "sidecar";
    a.thumb_path = loc.stored_path;
    EXPECT_EQ(store.resolve(v, a), loc.absolute);
}

TEST(ThumbStore, ReadOnlyVolumeFallsBackToCentral) {
    TempDir tmp;
    volume::Volume v{.id = 1, .mount_path = tmp.path.string(), .is_readonly = true};
    ThumbStore store(tmp.path / "central", StorageMode::Auto);
    auto loc = store.location(pending(v, "orc.stl", "abc"), formats::ThumbCategory::Model3D);
    EXPECT_EQ(loc.storage, "central");

    EXPECT_EQ(parse_storage_mode("auto"), StorageMode::Auto);
    EXPECT_THROW(parse_storage_mode("sidecar"), std::runtime_error);
}

// ---------------------------------------------------------------------------
// Daemon
// ---------------------------------------------------------------------------

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = tmp.path / "vol";
        fs::create_directories(root);
        cat = std::make_unique<catalog::Catalog>(catalog::Catalog::open((tmp.path / "catalog.db").string()));
        volume_id = cat->add_volume("nas", root.string(), false);
        cfg.central_dir = tmp.path / "thumbs";
        cfg.fast_workers = 2;
        cfg.slow_workers = 1;
        cfg.thumb_size = 32;
    }

    int64_t add(const std::string& rel, const std::string& hash, const std::string& format = "stl") {
        auto p = root / rel;
        fs::create_directories(p.parent_path());
        {
            std::ofstream out(p, std::ios::binary);
            out << "solid " << rel;
        }
        set_mtime(p, 1700000000);

        catalog::Asset a;
        a.volume_id = volume_id;
        a.relative_path = rel;
        a.filename = p.filename().string();
        a.format = format;
        a.file_size = static_cast<int64_t>(fs::file_size(p));
        a.file_mtime = 1700000000;
        a.partial_hash = hash;
        a.folder_path = volume::folder_path(rel);
        return cat->insert(AssetKind::Model, a);
    }

    TempDir tmp;
    fs::path root;
    std::unique_ptr<catalog::Catalog> cat;
    formats::Registry formats = formats::Registry::with_builtins();
    DaemonConfig cfg;
    int64_t volume_id = 0;
};

TEST_F(DaemonTest, RendersAndRecordsAllColumns) {
    auto id = add("minis/orc.stl", "aaa");
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("fake", 50, false), "config");

    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();

    auto a = cat->get(AssetKind::Model, id);
    ASSERT_TRUE(a);
    EXPECT_EQ(a->thumb_storage, "central");
    EXPECT_EQ(a->thumb_path, "3d/aaa.png");
    ASSERT_TRUE(a->thumb_rendered_at);
    EXPECT_GE(*a->thumb_rendered_at, 1700000000);
    EXPECT_EQ(a->thumb_source_mtime, 1700000000);
    EXPECT_FALSE(a->force_rerender);
    EXPECT_TRUE(is_png(cfg.central_dir / "3d/aaa.png"));
    EXPECT_EQ(d.progress().rendered_total, 1);

    // Nothing left to do.
    EXPECT_EQ(d.run_cycle(), 0);
    EXPECT_EQ(d.state(), State::Idle);
    EXPECT_STREQ(state_name(d.state()), "idle");
}

TEST_F(DaemonTest, FailureLeavesRowUntouched) {
    auto id = add("orc.stl", "bbb");
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("broken", 50, true), "config");

    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();

    auto a = cat->get(AssetKind::Model, id);
    ASSERT_TRUE(a);
    EXPECT_FALSE(a->thumb_path);
    EXPECT_FALSE(a->thumb_rendered_at);
    EXPECT_EQ(d.progress().failed_total, 1);
    EXPECT_EQ(cat->pending_thumbnails(10).size(), 1u);
}

TEST_F(DaemonTest, FormatWithoutRendererIsNotDispatched) {
    auto id = add("orc.stl", "fff");
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("pdf-only", 50, false, std::vector<std::string>{"pdf"}),
            "config");

    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 0);
    EXPECT_EQ(d.progress().failed_total, 0);
    EXPECT_FALSE(cat->get(AssetKind::Model, id)->thumb_path);
    EXPECT_EQ(d.state(), State::Idle);
}

TEST_F(DaemonTest, AdoptsExistingThumbnail) {
    auto id = add("orc.stl", "ccc");
    fs::create_directories(cfg.central_dir / "3d");
    PlaceholderRenderer().render({.output = cfg.central_dir / "3d/ccc.png", .size = 16});

    auto fake = std::make_shared<FakeRenderer>("fake", 50, false);
    RendererRegistry reg;
    reg.add(fake, "config");

    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 0);
    EXPECT_EQ(fake->calls.load(), 0);
    auto a = cat->get(AssetKind::Model, id);
    EXPECT_EQ(a->thumb_path, "3d/ccc.png");
    EXPECT_EQ(a->thumb_source_mtime, 1700000000);
}

TEST_F(DaemonTest, RequestRerenderHonoursStaleness) {
    auto id = add("orc.stl", "ddd");
    RendererRegistry reg;
    reg.add(std::make_shared<FakeRenderer>("fake", 50, false), "config");
    ThumbnailDaemon d(*cat, formats, reg, cfg);
    d.run_cycle();
    d.wait_idle();

    EXPECT_FALSE(d.request_rerender(AssetKind::Model, id, false));
    EXPECT_TRUE(d.request_rerender(AssetKind::Model, id, true));
    EXPECT_TRUE(cat->get(AssetKind::Model, id)->force_rerender);

    // A forced row renders again even though a thumbnail exists.
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();
    EXPECT_FALSE(cat->get(AssetKind::Model, id)->force_rerender);

    fs::remove(cfg.central_dir / "3d/ddd.png");
    EXPECT_TRUE(d.request_rerender(AssetKind::Model, id, false));
    EXPECT_FALSE(d.request_rerender(AssetKind::Model, 9999, true));
}

TEST_F(DaemonTest, RendersArchiveMembers) {
    auto zip = root / "pack.zip";
    {
        std::ofstream out(zip, std::ios::binary);
        out << stored_zip("m.stl", "solid");
    }
    set_mtime(zip, 1700000000);

    catalog::Asset a;
    a.volume_id = volume_id;
    a.relative_path = "pack.zip::m.stl";
    a.filename = "m.stl";
    a.format = "stl";
    a.file_size = 5;
    a.file_mtime = 1700000000;
    a.partial_hash = "eee";
    a.archive_path = "pack.zip";
    a.archive_member = "m.stl";
    auto id = cat->insert(AssetKind::Model, a);

    RendererRegistry reg;
    reg.add(std::make_shared<ExternalRenderer>("cat", std::vector<std::string>{"sh", "-c",
                "grep -q solid \"$0\" && cp \"$1\" \"$2\"", "{input}",
                (tmp.path / "src.png").string(), "{output}"}, std::vector<std::string>{}, 50),
            "config");
    PlaceholderRenderer().render({.output = tmp.path / "src.png", .size = 16});

    cfg.temp_dir = tmp.path;
    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();
    EXPECT_EQ(d.progress().failed_total, 0);
    EXPECT_EQ(cat->get(AssetKind::Model, id)->thumb_path, "3d/eee.png");
}

TEST_F(DaemonTest, ExpiredDeadlineSkipsExtraction) {
    auto zip = root / "pack.zip";
    {
        std::ofstream out(zip, std::ios::binary);
        out << stored_zip("m.stl", "solid");
    }
    set_mtime(zip, 1700000000);

    catalog::Asset a;
    a.volume_id = volume_id;
    a.relative_path = "pack.zip::m.stl";
    a.filename = "m.stl";
    a.format = "stl";
    a.file_size = 5;
    a.file_mtime = 1700000000;
    a.partial_hash = "fab";
    a.archive_path = "pack.zip";
    a.archive_member = "m.stl";
    auto id = cat->insert(AssetKind::Model, a);

    auto fake = std::make_shared<FakeRenderer>("fake", 50, false);
    RendererRegistry reg;
    reg.add(fake, "config");

    cfg.temp_dir = tmp.path / "scratch";
    fs::create_directories(cfg.temp_dir);
    cfg.fast_timeout = 0s;
    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();

    EXPECT_EQ(d.progress().failed_total, 1);
    EXPECT_EQ(fake->calls.load(), 0);
    EXPECT_FALSE(cat->get(AssetKind::Model, id)->thumb_path);
    EXPECT_TRUE(fs::is_empty(cfg.temp_dir));
}

TEST_F(DaemonTest, InProcessRenderPastDeadlineIsDiscarded) {
    // Draws a valid thumbnail, but only after the deadline has passed.
    class LateRenderer : public Renderer {
    public:
        const std::string& id() const override { return id_; }
        ProbeResult probe() const override { return {.available = true, .score = 100}; }
        bool supports(const std::string&) const override { return true; }
        void render(const RenderRequest& req) const override {
            std::this_thread::sleep_until(req.deadline + 50ms);
            PlaceholderRenderer().render(req);
        }

    private:
        std::string id_ = "late";
    };

    auto id = add("orc.stl", "abc");
    RendererRegistry reg;
    reg.add(std::make_shared<LateRenderer>(), "config");
    cfg.fast_timeout = 1s;

    ThumbnailDaemon d(*cat, formats, reg, cfg);
    EXPECT_EQ(d.run_cycle(), 1);
    d.wait_idle();

    EXPECT_EQ(d.progress().failed_total, 1);
    EXPECT_EQ(d.progress().rendered_total, 0);
    EXPECT_FALSE(cat->get(AssetKind::Model, id)->thumb_path);
    EXPECT_FALSE(fs::exists(cfg.central_dir / "3d/abc.png"));
}
