#pragma once

#include "assetcat/catalog.h"
#include "assetcat/formats.h"
#include "assetcat/thumbd_pool.h"
#include "assetcat/thumbd_renderer.h"
#include "assetcat/thumbd_store.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace assetcat::thumbd {

enum class State { Idle, Polling, Dispatching, Rendering, Updating, Stopped };

const char* state_name(State s);

struct DaemonConfig {
    std::filesystem::path central_dir;
    StorageMode storage = StorageMode::Central;
    int64_t size_threshold = 30ll * 1024 * 1024; // rows at or above go to the slow lane

    int fast_workers = 12;
    size_t fast_queue = 100;
    std::chrono::seconds fast_timeout{120};

    int slow_workers = 2;
    size_t slow_queue = 10;
    std::chrono::seconds slow_timeout{600};

    std::chrono::milliseconds poll_interval{5000};
    int poll_limit = 500;   // rows fetched per kind per cycle
    int thumb_size = 512;
    std::filesystem::path temp_dir; // empty = system temp; archive members are extracted here
};

struct Progress {
    size_t pending_fast = 0;
    size_t pending_slow = 0;
    int64_t rendered_total = 0;
    int64_t failed_total = 0;
};

// ThumbnailDaemon polls the catalog for rows whose thumbnail is missing or stale
// and renders them on two bounded worker pools split by file size. Workers only
// render; catalog updates are applied by the thread running the loop.
class ThumbnailDaemon {
public:
    ThumbnailDaemon(catalog::Catalog& cat, const formats::Registry& formats,
                    const RendererRegistry& renderers, DaemonConfig cfg);
    ~ThumbnailDaemon();

    ThumbnailDaemon(const ThumbnailDaemon&) = delete;
    ThumbnailDaemon& operator=(const ThumbnailDaemon&) = delete;

    // run loops until stop() is called.
    void run();

    // run_cycle polls once and dispatches. Returns the number of rows handed to
    // the pools (adopted thumbnails are recorded directly and not counted).
    int run_cycle();

    // wait_idle blocks until both lanes drain, applying their results.
    void wait_idle();

    // stop ends run() and aborts renders in flight. Safe from a signal-watching thread.
    void stop();

    // request_rerender flags a row for rendering. Without force the request is
    // honoured only if the recorded thumbnail is missing on disk or stale.
    // Returns true if the row was flagged. Wakes the poll loop.
    bool request_rerender(catalog::AssetKind kind, int64_t id, bool force);

    Progress progress() const;
    State state() const { return state_.load(); }

    const DaemonConfig& config() const { return cfg_; }

private:
    using Key = std::pair<catalog::AssetKind, int64_t>;

    struct Outcome {
        Key key;
        std::optional<catalog::ThumbUpdate> update;
        bool timed_out = false;
        std::string error;
        std::string relative_path;
    };

    catalog::ThumbUpdate render_one(const catalog::PendingThumb& row,
                                    const formats::FormatInfo& format,
                                    WorkerPool::Clock::time_point deadline);
    std::optional<catalog::ThumbUpdate> try_adopt(const catalog::PendingThumb& row,
                                                  formats::ThumbCategory category) const;
    void finish(Outcome outcome);
    void drain();
    bool thumbnail_current(const catalog::Asset& a) const;

    catalog::Catalog& cat_;
    const formats::Registry& formats_;
    const RendererRegistry& renderers_;
    DaemonConfig cfg_;
    ThumbStore store_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<Key> in_flight_;
    std::deque<Outcome> outcomes_;
    bool wake_ = false;
    bool stop_ = false;

    std::atomic<bool> abort_{false};
    std::atomic<State> state_{State::Idle};
    std::atomic<int64_t> rendered_total_{0};
    std::atomic<int64_t> failed_total_{0};
    std::atomic<uint64_t> temp_counter_{0};

    // Declared last: destroyed first, so workers are joined before the state they use.
    WorkerPool fast_;
    WorkerPool slow_;
};

} // namespace assetcat::thumbd
