#include "assetcat/thumbd.h"
#include "assetcat/archive.h"
#include "assetcat/errors.h"
#include "assetcat/log.h"
#include "assetcat/thumbd_png.h"
#include "assetcat/volume.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace assetcat::thumbd {

const char* state_name(State s) {
    switch (s) {
    case State::Idle: return "idle";
    case State::Polling: return "polling";
    case State::Dispatching: return "dispatching";
    case State::Rendering: return "rendering";
    case State::Updating: return "updating";
    case State::Stopped: return "stopped";
    }
    return "unknown";
}

namespace {

// TempFile removes its path on destruction unless released.
struct TempFile {
    fs::path path;

    TempFile() = default;
    explicit TempFile(fs::path p) : path(std::move(p)) {}
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile() {
        if (path.empty()) return;
        std::error_code ec;
        fs::remove(path, ec);
    }
};

void check_deadline(WorkerPool::Clock::time_point deadline, const std::atomic<bool>& abort,
                    const std::string& what) {
    if (abort.load())
        throw RenderTimeoutError(std::format("thumbd: {} aborted", what));
    if (WorkerPool::Clock::now() >= deadline)
        throw RenderTimeoutError(std::format("thumbd: {} ran past its deadline", what));
}

} // namespace

ThumbnailDaemon::ThumbnailDaemon(catalog::Catalog& cat, const formats::Registry& formats,
                                 const RendererRegistry& renderers, DaemonConfig cfg)
    : cat_(cat), formats_(formats), renderers_(renderers), cfg_(std::move(cfg)),
      store_(cfg_.central_dir, cfg_.storage),
      fast_("fast", cfg_.fast_workers, cfg_.fast_queue, cfg_.fast_timeout),
      slow_("slow", cfg_.slow_workers, cfg_.slow_queue, cfg_.slow_timeout) {}

ThumbnailDaemon::~ThumbnailDaemon() {
    stop();
    fast_.stop();
    slow_.stop();
}

// ---------------------------------------------------------------------------
// Rendering (worker threads)
// ---------------------------------------------------------------------------

catalog::ThumbUpdate ThumbnailDaemon::render_one(const catalog::PendingThumb& row,
                                                 const formats::FormatInfo& format,
                                                 WorkerPool::Clock::time_point deadline) {
    const auto& a = row.asset;
    check_deadline(deadline, abort_, a.relative_path);
    auto [container, member] = archive::split_virtual_path(a.relative_path);
    const fs::path source = volume::absolute(row.volume, container);
    const int64_t source_mtime = volume::file_mtime(source);

    TempFile extracted;
    fs::path input = source;
    if (!member.empty()) {
        auto arc = archive::list(source);
        auto it = std::find_if(arc.members.begin(), arc.members.end(), [&](const archive::Member& m) {
            return !m.is_dir && m.name == member;
        });
        if (it == arc.members.end())
            throw IOError(std::format("{}: member '{}' not found", source.string(), member));

        const fs::path dir = cfg_.temp_dir.empty() ? fs::temp_directory_path() : cfg_.temp_dir;
        extracted.path = dir / std::format("assetcat-{}-{}{}", a.id, temp_counter_++,
                                           fs::path(member).extension().string());
        std::ifstream in(source, std::ios::binary);
        std::ofstream out(extracted.path, std::ios::binary);
        if (!in || !out)
            throw IOError(std::format("{}: cannot extract '{}'", source.string(), member));
        archive::extract_each(in, *it, [&](const char* data, size_t n) {
            if (!out.write(data, static_cast<std::streamsize>(n)))
                throw IOError(std::format("{}: write failed", extracted.path.string()));
            check_deadline(deadline, abort_, "extracting " + a.relative_path);
        });
        out.close();
        if (!out)
            throw IOError(std::format("{}: write failed", extracted.path.string()));
        input = extracted.path;
        check_deadline(deadline, abort_, a.relative_path);
    }

    const Location loc = store_.location(row, format.category);
    fs::create_directories(loc.absolute.parent_path());
    TempFile partial(loc.absolute.parent_path() /
                     std::format(".{}.{}.partial.png", loc.absolute.stem().string(), temp_counter_++));

    RenderRequest req{
        .input = input,
        .output = partial.path,
        .format = format.id,
        .category = format.category,
        .size = cfg_.thumb_size,
        .deadline = deadline,
        .abort = &abort_,
    };
    const std::string used = render_with_chain(renderers_.chain(format.id), req);
    // In-process renderers do not watch the clock themselves.
    check_deadline(deadline, abort_, a.relative_path);

    fs::rename(partial.path, loc.absolute);
    partial.path.clear();
    LOGD("thumbd:", used, "rendered", a.relative_path, "->", loc.stored_path);

    return {
        .storage = loc.storage,
        .path = loc.stored_path,
        .rendered_at = std::max(catalog::now_unix(), source_mtime),
        .source_mtime = source_mtime,
    };
}

void ThumbnailDaemon::finish(Outcome outcome) {
    if (outcome.update)
        rendered_total_++;
    else
        failed_total_++;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }
    cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Loop (owning thread)
// ---------------------------------------------------------------------------

std::optional<catalog::ThumbUpdate> ThumbnailDaemon::try_adopt(const catalog::PendingThumb& row,
                                                               formats::ThumbCategory category) const {
    const auto loc = store_.location(row, category);
    std::error_code ec;
    auto written = fs::last_write_time(loc.absolute, ec);
    if (ec || !is_png(loc.absolute)) return std::nullopt;

    auto sys = std::chrono::file_clock::to_sys(written);
    int64_t thumb_mtime = std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
    if (thumb_mtime < row.asset.file_mtime) return std::nullopt;

    return catalog::ThumbUpdate{
        .storage = loc.storage,
        .path = loc.stored_path,
        .rendered_at = std::max(thumb_mtime, row.asset.file_mtime),
        .source_mtime = row.asset.file_mtime,
    };
}

int ThumbnailDaemon::run_cycle() {
    state_ = State::Polling;
    auto rows = cat_.pending_thumbnails(cfg_.poll_limit);
    state_ = State::Dispatching;

    int dispatched = 0;
    int adopted = 0;
    bool fast_full = false;
    bool slow_full = false;

    for (const auto& row : rows) {
        const Key key{row.kind, row.asset.id};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) break;
            if (in_flight_.contains(key)) continue;
        }
        const auto* format = formats_.find(row.asset.format);
        if (!format) {
            LOGW_ONCE("format:" + row.asset.format, "thumbd: no format entry for", row.asset.format,
                      "- first seen on", row.asset.relative_path);
            continue;
        }
        if (renderers_.chain(format->id).empty()) {
            LOGW_ONCE("renderer:" + format->id, "thumbd: no renderer for", format->id);
            continue;
        }

        if (!row.asset.force_rerender) {
            if (auto update = try_adopt(row, format->category)) {
                try {
                    cat_.apply_thumbnail(row.kind, row.asset.id, *update);
                    adopted++;
                } catch (const std::runtime_error& e) {
                    LOGE("thumbd: cannot record thumbnail for", row.asset.relative_path, "-", e.what());
                }
                continue;
            }
        }

        const bool slow = row.asset.file_size >= cfg_.size_threshold;
        bool& full = slow ? slow_full : fast_full;
        if (full) continue;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.insert(key);
        }
        auto& pool = slow ? slow_ : fast_;
        bool queued = pool.try_submit([this, row, format](WorkerPool::Clock::time_point deadline) {
            Outcome out{.key = {row.kind, row.asset.id}, .relative_path = row.asset.relative_path};
            try {
                out.update = render_one(row, *format, deadline);
            } catch (const RenderTimeoutError& e) {
                out.timed_out = true;
                out.error = e.what();
            } catch (const std::runtime_error& e) {
                out.error = e.what();
            }
            finish(std::move(out));
        });
        if (!queued) {
            // Left for the next cycle.
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
            full = true;
            continue;
        }
        dispatched++;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = in_flight_.empty() ? State::Idle : State::Rendering;
    }
    LOGD("thumbd: cycle done, state", state_name(state_.load()));
    if (dispatched > 0 || adopted > 0) {
        LOGI("thumbd:", rows.size(), "pending,", dispatched, "dispatched,", adopted, "adopted",
             fast_full || slow_full ? "(queue full)" : "");
    }
    return dispatched;
}

void ThumbnailDaemon::drain() {
    std::deque<Outcome> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(outcomes_);
    }
    if (batch.empty()) return;

    state_ = State::Updating;
    for (const auto& o : batch) {
        if (o.update) {
            try {
                cat_.apply_thumbnail(o.key.first, o.key.second, *o.update);
            } catch (const std::runtime_error& e) {
                // The row stays pending and is retried next cycle.
                LOGE("thumbd: cannot record thumbnail for", o.relative_path, "-", e.what());
            }
        } else if (o.timed_out) {
            LOGW("thumbd: requeued", o.relative_path, "-", o.error);
        } else {
            LOGW("thumbd: render failed for", o.relative_path, "-", o.error);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& o : batch) in_flight_.erase(o.key);
        state_ = in_flight_.empty() ? State::Idle : State::Rendering;
    }
    cv_.notify_all();
}

void ThumbnailDaemon::run() {
    LOGI("thumbd: fast lane", cfg_.fast_workers, "workers, slow lane", cfg_.slow_workers,
         "workers, threshold", cfg_.size_threshold, "bytes");

    auto next_poll = WorkerPool::Clock::now();
    for (;;) {
        bool poll_now = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_until(lock, next_poll, [this]() {
                return stop_ || wake_ || !outcomes_.empty();
            });
            if (stop_) break;
            poll_now = wake_ || WorkerPool::Clock::now() >= next_poll;
            wake_ = false;
        }
        drain();
        if (poll_now) {
            run_cycle();
            next_poll = WorkerPool::Clock::now() + cfg_.poll_interval;
        }
    }

    fast_.stop();
    slow_.stop();
    drain();
    state_ = State::Stopped;
    LOGI("thumbd: stopped,", rendered_total_.load(), "rendered,", failed_total_.load(), "failed");
}

void ThumbnailDaemon::wait_idle() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return !outcomes_.empty() || in_flight_.empty() || stop_;
            });
            if (outcomes_.empty() && (in_flight_.empty() || stop_)) return;
        }
        drain();
    }
}

void ThumbnailDaemon::stop() {
    abort_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

bool ThumbnailDaemon::thumbnail_current(const catalog::Asset& a) const {
    if (!a.thumb_path || !a.thumb_rendered_at || a.thumb_source_mtime != a.file_mtime) return false;
    auto v = cat_.get_volume(a.volume_id);
    if (!v) return false;
    auto path = store_.resolve(*v, a);
    std::error_code ec;
    return path && fs::exists(*path, ec);
}

bool ThumbnailDaemon::request_rerender(catalog::AssetKind kind, int64_t id, bool force) {
    auto a = cat_.get(kind, id);
    if (!a) return false;
    if (!force && thumbnail_current(*a)) return false;
    if (!cat_.request_rerender(kind, id)) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    cv_.notify_all();
    return true;
}

Progress ThumbnailDaemon::progress() const {
    return {
        .pending_fast = fast_.pending(),
        .pending_slow = slow_.pending(),
        .rendered_total = rendered_total_.load(),
        .failed_total = failed_total_.load(),
    };
}

} // namespace assetcat::thumbd
