#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace assetcat::thumbd {

// WorkerPool is a fixed set of threads fed from a bounded queue. Each task
// receives the deadline by which it must finish, taken when it starts.
class WorkerPool {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void(Clock::time_point deadline)>;

    WorkerPool(std::string name, int workers, size_t capacity, Clock::duration timeout);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // try_submit queues task. Returns false when the queue is full or the pool
    // has been stopped.
    bool try_submit(Task task);

    // pending counts queued and running tasks.
    size_t pending() const;

    // wait_idle blocks until no task is queued or running.
    void wait_idle();

    // stop drops queued tasks and joins the workers once running tasks return.
    void stop();

    const std::string& name() const { return name_; }
    int workers() const { return static_cast<int>(workers_.size()); }
    size_t capacity() const { return capacity_; }

private:
    void worker_loop();

    std::string name_;
    size_t capacity_ = 0;
    Clock::duration timeout_;

    mutable std::mutex mutex_;
    std::condition_variable jobs_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t running_ = 0;
    bool stop_ = false;
    std::vector<std::thread> workers_;
};

} // namespace assetcat::thumbd
