#include "assetcat/thumbd_pool.h"
#include "assetcat/log.h"

#include <format>
#include <stdexcept>
#include <utility>

namespace assetcat::thumbd {

WorkerPool::WorkerPool(std::string name, int workers, size_t capacity, Clock::duration timeout)
    : name_(std::move(name)), capacity_(capacity), timeout_(timeout) {
    if (workers <= 0 || workers > 256)
        throw std::invalid_argument(std::format("{}: worker count {} out of range", name_, workers));
    if (capacity == 0)
        throw std::invalid_argument(std::format("{}: queue capacity must be positive", name_));

    workers_.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::try_submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ || queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(task));
    }
    jobs_cv_.notify_one();
    return true;
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && running_ == 0; });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        queue_.clear();
    }
    jobs_cv_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

void WorkerPool::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            jobs_cv_.wait(lock, [this]() {
                return stop_ || !queue_.empty();
            });
            if (stop_) return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task(Clock::now() + timeout_);
        } catch (const std::exception& e) {
            LOGE("thumbd:", name_, "task failed:", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace assetcat::thumbd
