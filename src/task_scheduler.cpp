// =============================================================================
// AutoLink - Task Scheduler
// =============================================================================
// Single worker over a multimap keyed by deadline; equal deadlines run in insertion order.
// =============================================================================
#include "task_scheduler.hpp"
#include "autolink_log.hpp"

#include <system_error>

namespace autolink {

TaskScheduler::~TaskScheduler() {
    stop();
}

bool TaskScheduler::start() {
    if (running_.load()) return true;
    running_.store(true);
    try {
        worker_ = std::thread(&TaskScheduler::loop, this);
    } catch (const std::system_error& e) {
        ALOG_ERROR("sched", "Failed to start worker: %s", e.what());
        running_.store(false);
        return false;
    }
    return true;
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) return;
        running_.store(false);
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            // stop() from inside a task: let the loop exit on its own
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

TaskScheduler::TaskId TaskScheduler::schedule(std::chrono::milliseconds delay, Task fn) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        queue_.emplace(Clock::now() + delay, Entry{id, std::move(fn), std::chrono::milliseconds(0)});
    }
    cv_.notify_all();
    return id;
}

TaskScheduler::TaskId TaskScheduler::scheduleRepeating(std::chrono::milliseconds interval, Task fn) {
    if (interval.count() <= 0) interval = std::chrono::milliseconds(1);
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        queue_.emplace(Clock::now() + interval, Entry{id, std::move(fn), interval});
    }
    cv_.notify_all();
    return id;
}

bool TaskScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->second.id == id) {
            queue_.erase(it);
            return true;
        }
    }
    if (running_task_ == id) {
        running_cancelled_ = true;  // repeating task: do not requeue
    }
    return false;
}

size_t TaskScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskScheduler::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            continue;
        }

        auto deadline = queue_.begin()->first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;  // re-check: earlier task may have been queued or cancelled
        }

        auto node = queue_.extract(queue_.begin());
        Entry entry = std::move(node.mapped());
        running_task_ = entry.id;
        running_cancelled_ = false;

        lock.unlock();
        try {
            entry.fn();
        } catch (const std::exception& e) {
            ALOG_ERROR("sched", "Task %llu threw: %s", (unsigned long long)entry.id, e.what());
        }
        lock.lock();

        if (entry.interval.count() > 0 && !running_cancelled_ && running_.load()) {
            auto id = entry.id;
            auto interval = entry.interval;
            queue_.emplace(Clock::now() + interval, Entry{id, std::move(entry.fn), interval});
        }
        running_task_ = INVALID_TASK;
    }
}

} // namespace autolink
