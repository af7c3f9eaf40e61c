#pragma once
// =============================================================================
// AutoLink - Task Scheduler
// =============================================================================
// One worker thread running delayed and repeating tasks in deadline order.
// This is the cooperative loop that drives the lease-window rotation, the adb
// handshake diagnostic timer and the delayed rerun.
// =============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace autolink {

class TaskScheduler {
public:
    using TaskId = uint64_t;
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    static constexpr TaskId INVALID_TASK = 0;

    TaskScheduler() = default;
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    bool start();
    // Pending tasks are dropped; a task already running is waited for.
    void stop();
    bool is_running() const { return running_.load(); }

    TaskId schedule(std::chrono::milliseconds delay, Task fn);
    TaskId scheduleRepeating(std::chrono::milliseconds interval, Task fn);

    // True if the task was pending and will never run. A repeating task that
    // is currently executing will not be rescheduled.
    bool cancel(TaskId id);

    size_t pending() const;

private:
    struct Entry {
        TaskId id;
        Task fn;
        std::chrono::milliseconds interval{0};  // 0 = one-shot
    };

    void loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, Entry> queue_;
    TaskId next_id_ = 1;
    TaskId running_task_ = INVALID_TASK;
    bool running_cancelled_ = false;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace autolink
