// =============================================================================
// Unit tests for TaskScheduler (src/task_scheduler.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "task_scheduler.hpp"

using namespace autolink;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

} // namespace

TEST(TaskSchedulerTest, RunsDelayedTask) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::atomic<int> ran{0};

    s.schedule(10ms, [&] { ran++; });
    EXPECT_TRUE(eventually([&] { return ran.load() == 1; }));
    EXPECT_EQ(s.pending(), 0u);
}

// ---------------------------------------------------------------------------
// Tasks run in deadline order, not submission order
// ---------------------------------------------------------------------------
TEST(TaskSchedulerTest, DeadlineOrder) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::mutex m;
    std::vector<int> order;

    s.schedule(60ms, [&] { std::lock_guard<std::mutex> lk(m); order.push_back(3); });
    s.schedule(20ms, [&] { std::lock_guard<std::mutex> lk(m); order.push_back(1); });
    s.schedule(40ms, [&] { std::lock_guard<std::mutex> lk(m); order.push_back(2); });

    ASSERT_TRUE(eventually([&] { std::lock_guard<std::mutex> lk(m); return order.size() == 3; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TaskSchedulerTest, CancelPendingTask) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::atomic<int> ran{0};

    auto id = s.schedule(50ms, [&] { ran++; });
    EXPECT_TRUE(s.cancel(id));
    EXPECT_FALSE(s.cancel(id));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(ran.load(), 0);
}

TEST(TaskSchedulerTest, CancelUnknownIdIsFalse) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    EXPECT_FALSE(s.cancel(12345));
    EXPECT_FALSE(s.cancel(TaskScheduler::INVALID_TASK));
}

// ---------------------------------------------------------------------------
// Repeating task keeps running until cancelled
// ---------------------------------------------------------------------------
TEST(TaskSchedulerTest, RepeatingTask) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::atomic<int> ticks{0};

    auto id = s.scheduleRepeating(5ms, [&] { ticks++; });
    ASSERT_TRUE(eventually([&] { return ticks.load() >= 3; }));

    s.cancel(id);
    std::this_thread::sleep_for(20ms);
    int after_cancel = ticks.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(ticks.load(), after_cancel);
}

TEST(TaskSchedulerTest, ThrowingTaskDoesNotKillWorker) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::atomic<int> ran{0};

    s.schedule(1ms, [] { throw std::runtime_error("boom"); });
    s.schedule(10ms, [&] { ran++; });
    EXPECT_TRUE(eventually([&] { return ran.load() == 1; }));
}

TEST(TaskSchedulerTest, StopDropsPendingTasks) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    std::atomic<int> ran{0};

    s.schedule(200ms, [&] { ran++; });
    s.stop();
    EXPECT_FALSE(s.is_running());
    EXPECT_EQ(s.pending(), 0u);
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(ran.load(), 0);
}

TEST(TaskSchedulerTest, RestartAfterStop) {
    TaskScheduler s;
    ASSERT_TRUE(s.start());
    s.stop();
    ASSERT_TRUE(s.start());
    std::atomic<int> ran{0};
    s.schedule(1ms, [&] { ran++; });
    EXPECT_TRUE(eventually([&] { return ran.load() == 1; }));
}
