/**
 * @file timer_queue_test.cpp
 * @brief Unit tests for TimerQueue ordering, cancellation and shutdown
 */

#include "p2lan/TimerQueue.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace P2Lan;
using namespace std::chrono_literals;

TEST(TimerQueueTest, ScheduleFailsWhenNotRunning) {
    TimerQueue timers;
    EXPECT_EQ(timers.scheduleAfter(1ms, [] {}), 0u);
}

TEST(TimerQueueTest, CallbacksRunInDueOrder) {
    TimerQueue timers;
    ASSERT_TRUE(timers.start());

    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int n) {
        return [&, n] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(n);
        };
    };

    EXPECT_NE(timers.scheduleAfter(60ms, record(3)), 0u);
    EXPECT_NE(timers.scheduleAfter(20ms, record(1)), 0u);
    EXPECT_NE(timers.scheduleAfter(40ms, record(2)), 0u);

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (order.size() == 3) {
                break;
            }
        }
        std::this_thread::sleep_for(5ms);
    }

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TimerQueueTest, CancelledTimerNeverFires) {
    TimerQueue timers;
    ASSERT_TRUE(timers.start());

    std::atomic<bool> fired{false};
    auto id = timers.scheduleAfter(50ms, [&] { fired = true; });
    ASSERT_NE(id, 0u);
    EXPECT_TRUE(timers.cancel(id));
    EXPECT_FALSE(timers.cancel(id));

    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(fired.load());
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(TimerQueueTest, ThrowingCallbackDoesNotStopTheQueue) {
    TimerQueue timers;
    ASSERT_TRUE(timers.start());

    std::atomic<bool> second{false};
    timers.scheduleAfter(5ms, [] { throw std::runtime_error("boom"); }, "throws");
    timers.scheduleAfter(20ms, [&] { second = true; });

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!second.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(second.load());
}

TEST(TimerQueueTest, StopDiscardsPendingTimers) {
    TimerQueue timers;
    ASSERT_TRUE(timers.start());

    std::atomic<int> fired{0};
    for (int i = 0; i < 5; ++i) {
        timers.scheduleAfter(200ms, [&] { ++fired; });
    }
    timers.stop();
    EXPECT_FALSE(timers.isRunning());

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(fired.load(), 0);

    // Restartable
    ASSERT_TRUE(timers.start());
    EXPECT_NE(timers.scheduleAfter(1ms, [] {}), 0u);
}

TEST(TimerQueueTest, CallbackMayScheduleAnotherTimer) {
    TimerQueue timers;
    ASSERT_TRUE(timers.start());

    std::atomic<bool> chained{false};
    timers.scheduleAfter(5ms, [&] {
        timers.scheduleAfter(5ms, [&] { chained = true; });
    });

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!chained.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(chained.load());
}
