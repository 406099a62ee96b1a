/**
 * @file TimerQueue.h
 * @brief Cancellable delayed callbacks on one background thread
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace P2Lan {

/**
 * @brief Single-threaded timer wheel for request expiry and recovery delays
 *
 * Callbacks run on the timer thread, one at a time, outside the queue lock.
 * stop() discards pending timers and joins; no callback runs after stop()
 * returns. Calling stop() from inside a callback is not supported.
 */
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    TimerQueue() = default;
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Run a callback after a delay
     * @param tag Short label used when logging callback failures
     * @return Timer id, or 0 if the queue is not running
     */
    TimerId scheduleAfter(std::chrono::milliseconds delay, Callback callback,
                          const std::string& tag = "timer");

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was still pending
     */
    bool cancel(TimerId id);

    size_t pendingCount() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        TimerId id;
        Callback callback;
        std::string tag;
    };

    void threadFunc();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::multimap<Clock::time_point, Entry> m_timers;
    std::unordered_map<TimerId, Clock::time_point> m_index;
    TimerId m_nextId = 1;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    bool m_stopRequested = false;
};

}  // namespace P2Lan
