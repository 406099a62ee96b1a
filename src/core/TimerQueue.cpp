/**
 * @file TimerQueue.cpp
 * @brief TimerQueue implementation
 */

#include "p2lan/TimerQueue.h"
#include "p2lan/Debug.h"
#include "p2lan/ThreadSafeLog.h"

namespace P2Lan {

TimerQueue::~TimerQueue() {
    stop();
}

bool TimerQueue::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running.load()) {
        return true;
    }
    m_stopRequested = false;
    m_running.store(true);
    m_thread = std::thread(&TimerQueue::threadFunc, this);
    return true;
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.load()) {
            return;
        }
        m_stopRequested = true;
        m_timers.clear();
        m_index.clear();
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running.store(false);
}

TimerQueue::TimerId TimerQueue::scheduleAfter(std::chrono::milliseconds delay, Callback callback,
                                              const std::string& tag)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running.load() || m_stopRequested) {
        return 0;
    }

    const TimerId id = m_nextId++;
    const auto due = Clock::now() + delay;
    m_timers.emplace(due, Entry{id, std::move(callback), tag});
    m_index.emplace(id, due);
    m_cv.notify_all();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto idx = m_index.find(id);
    if (idx == m_index.end()) {
        return false;
    }

    auto range = m_timers.equal_range(idx->second);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second.id == id) {
            m_timers.erase(it);
            break;
        }
    }
    m_index.erase(idx);
    return true;
}

size_t TimerQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

void TimerQueue::threadFunc() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (!m_stopRequested) {
        if (m_timers.empty()) {
            m_cv.wait(lock, [this] { return m_stopRequested || !m_timers.empty(); });
            continue;
        }

        auto first = m_timers.begin();
        if (Clock::now() < first->first) {
            m_cv.wait_until(lock, first->first);
            continue;
        }

        Entry entry = std::move(first->second);
        m_timers.erase(first);
        m_index.erase(entry.id);

        lock.unlock();
        try {
            entry.callback();
        } catch (const std::exception& e) {
            LOG_ERROR("[TimerQueue] Callback '" << entry.tag << "' threw: " << e.what());
            ThreadSafeLog::log(std::string("[TimerQueue] Callback '") + entry.tag + "' threw: " + e.what());
        }
        lock.lock();
    }
}

}  // namespace P2Lan
