/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for lifecycle tracing
 *
 * (c) 2026 P2Lan Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace P2Lan {

/**
 * @brief Thread-safe logging to the trace log (p2lan_trace.txt)
 *
 * All lifecycle and crash logging across modules must use this class
 * to prevent file corruption from concurrent writes by multiple threads.
 *
 * Uses a global static mutex to synchronize file access across:
 * - SessionManager (listener, reader and writer threads)
 * - DiscoveryService (transmitter/listener/GC threads)
 * - TransferEngine (worker and cleanup threads)
 * - TimerQueue (expiry callbacks)
 *
 * Note: initialize() should be called before any worker threads start.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Initialize the log path
     * @param logPath Absolute path to the log file
     *
     * Must be called before any worker threads are started.
     * Calling log() before initialize() will silently do nothing.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Log a std::string message
     * @param message Message to log
     *
     * Thread-safe: locks global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     * @param message Message to log
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

    /**
     * @brief Current log path (empty if not initialized)
     */
    static std::filesystem::path logPath();

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Log file path (set by initialize())
    static std::filesystem::path s_logPath;
};

} // namespace P2Lan
