/**
 * @file PeerConnection.h
 * @brief One TCP session with one peer: reader thread, writer thread, FIFO
 */

#pragma once

#include "WireCodec.h"
#include "WireMessage.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace P2Lan {

/**
 * @class PeerConnection
 * @brief Owns exactly one socket
 *
 * - The reader thread decodes frames and hands them to the frame handler.
 * - The writer thread drains the outbound FIFO; it is the only thread that
 *   writes to the socket, so frames never interleave and messages leave in
 *   submission order.
 * - close() is idempotent; the closed handler runs exactly once, on the
 *   reader thread, after which both threads exit. The owner joins them.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    using Ptr = std::shared_ptr<PeerConnection>;
    using FrameHandler = std::function<void(const Ptr&, const WireMessage&)>;
    using ClosedHandler = std::function<void(const Ptr&, const std::string& reason)>;

    struct Timing {
        int heartbeatIntervalMs;
        int connectionTimeoutMs;
    };

    PeerConnection(int socket, std::string remoteIp, bool initiatedLocally,
                   std::string localId, Timing timing);
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    bool start(FrameHandler onFrame, ClosedHandler onClosed, std::string& errorMsg);

    /**
     * @brief Encode and queue a message
     * @param done Resolved with the write result when the frame leaves (optional)
     */
    bool enqueue(const WireMessage& message, std::string& errorMsg,
                 std::shared_ptr<std::promise<bool>> done = nullptr);

    /**
     * @brief Queue and block until written, failed or timed out
     */
    bool sendAndWait(const WireMessage& message, int timeoutMs, std::string& errorMsg);

    void close(const std::string& reason);

    /**
     * @brief Join reader and writer; never call from either of them
     */
    void join();

    bool isClosed() const { return m_closed.load(); }

    void markIdentified(const std::string& peerId);
    bool waitIdentified(int timeoutMs);
    bool isIdentified() const { return m_identified.load(); }
    std::string peerId() const;

    const std::string& remoteIp() const { return m_remoteIp; }
    bool initiatedLocally() const { return m_initiatedLocally; }
    uint64_t serial() const { return m_serial; }

private:
    struct Outbound {
        std::vector<uint8_t> frame;
        std::shared_ptr<std::promise<bool>> done;
    };

    void readerThreadFunc();
    void writerThreadFunc();
    void failQueued();

    int m_socket;
    const std::string m_remoteIp;
    const bool m_initiatedLocally;
    const std::string m_localId;
    const Timing m_timing;
    const uint64_t m_serial;

    FrameHandler m_onFrame;
    ClosedHandler m_onClosed;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_identifiedCv;
    std::string m_peerId;
    std::atomic<bool> m_identified{false};
    std::string m_closeReason;

    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<Outbound> m_queue;

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_started{false};
    std::thread m_readerThread;
    std::thread m_writerThread;
};

}  // namespace P2Lan
