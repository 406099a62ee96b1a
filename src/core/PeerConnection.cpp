/**
 * @file PeerConnection.cpp
 * @brief Per-peer session socket with serialized writer
 */

#include "p2lan/PeerConnection.h"
#include "p2lan/config.h"
#include "p2lan/Debug.h"
#include "p2lan/SocketUtils.h"
#include "p2lan/ThreadSafeLog.h"

namespace P2Lan {

namespace {
    #define LogSession(msg) P2Lan::ThreadSafeLog::log(msg)

    constexpr int READER_POLL_TIMEOUT_MS = 1000;
    constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

    std::atomic<uint64_t> g_nextSerial{1};
}

PeerConnection::PeerConnection(int socket, std::string remoteIp, bool initiatedLocally,
                               std::string localId, Timing timing)
    : m_socket(socket)
    , m_remoteIp(std::move(remoteIp))
    , m_initiatedLocally(initiatedLocally)
    , m_localId(std::move(localId))
    , m_timing(timing)
    , m_serial(g_nextSerial.fetch_add(1))
{
}

PeerConnection::~PeerConnection() {
    close("Connection destroyed");
    join();
    closeSocket(m_socket);
}

bool PeerConnection::start(FrameHandler onFrame, ClosedHandler onClosed, std::string& errorMsg) {
    m_onFrame = std::move(onFrame);
    m_onClosed = std::move(onClosed);

    setRecvTimeout(m_socket, READER_POLL_TIMEOUT_MS);
    setSendTimeout(m_socket, m_timing.connectionTimeoutMs);

    try {
        m_writerThread = std::thread(&PeerConnection::writerThreadFunc, this);
        m_readerThread = std::thread(&PeerConnection::readerThreadFunc, this);
    } catch (const std::system_error& e) {
        errorMsg = std::string("Failed to start connection threads: ") + e.what();
        m_closed.store(true);
        shutdownSocket(m_socket);
        m_queueCv.notify_all();
        join();
        return false;
    }

    m_started.store(true);
    return true;
}

//=============================================================================
// Identity
//=============================================================================

void PeerConnection::markIdentified(const std::string& peerId) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_peerId = peerId;
        m_identified.store(true);
    }
    m_identifiedCv.notify_all();
}

bool PeerConnection::waitIdentified(int timeoutMs) {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    m_identifiedCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] {
        return m_identified.load() || m_closed.load();
    });
    return m_identified.load() && !m_closed.load();
}

std::string PeerConnection::peerId() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_peerId;
}

//=============================================================================
// Outbound
//=============================================================================

bool PeerConnection::enqueue(const WireMessage& message, std::string& errorMsg,
                             std::shared_ptr<std::promise<bool>> done)
{
    Outbound item;
    if (!encodeFrame(message, item.frame, errorMsg)) {
        return false;
    }
    item.done = std::move(done);

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.load()) {
            errorMsg = "Connection is closed";
            return false;
        }
        if (m_queue.size() >= MAX_OUTBOUND_QUEUE) {
            errorMsg = "Outbound queue is full";
            return false;
        }
        m_queue.push_back(std::move(item));
    }
    m_queueCv.notify_one();
    return true;
}

bool PeerConnection::sendAndWait(const WireMessage& message, int timeoutMs, std::string& errorMsg) {
    auto done = std::make_shared<std::promise<bool>>();
    std::future<bool> result = done->get_future();

    if (!enqueue(message, errorMsg, done)) {
        return false;
    }

    if (result.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        errorMsg = "Timed out waiting for write";
        return false;
    }
    if (!result.get()) {
        errorMsg = "Write failed";
        return false;
    }
    return true;
}

void PeerConnection::failQueued() {
    std::deque<Outbound> dropped;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        dropped.swap(m_queue);
    }
    for (auto& item : dropped) {
        if (item.done) {
            item.done->set_value(false);
        }
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

void PeerConnection::close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (m_closed.exchange(true)) {
            return;
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_closeReason = reason;
    }

    shutdownSocket(m_socket);
    m_queueCv.notify_all();
    m_identifiedCv.notify_all();
}

void PeerConnection::join() {
    if (m_writerThread.joinable() && m_writerThread.get_id() != std::this_thread::get_id()) {
        m_writerThread.join();
    }
    if (m_readerThread.joinable() && m_readerThread.get_id() != std::this_thread::get_id()) {
        m_readerThread.join();
    }
}

//=============================================================================
// Threads
//=============================================================================

void PeerConnection::writerThreadFunc() {
    try {
        auto lastWrite = std::chrono::steady_clock::now();
        const auto heartbeatInterval = std::chrono::milliseconds(m_timing.heartbeatIntervalMs);

        while (true) {
            Outbound item;
            bool haveItem = false;
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_queueCv.wait_until(lock, lastWrite + heartbeatInterval, [this] {
                    return m_closed.load() || !m_queue.empty();
                });
                if (m_closed.load()) {
                    break;
                }
                if (!m_queue.empty()) {
                    item = std::move(m_queue.front());
                    m_queue.pop_front();
                    haveItem = true;
                }
            }

            if (!haveItem) {
                if (std::chrono::steady_clock::now() - lastWrite < heartbeatInterval) {
                    continue;
                }
                if (!m_identified.load()) {
                    lastWrite = std::chrono::steady_clock::now();
                    continue;
                }
                std::string encodeError;
                if (!encodeFrame(WireMessage::make(MessageType::Heartbeat, m_localId, peerId()),
                                 item.frame, encodeError)) {
                    LOG_ERROR("[Session] Cannot encode heartbeat: " << encodeError);
                    lastWrite = std::chrono::steady_clock::now();
                    continue;
                }
            }

            std::string sendError;
            const bool ok = sendExact(m_socket, item.frame.data(), item.frame.size(), sendError);
            if (item.done) {
                item.done->set_value(ok);
            }
            if (!ok) {
                close("Send failed: " + sendError);
                break;
            }
            lastWrite = std::chrono::steady_clock::now();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Writer thread failed: " << e.what());
        LogSession(std::string("[Session] Writer thread failed: ") + e.what());
        close(std::string("Writer failed: ") + e.what());
    }

    failQueued();
}

void PeerConnection::readerThreadFunc() {
    try {
        FrameDecoder decoder;
        std::vector<uint8_t> buffer(READ_CHUNK_SIZE);
        auto lastReceive = std::chrono::steady_clock::now();
        const auto timeout = std::chrono::milliseconds(m_timing.connectionTimeoutMs);

        while (!m_closed.load()) {
            size_t received = 0;
            bool timedOut = false;
            std::string recvError;
            if (!recvSome(m_socket, buffer.data(), buffer.size(), received, timedOut, recvError)) {
                close(recvError);
                break;
            }

            if (timedOut) {
                if (std::chrono::steady_clock::now() - lastReceive > timeout) {
                    close("Connection timed out");
                    break;
                }
                continue;
            }

            lastReceive = std::chrono::steady_clock::now();
            decoder.feed(buffer.data(), received);

            while (!m_closed.load()) {
                DecodeResult result = decoder.next();
                if (result.status == DecodeStatus::IncompleteFrame) {
                    break;
                }
                if (result.status == DecodeStatus::MalformedFrame) {
                    LOG_WARNING("[Session] Malformed frame from " << m_remoteIp << " dropped: " << result.error);
                    continue;
                }
                if (result.status == DecodeStatus::CorruptStream) {
                    LOG_ERROR("[Session] Corrupt stream from " << m_remoteIp << ": " << result.error);
                    close("Corrupt stream: " + result.error);
                    break;
                }
                m_onFrame(shared_from_this(), result.message);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Reader thread failed: " << e.what());
        LogSession(std::string("[Session] Reader thread failed: ") + e.what());
        close(std::string("Reader failed: ") + e.what());
    }

    std::string reason;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        reason = m_closeReason;
    }
    if (m_onClosed) {
        m_onClosed(shared_from_this(), reason);
    }
}

}  // namespace P2Lan
