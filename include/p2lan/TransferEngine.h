/**
 * @file TransferEngine.h
 * @brief Chunked, resumable, cancellable file transfer over peer sessions
 */

#pragma once

#include "CommandResult.h"
#include "PeerInfo.h"
#include "ServiceEvents.h"
#include "SessionCrypto.h"
#include "TimerQueue.h"
#include "TransferTask.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace P2Lan {

class EventBus;
class MessageDispatcher;
class PeerMessenger;
class TrustStore;
struct WireMessage;

//=============================================================================
// Settings and request model
//=============================================================================

/**
 * @brief Runtime transfer settings (from config.json)
 *
 * Size limits of -1 mean unlimited.
 */
struct TransferSettings {
    std::string downloadPath;                 ///< Empty = AppPaths::defaultDownloadDir()
    bool createDateFolders = false;
    bool createSenderFolders = false;
    int64_t maxReceiveFileSize = DEFAULT_MAX_FILE_SIZE_BYTES;
    int64_t maxTotalReceiveSize = DEFAULT_MAX_TOTAL_SIZE_BYTES;
    size_t maxConcurrentTasks = MAX_CONCURRENT_TRANSFERS;
    uint32_t maxChunkSizeKb = DEFAULT_CHUNK_SIZE_KB;
    bool autoCleanupCompleted = false;
    bool autoCleanupCancelled = false;
    bool autoCleanupFailed = false;
    int autoCleanupDelaySeconds = DEFAULT_AUTO_CLEANUP_DELAY_SECONDS;
    bool encryptTransfers = false;            ///< AES-256-GCM after an X25519 key exchange
    bool compressChunks = false;              ///< zlib per chunk, when it shrinks enough
};

struct TransferTimeouts {
    std::chrono::milliseconds pendingExpiry{PENDING_REQUEST_EXPIRY_MS};
    std::chrono::milliseconds outgoingTimeout{OUTGOING_REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds chunkAckTimeout{CHUNK_ACK_TIMEOUT_MS};
    std::chrono::milliseconds cleanupInterval{TRANSFER_CLEANUP_INTERVAL_MS};
};

/**
 * @brief One file announced in a file_transfer_request
 */
struct FileTransferEntry {
    std::string taskId;          ///< Sender's task id, reused by the receiver
    std::string fileName;
    int64_t fileSize = 0;
    std::string resumeFrom;      ///< Earlier task whose .part file should be continued
};

/**
 * @brief Inbound file transfer request waiting for a decision
 */
struct FileTransferRequestInfo {
    std::string requestId;
    std::string batchId;
    std::string peerId;
    std::string senderName;
    std::vector<FileTransferEntry> files;
    int64_t totalSize = 0;
    uint32_t maxChunkSizeKb = 0;
    bool resume = false;
    bool encrypted = false;          ///< Sender will only send encrypted_data_chunk
    int64_t requestTimeMs = 0;
    int64_t receivedAtMs = 0;
};

//=============================================================================
// TransferEngine Class
//=============================================================================

/**
 * @class TransferEngine
 * @brief Manages outgoing and incoming file transfer tasks
 *
 * Architecture:
 * - Worker thread pool; at most maxConcurrentTasks workers stream at once,
 *   the rest of the accepted tasks wait in a FIFO queue as Pending
 * - At most CHUNK_WINDOW unacknowledged data_chunk messages per task, so
 *   memory use does not grow with file size
 * - Incoming chunks are written to "<final>.part" on the sending peer's
 *   reader thread and acknowledged one by one
 * - A task completes only after data_transfer_complete has been answered
 *   by data_transfer_complete_ack; the receiver verifies size and SHA-256
 *   before renaming the .part file
 * - A cleanup thread removes terminal tasks after the configured delay
 * - With encryptTransfers on, the sender first runs a signed X25519 key
 *   exchange with the receiver (once per peer; both sides verify against
 *   the identity key pinned at the session handshake) and then seals
 *   every chunk with AES-256-GCM as encrypted_data_chunk. Chunks may also
 *   be zlib-compressed; compression happens before encryption.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - start() and stop() must not be called concurrently
 */
class TransferEngine {
public:
    TransferEngine(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                   TimerQueue& timers, TransferTimeouts timeouts = TransferTimeouts());
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void setIdentity(const LocalIdentity& identity);

    /**
     * @brief Key that signs transfer key exchanges
     */
    void setIdentityKey(IdentityKey::Ptr key);

    void setSettings(const TransferSettings& settings);
    TransferSettings settings() const;

    /**
     * @brief Route file_transfer_*, data_chunk*, encrypted_data_chunk,
     *        key_exchange_* and data_transfer_* here
     */
    void registerHandlers(MessageDispatcher& dispatcher);

    /**
     * @brief Spawn worker threads and the cleanup thread
     */
    bool start();

    /**
     * @brief Cancel every live task and join all threads
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Commands
    //=========================================================================

    /**
     * @brief Offer files to a paired peer
     *
     * Every file is checked against the size limits before anything is sent.
     * @return On success, message holds the batch id
     */
    CommandResult sendFiles(const std::vector<std::string>& paths, const std::string& peerId);

    /**
     * @brief Accept or reject a pending inbound request (one-shot)
     */
    CommandResult respondToFileTransferRequest(const std::string& requestId, bool accept,
                                               const std::string& rejectMessage = {});

    /**
     * @brief Cancel a task in any non-terminal state
     *
     * Chunk I/O stops before the next chunk; the partial file stays on disk.
     */
    CommandResult cancelTransfer(const std::string& taskId);

    CommandResult pauseTransfer(const std::string& taskId);

    /**
     * @brief Continue a paused task, or restart a failed or cancelled
     *        outgoing task as a new task that resumes from the receiver's .part
     * @return On success, message holds the id of the task that carries on
     */
    CommandResult resumeTransfer(const std::string& taskId);

    /**
     * @brief Remove a task (cancelling it first if it is still live)
     * @param deleteFileIfIncomplete Delete the .part file of an unfinished incoming task
     */
    CommandResult clearTransfer(const std::string& taskId, bool deleteFileIfIncomplete);

    CommandResult clearAllTransfers(bool deleteFiles);
    CommandResult clearBatch(const std::string& batchId, bool deleteFiles);

    /**
     * @brief Cancel every live task and drop every pending request
     */
    void cancelAllTransfers();

    /**
     * @brief Reject every pending inbound request from a peer
     * @return Number of requests rejected
     */
    size_t rejectPendingFrom(const std::string& peerId, RejectReason reason, const std::string& message);

    /**
     * @brief Fail every live task of a peer and drop its requests
     */
    void onPeerDisconnected(const std::string& peerId);

    //=========================================================================
    // Queries
    //=========================================================================

    std::vector<DataTransferTask> transfers() const;
    std::optional<DataTransferTask> transfer(const std::string& taskId) const;
    std::vector<FileTransferRequestInfo> pendingRequests() const;
    size_t activeCount() const;
    size_t queuedCount() const;

    /**
     * @brief Run one auto-cleanup pass now
     * @return Number of tasks removed
     */
    size_t runCleanupPass();

private:
    struct TaskState {
        DataTransferTask task;

        bool encrypted = false;       ///< Chunks travel as encrypted_data_chunk

        // Outgoing
        int64_t sentBytes = 0;
        size_t inFlight = 0;
        bool completeAcked = false;
        bool completeOk = false;
        std::string completeError;

        // Incoming
        std::mutex ioMutex;
        std::string partPath;
        std::ofstream out;
        bool finalizing = false;      ///< Verified and being moved into place; only Completed or Failed may follow

        std::chrono::steady_clock::time_point lastProgress{};
    };
    using TaskPtr = std::shared_ptr<TaskState>;

    struct OutgoingRequest {
        std::string requestId;
        std::string batchId;
        std::string peerId;
        std::vector<std::string> taskIds;
        TimerQueue::TimerId timer = 0;
    };

    struct IncomingRequest {
        FileTransferRequestInfo info;
        TimerQueue::TimerId timer = 0;
    };

    struct PeerCipher {
        std::string keyId;
        std::shared_ptr<ChunkCipher> cipher;
    };

    /**
     * @brief Sender side of a key exchange; shared by every task waiting on the peer
     */
    struct KeyExchange {
        std::string keyId;
        std::shared_ptr<EphemeralKeyPair> keyPair;
        bool done = false;
        bool ok = false;
        std::string error;
    };
    using KeyExchangePtr = std::shared_ptr<KeyExchange>;

    // Message handlers
    void handleFileTransferRequest(const WireMessage& message);
    void handleFileTransferResponse(const WireMessage& message);
    void handleDataChunk(const WireMessage& message, bool encrypted);
    void handleKeyExchangeRequest(const WireMessage& message);
    void handleKeyExchangeResponse(const WireMessage& message);
    void handleDataChunkAck(const WireMessage& message);
    void handleDataTransferComplete(const WireMessage& message);
    void handleDataTransferCompleteAck(const WireMessage& message);
    void handleDataTransferCancel(const WireMessage& message);

    // Outgoing
    CommandResult offerTasks(const std::string& peerId, const std::vector<TaskPtr>& tasks, bool resume);
    void workerThreadFunc(size_t workerIndex);
    void runSendTask(const TaskPtr& state);
    bool streamChunks(const TaskPtr& state, std::string& errorMsg);
    bool finishHandshake(const TaskPtr& state, std::string& errorMsg);
    std::shared_ptr<ChunkCipher> ensureCipher(const TaskPtr& state, std::string& keyIdOut,
                                              std::string& errorMsg);
    void finishKeyExchange(const std::string& peerId, const KeyExchangePtr& exchange,
                           bool ok, const std::string& error);
    bool waitForSender(std::unique_lock<std::mutex>& lock, const TaskPtr& state,
                       const std::function<bool()>& ready, const char* what, std::string& errorMsg);
    void expireOutgoingRequest(const std::string& requestId);

    // Incoming
    bool validateRequest(const FileTransferRequestInfo& info, RejectReason& reason,
                         std::string& message) const;
    CommandResult acceptRequest(const FileTransferRequestInfo& info);
    bool sendResponse(const FileTransferRequestInfo& info, bool accepted, RejectReason reason,
                      const std::string& message, const nlohmann::json& offsets);
    std::string resolveSaveDirectory(const std::string& senderName, std::string& errorMsg) const;
    void expireIncomingRequest(const std::string& requestId);
    void failIncoming(const TaskPtr& state, const std::string& error, bool notifyPeer);
    bool decodeChunkPayload(const TaskPtr& state, const std::string& peerId, const nlohmann::json& data,
                            bool encrypted, int64_t offset, std::vector<uint8_t>& out,
                            std::string& errorMsg);
    void sendKeyExchangeResponse(const std::string& peerId, const std::string& keyId, bool accepted,
                                 const std::string& publicKey, const std::string& signature,
                                 const std::string& error);

    // Task bookkeeping
    TaskPtr findTask(const std::string& taskId) const;
    TaskPtr findPeerTask(const std::string& taskId, const std::string& peerId,
                         TransferDirection direction) const;
    TransferStatusChanged applyStatusLocked(TaskState& state, TransferStatus status, const std::string& error);
    bool transition(const TaskPtr& state, TransferStatus status, const std::string& error = {},
                    std::optional<TransferStatus> expectedFrom = std::nullopt);
    void publishProgress(const TaskPtr& state, bool force);
    void sendCancel(const std::string& peerId, const std::string& taskId, const std::string& reason);
    bool removeTask(const std::string& taskId, bool deleteFileIfIncomplete);
    void cleanupThreadFunc();

    TrustStore& m_store;
    PeerMessenger& m_messenger;
    EventBus& m_bus;
    TimerQueue& m_timers;
    TransferTimeouts m_timeouts;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;          ///< Queue, acks, pause and cancel
    std::condition_variable m_cleanupCv;
    LocalIdentity m_identity;
    IdentityKey::Ptr m_identityKey;
    TransferSettings m_settings;

    std::unordered_map<std::string, TaskPtr> m_tasks;
    std::deque<std::string> m_queue;                                  ///< Pending outgoing task ids
    std::unordered_map<std::string, OutgoingRequest> m_outgoing;      ///< request id -> request
    std::unordered_map<std::string, IncomingRequest> m_incoming;      ///< request id -> request
    std::unordered_map<std::string, PeerCipher> m_ciphers;            ///< peer id -> agreed chunk key
    std::unordered_map<std::string, KeyExchangePtr> m_exchanges;      ///< peer id -> exchange in flight
    size_t m_activeCount = 0;

    std::vector<std::thread> m_workerThreads;
    std::thread m_cleanupThread;
    std::atomic<bool> m_running{false};
    bool m_stopRequested = false;
};

}  // namespace P2Lan
