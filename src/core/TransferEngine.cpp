/**
 * @file TransferEngine.cpp
 * @brief Chunked file transfer: request/response, streaming workers, completion handshake
 */

#include "p2lan/TransferEngine.h"
#include "p2lan/AppPaths.h"
#include "p2lan/AtomicFile.h"
#include "p2lan/Compression.h"
#include "p2lan/Debug.h"
#include "p2lan/ErrorCodes.h"
#include "p2lan/EventBus.h"
#include "p2lan/FileNameUtils.h"
#include "p2lan/HashUtils.h"
#include "p2lan/MessageDispatcher.h"
#include "p2lan/PeerMessenger.h"
#include "p2lan/ThreadSafeLog.h"
#include "p2lan/TrustStore.h"
#include "p2lan/UuidGenerator.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace P2Lan {

namespace {
    #define LogTransfer(msg) P2Lan::ThreadSafeLog::log(msg)

    int64_t wallClockMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string megabytes(int64_t bytes) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }

    std::string todayFolderName() {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &local);
        return buf;
    }

    constexpr const char* ENCRYPTION_SCHEME = "x25519-aes-256-gcm";

    // Length-prefixed fields, so no field can run into the next
    std::string keyExchangeTranscript(const char* role, const std::string& keyId,
                                      const std::string& senderId, const std::string& receiverId,
                                      const std::string& senderPublic, const std::string& receiverPublic)
    {
        std::string out = "P2Lan key exchange v1|";
        out += role;
        for (const std::string* field : {&keyId, &senderId, &receiverId, &senderPublic, &receiverPublic}) {
            out += "|" + std::to_string(field->size()) + ":" + *field;
        }
        return out;
    }

    template <size_t N>
    bool decodeFixed(const nlohmann::json& data, const char* key, std::array<uint8_t, N>& out) {
        std::vector<uint8_t> bytes;
        if (!data.contains(key) || !data[key].is_string() ||
            !HashUtils::base64Decode(data[key].get<std::string>(), bytes) || bytes.size() != N) {
            return false;
        }
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return true;
    }

    const char* errorCodeForReject(RejectReason reason) {
        switch (reason) {
            case RejectReason::FileSizeExceeded:    return ErrorCodes::TRANSFER_FILE_TOO_LARGE;
            case RejectReason::TotalSizeExceeded:   return ErrorCodes::TRANSFER_BATCH_TOO_LARGE;
            case RejectReason::StorageInsufficient: return ErrorCodes::TRANSFER_IO_ERROR;
            case RejectReason::PeerBlocked:         return ErrorCodes::PEER_BLOCKED;
            case RejectReason::NotPaired:           return ErrorCodes::PEER_NOT_PAIRED;
            default:                                return ErrorCodes::INVALID_ARGUMENT;
        }
    }
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

TransferEngine::TransferEngine(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                               TimerQueue& timers, TransferTimeouts timeouts)
    : m_store(store)
    , m_messenger(messenger)
    , m_bus(bus)
    , m_timers(timers)
    , m_timeouts(timeouts)
{
}

TransferEngine::~TransferEngine() {
    stop();
}

void TransferEngine::setIdentity(const LocalIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_identity = identity;
}

void TransferEngine::setIdentityKey(IdentityKey::Ptr key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_identityKey = std::move(key);
}

void TransferEngine::setSettings(const TransferSettings& settings) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = settings;
        m_settings.maxConcurrentTasks = std::clamp<size_t>(settings.maxConcurrentTasks, 1,
                                                           MAX_CONCURRENT_TRANSFERS_LIMIT);
        m_settings.maxChunkSizeKb = std::clamp(settings.maxChunkSizeKb, MIN_CHUNK_SIZE_KB,
                                               MAX_CHUNK_SIZE_KB);
        m_settings.autoCleanupDelaySeconds = std::max(0, settings.autoCleanupDelaySeconds);
    }
    // A raised concurrency limit may free a waiting worker
    m_cv.notify_all();
}

TransferSettings TransferEngine::settings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

void TransferEngine::registerHandlers(MessageDispatcher& dispatcher) {
    dispatcher.registerHandler(MessageType::FileTransferRequest,
                               [this](const WireMessage& m) { handleFileTransferRequest(m); });
    dispatcher.registerHandler(MessageType::FileTransferResponse,
                               [this](const WireMessage& m) { handleFileTransferResponse(m); });
    dispatcher.registerHandler(MessageType::DataChunk,
                               [this](const WireMessage& m) { handleDataChunk(m, false); });
    dispatcher.registerHandler(MessageType::EncryptedDataChunk,
                               [this](const WireMessage& m) { handleDataChunk(m, true); });
    dispatcher.registerHandler(MessageType::KeyExchangeRequest,
                               [this](const WireMessage& m) { handleKeyExchangeRequest(m); });
    dispatcher.registerHandler(MessageType::KeyExchangeResponse,
                               [this](const WireMessage& m) { handleKeyExchangeResponse(m); });
    dispatcher.registerHandler(MessageType::DataChunkAck,
                               [this](const WireMessage& m) { handleDataChunkAck(m); });
    dispatcher.registerHandler(MessageType::DataTransferComplete,
                               [this](const WireMessage& m) { handleDataTransferComplete(m); });
    dispatcher.registerHandler(MessageType::DataTransferCompleteAck,
                               [this](const WireMessage& m) { handleDataTransferCompleteAck(m); });
    dispatcher.registerHandler(MessageType::DataTransferCancel,
                               [this](const WireMessage& m) { handleDataTransferCancel(m); });
}

//=============================================================================
// TransferEngine: start() / stop()
//=============================================================================

bool TransferEngine::start() {
    if (m_running.load()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = false;
        m_activeCount = 0;
    }
    m_running.store(true);

    // The concurrency setting gates how many of these stream at once
    m_workerThreads.reserve(MAX_CONCURRENT_TRANSFERS_LIMIT);
    for (size_t i = 0; i < MAX_CONCURRENT_TRANSFERS_LIMIT; ++i) {
        m_workerThreads.emplace_back(&TransferEngine::workerThreadFunc, this, i);
    }
    m_cleanupThread = std::thread(&TransferEngine::cleanupThreadFunc, this);

    LogTransfer("[Transfer] Engine started");
    return true;
}

void TransferEngine::stop() {
    if (!m_running.load()) {
        return;
    }

    LogTransfer("=== TransferEngine::stop START ===");
    cancelAllTransfers();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    m_cleanupCv.notify_all();

    for (auto& thread : m_workerThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_workerThreads.clear();

    if (m_cleanupThread.joinable()) {
        m_cleanupThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.clear();
        m_ciphers.clear();
        m_exchanges.clear();
    }

    m_running.store(false);
    LogTransfer("=== TransferEngine::stop END ===");
}

//=============================================================================
// Commands: outgoing
//=============================================================================

CommandResult TransferEngine::sendFiles(const std::vector<std::string>& paths, const std::string& peerId) {
    auto peer = m_store.get(peerId);
    if (!peer) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + peerId);
    }
    if (peer->isBlocked) {
        return CommandResult::fail(ErrorCodes::PEER_BLOCKED, "Peer is blocked: " + peer->displayName);
    }
    if (!peer->isPaired) {
        return CommandResult::fail(ErrorCodes::PEER_NOT_PAIRED, "Peer is not paired: " + peer->displayName);
    }
    if (paths.empty()) {
        return CommandResult::fail(ErrorCodes::INVALID_ARGUMENT, "No files selected");
    }
    if (paths.size() > MAX_FILES_PER_REQUEST) {
        return CommandResult::fail(ErrorCodes::TRANSFER_TOO_MANY_FILES,
                                   "Too many files: " + std::to_string(paths.size()) +
                                   " (limit " + std::to_string(MAX_FILES_PER_REQUEST) + ")");
    }

    const TransferSettings limits = settings();

    std::vector<int64_t> sizes;
    int64_t totalSize = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return CommandResult::fail(ErrorCodes::TRANSFER_FILE_NOT_FOUND, "File does not exist: " + path);
        }
        const auto size = static_cast<int64_t>(fs::file_size(path, ec));
        if (ec) {
            return CommandResult::fail(ErrorCodes::TRANSFER_FILE_NOT_FOUND,
                                       "Cannot read file size: " + path + " (" + ec.message() + ")");
        }
        if (limits.maxReceiveFileSize >= 0 && size > limits.maxReceiveFileSize) {
            return CommandResult::fail(ErrorCodes::TRANSFER_FILE_TOO_LARGE,
                                       "File " + fs::path(path).filename().string() + " (" + megabytes(size) +
                                       ") exceeds the maximum file size of " +
                                       megabytes(limits.maxReceiveFileSize));
        }
        sizes.push_back(size);
        totalSize += size;
    }
    if (limits.maxTotalReceiveSize >= 0 && totalSize > limits.maxTotalReceiveSize) {
        return CommandResult::fail(ErrorCodes::TRANSFER_BATCH_TOO_LARGE,
                                   "Total size " + megabytes(totalSize) + " exceeds the limit of " +
                                   megabytes(limits.maxTotalReceiveSize));
    }

    const std::string batchId = UuidGenerator::generateWithPrefix("batch_");
    std::vector<TaskPtr> tasks;
    for (size_t i = 0; i < paths.size(); ++i) {
        auto state = std::make_shared<TaskState>();
        DataTransferTask& task = state->task;
        task.id = UuidGenerator::generateWithPrefix("task_");
        task.batchId = batchId;
        task.direction = TransferDirection::Send;
        task.peerId = peerId;
        task.peerName = peer->displayName;
        task.fileName = fs::path(paths[i]).filename().string();
        task.filePath = paths[i];
        task.fileSize = sizes[i];
        task.status = TransferStatus::Requesting;
        tasks.push_back(state);
    }
    if (batchId.empty() || std::any_of(tasks.begin(), tasks.end(),
                                       [](const TaskPtr& t) { return t->task.id.empty(); })) {
        return CommandResult::fail(ErrorCodes::INTERNAL_ERROR, "Failed to generate transfer ids");
    }

    CommandResult result = offerTasks(peerId, tasks, false);
    if (result.success) {
        result.message = batchId;
    }
    return result;
}

CommandResult TransferEngine::offerTasks(const std::string& peerId, const std::vector<TaskPtr>& tasks,
                                         bool resume)
{
    const std::string requestId = UuidGenerator::generateWithPrefix("ftr_");
    if (requestId.empty()) {
        return CommandResult::fail(ErrorCodes::INTERNAL_ERROR, "Failed to generate request id");
    }

    const int64_t now = wallClockMs();
    OutgoingRequest request;
    request.requestId = requestId;
    request.batchId = tasks.front()->task.batchId;
    request.peerId = peerId;

    nlohmann::json files = nlohmann::json::array();
    int64_t totalSize = 0;
    for (const auto& state : tasks) {
        state->task.requestId = requestId;
        state->task.createdAtMs = now;
        request.taskIds.push_back(state->task.id);

        nlohmann::json entry = {
            {"taskId", state->task.id},
            {"fileName", state->task.fileName},
            {"fileSize", state->task.fileSize}
        };
        if (!state->task.resumedFromTaskId.empty()) {
            entry["resumeFrom"] = state->task.resumedFromTaskId;
        }
        files.push_back(entry);
        totalSize += state->task.fileSize;
    }

    std::string senderName;
    uint32_t chunkKb = 0;
    bool encrypted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        encrypted = m_settings.encryptTransfers;
        for (const auto& state : tasks) {
            state->encrypted = encrypted;
            m_tasks[state->task.id] = state;
        }
        m_outgoing[requestId] = request;
        senderName = m_identity.displayName;
        chunkKb = m_settings.maxChunkSizeKb;
    }
    for (const auto& state : tasks) {
        m_bus.publish(TransferStatusChanged{state->task.id, peerId, TransferStatus::Requesting, {}});
    }

    nlohmann::json data = {
        {"requestId", requestId},
        {"batchId", request.batchId},
        {"senderName", senderName},
        {"files", files},
        {"totalSize", totalSize},
        {"maxChunkSize", chunkKb},
        {"resume", resume},
        {"requestTime", now}
    };
    if (encrypted) {
        data["encryption"] = ENCRYPTION_SCHEME;
    }

    std::string sendError;
    if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(MessageType::FileTransferRequest,
                                                                  m_messenger.localId(), peerId, data),
                                        sendError))
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_outgoing.erase(requestId);
            for (const auto& state : tasks) {
                m_tasks.erase(state->task.id);
            }
        }
        for (const auto& state : tasks) {
            m_bus.publish(TransferRemoved{state->task.id});
        }
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Failed to send file transfer request: " + sendError);
    }

    auto timer = m_timers.scheduleAfter(m_timeouts.outgoingTimeout,
        [this, requestId]() { expireOutgoingRequest(requestId); }, "transfer-outgoing");
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(requestId);
        if (it != m_outgoing.end()) {
            it->second.timer = timer;
            pending = true;
        }
    }
    if (!pending) {
        m_timers.cancel(timer);
    }

    for (const auto& state : tasks) {
        transition(state, TransferStatus::WaitingForApproval, {}, TransferStatus::Requesting);
    }

    LogTransfer("[Transfer] Request " + requestId + " sent to " + peerId + " (" +
                std::to_string(tasks.size()) + " files, " + std::to_string(totalSize) + " bytes)");
    return CommandResult::ok(requestId);
}

CommandResult TransferEngine::cancelTransfer(const std::string& taskId) {
    TaskPtr state = findTask(taskId);
    if (!state) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfer with id " + taskId);
    }

    if (!transition(state, TransferStatus::Cancelled, "Cancelled by user")) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (state->finalizing && !isTerminalStatus(state->task.status)) {
            return CommandResult::fail(ErrorCodes::TRANSFER_NOT_CANCELLABLE,
                                       "Transfer is being finalized");
        }
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_CANCELLABLE,
                                   "Transfer is already " + transferStatusToString(state->task.status));
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), taskId), m_queue.end());
    }
    if (state->task.direction == TransferDirection::Receive) {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->out.close();
    }

    sendCancel(state->task.peerId, taskId, "");
    LogTransfer("[Transfer] Task " + taskId + " cancelled by user");
    return CommandResult::ok();
}

CommandResult TransferEngine::pauseTransfer(const std::string& taskId) {
    TaskPtr state = findTask(taskId);
    if (!state) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfer with id " + taskId);
    }
    if (state->task.direction != TransferDirection::Send ||
        !transition(state, TransferStatus::Paused, {}, TransferStatus::InProgress))
    {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_PAUSABLE,
                                   "Only outgoing transfers in progress can be paused");
    }
    return CommandResult::ok();
}

CommandResult TransferEngine::resumeTransfer(const std::string& taskId) {
    TaskPtr state = findTask(taskId);
    if (!state) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfer with id " + taskId);
    }

    if (transition(state, TransferStatus::InProgress, {}, TransferStatus::Paused)) {
        return CommandResult::ok(taskId);
    }

    DataTransferTask old;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old = state->task;
    }
    if (old.direction != TransferDirection::Send ||
        (old.status != TransferStatus::Failed && old.status != TransferStatus::Cancelled))
    {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_RESUMABLE,
                                   "Transfer cannot be resumed while " + transferStatusToString(old.status));
    }

    auto peer = m_store.get(old.peerId);
    if (!peer || !peer->isPaired) {
        return CommandResult::fail(ErrorCodes::PEER_NOT_PAIRED, "Peer is no longer paired");
    }
    if (peer->isBlocked) {
        return CommandResult::fail(ErrorCodes::PEER_BLOCKED, "Peer is blocked: " + peer->displayName);
    }

    std::error_code ec;
    const auto size = fs::file_size(old.filePath, ec);
    if (ec) {
        return CommandResult::fail(ErrorCodes::TRANSFER_FILE_NOT_FOUND, "File does not exist: " + old.filePath);
    }

    auto resumed = std::make_shared<TaskState>();
    DataTransferTask& task = resumed->task;
    task.id = UuidGenerator::generateWithPrefix("task_");
    task.batchId = old.batchId;
    task.direction = TransferDirection::Send;
    task.peerId = old.peerId;
    task.peerName = peer->displayName;
    task.fileName = old.fileName;
    task.filePath = old.filePath;
    task.fileSize = static_cast<int64_t>(size);
    task.status = TransferStatus::Requesting;
    task.resumedFromTaskId = old.id;
    if (task.id.empty()) {
        return CommandResult::fail(ErrorCodes::INTERNAL_ERROR, "Failed to generate task id");
    }

    CommandResult result = offerTasks(old.peerId, {resumed}, true);
    if (result.success) {
        result.message = task.id;
        LogTransfer("[Transfer] Task " + old.id + " resumed as " + task.id);
    }
    return result;
}

//=============================================================================
// Commands: clearing
//=============================================================================

CommandResult TransferEngine::clearTransfer(const std::string& taskId, bool deleteFileIfIncomplete) {
    TaskPtr state = findTask(taskId);
    if (!state) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfer with id " + taskId);
    }

    bool live = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        live = !isTerminalStatus(state->task.status);
    }
    if (live) {
        auto cancelled = cancelTransfer(taskId);
        if (!cancelled) {
            // Finished on its own in the meantime
            LOG_DEBUG("[Transfer] Clearing " << taskId << ": " << cancelled.message);
        }
    }

    if (!removeTask(taskId, deleteFileIfIncomplete)) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfer with id " + taskId);
    }
    return CommandResult::ok();
}

CommandResult TransferEngine::clearAllTransfers(bool deleteFiles) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_tasks) {
            ids.push_back(entry.first);
        }
    }
    size_t cleared = 0;
    for (const auto& id : ids) {
        if (clearTransfer(id, deleteFiles).success) {
            ++cleared;
        }
    }
    return CommandResult::ok(std::to_string(cleared) + " transfers cleared");
}

CommandResult TransferEngine::clearBatch(const std::string& batchId, bool deleteFiles) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_tasks) {
            if (entry.second->task.batchId == batchId) {
                ids.push_back(entry.first);
            }
        }
    }
    if (ids.empty()) {
        return CommandResult::fail(ErrorCodes::TRANSFER_NOT_FOUND, "No transfers in batch " + batchId);
    }
    size_t cleared = 0;
    for (const auto& id : ids) {
        if (clearTransfer(id, deleteFiles).success) {
            ++cleared;
        }
    }
    return CommandResult::ok(std::to_string(cleared) + " transfers cleared");
}

void TransferEngine::cancelAllTransfers() {
    std::vector<TimerQueue::TimerId> timers;
    std::vector<std::string> live;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_incoming) {
            timers.push_back(entry.second.timer);
        }
        for (const auto& entry : m_outgoing) {
            timers.push_back(entry.second.timer);
        }
        m_incoming.clear();
        m_outgoing.clear();
        for (const auto& entry : m_tasks) {
            if (!isTerminalStatus(entry.second->task.status)) {
                live.push_back(entry.first);
            }
        }
    }
    for (auto id : timers) {
        if (id != 0) {
            m_timers.cancel(id);
        }
    }
    for (const auto& id : live) {
        if (!cancelTransfer(id)) {
            LOG_DEBUG("[Transfer] " << id << " finished before it could be cancelled");
        }
    }
    if (!live.empty()) {
        LogTransfer("[Transfer] Cancelled " + std::to_string(live.size()) + " live transfers");
    }
}

size_t TransferEngine::rejectPendingFrom(const std::string& peerId, RejectReason reason,
                                         const std::string& message)
{
    std::vector<IncomingRequest> taken;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_incoming.begin(); it != m_incoming.end();) {
            if (it->second.info.peerId == peerId) {
                taken.push_back(it->second);
                it = m_incoming.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& entry : taken) {
        m_timers.cancel(entry.timer);
        sendResponse(entry.info, false, reason, message, nullptr);
    }
    return taken.size();
}

void TransferEngine::onPeerDisconnected(const std::string& peerId) {
    std::vector<TimerQueue::TimerId> timers;
    std::vector<TaskPtr> live;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_incoming.begin(); it != m_incoming.end();) {
            if (it->second.info.peerId == peerId) {
                timers.push_back(it->second.timer);
                it = m_incoming.erase(it);
            } else {
                ++it;
            }
        }
        for (auto it = m_outgoing.begin(); it != m_outgoing.end();) {
            if (it->second.peerId == peerId) {
                timers.push_back(it->second.timer);
                it = m_outgoing.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& entry : m_tasks) {
            if (entry.second->task.peerId == peerId && !isTerminalStatus(entry.second->task.status)) {
                live.push_back(entry.second);
            }
        }
        m_ciphers.erase(peerId);
        auto kx = m_exchanges.find(peerId);
        if (kx != m_exchanges.end()) {
            kx->second->done = true;
            kx->second->error = "Peer disconnected";
            m_exchanges.erase(kx);
        }
    }
    m_cv.notify_all();

    for (auto id : timers) {
        if (id != 0) {
            m_timers.cancel(id);
        }
    }
    for (const auto& state : live) {
        if (transition(state, TransferStatus::Failed, "Peer disconnected") &&
            state->task.direction == TransferDirection::Receive)
        {
            std::lock_guard<std::mutex> io(state->ioMutex);
            state->out.close();
        }
    }
    if (!live.empty()) {
        LogTransfer("[Transfer] " + std::to_string(live.size()) + " transfers failed: peer " +
                    peerId + " disconnected");
    }
}

//=============================================================================
// Commands: incoming
//=============================================================================

CommandResult TransferEngine::respondToFileTransferRequest(const std::string& requestId, bool accept,
                                                           const std::string& rejectMessage)
{
    IncomingRequest entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it == m_incoming.end()) {
            return CommandResult::fail(ErrorCodes::TRANSFER_NO_SUCH_REQUEST,
                                       "No pending file transfer request with id " + requestId);
        }
        entry = it->second;
        m_incoming.erase(it);
    }
    m_timers.cancel(entry.timer);

    if (!accept) {
        const std::string message = rejectMessage.empty() ? "Rejected by user" : rejectMessage;
        if (!sendResponse(entry.info, false, RejectReason::UserRejected, message, nullptr)) {
            return CommandResult::ok("Request rejected; the peer could not be notified");
        }
        return CommandResult::ok();
    }

    RejectReason reason = RejectReason::Unknown;
    std::string message;
    if (!validateRequest(entry.info, reason, message)) {
        sendResponse(entry.info, false, reason, message, nullptr);
        return CommandResult::fail(errorCodeForReject(reason), message);
    }
    return acceptRequest(entry.info);
}

bool TransferEngine::validateRequest(const FileTransferRequestInfo& info, RejectReason& reason,
                                     std::string& message) const
{
    auto peer = m_store.get(info.peerId);
    if (!peer) {
        reason = RejectReason::NotPaired;
        message = "Unknown user";
        return false;
    }
    if (peer->isBlocked) {
        reason = RejectReason::PeerBlocked;
        message = "User blocked";
        return false;
    }
    if (!peer->isPaired) {
        reason = RejectReason::NotPaired;
        message = "User not paired";
        return false;
    }
    if (info.files.empty() || info.files.size() > MAX_FILES_PER_REQUEST) {
        reason = RejectReason::Unknown;
        message = "Invalid file count: " + std::to_string(info.files.size());
        return false;
    }

    const TransferSettings limits = settings();
    if (limits.maxTotalReceiveSize >= 0 && info.totalSize > limits.maxTotalReceiveSize) {
        reason = RejectReason::TotalSizeExceeded;
        message = "Total size " + megabytes(info.totalSize) + " exceeds limit " +
                  megabytes(limits.maxTotalReceiveSize);
        return false;
    }

    for (const auto& file : info.files) {
        if (file.taskId.empty() || file.fileSize < 0) {
            reason = RejectReason::Unknown;
            message = "Invalid file entry";
            return false;
        }
        if (limits.maxReceiveFileSize >= 0 && file.fileSize > limits.maxReceiveFileSize) {
            reason = RejectReason::FileSizeExceeded;
            message = "File " + file.fileName + " size " + megabytes(file.fileSize) + " exceeds limit " +
                      megabytes(limits.maxReceiveFileSize);
            return false;
        }
        std::string name = file.fileName;
        if (!sanitizeFileNameInPlace(name)) {
            reason = RejectReason::UnsupportedFileType;
            message = "Invalid file name: " + file.fileName;
            return false;
        }
        if (findTask(file.taskId)) {
            reason = RejectReason::Unknown;
            message = "Duplicate task id " + file.taskId;
            return false;
        }
    }

    const fs::path base = limits.downloadPath.empty() ? AppPaths::defaultDownloadDir()
                                                      : fs::path(limits.downloadPath);
    std::error_code ec;
    const auto space = fs::space(base, ec);
    if (!ec && static_cast<int64_t>(space.available) < info.totalSize) {
        reason = RejectReason::StorageInsufficient;
        message = "Not enough free space in " + base.string();
        return false;
    }
    return true;
}

CommandResult TransferEngine::acceptRequest(const FileTransferRequestInfo& info) {
    std::string dirError;
    const std::string dir = resolveSaveDirectory(info.senderName, dirError);
    if (dir.empty()) {
        sendResponse(info, false, RejectReason::StorageInsufficient, dirError, nullptr);
        return CommandResult::fail(ErrorCodes::TRANSFER_IO_ERROR, dirError);
    }

    const int64_t now = wallClockMs();
    nlohmann::json offsets = nlohmann::json::array();
    std::vector<TaskPtr> created;
    std::string openError;

    for (const auto& file : info.files) {
        auto state = std::make_shared<TaskState>();
        DataTransferTask& task = state->task;
        task.id = file.taskId;
        task.batchId = info.batchId;
        task.requestId = info.requestId;
        task.direction = TransferDirection::Receive;
        task.peerId = info.peerId;
        task.peerName = info.senderName;
        task.fileName = file.fileName;
        sanitizeFileNameInPlace(task.fileName);
        task.fileSize = file.fileSize;
        task.status = TransferStatus::Pending;
        task.createdAtMs = now;
        task.resumedFromTaskId = file.resumeFrom;
        state->encrypted = info.encrypted;

        int64_t offset = 0;
        if (info.resume && !file.resumeFrom.empty()) {
            TaskPtr previous = findPeerTask(file.resumeFrom, info.peerId, TransferDirection::Receive);
            if (previous) {
                std::lock_guard<std::mutex> io(previous->ioMutex);
                previous->out.close();
                std::error_code ec;
                const auto partSize = fs::file_size(previous->partPath, ec);
                if (!previous->partPath.empty() && !ec &&
                    static_cast<int64_t>(partSize) <= file.fileSize)
                {
                    state->partPath = previous->partPath;
                    task.savePath = previous->task.savePath;
                    offset = static_cast<int64_t>(partSize);
                    // The .part file now belongs to the resumed task
                    previous->partPath.clear();
                }
            }
        }

        if (state->partPath.empty()) {
            const fs::path finalPath = uniqueFinalPath(fs::path(dir) / task.fileName);
            task.savePath = finalPath.string();
            state->partPath = computeAtomicFilePaths(finalPath).tempPath.string();
            offset = 0;
        }

        const auto mode = std::ios::binary | std::ios::out | (offset > 0 ? std::ios::app : std::ios::trunc);
        state->out.open(state->partPath, mode);
        if (!state->out) {
            openError = "Failed to create " + state->partPath;
            break;
        }

        task.transferredBytes = offset;
        offsets.push_back({{"taskId", task.id}, {"offset", offset}});
        created.push_back(state);
    }

    if (!openError.empty()) {
        for (const auto& state : created) {
            state->out.close();
            if (state->task.transferredBytes == 0) {
                std::error_code ec;
                fs::remove(state->partPath, ec);
            }
        }
        LOG_ERROR("[Transfer] " << openError);
        sendResponse(info, false, RejectReason::StorageInsufficient, openError, nullptr);
        return CommandResult::fail(ErrorCodes::TRANSFER_IO_ERROR, openError);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& state : created) {
            m_tasks[state->task.id] = state;
        }
    }
    for (const auto& state : created) {
        m_bus.publish(TransferStatusChanged{state->task.id, info.peerId, TransferStatus::Pending, {}});
    }

    if (!sendResponse(info, true, RejectReason::Unknown, {}, offsets)) {
        for (const auto& state : created) {
            failIncoming(state, "Failed to deliver acceptance", false);
        }
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Accepted, but the sender could not be reached");
    }

    LogTransfer("[Transfer] Accepted request " + info.requestId + " from " + info.peerId + " into " + dir);
    return CommandResult::ok();
}

std::string TransferEngine::resolveSaveDirectory(const std::string& senderName, std::string& errorMsg) const {
    const TransferSettings current = settings();
    fs::path dir = current.downloadPath.empty() ? AppPaths::defaultDownloadDir()
                                                : fs::path(current.downloadPath);

    if (current.createSenderFolders) {
        std::string folder = senderName;
        if (!sanitizeFileNameInPlace(folder)) {
            folder = "Unknown";
        }
        dir /= folder;
    } else if (current.createDateFolders) {
        dir /= todayFolderName();
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        errorMsg = "Cannot create download folder " + dir.string() + ": " + ec.message();
        return {};
    }
    return dir.string();
}

bool TransferEngine::sendResponse(const FileTransferRequestInfo& info, bool accepted, RejectReason reason,
                                  const std::string& message, const nlohmann::json& offsets)
{
    nlohmann::json data = {
        {"requestId", info.requestId},
        {"batchId", info.batchId},
        {"accepted", accepted}
    };
    if (accepted) {
        data["offsets"] = offsets.is_array() ? offsets : nlohmann::json::array();
    } else {
        data["rejectReason"] = rejectReasonToString(reason);
        data["rejectMessage"] = message;
        LogTransfer("[Transfer] Rejecting request " + info.requestId + " from " + info.peerId + ": " + message);
    }

    if (!m_messenger.sendMessageToUser(info.peerId, WireMessage::make(MessageType::FileTransferResponse,
                                                                      m_messenger.localId(), info.peerId, data))) {
        LOG_WARNING("[Transfer] Failed to send response for " << info.requestId << " to " << info.peerId);
        return false;
    }
    return true;
}

void TransferEngine::expireIncomingRequest(const std::string& requestId) {
    IncomingRequest entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it == m_incoming.end()) {
            return;
        }
        entry = it->second;
        m_incoming.erase(it);
    }
    sendResponse(entry.info, false, RejectReason::Timeout, "Request timed out (no response)", nullptr);
    m_bus.publish(FileTransferRequestExpired{requestId, entry.info.peerId});
}

void TransferEngine::expireOutgoingRequest(const std::string& requestId) {
    OutgoingRequest request;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(requestId);
        if (it == m_outgoing.end()) {
            return;
        }
        request = it->second;
        m_outgoing.erase(it);
    }
    for (const auto& id : request.taskIds) {
        if (TaskPtr state = findTask(id)) {
            transition(state, TransferStatus::Failed, "No response from receiver");
        }
    }
    LogTransfer("[Transfer] Request " + requestId + " to " + request.peerId + " timed out");
}

//=============================================================================
// Inbound messages
//=============================================================================

void TransferEngine::handleFileTransferRequest(const WireMessage& message) {
    const auto& data = message.data;

    FileTransferRequestInfo info;
    info.requestId = data.value("requestId", "");
    info.batchId = data.value("batchId", "");
    info.peerId = message.fromUserId;
    info.senderName = data.value("senderName", "");
    info.maxChunkSizeKb = data.value("maxChunkSize", 0u);
    info.resume = data.value("resume", false);
    info.receivedAtMs = wallClockMs();
    info.requestTimeMs = data.value("requestTime", info.receivedAtMs);

    if (info.requestId.empty() || !data.contains("files") || !data["files"].is_array()) {
        LOG_WARNING("[Transfer] Dropping malformed file_transfer_request from " << info.peerId);
        return;
    }
    const std::string encryption = data.value("encryption", "");
    info.encrypted = !encryption.empty();
    for (const auto& f : data["files"]) {
        FileTransferEntry entry;
        entry.taskId = f.value("taskId", "");
        entry.fileName = f.value("fileName", "");
        entry.fileSize = f.value("fileSize", static_cast<int64_t>(-1));
        entry.resumeFrom = f.value("resumeFrom", "");
        info.totalSize += std::max<int64_t>(entry.fileSize, 0);
        info.files.push_back(entry);
    }
    if (info.senderName.empty()) {
        if (auto peer = m_store.get(info.peerId)) {
            info.senderName = peer->displayName;
        }
    }

    RejectReason reason = RejectReason::Unknown;
    std::string rejectMessage;
    if (!validateRequest(info, reason, rejectMessage)) {
        sendResponse(info, false, reason, rejectMessage, nullptr);
        return;
    }
    if (info.encrypted && encryption != ENCRYPTION_SCHEME) {
        sendResponse(info, false, RejectReason::Unknown, "Unsupported encryption: " + encryption, nullptr);
        return;
    }

    if (m_store.canAutoAccept(info.peerId)) {
        LogTransfer("[Transfer] Auto-accepting request " + info.requestId + " from trusted peer " + info.peerId);
        CommandResult result = acceptRequest(info);
        if (!result.success) {
            LOG_ERROR("[Transfer] Auto-accept failed: " << result.message);
            m_bus.publish(ServiceError{"Transfer", result.errorCode, result.message});
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_incoming.count(info.requestId) != 0) {
            LOG_WARNING("[Transfer] Duplicate request " << info.requestId << " ignored");
            return;
        }
        IncomingRequest entry;
        entry.info = info;
        m_incoming[info.requestId] = entry;
    }

    const std::string requestId = info.requestId;
    auto timer = m_timers.scheduleAfter(m_timeouts.pendingExpiry,
        [this, requestId]() { expireIncomingRequest(requestId); }, "transfer-expiry");
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it != m_incoming.end()) {
            it->second.timer = timer;
        }
    }

    LogTransfer("[Transfer] Request " + requestId + " from " + info.peerId + " awaiting decision");
    m_bus.publish(FileTransferRequestReceived{requestId, info.batchId, info.peerId, info.senderName,
                                              info.files.size(), info.totalSize});
}

void TransferEngine::handleFileTransferResponse(const WireMessage& message) {
    const auto& data = message.data;
    const std::string requestId = data.value("requestId", "");

    OutgoingRequest request;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(requestId);
        if (it == m_outgoing.end() || it->second.peerId != message.fromUserId) {
            LOG_WARNING("[Transfer] Response to unknown request " << requestId << " from " << message.fromUserId);
            return;
        }
        request = it->second;
        m_outgoing.erase(it);
    }
    m_timers.cancel(request.timer);

    if (!data.value("accepted", false)) {
        const RejectReason reason = rejectReasonFromString(data.value("rejectReason", "unknown"));
        const std::string text = data.value("rejectMessage", rejectReasonToString(reason));
        for (const auto& id : request.taskIds) {
            if (TaskPtr state = findTask(id)) {
                transition(state, TransferStatus::Rejected, text);
            }
        }
        LogTransfer("[Transfer] Request " + requestId + " rejected by " + request.peerId + ": " + text);
        return;
    }

    std::unordered_map<std::string, int64_t> offsets;
    if (data.contains("offsets") && data["offsets"].is_array()) {
        for (const auto& entry : data["offsets"]) {
            offsets[entry.value("taskId", "")] = entry.value("offset", static_cast<int64_t>(0));
        }
    }

    std::vector<TransferStatusChanged> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& id : request.taskIds) {
            auto it = m_tasks.find(id);
            if (it == m_tasks.end()) {
                continue;
            }
            TaskState& state = *it->second;
            if (state.task.status != TransferStatus::WaitingForApproval &&
                state.task.status != TransferStatus::Requesting) {
                continue;
            }
            auto off = offsets.find(id);
            int64_t offset = off == offsets.end() ? 0 : off->second;
            offset = std::clamp<int64_t>(offset, 0, state.task.fileSize);
            state.task.transferredBytes = offset;
            state.sentBytes = offset;
            state.inFlight = 0;
            events.push_back(applyStatusLocked(state, TransferStatus::Pending, {}));
            m_queue.push_back(id);
        }
    }
    for (const auto& event : events) {
        m_bus.publish(event);
    }
    m_cv.notify_all();
    LogTransfer("[Transfer] Request " + requestId + " accepted by " + request.peerId);
}

void TransferEngine::handleDataChunk(const WireMessage& message, bool encrypted) {
    const auto& data = message.data;
    const std::string taskId = data.value("taskId", "");
    TaskPtr state = findPeerTask(taskId, message.fromUserId, TransferDirection::Receive);
    if (!state) {
        LOG_WARNING("[Transfer] Chunk for unknown task " << taskId << " from " << message.fromUserId);
        return;
    }

    int64_t expected = 0;
    TransferStatus status;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        status = state->task.status;
        expected = state->task.transferredBytes;
    }
    if (isTerminalStatus(status)) {
        return;
    }
    if (status == TransferStatus::Pending) {
        transition(state, TransferStatus::InProgress);
    }

    const int64_t offset = data.value("offset", static_cast<int64_t>(-1));
    if (offset != expected) {
        failIncoming(state, "Unexpected chunk offset " + std::to_string(offset) +
                            " (expected " + std::to_string(expected) + ")", true);
        return;
    }

    std::vector<uint8_t> bytes;
    std::string decodeError;
    if (!decodeChunkPayload(state, message.fromUserId, data, encrypted, offset, bytes, decodeError)) {
        failIncoming(state, decodeError, true);
        return;
    }
    if (offset + static_cast<int64_t>(bytes.size()) > state->task.fileSize) {
        failIncoming(state, "Chunk exceeds announced file size", true);
        return;
    }

    bool written = false;
    {
        std::lock_guard<std::mutex> io(state->ioMutex);
        if (!state->out.is_open()) {
            return;
        }
        state->out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        state->out.flush();
        written = static_cast<bool>(state->out);
    }
    if (!written) {
        failIncoming(state, "Failed to write " + state->partPath + " (disk full?)", true);
        return;
    }

    int64_t received = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isTerminalStatus(state->task.status)) {
            return;
        }
        state->task.transferredBytes += static_cast<int64_t>(bytes.size());
        received = state->task.transferredBytes;
    }
    publishProgress(state, false);

    nlohmann::json ack = {{"taskId", taskId}, {"receivedBytes", received}};
    if (!m_messenger.sendMessageToUser(message.fromUserId, WireMessage::make(MessageType::DataChunkAck,
                                                                             m_messenger.localId(),
                                                                             message.fromUserId, ack))) {
        LOG_WARNING("[Transfer] Failed to acknowledge chunk of " << taskId);
    }
}

bool TransferEngine::decodeChunkPayload(const TaskPtr& state, const std::string& peerId,
                                        const nlohmann::json& data, bool encrypted, int64_t offset,
                                        std::vector<uint8_t>& out, std::string& errorMsg)
{
    if (!encrypted && state->encrypted) {
        errorMsg = "Unencrypted chunk for an encrypted transfer";
        return false;
    }

    std::vector<uint8_t> payload;
    if (!HashUtils::base64Decode(data.value("data", ""), payload)) {
        errorMsg = "Corrupt chunk data";
        return false;
    }

    const bool compressed = data.value("compressed", false);
    const int64_t rawSize = compressed ? data.value("rawSize", static_cast<int64_t>(0)) : 0;

    if (encrypted) {
        const std::string keyId = data.value("keyId", "");
        std::shared_ptr<ChunkCipher> cipher;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_ciphers.find(peerId);
            if (it != m_ciphers.end() && it->second.keyId == keyId) {
                cipher = it->second.cipher;
            }
        }
        if (!cipher) {
            errorMsg = "No session key " + keyId + " for encrypted chunk";
            return false;
        }

        SealedChunk sealed;
        if (!decodeFixed(data, "nonce", sealed.nonce) || !decodeFixed(data, "tag", sealed.tag)) {
            errorMsg = "Corrupt chunk data";
            return false;
        }
        sealed.ciphertext = std::move(payload);
        if (!cipher->open(sealed, ChunkCipher::associatedData(state->task.id, offset, rawSize),
                          payload, errorMsg)) {
            return false;
        }
    }

    if (compressed) {
        std::vector<uint8_t> inflated;
        if (rawSize <= 0 ||
            !Compression::decompressChunk(payload.data(), payload.size(), static_cast<size_t>(rawSize),
                                          inflated, errorMsg)) {
            if (rawSize <= 0) {
                errorMsg = "Compressed chunk without a valid rawSize";
            }
            return false;
        }
        payload.swap(inflated);
    }

    out.swap(payload);
    return true;
}

//=============================================================================
// Key exchange
//=============================================================================

void TransferEngine::sendKeyExchangeResponse(const std::string& peerId, const std::string& keyId, bool accepted,
                                             const std::string& publicKey, const std::string& signature,
                                             const std::string& error)
{
    nlohmann::json data = {{"keyId", keyId}, {"accepted", accepted}};
    if (accepted) {
        data["publicKey"] = publicKey;
        data["signature"] = signature;
    } else {
        data["error"] = error;
        LOG_WARNING("[Transfer] Refusing key exchange " << keyId << " from " << peerId << ": " << error);
    }
    if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(MessageType::KeyExchangeResponse,
                                                                 m_messenger.localId(), peerId, data))) {
        LOG_WARNING("[Transfer] Failed to answer key exchange " << keyId << " from " << peerId);
    }
}

void TransferEngine::handleKeyExchangeRequest(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const std::string keyId = message.data.value("keyId", "");
    const std::string peerPublic = message.data.value("publicKey", "");
    const std::string signature = message.data.value("signature", "");
    if (keyId.empty() || keyId.size() > MAX_UUID_LENGTH) {
        LOG_WARNING("[Transfer] Dropping malformed key_exchange_request from " << peerId);
        return;
    }

    const std::string scheme = message.data.value("scheme", "");
    if (scheme != ENCRYPTION_SCHEME) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, "Unsupported scheme: " + scheme);
        return;
    }

    auto peer = m_store.get(peerId);
    if (!peer || !peer->isPaired || peer->isBlocked) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, "Not paired");
        return;
    }
    if (peer->identityKey.empty()) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, "No verified identity key");
        return;
    }

    const std::string self = m_messenger.localId();
    if (!IdentityKey::verify(peer->identityKey,
                             keyExchangeTranscript("request", keyId, peerId, self, peerPublic, {}),
                             signature)) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, "Key exchange signature invalid");
        return;
    }

    IdentityKey::Ptr identityKey;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        identityKey = m_identityKey;
    }
    if (!identityKey) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, "Identity key not set");
        return;
    }

    std::string errorMsg;
    std::unique_ptr<EphemeralKeyPair> ours = EphemeralKeyPair::generate(errorMsg);
    SessionKey key{};
    std::string ourSignature;
    if (!ours || !ours->deriveSessionKey(peerPublic, keyId, key, errorMsg) ||
        !identityKey->sign(keyExchangeTranscript("response", keyId, peerId, self, peerPublic,
                                                 ours->publicKeyHex()),
                           ourSignature, errorMsg)) {
        sendKeyExchangeResponse(peerId, keyId, false, {}, {}, errorMsg);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ciphers[peerId] = PeerCipher{keyId, std::make_shared<ChunkCipher>(key)};
    }
    OPENSSL_cleanse(key.data(), key.size());

    sendKeyExchangeResponse(peerId, keyId, true, ours->publicKeyHex(), ourSignature, {});
    LogTransfer("[Transfer] Session key " + keyId + " agreed with " + peerId);
}

void TransferEngine::handleKeyExchangeResponse(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const std::string keyId = message.data.value("keyId", "");

    KeyExchangePtr exchange;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_exchanges.find(peerId);
        if (it == m_exchanges.end() || it->second->keyId != keyId || !it->second->keyPair) {
            LOG_WARNING("[Transfer] key_exchange_response " << keyId << " from " << peerId
                        << " matches no exchange, dropped");
            return;
        }
        exchange = it->second;
    }

    if (!message.data.value("accepted", false)) {
        finishKeyExchange(peerId, exchange, false, message.data.value("error", "Refused by receiver"));
        return;
    }

    const std::string peerPublic = message.data.value("publicKey", "");
    const std::string signature = message.data.value("signature", "");
    auto peer = m_store.get(peerId);
    if (!peer || peer->identityKey.empty() ||
        !IdentityKey::verify(peer->identityKey,
                             keyExchangeTranscript("response", keyId, m_messenger.localId(), peerId,
                                                   exchange->keyPair->publicKeyHex(), peerPublic),
                             signature)) {
        finishKeyExchange(peerId, exchange, false, "Key exchange signature invalid");
        return;
    }

    SessionKey key{};
    std::string errorMsg;
    if (!exchange->keyPair->deriveSessionKey(peerPublic, keyId, key, errorMsg)) {
        finishKeyExchange(peerId, exchange, false, errorMsg);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ciphers[peerId] = PeerCipher{keyId, std::make_shared<ChunkCipher>(key)};
    }
    OPENSSL_cleanse(key.data(), key.size());
    finishKeyExchange(peerId, exchange, true, {});
    LogTransfer("[Transfer] Session key " + keyId + " agreed with " + peerId);
}

void TransferEngine::finishKeyExchange(const std::string& peerId, const KeyExchangePtr& exchange,
                                       bool ok, const std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        exchange->done = true;
        exchange->ok = ok;
        exchange->error = error;
        exchange->keyPair.reset();
        auto it = m_exchanges.find(peerId);
        if (it != m_exchanges.end() && it->second == exchange) {
            m_exchanges.erase(it);
        }
    }
    m_cv.notify_all();
    if (!ok) {
        LOG_WARNING("[Transfer] Key exchange with " << peerId << " failed: " << error);
    }
}

void TransferEngine::handleDataChunkAck(const WireMessage& message) {
    const std::string taskId = message.data.value("taskId", "");
    TaskPtr state = findPeerTask(taskId, message.fromUserId, TransferDirection::Send);
    if (!state) {
        return;
    }
    const int64_t received = message.data.value("receivedBytes", static_cast<int64_t>(0));
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isTerminalStatus(state->task.status)) {
            return;
        }
        if (state->inFlight > 0) {
            --state->inFlight;
        }
        if (received > state->task.transferredBytes && received <= state->sentBytes) {
            state->task.transferredBytes = received;
        }
    }
    publishProgress(state, false);
    m_cv.notify_all();
}

void TransferEngine::handleDataTransferComplete(const WireMessage& message) {
    const std::string taskId = message.data.value("taskId", "");
    const std::string expectedHash = message.data.value("sha256", "");
    const std::string& peerId = message.fromUserId;

    auto reply = [this, &peerId, &taskId](bool success, const std::string& error) {
        nlohmann::json ack = {{"taskId", taskId}, {"success", success}};
        if (!error.empty()) {
            ack["error"] = error;
        }
        if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(MessageType::DataTransferCompleteAck,
                                                                     m_messenger.localId(), peerId, ack))) {
            LOG_WARNING("[Transfer] Failed to send completion ack for " << taskId);
        }
    };

    TaskPtr state = findPeerTask(taskId, peerId, TransferDirection::Receive);
    if (!state) {
        reply(false, "Unknown task");
        return;
    }

    DataTransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = state->task;
    }
    if (isTerminalStatus(snapshot.status)) {
        reply(false, "Transfer is " + transferStatusToString(snapshot.status));
        return;
    }

    std::string partPath;
    {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->out.close();
        partPath = state->partPath;
    }

    std::string error;
    if (snapshot.transferredBytes != snapshot.fileSize) {
        error = "Size mismatch: received " + std::to_string(snapshot.transferredBytes) + " of " +
                std::to_string(snapshot.fileSize) + " bytes";
    } else {
        std::string hashError;
        const std::string actual = HashUtils::computeFileHashHex(partPath, hashError);
        if (actual.empty()) {
            error = hashError;
        } else if (!HashUtils::compareHashHex(actual, expectedHash)) {
            error = "Checksum mismatch";
        }
    }

    if (!error.empty()) {
        reply(false, error);
        failIncoming(state, error, false);
        return;
    }

    // A local cancel may have landed while the file was being hashed
    TransferStatus current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        current = state->task.status;
        if (!isTerminalStatus(current)) {
            state->finalizing = true;
        }
    }
    if (isTerminalStatus(current)) {
        LOG_INFO("[Transfer] Task " << taskId << " became " << transferStatusToString(current)
                 << " before it could be finalized");
        reply(false, "Transfer is " + transferStatusToString(current));
        return;
    }

    fs::path finalPath = snapshot.savePath;
    std::error_code ec;
    if (fs::exists(finalPath, ec)) {
        finalPath = uniqueFinalPath(finalPath);
    }
    if (!atomicRenameToFinal(partPath, finalPath, error)) {
        reply(false, error);
        failIncoming(state, error, false);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        state->task.savePath = finalPath.string();
    }
    {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->partPath.clear();
    }
    publishProgress(state, true);
    if (!transition(state, TransferStatus::Completed)) {
        LOG_WARNING("[Transfer] Task " << taskId << " finalized but its status could not be set to Completed");
    }
    reply(true, {});
    LogTransfer("[Transfer] Received " + snapshot.fileName + " from " + peerId + " -> " + finalPath.string());
}

void TransferEngine::handleDataTransferCompleteAck(const WireMessage& message) {
    const std::string taskId = message.data.value("taskId", "");
    TaskPtr state = findPeerTask(taskId, message.fromUserId, TransferDirection::Send);
    if (!state) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        state->completeAcked = true;
        state->completeOk = message.data.value("success", false);
        state->completeError = message.data.value("error", "");
    }
    m_cv.notify_all();
}

void TransferEngine::handleDataTransferCancel(const WireMessage& message) {
    const std::string taskId = message.data.value("taskId", "");
    const std::string reason = message.data.value("reason", "");

    TaskPtr state = findTask(taskId);
    if (!state || state->task.peerId != message.fromUserId) {
        return;
    }

    bool changed = reason.empty()
        ? transition(state, TransferStatus::Cancelled, "Cancelled by peer")
        : transition(state, TransferStatus::Failed, "Peer reported: " + reason);
    if (!changed) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), taskId), m_queue.end());
    }
    if (state->task.direction == TransferDirection::Receive) {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->out.close();
    }
    LogTransfer("[Transfer] Task " + taskId + " stopped by " + message.fromUserId +
                (reason.empty() ? std::string() : ": " + reason));
}

void TransferEngine::failIncoming(const TaskPtr& state, const std::string& error, bool notifyPeer) {
    if (!transition(state, TransferStatus::Failed, error)) {
        return;
    }
    {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->out.close();
    }
    LOG_ERROR("[Transfer] Task " << state->task.id << " failed: " << error);
    if (notifyPeer) {
        sendCancel(state->task.peerId, state->task.id, error);
    }
}

//=============================================================================
// Workers
//=============================================================================

void TransferEngine::workerThreadFunc(size_t workerIndex) {
    (void)workerIndex;

    try {
        while (true) {
            TaskPtr state;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this] {
                    return m_stopRequested ||
                           (!m_queue.empty() && m_activeCount < m_settings.maxConcurrentTasks);
                });
                if (m_stopRequested) {
                    break;
                }

                const std::string id = m_queue.front();
                m_queue.pop_front();
                auto it = m_tasks.find(id);
                if (it == m_tasks.end() || it->second->task.status != TransferStatus::Pending) {
                    continue;
                }
                state = it->second;
                ++m_activeCount;
            }

            runSendTask(state);

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                --m_activeCount;
            }
            m_cv.notify_all();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Transfer] Worker thread failed: " << e.what());
        LogTransfer(std::string("[Transfer] Worker thread failed: ") + e.what());
    }
}

void TransferEngine::runSendTask(const TaskPtr& state) {
    if (!transition(state, TransferStatus::InProgress, {}, TransferStatus::Pending)) {
        return;
    }
    LogTransfer("[Transfer] Sending " + state->task.fileName + " to " + state->task.peerId);

    bool ok = false;
    std::string error;
    try {
        ok = streamChunks(state, error) && finishHandshake(state, error);
    } catch (const std::exception& e) {
        error = std::string("Unexpected error: ") + e.what();
    }

    if (ok) {
        publishProgress(state, true);
        transition(state, TransferStatus::Completed);
        LogTransfer("[Transfer] Sent " + state->task.fileName + " to " + state->task.peerId);
        return;
    }

    // Already cancelled, failed by a disconnect, or stopped
    if (error.empty()) {
        return;
    }
    if (transition(state, TransferStatus::Failed, error)) {
        LOG_ERROR("[Transfer] Task " << state->task.id << " failed: " << error);
        sendCancel(state->task.peerId, state->task.id, error);
    }
}

bool TransferEngine::waitForSender(std::unique_lock<std::mutex>& lock, const TaskPtr& state,
                                   const std::function<bool()>& ready, const char* what,
                                   std::string& errorMsg)
{
    auto deadline = std::chrono::steady_clock::now() + m_timeouts.chunkAckTimeout;
    while (true) {
        if (m_stopRequested || isTerminalStatus(state->task.status)) {
            return false;
        }
        if (state->task.status == TransferStatus::Paused) {
            m_cv.wait(lock);
            deadline = std::chrono::steady_clock::now() + m_timeouts.chunkAckTimeout;
            continue;
        }
        if (ready()) {
            return true;
        }
        if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout && !ready() &&
            state->task.status != TransferStatus::Paused)
        {
            if (!isTerminalStatus(state->task.status) && !m_stopRequested) {
                errorMsg = std::string("Timed out waiting for ") + what;
            }
            return false;
        }
    }
}

bool TransferEngine::streamChunks(const TaskPtr& state, std::string& errorMsg) {
    size_t chunkSize = 0;
    int64_t offset = 0;
    bool compress = false;
    const int64_t total = state->task.fileSize;
    const std::string taskId = state->task.id;
    const std::string peerId = state->task.peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        chunkSize = static_cast<size_t>(m_settings.maxChunkSizeKb) * 1024;
        compress = m_settings.compressChunks;
        offset = state->sentBytes;
    }

    std::shared_ptr<ChunkCipher> cipher;
    std::string keyId;
    if (state->encrypted) {
        cipher = ensureCipher(state, keyId, errorMsg);
        if (!cipher) {
            return false;
        }
    }

    std::ifstream in(state->task.filePath, std::ios::binary);
    if (!in) {
        errorMsg = "Failed to open file: " + state->task.filePath;
        return false;
    }
    in.seekg(offset);
    if (!in) {
        errorMsg = "Failed to seek to offset " + std::to_string(offset);
        return false;
    }

    std::vector<uint8_t> buffer(chunkSize);
    std::vector<uint8_t> packed;
    while (offset < total) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!waitForSender(lock, state, [&state] { return state->inFlight < CHUNK_WINDOW; },
                               "chunk acknowledgement", errorMsg)) {
                return false;
            }
        }

        const size_t toRead = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(chunkSize), total - offset));
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(toRead));
        if (static_cast<size_t>(in.gcount()) != toRead) {
            errorMsg = "Failed to read " + state->task.filePath + " at offset " + std::to_string(offset);
            return false;
        }

        const uint8_t* payload = buffer.data();
        size_t payloadSize = toRead;
        int64_t rawSize = 0;
        if (compress && Compression::compressChunk(buffer.data(), toRead, packed)) {
            payload = packed.data();
            payloadSize = packed.size();
            rawSize = static_cast<int64_t>(toRead);
        }

        nlohmann::json data = {
            {"taskId", taskId},
            {"offset", offset},
            {"isLast", offset + static_cast<int64_t>(toRead) == total}
        };
        if (rawSize > 0) {
            data["compressed"] = true;
            data["rawSize"] = rawSize;
        }

        MessageType type = MessageType::DataChunk;
        if (cipher) {
            SealedChunk sealed;
            if (!cipher->seal(payload, payloadSize, ChunkCipher::associatedData(taskId, offset, rawSize),
                              sealed, errorMsg)) {
                return false;
            }
            data["keyId"] = keyId;
            data["nonce"] = HashUtils::base64Encode(sealed.nonce.data(), sealed.nonce.size());
            data["tag"] = HashUtils::base64Encode(sealed.tag.data(), sealed.tag.size());
            data["data"] = HashUtils::base64Encode(sealed.ciphertext.data(), sealed.ciphertext.size());
            type = MessageType::EncryptedDataChunk;
        } else {
            data["data"] = HashUtils::base64Encode(payload, payloadSize);
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (isTerminalStatus(state->task.status)) {
                return false;
            }
            // Counted before the write so an early ack cannot underflow
            ++state->inFlight;
            state->sentBytes = offset + static_cast<int64_t>(toRead);
        }

        std::string sendError;
        if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(type, m_messenger.localId(), peerId, data),
                                            sendError)) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!isTerminalStatus(state->task.status)) {
                errorMsg = "Send failed: " + sendError;
            }
            return false;
        }
        offset += static_cast<int64_t>(toRead);
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    return waitForSender(lock, state, [&state, total] { return state->task.transferredBytes >= total; },
                         "final acknowledgement", errorMsg);
}

bool TransferEngine::finishHandshake(const TaskPtr& state, std::string& errorMsg) {
    std::string hashError;
    const std::string hash = HashUtils::computeFileHashHex(state->task.filePath, hashError);
    if (hash.empty()) {
        errorMsg = "Failed to hash " + state->task.filePath + ": " + hashError;
        return false;
    }

    const std::string& peerId = state->task.peerId;
    nlohmann::json data = {
        {"taskId", state->task.id},
        {"fileSize", state->task.fileSize},
        {"sha256", hash}
    };
    std::string sendError;
    if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(MessageType::DataTransferComplete,
                                                                  m_messenger.localId(), peerId, data),
                                        sendError)) {
        errorMsg = "Send failed: " + sendError;
        return false;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!waitForSender(lock, state, [&state] { return state->completeAcked; },
                       "completion acknowledgement", errorMsg)) {
        return false;
    }
    if (!state->completeOk) {
        errorMsg = "Receiver reported: " + (state->completeError.empty() ? std::string("failure")
                                                                          : state->completeError);
        return false;
    }
    return true;
}

std::shared_ptr<ChunkCipher> TransferEngine::ensureCipher(const TaskPtr& state, std::string& keyIdOut,
                                                          std::string& errorMsg)
{
    const std::string peerId = state->task.peerId;
    KeyExchangePtr exchange;
    IdentityKey::Ptr identityKey;
    bool initiate = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto cipher = m_ciphers.find(peerId);
        if (cipher != m_ciphers.end()) {
            keyIdOut = cipher->second.keyId;
            return cipher->second.cipher;
        }
        auto it = m_exchanges.find(peerId);
        if (it == m_exchanges.end()) {
            exchange = std::make_shared<KeyExchange>();
            m_exchanges[peerId] = exchange;
            initiate = true;
        } else {
            exchange = it->second;
        }
        identityKey = m_identityKey;
    }

    if (initiate) {
        const std::string keyId = UuidGenerator::generateWithPrefix("kx_");
        std::shared_ptr<EphemeralKeyPair> keyPair;
        std::string signature;
        std::string kxError;
        if (!identityKey) {
            kxError = "Identity key not set";
        } else if (keyId.empty()) {
            kxError = "Failed to generate key exchange id";
        } else {
            keyPair = EphemeralKeyPair::generate(kxError);
            if (keyPair &&
                !identityKey->sign(keyExchangeTranscript("request", keyId, m_messenger.localId(), peerId,
                                                         keyPair->publicKeyHex(), {}),
                                   signature, kxError)) {
                keyPair.reset();
            }
        }

        if (!keyPair) {
            finishKeyExchange(peerId, exchange, false, kxError);
        } else {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                exchange->keyId = keyId;
                exchange->keyPair = keyPair;
            }
            nlohmann::json data = {
                {"keyId", keyId},
                {"scheme", ENCRYPTION_SCHEME},
                {"publicKey", keyPair->publicKeyHex()},
                {"signature", signature}
            };
            std::string sendError;
            if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(MessageType::KeyExchangeRequest,
                                                                          m_messenger.localId(), peerId, data),
                                                sendError)) {
                finishKeyExchange(peerId, exchange, false, "Send failed: " + sendError);
            }
        }
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!waitForSender(lock, state, [&exchange] { return exchange->done; }, "key exchange", errorMsg)) {
        // A timed-out exchange is forgotten so the next task starts a fresh one
        auto it = m_exchanges.find(peerId);
        if (!exchange->done && it != m_exchanges.end() && it->second == exchange) {
            m_exchanges.erase(it);
        }
        return nullptr;
    }
    if (!exchange->ok) {
        errorMsg = "Key exchange failed: " + exchange->error;
        return nullptr;
    }
    auto cipher = m_ciphers.find(peerId);
    if (cipher == m_ciphers.end()) {
        errorMsg = "Session key was dropped";
        return nullptr;
    }
    keyIdOut = cipher->second.keyId;
    return cipher->second.cipher;
}

//=============================================================================
// Task bookkeeping
//=============================================================================

TransferEngine::TaskPtr TransferEngine::findTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(taskId);
    return it == m_tasks.end() ? nullptr : it->second;
}

TransferEngine::TaskPtr TransferEngine::findPeerTask(const std::string& taskId, const std::string& peerId,
                                                     TransferDirection direction) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end() || it->second->task.peerId != peerId || it->second->task.direction != direction) {
        return nullptr;
    }
    return it->second;
}

TransferStatusChanged TransferEngine::applyStatusLocked(TaskState& state, TransferStatus status,
                                                        const std::string& error)
{
    DataTransferTask& task = state.task;
    task.status = status;
    const int64_t now = wallClockMs();
    if (status == TransferStatus::InProgress && task.startedAtMs == 0) {
        task.startedAtMs = now;
    }
    if (isTerminalStatus(status)) {
        task.finishedAtMs = now;
    }
    if (!error.empty()) {
        task.errorMessage = error;
    }
    return TransferStatusChanged{task.id, task.peerId, status, task.errorMessage};
}

bool TransferEngine::transition(const TaskPtr& state, TransferStatus status, const std::string& error,
                                std::optional<TransferStatus> expectedFrom)
{
    TransferStatusChanged event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const TransferStatus current = state->task.status;
        if (isTerminalStatus(current) || current == status) {
            return false;
        }
        if (state->finalizing && status != TransferStatus::Completed && status != TransferStatus::Failed) {
            return false;
        }
        if (expectedFrom && current != *expectedFrom) {
            return false;
        }
        event = applyStatusLocked(*state, status, error);
    }
    m_bus.publish(event);
    m_cv.notify_all();
    return true;
}

void TransferEngine::publishProgress(const TaskPtr& state, bool force) {
    TransferProgress event;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = std::chrono::steady_clock::now();
        if (!force && now - state->lastProgress < std::chrono::milliseconds(PROGRESS_THROTTLE_MS)) {
            return;
        }
        state->lastProgress = now;
        event = TransferProgress{state->task.id, state->task.transferredBytes, state->task.fileSize};
    }
    m_bus.publish(event);
}

void TransferEngine::sendCancel(const std::string& peerId, const std::string& taskId, const std::string& reason) {
    if (!m_messenger.isConnected(peerId)) {
        return;
    }
    nlohmann::json data = {{"taskId", taskId}};
    if (!reason.empty()) {
        data["reason"] = reason;
    }
    if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(MessageType::DataTransferCancel,
                                                                 m_messenger.localId(), peerId, data))) {
        LOG_WARNING("[Transfer] Failed to send cancel for " << taskId << " to " << peerId);
    }
}

bool TransferEngine::removeTask(const std::string& taskId, bool deleteFileIfIncomplete) {
    TaskPtr state;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_tasks.find(taskId);
        if (it == m_tasks.end()) {
            return false;
        }
        state = it->second;
        m_tasks.erase(it);
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), taskId), m_queue.end());
    }

    if (deleteFileIfIncomplete && state->task.direction == TransferDirection::Receive &&
        state->task.status != TransferStatus::Completed)
    {
        std::lock_guard<std::mutex> io(state->ioMutex);
        state->out.close();
        if (!state->partPath.empty()) {
            std::error_code ec;
            fs::remove(state->partPath, ec);
            if (ec) {
                LOG_WARNING("[Transfer] Failed to delete " << state->partPath << ": " << ec.message());
            }
            state->partPath.clear();
        }
    }

    m_bus.publish(TransferRemoved{taskId});
    return true;
}

size_t TransferEngine::runCleanupPass() {
    const int64_t now = wallClockMs();
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int64_t delayMs = static_cast<int64_t>(m_settings.autoCleanupDelaySeconds) * 1000;
        for (const auto& entry : m_tasks) {
            const DataTransferTask& task = entry.second->task;
            if (!isTerminalStatus(task.status) || task.finishedAtMs == 0) {
                continue;
            }
            bool enabled = false;
            switch (task.status) {
                case TransferStatus::Completed: enabled = m_settings.autoCleanupCompleted; break;
                case TransferStatus::Cancelled: enabled = m_settings.autoCleanupCancelled; break;
                case TransferStatus::Failed:
                case TransferStatus::Rejected:  enabled = m_settings.autoCleanupFailed; break;
                default: break;
            }
            if (enabled && now - task.finishedAtMs >= delayMs) {
                expired.push_back(entry.first);
            }
        }
    }

    size_t removed = 0;
    for (const auto& id : expired) {
        if (removeTask(id, false)) {
            ++removed;
        }
    }
    return removed;
}

void TransferEngine::cleanupThreadFunc() {
    try {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cleanupCv.wait_for(lock, m_timeouts.cleanupInterval, [this] { return m_stopRequested; });
                if (m_stopRequested) {
                    break;
                }
            }
            size_t removed = runCleanupPass();
            if (removed > 0) {
                LOG_DEBUG("[Transfer] Auto-cleanup removed " << removed << " tasks");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Transfer] Cleanup thread failed: " << e.what());
        LogTransfer(std::string("[Transfer] Cleanup thread failed: ") + e.what());
    }
}

//=============================================================================
// Queries
//=============================================================================

std::vector<DataTransferTask> TransferEngine::transfers() const {
    std::vector<DataTransferTask> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        result.reserve(m_tasks.size());
        for (const auto& entry : m_tasks) {
            result.push_back(entry.second->task);
        }
    }
    std::sort(result.begin(), result.end(), [](const DataTransferTask& a, const DataTransferTask& b) {
        return a.createdAtMs != b.createdAtMs ? a.createdAtMs < b.createdAtMs : a.id < b.id;
    });
    return result;
}

std::optional<DataTransferTask> TransferEngine::transfer(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(taskId);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second->task;
}

std::vector<FileTransferRequestInfo> TransferEngine::pendingRequests() const {
    std::vector<FileTransferRequestInfo> result;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_incoming) {
        result.push_back(entry.second.info);
    }
    return result;
}

size_t TransferEngine::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activeCount;
}

size_t TransferEngine::queuedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

}  // namespace P2Lan
