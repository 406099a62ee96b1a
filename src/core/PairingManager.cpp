/**
 * @file PairingManager.cpp
 * @brief Pairing handshake and trust commands
 */

#include "p2lan/PairingManager.h"
#include "p2lan/Debug.h"
#include "p2lan/ErrorCodes.h"
#include "p2lan/EventBus.h"
#include "p2lan/MessageDispatcher.h"
#include "p2lan/PeerMessenger.h"
#include "p2lan/ThreadSafeLog.h"
#include "p2lan/TrustStore.h"
#include "p2lan/UuidGenerator.h"

#include <algorithm>

namespace P2Lan {

namespace {
    #define LogPairing(msg) P2Lan::ThreadSafeLog::log(msg)

    constexpr const char* REASON_REJECTED = "rejected";
    constexpr const char* REASON_BLOCKED = "blocked";
    constexpr const char* REASON_TIMEOUT = "timeout";
    constexpr const char* REASON_DUPLICATE = "duplicate";
    constexpr const char* REASON_ERROR = "error";

    int64_t wallClockMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

PairingManager::PairingManager(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                               TimerQueue& timers, PairingTimeouts timeouts)
    : m_store(store)
    , m_messenger(messenger)
    , m_bus(bus)
    , m_timers(timers)
    , m_timeouts(timeouts)
{
}

PairingManager::~PairingManager() {
    clear();
}

void PairingManager::setIdentity(const LocalIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_identity = identity;
}

void PairingManager::registerHandlers(MessageDispatcher& dispatcher) {
    dispatcher.registerHandler(MessageType::PairingRequest,
                               [this](const WireMessage& m) { handlePairingRequest(m); });
    dispatcher.registerHandler(MessageType::PairingResponse,
                               [this](const WireMessage& m) { handlePairingResponse(m); });
    dispatcher.registerHandler(MessageType::TrustRequest,
                               [this](const WireMessage& m) { handleTrustRequest(m); });
    dispatcher.registerHandler(MessageType::TrustResponse,
                               [this](const WireMessage& m) { handleTrustResponse(m); });
}

//=============================================================================
// Commands
//=============================================================================

CommandResult PairingManager::sendPairingRequest(const std::string& peerId, bool trustUser,
                                                 bool saveConnection)
{
    auto peer = m_store.get(peerId);
    if (!peer) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + peerId);
    }
    if (peer->isBlocked) {
        return CommandResult::fail(ErrorCodes::PEER_BLOCKED, "Peer is blocked: " + peer->displayName);
    }
    if (peer->isPaired) {
        return CommandResult::fail(ErrorCodes::PAIRING_ALREADY_PAIRED,
                                   "Already paired with " + peer->displayName);
    }

    const std::string requestId = UuidGenerator::generateWithPrefix("pair_");
    if (requestId.empty()) {
        return CommandResult::fail(ErrorCodes::INTERNAL_ERROR, "Failed to generate request id");
    }

    LocalIdentity identity;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_outgoing.count(peerId) != 0) {
            return CommandResult::fail(ErrorCodes::PAIRING_ALREADY_PENDING,
                                       "A pairing request to this peer is already pending");
        }
        bool inboundPending = std::any_of(m_incoming.begin(), m_incoming.end(),
            [&peerId](const auto& entry) { return entry.second.info.peerId == peerId; });
        if (inboundPending) {
            return CommandResult::fail(ErrorCodes::PAIRING_ALREADY_PENDING,
                                       "This peer has a pairing request awaiting your decision");
        }

        Outgoing out;
        out.requestId = requestId;
        out.peerId = peerId;
        out.trustUser = trustUser;
        out.saveConnection = saveConnection;
        m_outgoing[peerId] = out;
        identity = m_identity;
    }

    nlohmann::json data = {
        {"requestId", requestId},
        {"displayName", identity.displayName},
        {"profileId", identity.profileId},
        {"platform", platformToString(identity.platform)},
        {"trustUser", trustUser},
        {"saveConnection", saveConnection},
        {"requestTime", wallClockMs()}
    };

    std::string sendError;
    if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(MessageType::PairingRequest,
                                                                  m_messenger.localId(), peerId, data),
                                        sendError))
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_outgoing.erase(peerId);
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Failed to send pairing request: " + sendError);
    }

    auto timer = m_timers.scheduleAfter(m_timeouts.outgoingTimeout,
        [this, peerId, requestId]() { expireOutgoing(peerId, requestId); }, "pairing-outgoing");

    bool stillPending = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(peerId);
        if (it != m_outgoing.end() && it->second.requestId == requestId) {
            it->second.timer = timer;
            stillPending = true;
        }
    }
    if (!stillPending) {
        // Response already arrived
        m_timers.cancel(timer);
    } else if (!m_store.setConnectionStatus(peerId, ConnectionStatus::Pairing)) {
        LOG_DEBUG("[Pairing] " << peerId << " not moved to Pairing state");
    }

    LogPairing("[Pairing] Request " + requestId + " sent to " + peerId);
    return CommandResult::ok(requestId);
}

CommandResult PairingManager::respondToPairingRequest(const std::string& requestId, bool accept,
                                                      bool trustUser, bool saveConnection)
{
    Incoming entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it == m_incoming.end()) {
            return CommandResult::fail(ErrorCodes::PAIRING_NO_SUCH_REQUEST,
                                       "No pending pairing request with id " + requestId);
        }
        entry = it->second;
        m_incoming.erase(it);
    }
    m_timers.cancel(entry.timer);

    const std::string& peerId = entry.info.peerId;

    if (!accept) {
        bool sent = sendResponse(peerId, requestId, false, false, false, REASON_REJECTED);
        leavePairingState(peerId);
        m_bus.publish(PairingRejected{requestId, peerId, REASON_REJECTED, false});
        LogPairing("[Pairing] Request " + requestId + " rejected by operator");
        if (!sent) {
            return CommandResult::ok("Request rejected; the peer could not be notified");
        }
        return CommandResult::ok();
    }

    std::string storeError;
    if (!m_store.applyPairing(peerId, trustUser, saveConnection, storeError)) {
        LOG_ERROR("[Pairing] Failed to store pairing with " << peerId << ": " << storeError);
        sendResponse(peerId, requestId, false, false, false, REASON_ERROR);
        leavePairingState(peerId);
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED,
                                   "Failed to save pairing: " + storeError);
    }

    m_bus.publish(PairingCompleted{peerId, trustUser, saveConnection});
    LogPairing("[Pairing] Request " + requestId + " accepted, paired with " + peerId);

    if (!sendResponse(peerId, requestId, true, trustUser, saveConnection, "")) {
        return CommandResult::fail(ErrorCodes::SEND_FAILED,
                                   "Paired locally but the acceptance could not be delivered");
    }
    return CommandResult::ok();
}

size_t PairingManager::rejectPendingFrom(const std::string& peerId, const std::string& reason) {
    std::vector<Incoming> taken;
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
        if (!sendResponse(peerId, entry.info.id, false, false, false, reason)) {
            LOG_WARNING("[Pairing] Could not notify " << peerId << " of rejection " << entry.info.id);
        }
        m_bus.publish(PairingRejected{entry.info.id, peerId, reason, false});
    }
    if (!taken.empty()) {
        leavePairingState(peerId);
    }
    return taken.size();
}

CommandResult PairingManager::unpair(const std::string& peerId) {
    auto peer = m_store.get(peerId);
    if (!peer) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + peerId);
    }
    if (!peer->isPaired) {
        return CommandResult::fail(ErrorCodes::PEER_NOT_PAIRED, "Peer is not paired: " + peer->displayName);
    }

    std::string storeError;
    if (!m_store.unpair(peerId, storeError)) {
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED, "Failed to unpair: " + storeError);
    }

    LogPairing("[Pairing] Unpaired " + peerId);

    if (m_messenger.isConnected(peerId)) {
        nlohmann::json data = {{"paired", false}};
        if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(MessageType::TrustResponse,
                                                                     m_messenger.localId(), peerId, data))) {
            LOG_WARNING("[Pairing] Could not notify " << peerId << " of unpair");
        }
    }
    return CommandResult::ok();
}

CommandResult PairingManager::addTrust(const std::string& peerId) {
    auto peer = m_store.get(peerId);
    if (!peer) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + peerId);
    }
    if (!peer->isPaired) {
        return CommandResult::fail(ErrorCodes::PEER_NOT_PAIRED,
                                   "Only paired peers can be trusted: " + peer->displayName);
    }
    std::string storeError;
    if (!m_store.setTrusted(peerId, true, storeError)) {
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED, "Failed to add trust: " + storeError);
    }
    return CommandResult::ok();
}

CommandResult PairingManager::removeTrust(const std::string& peerId) {
    if (!m_store.has(peerId)) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + peerId);
    }
    std::string storeError;
    if (!m_store.setTrusted(peerId, false, storeError)) {
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED, "Failed to remove trust: " + storeError);
    }
    return CommandResult::ok();
}

void PairingManager::onPeerDisconnected(const std::string& peerId) {
    Outgoing out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(peerId);
        if (it == m_outgoing.end()) {
            return;
        }
        out = it->second;
        m_outgoing.erase(it);
    }
    m_timers.cancel(out.timer);
    m_bus.publish(PairingRejected{out.requestId, peerId, "Peer disconnected", false});
    LogPairing("[Pairing] Outgoing request " + out.requestId + " dropped: peer disconnected");
}

void PairingManager::clear() {
    std::vector<TimerQueue::TimerId> timers;
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
    }
    for (auto id : timers) {
        if (id != 0) {
            m_timers.cancel(id);
        }
    }
}

//=============================================================================
// Queries
//=============================================================================

std::vector<PairingRequestInfo> PairingManager::pendingRequests() const {
    const int64_t now = wallClockMs();
    std::vector<PairingRequestInfo> result;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_incoming) {
        if (isSurfaceable(entry.second.info, now)) {
            result.push_back(entry.second.info);
        }
    }
    std::sort(result.begin(), result.end(), [](const PairingRequestInfo& a, const PairingRequestInfo& b) {
        return a.receivedAtMs < b.receivedAtMs;
    });
    return result;
}

bool PairingManager::hasPendingRequest(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_incoming.count(requestId) != 0;
}

bool PairingManager::hasOutgoingRequest(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outgoing.count(peerId) != 0;
}

//=============================================================================
// Inbound messages
//=============================================================================

void PairingManager::handlePairingRequest(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const auto& data = message.data;

    PairingRequestInfo info;
    info.id = data.value("requestId", "");
    if (info.id.empty()) {
        LOG_WARNING("[Pairing] Dropping pairing_request without requestId from " << peerId);
        return;
    }
    info.peerId = peerId;
    info.peerName = data.value("displayName", "");
    info.profileId = data.value("profileId", "");
    info.platform = platformFromString(data.value("platform", ""));
    info.wantsTrust = data.value("trustUser", false);
    info.wantsSave = data.value("saveConnection", false);
    info.receivedAtMs = wallClockMs();
    info.requestTimeMs = data.value("requestTime", info.receivedAtMs);

    // First contact may be the pairing request itself
    PeerSighting sighting;
    sighting.id = peerId;
    sighting.displayName = info.peerName;
    sighting.profileId = info.profileId;
    sighting.platform = info.platform;
    m_store.recordSighting(sighting, info.receivedAtMs);

    if (m_store.isBlocked(peerId)) {
        LogPairing("[Pairing] Auto-rejected request " + info.id + " from blocked peer " + peerId);
        sendResponse(peerId, info.id, false, false, false, REASON_BLOCKED);
        return;
    }

    if (m_store.canAutoAccept(peerId)) {
        auto peer = m_store.get(peerId);
        bool saved = peer && peer->isStored;
        std::string storeError;
        if (!m_store.applyPairing(peerId, true, saved, storeError)) {
            LOG_ERROR("[Pairing] Auto-accept failed for " << peerId << ": " << storeError);
            sendResponse(peerId, info.id, false, false, false, REASON_ERROR);
            return;
        }
        LogPairing("[Pairing] Auto-accepted request " + info.id + " from trusted peer " + peerId);
        sendResponse(peerId, info.id, true, true, saved, "");
        m_bus.publish(PairingCompleted{peerId, true, saved});
        return;
    }

    // Both sides asked at once: their request answers ours
    Outgoing crossed;
    bool isCrossed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(peerId);
        if (it != m_outgoing.end()) {
            crossed = it->second;
            m_outgoing.erase(it);
            isCrossed = true;
        }
    }
    if (isCrossed) {
        m_timers.cancel(crossed.timer);
        const bool trusted = crossed.trustUser || info.wantsTrust;
        std::string storeError;
        if (!m_store.applyPairing(peerId, trusted, crossed.saveConnection, storeError)) {
            LOG_ERROR("[Pairing] Crossed request from " << peerId << " could not be stored: " << storeError);
            sendResponse(peerId, info.id, false, false, false, REASON_ERROR);
            leavePairingState(peerId);
            m_bus.publish(PairingRejected{crossed.requestId, peerId, REASON_ERROR, true});
            return;
        }
        LogPairing("[Pairing] Request " + info.id + " crossed our request " + crossed.requestId +
                   "; paired with " + peerId);
        sendResponse(peerId, info.id, true, trusted, crossed.saveConnection, "");
        m_bus.publish(PairingCompleted{peerId, trusted, crossed.saveConnection});
        return;
    }

    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        duplicate = std::any_of(m_incoming.begin(), m_incoming.end(),
            [&peerId](const auto& entry) { return entry.second.info.peerId == peerId; });
        if (!duplicate) {
            Incoming entry;
            entry.info = info;
            m_incoming[info.id] = entry;
        }
    }
    if (duplicate) {
        LOG_INFO("[Pairing] Rejecting duplicate request " << info.id << " from " << peerId);
        sendResponse(peerId, info.id, false, false, false, REASON_DUPLICATE);
        return;
    }

    const std::string requestId = info.id;
    auto timer = m_timers.scheduleAfter(m_timeouts.pendingExpiry,
        [this, requestId]() { expireIncoming(requestId); }, "pairing-expiry");
    if (timer == 0) {
        LOG_WARNING("[Pairing] Timer queue not running; request " << requestId << " will not expire");
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it != m_incoming.end()) {
            it->second.timer = timer;
        }
    }

    if (!m_store.setConnectionStatus(peerId, ConnectionStatus::Pairing)) {
        LOG_DEBUG("[Pairing] " << peerId << " not moved to Pairing state");
    }
    LogPairing("[Pairing] Request " + requestId + " from " + peerId + " queued for decision");

    if (isSurfaceable(info, info.receivedAtMs)) {
        m_bus.publish(PairingRequestReceived{requestId, peerId, info.peerName,
                                             info.wantsTrust, info.wantsSave});
    } else {
        LOG_INFO("[Pairing] Request " << requestId << " is older than the expiry and is not surfaced");
    }
}

void PairingManager::handlePairingResponse(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const auto& data = message.data;
    const std::string requestId = data.value("requestId", "");

    Outgoing out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(peerId);
        if (it == m_outgoing.end() || it->second.requestId != requestId) {
            LOG_WARNING("[Pairing] Ignoring response to unknown request " << requestId << " from " << peerId);
            return;
        }
        out = it->second;
        m_outgoing.erase(it);
    }
    m_timers.cancel(out.timer);

    const bool accepted = data.value("accepted", false);
    if (!accepted) {
        const std::string reason = data.value("reason", REASON_REJECTED);
        leavePairingState(peerId);
        m_bus.publish(PairingRejected{requestId, peerId, reason, true});
        LogPairing("[Pairing] Request " + requestId + " rejected by " + peerId + ": " + reason);
        return;
    }

    const bool trusted = out.trustUser || data.value("trustUser", false);
    std::string storeError;
    if (!m_store.applyPairing(peerId, trusted, out.saveConnection, storeError)) {
        LOG_ERROR("[Pairing] Peer accepted but storing the pairing failed: " << storeError);
        m_bus.publish(ServiceError{"Pairing", ErrorCodes::PERSISTENCE_FAILED, storeError});
        leavePairingState(peerId);
        return;
    }
    m_bus.publish(PairingCompleted{peerId, trusted, out.saveConnection});
    LogPairing("[Pairing] Request " + requestId + " accepted by " + peerId);
}

void PairingManager::handleTrustRequest(const WireMessage& message) {
    LOG_INFO("[Pairing] Peer " << message.fromUserId << " changed its trust in us to "
             << (message.data.value("trusted", false) ? "trusted" : "untrusted"));
}

void PairingManager::handleTrustResponse(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    if (message.data.value("paired", true)) {
        return;
    }
    auto peer = m_store.get(peerId);
    if (!peer || !peer->isPaired) {
        return;
    }
    std::string storeError;
    if (!m_store.unpair(peerId, storeError)) {
        LOG_ERROR("[Pairing] Failed to apply remote unpair from " << peerId << ": " << storeError);
        return;
    }
    LogPairing("[Pairing] Peer " + peerId + " unpaired us");
}

//=============================================================================
// Expiry
//=============================================================================

void PairingManager::expireIncoming(const std::string& requestId) {
    Incoming entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it == m_incoming.end()) {
            return;
        }
        entry = it->second;
        m_incoming.erase(it);
    }

    const std::string& peerId = entry.info.peerId;
    sendResponse(peerId, requestId, false, false, false, REASON_TIMEOUT);
    leavePairingState(peerId);
    m_bus.publish(PairingRequestExpired{requestId, peerId, false});
    LogPairing("[Pairing] Request " + requestId + " from " + peerId + " expired");
}

void PairingManager::expireOutgoing(const std::string& peerId, const std::string& requestId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_outgoing.find(peerId);
        if (it == m_outgoing.end() || it->second.requestId != requestId) {
            return;
        }
        m_outgoing.erase(it);
    }
    leavePairingState(peerId);
    m_bus.publish(PairingRequestExpired{requestId, peerId, true});
    LogPairing("[Pairing] No response to request " + requestId + " from " + peerId);
}

//=============================================================================
// Helpers
//=============================================================================

bool PairingManager::sendResponse(const std::string& peerId, const std::string& requestId, bool accepted,
                                  bool trustUser, bool saveConnection, const std::string& reason)
{
    nlohmann::json data = {
        {"requestId", requestId},
        {"accepted", accepted},
        {"trustUser", trustUser},
        {"saveConnection", saveConnection}
    };
    if (!reason.empty()) {
        data["reason"] = reason;
    }
    if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(MessageType::PairingResponse,
                                                                 m_messenger.localId(), peerId, data))) {
        LOG_WARNING("[Pairing] Failed to send response for " << requestId << " to " << peerId);
        return false;
    }
    return true;
}

void PairingManager::leavePairingState(const std::string& peerId) {
    auto peer = m_store.get(peerId);
    if (peer && peer->connectionStatus == ConnectionStatus::Pairing &&
        !m_store.setConnectionStatus(peerId, ConnectionStatus::Connected)) {
        LOG_DEBUG("[Pairing] " << peerId << " left in Pairing state");
    }
}

bool PairingManager::isSurfaceable(const PairingRequestInfo& info, int64_t nowMs) const {
    return nowMs - info.requestTimeMs < static_cast<int64_t>(m_timeouts.pendingExpiry.count());
}

}  // namespace P2Lan
