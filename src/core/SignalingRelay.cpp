/**
 * @file SignalingRelay.cpp
 * @brief Shared handshake and session bookkeeping of the signaling relays
 */

#include "p2lan/SignalingRelay.h"
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
    #define LogRelay(msg) P2Lan::ThreadSafeLog::log(msg)

    constexpr const char* REASON_UNKNOWN_USER = "Unknown user";
    constexpr const char* REASON_NOT_PAIRED = "User not paired";
    constexpr const char* REASON_BLOCKED = "User blocked";
    constexpr const char* REASON_ACTIVE = "Session already active";
    constexpr const char* REASON_DUPLICATE = "Request already pending";
    constexpr const char* REASON_REJECTED = "Rejected by user";
    constexpr const char* REASON_TIMEOUT = "Request timed out";
    constexpr const char* REASON_NO_RESPONSE = "No response";
    constexpr const char* REASON_PEER_GONE = "Peer disconnected";

    int64_t wallClockMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string prefixed(const char* component, const std::string& text) {
        return std::string("[") + component + "] " + text;
    }
}

SignalingRelay::SignalingRelay(const Protocol& protocol, TrustStore& store, PeerMessenger& messenger,
                               EventBus& bus, TimerQueue& timers, RelayTimeouts timeouts)
    : m_protocol(protocol)
    , m_store(store)
    , m_messenger(messenger)
    , m_bus(bus)
    , m_timers(timers)
    , m_timeouts(timeouts)
{
}

SignalingRelay::~SignalingRelay() {
    std::vector<TimerQueue::TimerId> timers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_incoming) {
            timers.push_back(entry.second.timer);
        }
        if (m_outgoing) {
            timers.push_back(m_outgoing->timer);
        }
        m_incoming.clear();
        m_outgoing.reset();
    }
    for (auto id : timers) {
        if (id != 0) {
            m_timers.cancel(id);
        }
    }
}

void SignalingRelay::setIdentity(const LocalIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_identity = identity;
}

void SignalingRelay::setAutoAcceptTrusted(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_autoAcceptTrusted = enabled;
}

void SignalingRelay::registerHandlers(MessageDispatcher& dispatcher) {
    dispatcher.registerHandler(m_protocol.request,
                               [this](const WireMessage& m) { handleRequest(m); });
    dispatcher.registerHandler(m_protocol.response,
                               [this](const WireMessage& m) { handleResponse(m); });
    dispatcher.registerHandler(m_protocol.data,
                               [this](const WireMessage& m) { handleData(m); });
    dispatcher.registerHandler(m_protocol.disconnect,
                               [this](const WireMessage& m) { handleDisconnect(m); });
}

//=============================================================================
// Outgoing handshake
//=============================================================================

CommandResult SignalingRelay::sendRequest(const std::string& peerId, const nlohmann::json& params) {
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

    const std::string requestId = UuidGenerator::generateWithPrefix(m_protocol.idPrefix);
    if (requestId.empty()) {
        return CommandResult::fail(ErrorCodes::INTERNAL_ERROR, "Failed to generate request id");
    }

    LocalIdentity identity;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active) {
            return CommandResult::fail(ErrorCodes::SESSION_ALREADY_ACTIVE,
                                       "A session is already active with " + m_active->peerId);
        }
        if (m_outgoing) {
            return CommandResult::fail(ErrorCodes::SESSION_REQUEST_PENDING,
                                       "A request to " + m_outgoing->peerId + " is still pending");
        }
        Outgoing out;
        out.requestId = requestId;
        out.peerId = peerId;
        out.params = params;
        m_outgoing = out;
        identity = m_identity;
    }

    nlohmann::json data = params;
    data["requestId"] = requestId;
    data["senderName"] = identity.displayName;
    data["requestTime"] = wallClockMs();

    std::string sendError;
    if (!m_messenger.sendMessageAndWait(peerId, WireMessage::make(m_protocol.request,
                                                                  m_messenger.localId(), peerId, data),
                                        sendError))
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_outgoing && m_outgoing->requestId == requestId) {
            m_outgoing.reset();
        }
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Failed to send request: " + sendError);
    }

    auto timer = m_timers.scheduleAfter(m_timeouts.outgoingTimeout,
        [this, requestId]() { expireOutgoing(requestId); }, std::string(m_protocol.component) + "-outgoing");

    bool stillPending = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_outgoing && m_outgoing->requestId == requestId) {
            m_outgoing->timer = timer;
            stillPending = true;
        }
    }
    if (!stillPending) {
        // Response already arrived
        m_timers.cancel(timer);
    }

    LogRelay(prefixed(m_protocol.component, "Request " + requestId + " sent to " + peerId));
    return CommandResult::ok(requestId);
}

CommandResult SignalingRelay::respondToRequest(const std::string& requestId, bool accept,
                                               const nlohmann::json& params)
{
    Incoming entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it == m_incoming.end()) {
            return CommandResult::fail(ErrorCodes::SESSION_NO_SUCH_REQUEST,
                                       "No pending request with id " + requestId);
        }
        entry = it->second;
        m_incoming.erase(it);
    }
    m_timers.cancel(entry.timer);

    const std::string& peerId = entry.info.peerId;

    if (!accept) {
        bool sent = sendResponse(peerId, requestId, false, REASON_REJECTED, params);
        LogRelay(prefixed(m_protocol.component, "Request " + requestId + " rejected by operator"));
        if (!sent) {
            return CommandResult::ok("Request rejected; the peer could not be notified");
        }
        return CommandResult::ok();
    }

    RelaySession session;
    session.sessionId = requestId;
    session.peerId = peerId;
    session.isRequester = false;
    session.startedAtMs = wallClockMs();
    session.params = entry.info.params;
    for (const auto& item : params.items()) {
        session.params[item.key()] = item.value();
    }

    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        busy = m_active.has_value();
        if (!busy) {
            m_active = session;
        }
    }
    if (busy) {
        if (!sendResponse(peerId, requestId, false, REASON_ACTIVE, params)) {
            LOG_WARNING("[" << m_protocol.component << "] Could not notify " << peerId << " of rejection");
        }
        return CommandResult::fail(ErrorCodes::SESSION_ALREADY_ACTIVE,
                                   "Another session became active; request rejected");
    }

    if (!sendResponse(peerId, requestId, true, "", session.params)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_active && m_active->sessionId == requestId) {
            m_active.reset();
        }
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Failed to deliver the acceptance to " + peerId);
    }

    startSession(session);
    return CommandResult::ok(requestId);
}

//=============================================================================
// Session
//=============================================================================

CommandResult SignalingRelay::sendSessionData(const nlohmann::json& payload,
                                              std::optional<bool> requireRequester)
{
    RelaySession session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) {
            return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "No active session");
        }
        session = *m_active;
    }
    if (requireRequester && *requireRequester != session.isRequester) {
        return CommandResult::fail(ErrorCodes::SESSION_WRONG_ROLE,
                                   "This device does not hold the required role in the session");
    }

    nlohmann::json data = payload;
    data["sessionId"] = session.sessionId;
    if (!m_messenger.sendMessageToUser(session.peerId, WireMessage::make(m_protocol.data,
                                                                         m_messenger.localId(),
                                                                         session.peerId, data))) {
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Failed to relay to " + session.peerId);
    }
    return CommandResult::ok();
}

CommandResult SignalingRelay::disconnect(const std::string& reason) {
    if (!endSession(reason, true)) {
        return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "No active session");
    }
    return CommandResult::ok();
}

bool SignalingRelay::endSession(const std::string& reason, bool notifyPeer) {
    RelaySession session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active) {
            return false;
        }
        session = *m_active;
        m_active.reset();
    }

    if (notifyPeer && m_messenger.isConnected(session.peerId)) {
        nlohmann::json data = {{"sessionId", session.sessionId}};
        if (!m_messenger.sendMessageToUser(session.peerId, WireMessage::make(m_protocol.disconnect,
                                                                             m_messenger.localId(),
                                                                             session.peerId, data))) {
            LOG_WARNING("[" << m_protocol.component << "] Could not notify " << session.peerId
                        << " that session " << session.sessionId << " ended");
        }
    }

    LogRelay(prefixed(m_protocol.component, "Session " + session.sessionId + " ended: " + reason));
    publishSessionEnded(session, reason);
    return true;
}

bool SignalingRelay::updateSessionParams(const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) {
        return false;
    }
    for (const auto& item : params.items()) {
        m_active->params[item.key()] = item.value();
    }
    return true;
}

void SignalingRelay::startSession(const RelaySession& session) {
    LogRelay(prefixed(m_protocol.component, "Session " + session.sessionId + " started with "
                      + session.peerId + (session.isRequester ? " (requester)" : " (responder)")));
    publishSessionStarted(session);
}

size_t SignalingRelay::rejectPendingFrom(const std::string& peerId, const std::string& reason) {
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
        if (!sendResponse(peerId, entry.info.requestId, false, reason, nlohmann::json::object())) {
            LOG_WARNING("[" << m_protocol.component << "] Could not notify " << peerId
                        << " of rejection " << entry.info.requestId);
        }
    }
    return taken.size();
}

void SignalingRelay::onPeerDisconnected(const std::string& peerId) {
    std::vector<Incoming> dropped;
    std::optional<Outgoing> out;
    bool sessionBound = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_incoming.begin(); it != m_incoming.end();) {
            if (it->second.info.peerId == peerId) {
                dropped.push_back(it->second);
                it = m_incoming.erase(it);
            } else {
                ++it;
            }
        }
        if (m_outgoing && m_outgoing->peerId == peerId) {
            out = m_outgoing;
            m_outgoing.reset();
        }
        sessionBound = m_active && m_active->peerId == peerId;
    }

    for (const auto& entry : dropped) {
        m_timers.cancel(entry.timer);
    }
    if (out) {
        m_timers.cancel(out->timer);
        publishRequestRejected(out->requestId, peerId, REASON_PEER_GONE);
    }
    if (sessionBound) {
        endSession(REASON_PEER_GONE, true);
    }
}

void SignalingRelay::clear() {
    endSession("Networking stopped", true);

    std::vector<TimerQueue::TimerId> timers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_incoming) {
            timers.push_back(entry.second.timer);
        }
        if (m_outgoing) {
            timers.push_back(m_outgoing->timer);
        }
        m_incoming.clear();
        m_outgoing.reset();
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

std::optional<RelaySession> SignalingRelay::activeSession() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

std::vector<RelayRequestInfo> SignalingRelay::pendingRequests() const {
    const int64_t now = wallClockMs();
    std::vector<RelayRequestInfo> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_incoming) {
            if (isSurfaceable(entry.second.info, now)) {
                result.push_back(entry.second.info);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const RelayRequestInfo& a, const RelayRequestInfo& b) {
        return a.receivedAtMs < b.receivedAtMs;
    });
    return result;
}

bool SignalingRelay::hasOutgoingRequest() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outgoing.has_value();
}

//=============================================================================
// Inbound messages
//=============================================================================

void SignalingRelay::handleRequest(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const auto& data = message.data;

    RelayRequestInfo info;
    info.requestId = data.value("requestId", "");
    if (info.requestId.empty()) {
        LOG_WARNING("[" << m_protocol.component << "] Dropping request without requestId from " << peerId);
        return;
    }
    info.peerId = peerId;
    info.peerName = data.value("senderName", "");
    info.receivedAtMs = wallClockMs();
    info.requestTimeMs = data.value("requestTime", info.receivedAtMs);
    info.params = data;
    info.params.erase("requestId");
    info.params.erase("senderName");
    info.params.erase("requestTime");

    auto peer = m_store.get(peerId);
    const char* rejection = nullptr;
    if (!peer) {
        rejection = REASON_UNKNOWN_USER;
    } else if (peer->isBlocked) {
        rejection = REASON_BLOCKED;
    } else if (!peer->isPaired) {
        rejection = REASON_NOT_PAIRED;
    }
    if (info.peerName.empty() && peer) {
        info.peerName = peer->displayName;
    }

    bool autoAccept = false;
    RelaySession session;
    if (!rejection) {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool duplicate = std::any_of(m_incoming.begin(), m_incoming.end(),
            [&peerId](const auto& entry) { return entry.second.info.peerId == peerId; });
        if (m_active) {
            rejection = REASON_ACTIVE;
        } else if (duplicate) {
            rejection = REASON_DUPLICATE;
        } else if (m_autoAcceptTrusted && m_store.canAutoAccept(peerId)) {
            session.sessionId = info.requestId;
            session.peerId = peerId;
            session.isRequester = false;
            session.startedAtMs = info.receivedAtMs;
            session.params = info.params;
            m_active = session;
            autoAccept = true;
        } else {
            Incoming entry;
            entry.info = info;
            m_incoming[info.requestId] = entry;
        }
    }

    if (rejection) {
        LogRelay(prefixed(m_protocol.component, "Auto-rejected request " + info.requestId + " from "
                          + peerId + ": " + rejection));
        if (!sendResponse(peerId, info.requestId, false, rejection, nlohmann::json::object())) {
            LOG_WARNING("[" << m_protocol.component << "] Could not notify " << peerId << " of rejection");
        }
        return;
    }

    if (autoAccept) {
        LogRelay(prefixed(m_protocol.component, "Auto-accepted request " + info.requestId
                          + " from trusted peer " + peerId));
        if (!sendResponse(peerId, info.requestId, true, "", session.params)) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_active && m_active->sessionId == session.sessionId) {
                m_active.reset();
            }
            return;
        }
        startSession(session);
        return;
    }

    const std::string requestId = info.requestId;
    auto timer = m_timers.scheduleAfter(m_timeouts.pendingExpiry,
        [this, requestId]() { expireIncoming(requestId); }, std::string(m_protocol.component) + "-expiry");
    if (timer == 0) {
        LOG_WARNING("[" << m_protocol.component << "] Timer queue not running; request "
                    << requestId << " will not expire");
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_incoming.find(requestId);
        if (it != m_incoming.end()) {
            it->second.timer = timer;
        }
    }

    LogRelay(prefixed(m_protocol.component, "Request " + requestId + " from " + peerId + " queued for decision"));
    if (isSurfaceable(info, info.receivedAtMs)) {
        publishRequestReceived(info);
    } else {
        LOG_INFO("[" << m_protocol.component << "] Request " << requestId
                 << " is older than the expiry and is not surfaced");
    }
}

void SignalingRelay::handleResponse(const WireMessage& message) {
    const std::string& peerId = message.fromUserId;
    const auto& data = message.data;
    const std::string requestId = data.value("requestId", "");

    Outgoing out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_outgoing || m_outgoing->requestId != requestId || m_outgoing->peerId != peerId) {
            LOG_WARNING("[" << m_protocol.component << "] Ignoring response to unknown request "
                        << requestId << " from " << peerId);
            return;
        }
        out = *m_outgoing;
        m_outgoing.reset();
    }
    m_timers.cancel(out.timer);

    if (!data.value("accepted", false)) {
        const std::string reason = data.value("reason", REASON_REJECTED);
        LogRelay(prefixed(m_protocol.component, "Request " + requestId + " rejected by " + peerId + ": " + reason));
        publishRequestRejected(requestId, peerId, reason);
        return;
    }

    RelaySession session;
    session.sessionId = requestId;
    session.peerId = peerId;
    session.isRequester = true;
    session.startedAtMs = wallClockMs();
    session.params = out.params;
    for (const auto& item : data.items()) {
        if (item.key() != "requestId" && item.key() != "accepted" && item.key() != "reason") {
            session.params[item.key()] = item.value();
        }
    }

    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        busy = m_active.has_value();
        if (!busy) {
            m_active = session;
        }
    }
    if (busy) {
        // Another session won the race; release the peer immediately
        nlohmann::json bye = {{"sessionId", requestId}};
        if (!m_messenger.sendMessageToUser(peerId, WireMessage::make(m_protocol.disconnect,
                                                                     m_messenger.localId(), peerId, bye))) {
            LOG_WARNING("[" << m_protocol.component << "] Could not release " << peerId);
        }
        publishRequestRejected(requestId, peerId, REASON_ACTIVE);
        return;
    }
    startSession(session);
}

void SignalingRelay::handleData(const WireMessage& message) {
    const std::string sessionId = message.data.value("sessionId", "");
    RelaySession session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || m_active->sessionId != sessionId || m_active->peerId != message.fromUserId) {
            LOG_WARNING("[" << m_protocol.component << "] Dropping data for unknown session "
                        << sessionId << " from " << message.fromUserId);
            return;
        }
        session = *m_active;
    }
    onSessionData(session, message);
}

void SignalingRelay::handleDisconnect(const WireMessage& message) {
    const std::string sessionId = message.data.value("sessionId", "");
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_active || m_active->sessionId != sessionId || m_active->peerId != message.fromUserId) {
            return;
        }
    }
    endSession("Disconnected by peer", false);
}

//=============================================================================
// Helpers
//=============================================================================

bool SignalingRelay::isSurfaceable(const RelayRequestInfo& info, int64_t nowMs) const {
    return nowMs - info.requestTimeMs < static_cast<int64_t>(m_timeouts.pendingExpiry.count());
}

bool SignalingRelay::sendResponse(const std::string& peerId, const std::string& requestId, bool accepted,
                                  const std::string& reason, const nlohmann::json& params)
{
    nlohmann::json data = params.is_object() ? params : nlohmann::json::object();
    data["requestId"] = requestId;
    data["accepted"] = accepted;
    if (!accepted) {
        data["reason"] = reason;
    }
    return m_messenger.sendMessageToUser(peerId, WireMessage::make(m_protocol.response,
                                                                   m_messenger.localId(), peerId, data));
}

void SignalingRelay::expireIncoming(const std::string& requestId) {
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
    if (!sendResponse(entry.info.peerId, requestId, false, REASON_TIMEOUT, nlohmann::json::object())) {
        LOG_WARNING("[" << m_protocol.component << "] Could not notify " << entry.info.peerId << " of expiry");
    }
    LogRelay(prefixed(m_protocol.component, "Request " + requestId + " expired"));
    publishRequestRejected(requestId, entry.info.peerId, REASON_TIMEOUT);
}

void SignalingRelay::expireOutgoing(const std::string& requestId) {
    Outgoing out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_outgoing || m_outgoing->requestId != requestId) {
            return;
        }
        out = *m_outgoing;
        m_outgoing.reset();
    }
    LogRelay(prefixed(m_protocol.component, "Request " + requestId + " to " + out.peerId + " got no response"));
    publishRequestRejected(requestId, out.peerId, REASON_NO_RESPONSE);
}

}  // namespace P2Lan
