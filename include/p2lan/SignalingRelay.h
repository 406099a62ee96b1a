/**
 * @file SignalingRelay.h
 * @brief Request/response handshake and single-session relay shared by
 *        remote control and screen sharing
 */

#pragma once

#include "CommandResult.h"
#include "PeerInfo.h"
#include "TimerQueue.h"
#include "WireMessage.h"
#include "config.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace P2Lan {

class EventBus;
class MessageDispatcher;
class PeerMessenger;
class TrustStore;

/**
 * @brief Inbound session request waiting for a decision
 */
struct RelayRequestInfo {
    std::string requestId;
    std::string peerId;
    std::string peerName;
    nlohmann::json params = nlohmann::json::object();  ///< Sub-protocol specific fields
    int64_t requestTimeMs = 0;
    int64_t receivedAtMs = 0;
};

/**
 * @brief The one active session of a relay
 *
 * The session id is the id of the request that created it.
 */
struct RelaySession {
    std::string sessionId;
    std::string peerId;
    bool isRequester = false;     ///< Controller (remote control) or sharer (screen sharing)
    int64_t startedAtMs = 0;
    nlohmann::json params = nlohmann::json::object();
};

struct RelayTimeouts {
    std::chrono::milliseconds pendingExpiry{PENDING_REQUEST_EXPIRY_MS};
    std::chrono::milliseconds outgoingTimeout{OUTGOING_REQUEST_TIMEOUT_MS};
};

/**
 * @class SignalingRelay
 * @brief request -> decision -> response -> session -> opaque relay -> disconnect
 *
 * Inbound requests are rejected when the sender is unknown, unpaired or
 * blocked, or when a session (or a decision) is already in progress. A
 * paired, trusted, unblocked sender is accepted without a prompt when
 * auto-accept is enabled for the capability; anything else waits for the
 * operator for at most the pending expiry.
 *
 * Subclasses own the payload of the data message and the events published
 * for their capability.
 */
class SignalingRelay {
public:
    /**
     * @brief Message types and naming of one sub-protocol
     */
    struct Protocol {
        MessageType request;
        MessageType response;
        MessageType data;
        MessageType disconnect;
        const char* component;    ///< Log prefix, e.g. "RemoteControl"
        const char* idPrefix;     ///< Request id prefix, e.g. "rc_"
    };

    SignalingRelay(const Protocol& protocol, TrustStore& store, PeerMessenger& messenger,
                   EventBus& bus, TimerQueue& timers, RelayTimeouts timeouts);
    virtual ~SignalingRelay();

    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    void setIdentity(const LocalIdentity& identity);
    void setAutoAcceptTrusted(bool enabled);

    void registerHandlers(MessageDispatcher& dispatcher);

    /**
     * @brief End the active session and notify the counterpart
     */
    CommandResult disconnect(const std::string& reason = "Disconnected by user");

    /**
     * @brief Reject every pending inbound request from a peer
     */
    size_t rejectPendingFrom(const std::string& peerId, const std::string& reason);

    /**
     * @brief Tear down state bound to a peer whose session closed
     */
    void onPeerDisconnected(const std::string& peerId);

    /**
     * @brief End the active session and drop every pending request
     */
    void clear();

    std::optional<RelaySession> activeSession() const;

    /**
     * @brief Inbound requests whose origin timestamp is within the expiry
     */
    std::vector<RelayRequestInfo> pendingRequests() const;
    bool hasOutgoingRequest() const;

protected:
    CommandResult sendRequest(const std::string& peerId, const nlohmann::json& params);
    CommandResult respondToRequest(const std::string& requestId, bool accept,
                                   const nlohmann::json& params = nlohmann::json::object());

    /**
     * @brief Send a message of the data type within the active session
     * @param requireRequester Required role of this device, if any
     */
    CommandResult sendSessionData(const nlohmann::json& payload, std::optional<bool> requireRequester);

    /**
     * @brief End the active session locally (and tell the peer when notifyPeer is set)
     */
    bool endSession(const std::string& reason, bool notifyPeer);

    /**
     * @brief Merge fields into the active session's params
     */
    bool updateSessionParams(const nlohmann::json& params);

    const char* component() const { return m_protocol.component; }
    EventBus& bus() { return m_bus; }

    // Capability hooks
    virtual void onSessionData(const RelaySession& session, const WireMessage& message) = 0;
    virtual void publishRequestReceived(const RelayRequestInfo& request) = 0;
    virtual void publishRequestRejected(const std::string& requestId, const std::string& peerId,
                                        const std::string& reason) = 0;
    virtual void publishSessionStarted(const RelaySession& session) = 0;
    virtual void publishSessionEnded(const RelaySession& session, const std::string& reason) = 0;

private:
    struct Incoming {
        RelayRequestInfo info;
        TimerQueue::TimerId timer = 0;
    };

    struct Outgoing {
        std::string requestId;
        std::string peerId;
        nlohmann::json params;
        TimerQueue::TimerId timer = 0;
    };

    void handleRequest(const WireMessage& message);
    void handleResponse(const WireMessage& message);
    void handleData(const WireMessage& message);
    void handleDisconnect(const WireMessage& message);

    bool sendResponse(const std::string& peerId, const std::string& requestId, bool accepted,
                      const std::string& reason, const nlohmann::json& params);
    void expireIncoming(const std::string& requestId);
    void expireOutgoing(const std::string& requestId);
    void startSession(const RelaySession& session);
    bool isSurfaceable(const RelayRequestInfo& info, int64_t nowMs) const;

    Protocol m_protocol;
    TrustStore& m_store;
    PeerMessenger& m_messenger;
    EventBus& m_bus;
    TimerQueue& m_timers;
    RelayTimeouts m_timeouts;

    mutable std::mutex m_mutex;
    LocalIdentity m_identity;
    bool m_autoAcceptTrusted = true;
    std::unordered_map<std::string, Incoming> m_incoming;   ///< request id -> entry
    std::optional<Outgoing> m_outgoing;
    std::optional<RelaySession> m_active;
};

}  // namespace P2Lan
