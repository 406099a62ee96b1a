/**
 * @file PairingManager.h
 * @brief Pairing handshake, pending-request queue and trust commands
 */

#pragma once

#include "CommandResult.h"
#include "PeerInfo.h"
#include "TimerQueue.h"
#include "config.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace P2Lan {

class EventBus;
class MessageDispatcher;
class PeerMessenger;
class TrustStore;
struct WireMessage;

/**
 * @brief Inbound pairing request waiting for an operator decision
 */
struct PairingRequestInfo {
    std::string id;
    std::string peerId;
    std::string peerName;
    std::string profileId;
    UserPlatform platform = UserPlatform::Unknown;
    bool wantsTrust = false;         ///< Sender's own trust choice
    bool wantsSave = false;          ///< Sender's own save choice
    int64_t requestTimeMs = 0;       ///< Origin timestamp from the sender
    int64_t receivedAtMs = 0;        ///< Local receipt time
};

struct PairingTimeouts {
    std::chrono::milliseconds pendingExpiry{PENDING_REQUEST_EXPIRY_MS};
    std::chrono::milliseconds outgoingTimeout{OUTGOING_REQUEST_TIMEOUT_MS};
};

/**
 * @class PairingManager
 * @brief Per-peer pairing state machine
 *
 * Outbound: none -> requestSent -> accepted | rejected | expired.
 * Inbound:  none -> requestReceived -> accepted | rejected | expired.
 *
 * At most one negotiation per peer is in flight. Inbound requests from a
 * blocked peer are rejected without ever being queued; requests from a
 * paired, trusted and unblocked peer are accepted without a prompt. A
 * request from a peer we are ourselves waiting on counts as acceptance of
 * both; the pairing is trusted if either side asked for trust.
 *
 * Every decision on a pending request is one-shot: the entry is taken out
 * of the table under the lock before anything is sent.
 */
class PairingManager {
public:
    PairingManager(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                   TimerQueue& timers, PairingTimeouts timeouts = PairingTimeouts());
    ~PairingManager();

    PairingManager(const PairingManager&) = delete;
    PairingManager& operator=(const PairingManager&) = delete;

    void setIdentity(const LocalIdentity& identity);

    /**
     * @brief Route pairing_request, pairing_response, trust_request and trust_response here
     */
    void registerHandlers(MessageDispatcher& dispatcher);

    //=========================================================================
    // Commands
    //=========================================================================

    /**
     * @brief Ask a peer to pair
     * @param trustUser Trust the peer once paired
     * @param saveConnection Keep the peer record across restarts
     */
    CommandResult sendPairingRequest(const std::string& peerId, bool trustUser, bool saveConnection);

    /**
     * @brief Accept or reject a pending inbound request (one-shot)
     */
    CommandResult respondToPairingRequest(const std::string& requestId, bool accept,
                                          bool trustUser, bool saveConnection);

    /**
     * @brief Reject every pending inbound request from a peer
     *
     * Used when the operator blocks a peer while its request is pending.
     * @return Number of requests rejected
     */
    size_t rejectPendingFrom(const std::string& peerId, const std::string& reason);

    /**
     * @brief Drop the pairing locally and tell the peer to drop it too
     */
    CommandResult unpair(const std::string& peerId);

    CommandResult addTrust(const std::string& peerId);
    CommandResult removeTrust(const std::string& peerId);

    /**
     * @brief Fail the outgoing request bound to a disconnected peer
     */
    void onPeerDisconnected(const std::string& peerId);

    /**
     * @brief Cancel all timers and forget every pending request
     */
    void clear();

    //=========================================================================
    // Queries
    //=========================================================================

    /**
     * @brief Inbound requests still eligible to be shown to the operator
     *
     * A request whose origin timestamp is older than the expiry is hidden
     * but can still be answered until it physically expires.
     */
    std::vector<PairingRequestInfo> pendingRequests() const;

    bool hasPendingRequest(const std::string& requestId) const;
    bool hasOutgoingRequest(const std::string& peerId) const;

private:
    struct Incoming {
        PairingRequestInfo info;
        TimerQueue::TimerId timer = 0;
    };

    struct Outgoing {
        std::string requestId;
        std::string peerId;
        bool trustUser = false;
        bool saveConnection = false;
        TimerQueue::TimerId timer = 0;
    };

    void handlePairingRequest(const WireMessage& message);
    void handlePairingResponse(const WireMessage& message);
    void handleTrustRequest(const WireMessage& message);
    void handleTrustResponse(const WireMessage& message);

    void expireIncoming(const std::string& requestId);
    void expireOutgoing(const std::string& peerId, const std::string& requestId);

    bool sendResponse(const std::string& peerId, const std::string& requestId, bool accepted,
                      bool trustUser, bool saveConnection, const std::string& reason);
    void leavePairingState(const std::string& peerId);
    bool isSurfaceable(const PairingRequestInfo& info, int64_t nowMs) const;

    TrustStore& m_store;
    PeerMessenger& m_messenger;
    EventBus& m_bus;
    TimerQueue& m_timers;
    PairingTimeouts m_timeouts;

    mutable std::mutex m_mutex;
    LocalIdentity m_identity;
    std::unordered_map<std::string, Incoming> m_incoming;  ///< request id -> entry
    std::unordered_map<std::string, Outgoing> m_outgoing;  ///< peer id -> entry
};

}  // namespace P2Lan
