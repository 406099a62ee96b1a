/**
 * @file SessionManager.h
 * @brief One persistent TCP session per peer, message routing and fan-out
 */

#pragma once

#include "MessageDispatcher.h"
#include "PeerConnection.h"
#include "PeerInfo.h"
#include "PeerMessenger.h"
#include "SessionCrypto.h"
#include "TrustStore.h"
#include "config.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace P2Lan {

class EventBus;
class TrustStore;

/**
 * @class SessionManager
 * @brief Owns every peer socket
 *
 * Handshake (three frames):
 * 1. initiator -> `discovery`: identity, Ed25519 public key, nonce A
 * 2. responder -> `discovery_response`: identity, public key, nonce B and a
 *    signature over the transcript
 * 3. initiator -> `handshake_confirm`: its own signature over the transcript
 *
 * A peer whose key differs from the one pinned in the TrustStore is
 * refused; the first verified key of a device id is pinned. Only after the
 * handshake is a connection keyed by peer id and its traffic routed
 * through the MessageDispatcher.
 *
 * Duplicate connections (both sides dialing at once) resolve to the one
 * initiated by the lexicographically smaller device id, so both ends keep
 * the same socket. A newer connection from the same initiator replaces the
 * older one.
 *
 * On EOF, error or timeout the peer is set offline in the TrustStore and a
 * PeerDisconnected event is published; transfer and relay subsystems tear
 * down their state from that event.
 */
class SessionManager : public PeerMessenger {
public:
    SessionManager(TrustStore& store, EventBus& bus, MessageDispatcher& dispatcher);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void setIdentity(const LocalIdentity& identity);

    /**
     * @brief Key that proves this device's identity; required before start()
     */
    void setIdentityKey(IdentityKey::Ptr key);

    void setPortRange(uint16_t firstPort, uint16_t lastPort);
    void setTimeouts(int heartbeatIntervalMs, int connectionTimeoutMs);

    /**
     * @brief Bind the listener on the first free port and accept connections
     */
    bool start(std::string& errorMsg);

    /**
     * @brief Send `disconnect` to every peer, close everything, join all threads
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t listenPort() const { return m_listenPort.load(); }

    /**
     * @brief Open (or reuse) a session and complete the handshake
     * @param peerIdOut Identified peer id
     */
    bool connectToPeer(const std::string& ip, uint16_t port, std::string& peerIdOut,
                       std::string& errorMsg);

    /**
     * @brief Manual connect: probe every port of the range on one address
     */
    bool connectToAddress(const std::string& ip, std::string& peerIdOut, std::string& errorMsg);

    /**
     * @brief Send `disconnect` and close the session with a peer
     */
    bool disconnectPeer(const std::string& peerId, const std::string& reason);

    std::vector<std::string> connectedPeers() const;

    //=========================================================================
    // PeerMessenger
    //=========================================================================

    std::string localId() const override;
    bool sendMessageToUser(const std::string& peerId, const WireMessage& message) override;
    bool sendMessageAndWait(const std::string& peerId, const WireMessage& message,
                            std::string& errorMsg) override;
    bool isConnected(const std::string& peerId) const override;

private:
    void acceptThreadFunc();
    void reaperThreadFunc();

    PeerConnection::Ptr openConnection(int socket, const std::string& remoteIp, bool initiatedLocally,
                                       std::string& errorMsg);
    PeerConnection::Ptr findConnection(const std::string& peerId) const;
    PeerConnection::Ptr ensureConnection(const std::string& peerId, std::string& errorMsg);
    WireMessage addressed(const std::string& peerId, const WireMessage& message) const;
    nlohmann::json identityPayload() const;
    IdentityKey::Ptr identityKey() const;

    void onFrame(const PeerConnection::Ptr& conn, const WireMessage& message);
    void onClosed(const PeerConnection::Ptr& conn, const std::string& reason);
    struct PendingHandshake {
        std::string peerId;
        std::string peerKey;
        std::string initiatorNonce;
        std::string responderNonce;
        PeerSighting sighting;
    };

    void handleHandshake(const PeerConnection::Ptr& conn, const WireMessage& message);
    void handleDiscovery(const PeerConnection::Ptr& conn, const WireMessage& message);
    void handleDiscoveryResponse(const PeerConnection::Ptr& conn, const WireMessage& message);
    void handleHandshakeConfirm(const PeerConnection::Ptr& conn, const WireMessage& message);
    bool parseHandshakeIdentity(const PeerConnection::Ptr& conn, const WireMessage& message,
                                PendingHandshake& out);
    std::string transcript(const char* role, const PendingHandshake& hs, bool initiatedLocally) const;
    void completeHandshake(const PeerConnection::Ptr& conn, const PendingHandshake& hs);
    bool registerIdentified(const PeerConnection::Ptr& conn, const std::string& peerId);

    TrustStore& m_store;
    EventBus& m_bus;
    MessageDispatcher& m_dispatcher;

    mutable std::mutex m_identityMutex;
    LocalIdentity m_identity;
    IdentityKey::Ptr m_identityKey;

    uint16_t m_firstPort = P2P_BASE_PORT;
    uint16_t m_lastPort = P2P_MAX_PORT;
    PeerConnection::Timing m_timing{static_cast<int>(HEARTBEAT_INTERVAL_MS),
                                    static_cast<int>(CONNECTION_TIMEOUT_MS)};

    // Listener
    int m_listenSocket;
    std::atomic<uint16_t> m_listenPort{0};
    std::thread m_acceptThread;

    // Connections
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, PeerConnection::Ptr> m_connections;  ///< peer id -> live session
    std::list<PeerConnection::Ptr> m_allConnections;                     ///< includes unidentified
    std::unordered_map<uint64_t, PendingHandshake> m_handshakes;         ///< connection serial -> state
    std::condition_variable m_connectionsCv;

    // Closed connections waiting to be joined
    std::mutex m_reapMutex;
    std::condition_variable m_reapCv;
    std::list<PeerConnection::Ptr> m_reapQueue;
    bool m_reaperStop = false;
    std::thread m_reaperThread;

    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
};

}  // namespace P2Lan
