/**
 * @file DiscoveryService.h
 * @brief UDP broadcast peer discovery over the P2Lan port range
 */

#pragma once

#include "PeerInfo.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace P2Lan {

class TrustStore;

enum class DiscoveryState {
    Disabled,
    Enabling,
    Listening,
    Disabling
};

std::string discoveryStateToString(DiscoveryState state);

/**
 * @class DiscoveryService
 * @brief Presence beacons on a bounded local port range
 *
 * The UDP socket binds the first free port of the range and every beacon
 * is sent to every port of the range on every interface broadcast address,
 * so instances sharing a host still see each other.
 *
 * Sightings are upserted into the TrustStore keyed by device id, which is
 * what keeps re-enabling from duplicating peers. The GC thread only marks
 * silent peers offline; records are never deleted here.
 *
 * Thread Safety:
 * - enable()/disable() are serialized by a lifecycle mutex; enable() while
 *   already listening is a no-op
 * - Worker threads: transmitter, listener, garbage collector
 */
class DiscoveryService {
public:
    explicit DiscoveryService(TrustStore& store);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    /**
     * @brief Bind the socket and start the worker threads
     * @param errorMsg Reason on failure (no free port, socket error)
     * @return true if listening (including when already listening)
     */
    bool enable(std::string& errorMsg);

    /**
     * @brief Broadcast goodbye, close the socket, join threads
     *
     * Every peer sighted by this service is marked offline. Idempotent.
     */
    void disable();

    DiscoveryState state() const { return m_state.load(); }
    bool isEnabled() const { return m_state.load() == DiscoveryState::Listening; }

    /**
     * @brief Send an immediate scan beacon
     *
     * Listeners answer with an announce beacon straight back to us.
     */
    bool manualScan(std::string& errorMsg);

    void setIdentity(const LocalIdentity& identity);
    void setTcpPort(uint16_t port);
    void setPortRange(uint16_t firstPort, uint16_t lastPort);

    uint16_t boundPort() const { return m_boundPort.load(); }

    /**
     * @brief Number of times a discovery socket was opened since construction
     */
    uint32_t socketOpenCount() const { return m_socketOpenCount.load(); }

    //=========================================================================
    // Test helpers
    //=========================================================================

    void simulateIncomingBeacon(const std::string& beaconJson, const std::string& senderIp);
    std::string generateBeaconJsonForTesting(const std::string& beaconType) const;

    /**
     * @brief Run one GC pass as if `elapsed` had passed since each sighting
     */
    void runGarbageCollectionForTesting(std::chrono::milliseconds elapsed);

private:
    using Clock = std::chrono::steady_clock;

    void transmitterThreadFunc();
    void listenerThreadFunc();
    void gcThreadFunc();

    std::string generateBeaconJson(const char* beaconType) const;
    void broadcastBeacon(const std::string& beacon, const std::vector<std::string>& addresses);
    void sendBeaconTo(const std::string& beacon, const std::string& ip, uint16_t port);
    void broadcastGoodbye();
    void parseBeacon(const std::string& json, const std::string& senderIp);
    void collectStalePeers(Clock::time_point now);

    TrustStore& m_store;

    // Identity
    mutable std::mutex m_identityMutex;
    LocalIdentity m_identity;
    std::atomic<uint16_t> m_tcpPort{0};

    // Port range
    uint16_t m_firstPort = P2P_BASE_PORT;
    uint16_t m_lastPort = P2P_MAX_PORT;

    // Socket
    int m_udpSocket;
    std::atomic<uint16_t> m_boundPort{0};
    std::atomic<uint32_t> m_socketOpenCount{0};

    // Sightings made by this service (device id -> last beacon)
    std::mutex m_seenMutex;
    std::unordered_map<std::string, Clock::time_point> m_lastSeen;

    // Lifecycle
    std::mutex m_lifecycleMutex;
    std::atomic<DiscoveryState> m_state{DiscoveryState::Disabled};

    std::thread m_transmitterThread;
    std::thread m_listenerThread;
    std::thread m_gcThread;

    std::atomic<bool> m_stopRequested{false};
    std::condition_variable m_stopCv;
    std::mutex m_stopCvMutex;
};

}  // namespace P2Lan
