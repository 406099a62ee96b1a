/**
 * @file DiscoveryService.cpp
 * @brief Implementation of UDP broadcast discovery service
 *
 * Handles automatic peer discovery on the local network using
 * UDP broadcast beacons with JSON payloads.
 */

#include "p2lan/DiscoveryService.h"
#include "p2lan/Debug.h"
#include "p2lan/SocketUtils.h"
#include "p2lan/ThreadSafeLog.h"
#include "p2lan/TrustStore.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <functional>
#include <random>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

using json = nlohmann::json;

namespace P2Lan {

namespace {
    #define LogDiscovery(msg) P2Lan::ThreadSafeLog::log(msg)

    int64_t wallClockMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    constexpr int LISTENER_POLL_TIMEOUT_MS = 500;
}

std::string discoveryStateToString(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::Disabled:  return "disabled";
        case DiscoveryState::Enabling:  return "enabling";
        case DiscoveryState::Listening: return "listening";
        case DiscoveryState::Disabling: return "disabling";
    }
    return "disabled";
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

DiscoveryService::DiscoveryService(TrustStore& store)
    : m_store(store)
    , m_udpSocket(INVALID_SOCKET_FD)
{
}

DiscoveryService::~DiscoveryService() {
    disable();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool DiscoveryService::enable(std::string& errorMsg) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (m_state.load() == DiscoveryState::Listening) {
        return true;
    }

    m_state.store(DiscoveryState::Enabling);

    uint16_t port = 0;
    int sock = bindUdpBroadcastSocket(m_firstPort, m_lastPort, port, errorMsg);
    if (sock == INVALID_SOCKET_FD) {
        LOG_ERROR("[Discovery] " << errorMsg);
        m_state.store(DiscoveryState::Disabled);
        return false;
    }
    setRecvTimeout(sock, LISTENER_POLL_TIMEOUT_MS);

    m_udpSocket = sock;
    m_boundPort.store(port);
    m_socketOpenCount.fetch_add(1);
    m_stopRequested.store(false);

    try {
        m_listenerThread = std::thread(&DiscoveryService::listenerThreadFunc, this);
        m_transmitterThread = std::thread(&DiscoveryService::transmitterThreadFunc, this);
        m_gcThread = std::thread(&DiscoveryService::gcThreadFunc, this);
    } catch (const std::system_error& e) {
        errorMsg = std::string("Failed to start discovery threads: ") + e.what();
        LOG_ERROR("[Discovery] " << errorMsg);
        m_stopRequested.store(true);
        m_stopCv.notify_all();
        shutdownSocket(m_udpSocket);
        if (m_listenerThread.joinable()) m_listenerThread.join();
        if (m_transmitterThread.joinable()) m_transmitterThread.join();
        if (m_gcThread.joinable()) m_gcThread.join();
        closeSocket(m_udpSocket);
        m_boundPort.store(0);
        m_state.store(DiscoveryState::Disabled);
        return false;
    }

    m_state.store(DiscoveryState::Listening);
    LOG_INFO("[Discovery] Listening on UDP port " << port);
    LogDiscovery("[Discovery] Enabled on UDP port " + std::to_string(port));
    return true;
}

void DiscoveryService::disable() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    if (m_state.load() != DiscoveryState::Listening) {
        return;
    }

    LogDiscovery("=== DiscoveryService::disable START ===");
    m_state.store(DiscoveryState::Disabling);

    broadcastGoodbye();

    {
        std::lock_guard<std::mutex> lock(m_stopCvMutex);
        m_stopRequested.store(true);
    }
    m_stopCv.notify_all();

    // Unblocks recvfrom() in the listener; the fd stays valid until joined
    shutdownSocket(m_udpSocket);

    if (m_transmitterThread.joinable()) {
        m_transmitterThread.join();
    }
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }
    if (m_gcThread.joinable()) {
        m_gcThread.join();
    }

    closeSocket(m_udpSocket);
    m_boundPort.store(0);

    std::vector<std::string> seen;
    {
        std::lock_guard<std::mutex> lock(m_seenMutex);
        for (const auto& pair : m_lastSeen) {
            seen.push_back(pair.first);
        }
        m_lastSeen.clear();
    }
    for (const auto& id : seen) {
        m_store.setOnline(id, false);
    }

    m_state.store(DiscoveryState::Disabled);
    LOG_INFO("[Discovery] Disabled");
    LogDiscovery("=== DiscoveryService::disable END ===");
}

bool DiscoveryService::manualScan(std::string& errorMsg) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_state.load() != DiscoveryState::Listening) {
        errorMsg = "Discovery is not enabled";
        return false;
    }

    broadcastBeacon(generateBeaconJson(BEACON_TYPE_SCAN), getBroadcastAddresses());
    LOG_INFO("[Discovery] Manual scan sent");
    return true;
}

void DiscoveryService::setIdentity(const LocalIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    m_identity = identity;
    if (m_identity.displayName.size() > MAX_DISPLAY_NAME) {
        m_identity.displayName.resize(MAX_DISPLAY_NAME);
    }
}

void DiscoveryService::setTcpPort(uint16_t port) {
    m_tcpPort.store(port);
}

void DiscoveryService::setPortRange(uint16_t firstPort, uint16_t lastPort) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (firstPort == 0 || lastPort < firstPort) {
        return;
    }
    m_firstPort = firstPort;
    m_lastPort = lastPort;
}

//=============================================================================
// Worker threads
//=============================================================================

void DiscoveryService::transmitterThreadFunc() {
    try {
        std::array<std::mt19937::result_type, std::mt19937::state_size> seedData;
        std::random_device rd;
        std::generate(seedData.begin(), seedData.end(), std::ref(rd));
        std::seed_seq seq(seedData.begin(), seedData.end());
        std::mt19937 rng(seq);

        int burstRemaining = DISCOVERY_STARTUP_BURST_COUNT;

        while (!m_stopRequested.load()) {
            // Adapter list is refreshed every round; roaming and new NICs need no restart
            broadcastBeacon(generateBeaconJson(BEACON_TYPE_ANNOUNCE), getBroadcastAddresses());

            uint32_t baseIntervalMs;
            if (burstRemaining > 0) {
                baseIntervalMs = DISCOVERY_STARTUP_INTERVAL_MS;
                --burstRemaining;
            } else {
                baseIntervalMs = DISCOVERY_INTERVAL_MS;
            }

            // +/- BEACON_JITTER_MAX_PERCENT% keeps many peers from beaconing in lockstep
            const int jitterRange = static_cast<int>(baseIntervalMs) * BEACON_JITTER_MAX_PERCENT / 100;
            std::uniform_int_distribution<int> dist(-jitterRange, jitterRange);
            const int sleepMs = std::max(500, static_cast<int>(baseIntervalMs) + dist(rng));

            std::unique_lock<std::mutex> waitLock(m_stopCvMutex);
            m_stopCv.wait_for(waitLock, std::chrono::milliseconds(sleepMs),
                              [this]() { return m_stopRequested.load(); });
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Discovery] Transmitter thread failed: " << e.what());
        LogDiscovery(std::string("[Discovery] Transmitter thread failed: ") + e.what());
    }
}

void DiscoveryService::listenerThreadFunc() {
    try {
        std::vector<char> buffer(MAX_BEACON_SIZE);

        while (!m_stopRequested.load()) {
            sockaddr_in senderAddr{};
            socklen_t senderLen = sizeof(senderAddr);

            ssize_t bytesReceived = ::recvfrom(m_udpSocket, buffer.data(), buffer.size(), 0,
                                               reinterpret_cast<sockaddr*>(&senderAddr), &senderLen);
            if (bytesReceived < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                if (!m_stopRequested.load()) {
                    LOG_WARNING("[Discovery] recvfrom() failed: " << socketErrorString(errno));
                }
                break;
            }
            if (bytesReceived == 0) {
                // Zero-length datagram, or the socket was shut down
                continue;
            }

            const std::string senderIp = addressToString(senderAddr);
            try {
                parseBeacon(std::string(buffer.data(), static_cast<size_t>(bytesReceived)), senderIp);
            } catch (const json::exception& e) {
                LOG_DEBUG("[Discovery] Dropping beacon from " << senderIp << ": " << e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Discovery] Listener thread failed: " << e.what());
        LogDiscovery(std::string("[Discovery] Listener thread failed: ") + e.what());
    }
}

void DiscoveryService::gcThreadFunc() {
    try {
        while (!m_stopRequested.load()) {
            std::unique_lock<std::mutex> waitLock(m_stopCvMutex);
            m_stopCv.wait_for(waitLock, std::chrono::milliseconds(GC_INTERVAL_MS),
                              [this]() { return m_stopRequested.load(); });
            if (m_stopRequested.load()) {
                break;
            }
            waitLock.unlock();

            collectStalePeers(Clock::now());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Discovery] GC thread failed: " << e.what());
        LogDiscovery(std::string("[Discovery] GC thread failed: ") + e.what());
    }
}

void DiscoveryService::collectStalePeers(Clock::time_point now) {
    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(m_seenMutex);
        for (auto it = m_lastSeen.begin(); it != m_lastSeen.end();) {
            if (now - it->second > std::chrono::milliseconds(PEER_TIMEOUT_MS)) {
                stale.push_back(it->first);
                it = m_lastSeen.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& id : stale) {
        auto peer = m_store.get(id);
        if (!peer) {
            continue;
        }
        // A live session keeps the peer online even without beacons
        if (peer->connectionStatus == ConnectionStatus::Discovering ||
            peer->connectionStatus == ConnectionStatus::Disconnected) {
            LOG_DEBUG("[Discovery] Peer timed out: " << id);
            m_store.setOnline(id, false);
        }
    }
}

//=============================================================================
// Beacons
//=============================================================================

std::string DiscoveryService::generateBeaconJson(const char* beaconType) const {
    LocalIdentity identity;
    {
        std::lock_guard<std::mutex> lock(m_identityMutex);
        identity = m_identity;
    }

    json beacon;
    beacon["protocol_id"]    = PROTOCOL_ID;
    beacon["proto_version"]  = PROTOCOL_VERSION;
    beacon["beacon_type"]    = beaconType;
    beacon["device_uuid"]    = identity.id;
    beacon["display_name"]   = identity.displayName;
    beacon["profile_id"]     = identity.profileId;
    beacon["platform"]       = platformToString(identity.platform);
    beacon["tcp_port"]       = m_tcpPort.load();
    beacon["discovery_port"] = m_boundPort.load();
    beacon["timestamp_ms"]   = wallClockMs();
    return beacon.dump();
}

void DiscoveryService::sendBeaconTo(const std::string& beacon, const std::string& ip, uint16_t port) {
    if (m_udpSocket == INVALID_SOCKET_FD) {
        return;
    }
    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &target.sin_addr) != 1) {
        return;
    }

    ssize_t sent = ::sendto(m_udpSocket, beacon.data(), beacon.size(), 0,
                            reinterpret_cast<sockaddr*>(&target), sizeof(target));
    if (sent < 0 && errno != ENETUNREACH && errno != EHOSTUNREACH) {
        LOG_DEBUG("[Discovery] sendto(" << ip << ":" << port << ") failed: " << socketErrorString(errno));
    }
}

void DiscoveryService::broadcastBeacon(const std::string& beacon, const std::vector<std::string>& addresses) {
    for (uint32_t port = m_firstPort; port <= m_lastPort; ++port) {
        for (const auto& ip : addresses) {
            sendBeaconTo(beacon, ip, static_cast<uint16_t>(port));
        }
    }
}

void DiscoveryService::broadcastGoodbye() {
    const std::string goodbye = generateBeaconJson(BEACON_TYPE_GOODBYE);
    const std::vector<std::string> addresses = getBroadcastAddresses();

    for (int i = 0; i < GOODBYE_BROADCAST_COUNT; ++i) {
        broadcastBeacon(goodbye, addresses);
        if (i < GOODBYE_BROADCAST_COUNT - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(GOODBYE_BROADCAST_DELAY_MS));
        }
    }
}

void DiscoveryService::parseBeacon(const std::string& jsonStr, const std::string& senderIp) {
    json beacon = json::parse(jsonStr);

    if (!beacon.is_object() || !beacon.contains("protocol_id") || beacon["protocol_id"] != PROTOCOL_ID) {
        // Not our protocol
        return;
    }
    if (!beacon.contains("device_uuid") || !beacon["device_uuid"].is_string()) {
        return;
    }

    const std::string uuid = beacon["device_uuid"].get<std::string>();
    if (uuid.empty() || uuid.size() > MAX_UUID_LENGTH) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_identityMutex);
        if (uuid == m_identity.id) {
            return;
        }
    }

    const std::string beaconType = (beacon.contains("beacon_type") && beacon["beacon_type"].is_string())
        ? beacon["beacon_type"].get<std::string>()
        : std::string(BEACON_TYPE_ANNOUNCE);

    // Goodbye: honoured only from the peer's known address, so a spoofed
    // goodbye cannot take a live peer offline
    if (beaconType == BEACON_TYPE_GOODBYE) {
        auto known = m_store.get(uuid);
        if (!known) {
            return;
        }
        if (known->ipAddress != senderIp) {
            LOG_WARNING("[Discovery] Goodbye from " << senderIp << " claimed " << uuid
                        << " (known at " << known->ipAddress << "), ignored");
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_seenMutex);
            m_lastSeen.erase(uuid);
        }
        LOG_INFO("[Discovery] Peer departed: " << uuid << " (" << senderIp << ")");
        m_store.setOnline(uuid, false);
        return;
    }

    if (beaconType != BEACON_TYPE_ANNOUNCE && beaconType != BEACON_TYPE_SCAN) {
        return;
    }

    PeerSighting sighting;
    sighting.id = uuid;
    sighting.ipAddress = senderIp;
    if (beacon.contains("display_name") && beacon["display_name"].is_string()) {
        sighting.displayName = beacon["display_name"].get<std::string>();
        if (sighting.displayName.size() > MAX_DISPLAY_NAME) {
            sighting.displayName.resize(MAX_DISPLAY_NAME);
        }
    }
    if (beacon.contains("profile_id") && beacon["profile_id"].is_string()) {
        sighting.profileId = beacon["profile_id"].get<std::string>();
    }
    if (beacon.contains("platform") && beacon["platform"].is_string()) {
        sighting.platform = platformFromString(beacon["platform"].get<std::string>());
    }
    if (beacon.contains("tcp_port") && beacon["tcp_port"].is_number_unsigned()) {
        const auto port = beacon["tcp_port"].get<uint64_t>();
        if (port <= 65535) {
            sighting.port = static_cast<uint16_t>(port);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_seenMutex);
        m_lastSeen[uuid] = Clock::now();
    }
    m_store.recordSighting(sighting, wallClockMs());

    if (beaconType == BEACON_TYPE_SCAN &&
        beacon.contains("discovery_port") && beacon["discovery_port"].is_number_unsigned()) {
        const auto replyPort = beacon["discovery_port"].get<uint64_t>();
        if (replyPort > 0 && replyPort <= 65535) {
            sendBeaconTo(generateBeaconJson(BEACON_TYPE_ANNOUNCE), senderIp,
                         static_cast<uint16_t>(replyPort));
        }
    }
}

//=============================================================================
// Test helpers
//=============================================================================

void DiscoveryService::simulateIncomingBeacon(const std::string& beaconJson, const std::string& senderIp) {
    try {
        parseBeacon(beaconJson, senderIp);
    } catch (const json::exception& e) {
        LOG_DEBUG("[Discovery] Dropping simulated beacon: " << e.what());
    }
}

std::string DiscoveryService::generateBeaconJsonForTesting(const std::string& beaconType) const {
    return generateBeaconJson(beaconType.c_str());
}

void DiscoveryService::runGarbageCollectionForTesting(std::chrono::milliseconds elapsed) {
    collectStalePeers(Clock::now() + elapsed);
}

}  // namespace P2Lan
