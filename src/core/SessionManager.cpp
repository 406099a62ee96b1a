/**
 * @file SessionManager.cpp
 * @brief Peer session ownership, handshake and routing
 */

#include "p2lan/SessionManager.h"
#include "p2lan/Debug.h"
#include "p2lan/EventBus.h"
#include "p2lan/SocketUtils.h"
#include "p2lan/ThreadSafeLog.h"
#include "p2lan/TrustStore.h"
#include "p2lan/UuidGenerator.h"

#include <algorithm>
#include <cerrno>
#include <chrono>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace P2Lan {

namespace {
    #define LogSession(msg) P2Lan::ThreadSafeLog::log(msg)

    constexpr int ACCEPT_POLL_TIMEOUT_MS = 500;
    constexpr int STOP_FLUSH_TIMEOUT_MS = 500;
    constexpr int STOP_DRAIN_TIMEOUT_MS = 5000;

    constexpr size_t MAX_NONCE_LENGTH = 64;

    int64_t wallClockMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string readToken(const nlohmann::json& data, const char* key, size_t maxLength) {
        if (!data.contains(key) || !data[key].is_string()) {
            return {};
        }
        std::string value = data[key].get<std::string>();
        return value.size() > maxLength ? std::string() : value;
    }
}

SessionManager::SessionManager(TrustStore& store, EventBus& bus, MessageDispatcher& dispatcher)
    : m_store(store)
    , m_bus(bus)
    , m_dispatcher(dispatcher)
    , m_listenSocket(INVALID_SOCKET_FD)
{
}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::setIdentity(const LocalIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    m_identity = identity;
}

void SessionManager::setIdentityKey(IdentityKey::Ptr key) {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    m_identityKey = std::move(key);
}

IdentityKey::Ptr SessionManager::identityKey() const {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    return m_identityKey;
}

void SessionManager::setPortRange(uint16_t firstPort, uint16_t lastPort) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (firstPort == 0 || lastPort < firstPort) {
        return;
    }
    m_firstPort = firstPort;
    m_lastPort = lastPort;
}

void SessionManager::setTimeouts(int heartbeatIntervalMs, int connectionTimeoutMs) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    m_timing.heartbeatIntervalMs = heartbeatIntervalMs;
    m_timing.connectionTimeoutMs = connectionTimeoutMs;
}

std::string SessionManager::localId() const {
    std::lock_guard<std::mutex> lock(m_identityMutex);
    return m_identity.id;
}

nlohmann::json SessionManager::identityPayload() const {
    LocalIdentity identity;
    IdentityKey::Ptr key;
    {
        std::lock_guard<std::mutex> lock(m_identityMutex);
        identity = m_identity;
        key = m_identityKey;
    }

    nlohmann::json data;
    data["deviceId"] = identity.id;
    data["displayName"] = identity.displayName;
    data["profileId"] = identity.profileId;
    data["platform"] = platformToString(identity.platform);
    data["tcpPort"] = m_listenPort.load();
    data["protocolVersion"] = PROTOCOL_VERSION;
    if (key) {
        data["identityKey"] = key->publicKeyHex();
    }
    return data;
}

//=============================================================================
// Lifecycle
//=============================================================================

bool SessionManager::start(std::string& errorMsg) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_running.load()) {
        return true;
    }
    if (!identityKey()) {
        errorMsg = "Identity key not set";
        LOG_ERROR("[Session] " << errorMsg);
        return false;
    }

    uint16_t port = 0;
    m_listenSocket = bindTcpListener(m_firstPort, m_lastPort, port, errorMsg);
    if (m_listenSocket == INVALID_SOCKET_FD) {
        LOG_ERROR("[Session] " << errorMsg);
        return false;
    }

    m_listenPort.store(port);
    m_stopRequested.store(false);
    {
        std::lock_guard<std::mutex> lock(m_reapMutex);
        m_reaperStop = false;
    }

    try {
        m_reaperThread = std::thread(&SessionManager::reaperThreadFunc, this);
        m_acceptThread = std::thread(&SessionManager::acceptThreadFunc, this);
    } catch (const std::system_error& e) {
        errorMsg = std::string("Failed to start session threads: ") + e.what();
        LOG_ERROR("[Session] " << errorMsg);
        m_stopRequested.store(true);
        {
            std::lock_guard<std::mutex> lock(m_reapMutex);
            m_reaperStop = true;
        }
        m_reapCv.notify_all();
        if (m_reaperThread.joinable()) m_reaperThread.join();
        if (m_acceptThread.joinable()) m_acceptThread.join();
        closeSocket(m_listenSocket);
        m_listenPort.store(0);
        return false;
    }

    m_running.store(true);
    LOG_INFO("[Session] Listening on TCP port " << port);
    LogSession("[Session] Started on TCP port " + std::to_string(port));
    return true;
}

void SessionManager::stop() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (!m_running.load()) {
        return;
    }

    LogSession("=== SessionManager::stop START ===");
    m_stopRequested.store(true);

    shutdownSocket(m_listenSocket);
    if (m_acceptThread.joinable()) {
        m_acceptThread.join();
    }
    closeSocket(m_listenSocket);
    m_listenPort.store(0);

    std::vector<PeerConnection::Ptr> open;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        open.assign(m_allConnections.begin(), m_allConnections.end());
    }

    const std::string self = localId();
    for (const auto& conn : open) {
        if (conn->isIdentified() && !conn->isClosed()) {
            std::string sendError;
            if (!conn->sendAndWait(WireMessage::make(MessageType::Disconnect, self, conn->peerId()),
                                   STOP_FLUSH_TIMEOUT_MS, sendError)) {
                LOG_DEBUG("[Session] Disconnect notice to " << conn->peerId() << " not delivered: " << sendError);
            }
        }
        conn->close("Networking stopped");
    }

    // Readers report through onClosed(); wait for all of them before the reaper goes
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_connectionsCv.wait_for(lock, std::chrono::milliseconds(STOP_DRAIN_TIMEOUT_MS),
                                 [this] { return m_allConnections.empty(); });
        if (!m_allConnections.empty()) {
            LOG_WARNING("[Session] " << m_allConnections.size() << " connections still draining at stop");
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_reapMutex);
        m_reaperStop = true;
    }
    m_reapCv.notify_all();
    if (m_reaperThread.joinable()) {
        m_reaperThread.join();
    }

    // Anything left never reached onClosed(); join it here
    std::list<PeerConnection::Ptr> leftovers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        leftovers.swap(m_allConnections);
        m_connections.clear();
        m_handshakes.clear();
    }
    for (const auto& conn : leftovers) {
        conn->join();
    }

    m_running.store(false);
    LOG_INFO("[Session] Stopped");
    LogSession("=== SessionManager::stop END ===");
}

void SessionManager::acceptThreadFunc() {
    try {
        while (!m_stopRequested.load()) {
            pollfd pfd{};
            pfd.fd = m_listenSocket;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, ACCEPT_POLL_TIMEOUT_MS);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("[Session] poll() on listener failed: " << socketErrorString(errno));
                break;
            }
            if (ready == 0 || m_stopRequested.load()) {
                continue;
            }

            sockaddr_in clientAddr{};
            socklen_t clientLen = sizeof(clientAddr);
            int client = ::accept(m_listenSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
            if (client < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
                    continue;
                }
                if (!m_stopRequested.load()) {
                    LOG_ERROR("[Session] accept() failed: " << socketErrorString(errno));
                }
                break;
            }

            const std::string remoteIp = addressToString(clientAddr);
            std::string errorMsg;
            if (!openConnection(client, remoteIp, false, errorMsg)) {
                LOG_ERROR("[Session] Cannot open inbound session from " << remoteIp << ": " << errorMsg);
            } else {
                LOG_DEBUG("[Session] Inbound connection from " << remoteIp);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Accept thread failed: " << e.what());
        LogSession(std::string("[Session] Accept thread failed: ") + e.what());
    }
}

void SessionManager::reaperThreadFunc() {
    try {
        while (true) {
            std::list<PeerConnection::Ptr> batch;
            {
                std::unique_lock<std::mutex> lock(m_reapMutex);
                m_reapCv.wait(lock, [this] { return m_reaperStop || !m_reapQueue.empty(); });
                if (m_reapQueue.empty() && m_reaperStop) {
                    break;
                }
                batch.swap(m_reapQueue);
            }

            for (const auto& conn : batch) {
                conn->join();
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Session] Reaper thread failed: " << e.what());
        LogSession(std::string("[Session] Reaper thread failed: ") + e.what());
    }
}

//=============================================================================
// Connections
//=============================================================================

PeerConnection::Ptr SessionManager::openConnection(int socket, const std::string& remoteIp,
                                                   bool initiatedLocally, std::string& errorMsg)
{
    auto conn = std::make_shared<PeerConnection>(socket, remoteIp, initiatedLocally, localId(), m_timing);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_allConnections.push_back(conn);
    }

    const bool started = conn->start(
        [this](const PeerConnection::Ptr& c, const WireMessage& m) { onFrame(c, m); },
        [this](const PeerConnection::Ptr& c, const std::string& reason) { onClosed(c, reason); },
        errorMsg);

    if (!started) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_allConnections.remove(conn);
        return nullptr;
    }
    return conn;
}

PeerConnection::Ptr SessionManager::findConnection(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(peerId);
    if (it == m_connections.end() || it->second->isClosed()) {
        return nullptr;
    }
    return it->second;
}

bool SessionManager::connectToPeer(const std::string& ip, uint16_t port, std::string& peerIdOut,
                                   std::string& errorMsg)
{
    if (!m_running.load() || m_stopRequested.load()) {
        errorMsg = "Networking is not started";
        return false;
    }

    int sock = connectWithTimeout(ip, port, static_cast<int>(CONNECT_TIMEOUT_MS), errorMsg);
    if (sock == INVALID_SOCKET_FD) {
        return false;
    }

    PeerConnection::Ptr conn = openConnection(sock, ip, true, errorMsg);
    if (!conn) {
        return false;
    }

    PendingHandshake hs;
    hs.initiatorNonce = UuidGenerator::generate();
    if (hs.initiatorNonce.empty()) {
        conn->close("Cannot generate handshake nonce");
        errorMsg = "Cannot generate handshake nonce";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handshakes[conn->serial()] = hs;
    }

    nlohmann::json hello = identityPayload();
    hello["nonce"] = hs.initiatorNonce;
    if (!conn->enqueue(WireMessage::make(MessageType::Discovery, localId(), "", hello), errorMsg)) {
        conn->close("Handshake send failed");
        return false;
    }

    if (conn->waitIdentified(static_cast<int>(CONNECT_TIMEOUT_MS))) {
        peerIdOut = conn->peerId();
        return true;
    }

    // Lost a duplicate-connection race: the peer is still reachable on the other socket
    const std::string candidate = conn->peerId();
    if (!candidate.empty() && isConnected(candidate)) {
        peerIdOut = candidate;
        return true;
    }

    conn->close("Handshake timed out");
    errorMsg = "No P2Lan handshake from " + ip + ":" + std::to_string(port);
    return false;
}

bool SessionManager::connectToAddress(const std::string& ip, std::string& peerIdOut, std::string& errorMsg) {
    if (!isValidIpv4(ip)) {
        errorMsg = "Invalid IPv4 address: " + ip;
        return false;
    }

    std::string lastError;
    for (uint32_t port = m_firstPort; port <= m_lastPort; ++port) {
        if (connectToPeer(ip, static_cast<uint16_t>(port), peerIdOut, lastError)) {
            LOG_INFO("[Session] Manual connect to " << ip << ":" << port << " reached " << peerIdOut);
            return true;
        }
        LOG_DEBUG("[Session] Probe " << ip << ":" << port << " failed: " << lastError);
    }

    errorMsg = "No P2Lan peer answered on " + ip + " ports " +
               std::to_string(m_firstPort) + "-" + std::to_string(m_lastPort);
    return false;
}

PeerConnection::Ptr SessionManager::ensureConnection(const std::string& peerId, std::string& errorMsg) {
    if (PeerConnection::Ptr conn = findConnection(peerId)) {
        return conn;
    }

    if (!m_running.load()) {
        errorMsg = "Networking is not started";
        return nullptr;
    }

    auto peer = m_store.get(peerId);
    if (!peer || peer->ipAddress.empty() || peer->port == 0) {
        errorMsg = "Peer address unknown: " + peerId;
        return nullptr;
    }

    std::string reached;
    if (!connectToPeer(peer->ipAddress, peer->port, reached, errorMsg)) {
        return nullptr;
    }
    if (reached != peerId) {
        errorMsg = "Address " + peer->ipAddress + " now belongs to another device";
        return nullptr;
    }

    PeerConnection::Ptr conn = findConnection(peerId);
    if (!conn) {
        errorMsg = "Session closed during connect";
    }
    return conn;
}

bool SessionManager::disconnectPeer(const std::string& peerId, const std::string& reason) {
    PeerConnection::Ptr conn = findConnection(peerId);
    if (!conn) {
        return false;
    }

    std::string sendError;
    if (!conn->sendAndWait(WireMessage::make(MessageType::Disconnect, localId(), peerId),
                           STOP_FLUSH_TIMEOUT_MS, sendError)) {
        LOG_DEBUG("[Session] Disconnect notice to " << peerId << " not delivered: " << sendError);
    }
    conn->close(reason);
    return true;
}

std::vector<std::string> SessionManager::connectedPeers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& pair : m_connections) {
        if (!pair.second->isClosed()) {
            ids.push_back(pair.first);
        }
    }
    return ids;
}

bool SessionManager::isConnected(const std::string& peerId) const {
    return findConnection(peerId) != nullptr;
}

//=============================================================================
// Sending
//=============================================================================

WireMessage SessionManager::addressed(const std::string& peerId, const WireMessage& message) const {
    WireMessage out = message;
    out.fromUserId = localId();
    out.toUserId = peerId;
    out.rawType = messageTypeToString(out.type);
    return out;
}

bool SessionManager::sendMessageToUser(const std::string& peerId, const WireMessage& message) {
    std::string errorMsg;
    PeerConnection::Ptr conn = ensureConnection(peerId, errorMsg);
    if (!conn) {
        LOG_WARNING("[Session] Cannot send " << messageTypeToString(message.type) << " to "
                    << peerId << ": " << errorMsg);
        return false;
    }

    if (!conn->enqueue(addressed(peerId, message), errorMsg)) {
        LOG_WARNING("[Session] Cannot queue " << messageTypeToString(message.type) << " for "
                    << peerId << ": " << errorMsg);
        return false;
    }
    return true;
}

bool SessionManager::sendMessageAndWait(const std::string& peerId, const WireMessage& message,
                                        std::string& errorMsg)
{
    PeerConnection::Ptr conn = ensureConnection(peerId, errorMsg);
    if (!conn) {
        return false;
    }
    return conn->sendAndWait(addressed(peerId, message), m_timing.connectionTimeoutMs, errorMsg);
}

//=============================================================================
// Inbound
//=============================================================================

void SessionManager::onFrame(const PeerConnection::Ptr& conn, const WireMessage& message) {
    if (!conn->isIdentified()) {
        handleHandshake(conn, message);
        return;
    }

    const std::string peerId = conn->peerId();
    if (message.fromUserId != peerId) {
        LOG_WARNING("[Session] Frame on " << peerId << "'s session claims sender "
                    << message.fromUserId << ", dropped");
        return;
    }

    switch (message.type) {
        case MessageType::Heartbeat:
            return;
        case MessageType::Disconnect:
            conn->close("Peer disconnected");
            return;
        case MessageType::DiscoveryScanRequest: {
            std::string sendError;
            if (!conn->enqueue(WireMessage::make(MessageType::DiscoveryResponse, localId(), peerId,
                                                 identityPayload()), sendError)) {
                LOG_DEBUG("[Session] Scan reply to " << peerId << " failed: " << sendError);
            }
            return;
        }
        case MessageType::Discovery:
        case MessageType::DiscoveryResponse:
        case MessageType::HandshakeConfirm:
            // Late or repeated handshake on a live session
            return;
        default:
            m_dispatcher.dispatch(message);
            return;
    }
}

void SessionManager::handleHandshake(const PeerConnection::Ptr& conn, const WireMessage& message) {
    const bool outbound = conn->initiatedLocally();
    switch (message.type) {
        case MessageType::Discovery:
            if (!outbound) {
                handleDiscovery(conn, message);
                return;
            }
            break;
        case MessageType::DiscoveryResponse:
            if (outbound) {
                handleDiscoveryResponse(conn, message);
                return;
            }
            break;
        case MessageType::HandshakeConfirm:
            if (!outbound) {
                handleHandshakeConfirm(conn, message);
                return;
            }
            break;
        default:
            break;
    }
    LOG_WARNING("[Session] Unexpected '" << message.rawType << "' during handshake with "
                << conn->remoteIp() << ", dropped");
}

bool SessionManager::parseHandshakeIdentity(const PeerConnection::Ptr& conn, const WireMessage& message,
                                            PendingHandshake& out)
{
    const std::string peerId = message.fromUserId;
    if (peerId.empty() || peerId.size() > MAX_UUID_LENGTH) {
        conn->close("Invalid handshake identity");
        return false;
    }
    if (peerId == localId()) {
        conn->close("Connected to self");
        return false;
    }

    const auto& data = message.data;
    std::vector<uint8_t> rawKey;
    if (!hexToBytes(readToken(data, "identityKey", ED25519_KEY_SIZE * 2), rawKey) ||
        rawKey.size() != ED25519_KEY_SIZE) {
        LOG_WARNING("[Session] Handshake from " << peerId << " at " << conn->remoteIp()
                    << " carries no valid identity key");
        conn->close("Missing identity key");
        return false;
    }
    const std::string peerKey = bytesToHex(rawKey.data(), rawKey.size());
    if (!m_store.matchesPinnedKey(peerId, peerKey)) {
        LOG_WARNING("[Session] " << conn->remoteIp() << " claims to be " << peerId
                    << " but presents a different identity key; refused");
        LogSession("[Session] Identity key mismatch for " + peerId + " from " + conn->remoteIp());
        conn->close("Identity key mismatch");
        return false;
    }

    PeerSighting sighting;
    sighting.id = peerId;
    sighting.ipAddress = conn->remoteIp();
    if (data.contains("displayName") && data["displayName"].is_string()) {
        sighting.displayName = data["displayName"].get<std::string>();
        if (sighting.displayName.size() > MAX_DISPLAY_NAME) {
            sighting.displayName.resize(MAX_DISPLAY_NAME);
        }
    }
    if (data.contains("profileId") && data["profileId"].is_string()) {
        sighting.profileId = data["profileId"].get<std::string>();
    }
    if (data.contains("platform") && data["platform"].is_string()) {
        sighting.platform = platformFromString(data["platform"].get<std::string>());
    }
    if (data.contains("tcpPort") && data["tcpPort"].is_number_unsigned() &&
        data["tcpPort"].get<uint64_t>() <= 65535) {
        sighting.port = static_cast<uint16_t>(data["tcpPort"].get<uint64_t>());
    }

    out.peerId = peerId;
    out.peerKey = peerKey;
    out.sighting = sighting;
    return true;
}

std::string SessionManager::transcript(const char* role, const PendingHandshake& hs,
                                       bool initiatedLocally) const
{
    const std::string self = localId();
    IdentityKey::Ptr key = identityKey();
    const std::string ownKey = key ? key->publicKeyHex() : std::string();

    const std::string& initiatorId = initiatedLocally ? self : hs.peerId;
    const std::string& responderId = initiatedLocally ? hs.peerId : self;
    const std::string& initiatorKey = initiatedLocally ? ownKey : hs.peerKey;
    const std::string& responderKey = initiatedLocally ? hs.peerKey : ownKey;

    std::string out = "P2Lan handshake v1|";
    out += role;
    for (const std::string* field : {&hs.initiatorNonce, &hs.responderNonce, &initiatorId,
                                     &responderId, &initiatorKey, &responderKey}) {
        out += "|" + std::to_string(field->size()) + ":" + *field;
    }
    return out;
}

void SessionManager::handleDiscovery(const PeerConnection::Ptr& conn, const WireMessage& message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_handshakes.count(conn->serial()) > 0) {
            LOG_WARNING("[Session] Repeated discovery from " << conn->remoteIp() << ", dropped");
            return;
        }
    }

    PendingHandshake hs;
    if (!parseHandshakeIdentity(conn, message, hs)) {
        return;
    }
    hs.initiatorNonce = readToken(message.data, "nonce", MAX_NONCE_LENGTH);
    if (hs.initiatorNonce.empty()) {
        conn->close("Missing handshake nonce");
        return;
    }
    hs.responderNonce = UuidGenerator::generate();
    if (hs.responderNonce.empty()) {
        conn->close("Cannot generate handshake nonce");
        return;
    }

    IdentityKey::Ptr key = identityKey();
    std::string signature;
    std::string errorMsg = "Identity key not set";
    if (!key || !key->sign(transcript("responder", hs, false), signature, errorMsg)) {
        LOG_ERROR("[Session] Cannot sign handshake for " << hs.peerId << ": " << errorMsg);
        conn->close("Handshake signing failed");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handshakes[conn->serial()] = hs;
    }

    nlohmann::json data = identityPayload();
    data["nonce"] = hs.responderNonce;
    data["signature"] = signature;
    if (!conn->enqueue(WireMessage::make(MessageType::DiscoveryResponse, localId(), hs.peerId, data), errorMsg)) {
        conn->close("Handshake reply failed: " + errorMsg);
    }
}

void SessionManager::handleDiscoveryResponse(const PeerConnection::Ptr& conn, const WireMessage& message) {
    PendingHandshake hs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handshakes.find(conn->serial());
        if (it == m_handshakes.end() || !it->second.peerId.empty()) {
            LOG_WARNING("[Session] Unsolicited discovery_response from " << conn->remoteIp() << ", dropped");
            return;
        }
        hs.initiatorNonce = it->second.initiatorNonce;
    }

    if (!parseHandshakeIdentity(conn, message, hs)) {
        return;
    }
    hs.responderNonce = readToken(message.data, "nonce", MAX_NONCE_LENGTH);
    const std::string signature = readToken(message.data, "signature", ED25519_SIGNATURE_SIZE * 2);
    if (hs.responderNonce.empty() ||
        !IdentityKey::verify(hs.peerKey, transcript("responder", hs, true), signature)) {
        LOG_WARNING("[Session] Handshake signature of " << hs.peerId << " at " << conn->remoteIp()
                    << " does not verify");
        conn->close("Handshake signature invalid");
        return;
    }

    IdentityKey::Ptr key = identityKey();
    std::string confirmSignature;
    std::string errorMsg = "Identity key not set";
    if (!key || !key->sign(transcript("initiator", hs, true), confirmSignature, errorMsg)) {
        LOG_ERROR("[Session] Cannot sign handshake for " << hs.peerId << ": " << errorMsg);
        conn->close("Handshake signing failed");
        return;
    }

    nlohmann::json data;
    data["signature"] = confirmSignature;
    if (!conn->enqueue(WireMessage::make(MessageType::HandshakeConfirm, localId(), hs.peerId, data), errorMsg)) {
        conn->close("Handshake confirm failed: " + errorMsg);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handshakes.erase(conn->serial());
    }
    completeHandshake(conn, hs);
}

void SessionManager::handleHandshakeConfirm(const PeerConnection::Ptr& conn, const WireMessage& message) {
    PendingHandshake hs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handshakes.find(conn->serial());
        if (it == m_handshakes.end()) {
            LOG_WARNING("[Session] handshake_confirm before discovery from " << conn->remoteIp() << ", dropped");
            return;
        }
        hs = it->second;
        m_handshakes.erase(it);
    }

    if (message.fromUserId != hs.peerId) {
        conn->close("Handshake identity changed");
        return;
    }
    const std::string signature = readToken(message.data, "signature", ED25519_SIGNATURE_SIZE * 2);
    if (!IdentityKey::verify(hs.peerKey, transcript("initiator", hs, false), signature)) {
        LOG_WARNING("[Session] Handshake confirmation of " << hs.peerId << " at " << conn->remoteIp()
                    << " does not verify");
        conn->close("Handshake signature invalid");
        return;
    }

    completeHandshake(conn, hs);
}

void SessionManager::completeHandshake(const PeerConnection::Ptr& conn, const PendingHandshake& hs) {
    const std::string& peerId = hs.peerId;
    if (!registerIdentified(conn, peerId)) {
        return;
    }

    m_store.recordSighting(hs.sighting, wallClockMs());
    std::string pinError;
    if (!m_store.pinIdentityKey(peerId, hs.peerKey, pinError)) {
        LOG_WARNING("[Session] Cannot pin identity key of " << peerId << ": " << pinError);
        conn->close("Identity key mismatch");
        return;
    }

    if (!m_store.setConnectionStatus(peerId, ConnectionStatus::Connected)) {
        LOG_DEBUG("[Session] Status of " << peerId << " left unchanged on connect");
    }
    auto peer = m_store.get(peerId);
    if (peer && peer->isPaired && !m_store.setConnectionStatus(peerId, ConnectionStatus::Paired)) {
        LOG_DEBUG("[Session] Could not restore paired status of " << peerId);
    }

    LOG_INFO("[Session] Session established with " << peerId << " (" << conn->remoteIp()
             << (conn->initiatedLocally() ? ", outbound)" : ", inbound)"));
}

bool SessionManager::registerIdentified(const PeerConnection::Ptr& conn, const std::string& peerId) {
    PeerConnection::Ptr loser;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(peerId);
        if (it == m_connections.end() || it->second->isClosed()) {
            m_connections[peerId] = conn;
        } else if (it->second != conn) {
            const PeerConnection::Ptr& existing = it->second;
            bool newWins = true;
            if (existing->initiatedLocally() != conn->initiatedLocally()) {
                const std::string self = localId();
                const std::string& smaller = std::min(self, peerId);
                const std::string initiator = conn->initiatedLocally() ? self : peerId;
                newWins = (initiator == smaller);
            }
            if (newWins) {
                loser = existing;
                it->second = conn;
            } else {
                loser = conn;
            }
        }
    }

    conn->markIdentified(peerId);

    if (loser) {
        LOG_DEBUG("[Session] Duplicate session with " << peerId << ", closing connection #" << loser->serial());
        loser->close("Duplicate connection");
    }
    return loser != conn;
}

void SessionManager::onClosed(const PeerConnection::Ptr& conn, const std::string& reason) {
    bool wasCurrent = false;
    std::string peerId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_allConnections.remove(conn);
        m_handshakes.erase(conn->serial());
        if (conn->isIdentified()) {
            peerId = conn->peerId();
            auto it = m_connections.find(peerId);
            if (it != m_connections.end() && it->second == conn) {
                m_connections.erase(it);
                wasCurrent = true;
            }
        }
    }
    m_connectionsCv.notify_all();

    {
        std::lock_guard<std::mutex> lock(m_reapMutex);
        m_reapQueue.push_back(conn);
    }
    m_reapCv.notify_all();

    if (!wasCurrent) {
        return;
    }

    LOG_INFO("[Session] Session with " << peerId << " closed: " << reason);
    LogSession("[Session] Session with " + peerId + " closed: " + reason);
    m_store.setOnline(peerId, false);
    m_bus.publish(PeerDisconnected{peerId, reason});
}

}  // namespace P2Lan
