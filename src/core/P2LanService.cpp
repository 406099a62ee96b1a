/**
 * @file P2LanService.cpp
 * @brief Service context implementation
 */

#include "p2lan/P2LanService.h"
#include "p2lan/AppPaths.h"
#include "p2lan/Debug.h"
#include "p2lan/ErrorCodes.h"
#include "p2lan/SessionCrypto.h"
#include "p2lan/ThreadSafeLog.h"

namespace P2Lan {

namespace {
    #define LogService(msg) P2Lan::ThreadSafeLog::log(msg)

    struct CommandNameVisitor {
        const char* operator()(const StartNetworking&) const { return "StartNetworking"; }
        const char* operator()(const StopNetworking&) const { return "StopNetworking"; }
        const char* operator()(const ManualDiscovery&) const { return "ManualDiscovery"; }
        const char* operator()(const ConnectToAddress&) const { return "ConnectToAddress"; }
        const char* operator()(const SendPairingRequest&) const { return "SendPairingRequest"; }
        const char* operator()(const RespondToPairingRequest&) const { return "RespondToPairingRequest"; }
        const char* operator()(const AddTrust&) const { return "AddTrust"; }
        const char* operator()(const RemoveTrust&) const { return "RemoveTrust"; }
        const char* operator()(const UnpairUser&) const { return "UnpairUser"; }
        const char* operator()(const BlockUser&) const { return "BlockUser"; }
        const char* operator()(const SendFilesToUser&) const { return "SendFilesToUser"; }
        const char* operator()(const RespondToFileTransferRequest&) const { return "RespondToFileTransferRequest"; }
        const char* operator()(const CancelTransfer&) const { return "CancelTransfer"; }
        const char* operator()(const PauseTransfer&) const { return "PauseTransfer"; }
        const char* operator()(const ResumeTransfer&) const { return "ResumeTransfer"; }
        const char* operator()(const ClearTransfer&) const { return "ClearTransfer"; }
        const char* operator()(const ClearAllTransfers&) const { return "ClearAllTransfers"; }
        const char* operator()(const ClearBatch&) const { return "ClearBatch"; }
        const char* operator()(const SendRemoteControlRequest&) const { return "SendRemoteControlRequest"; }
        const char* operator()(const RespondToRemoteControlRequest&) const { return "RespondToRemoteControlRequest"; }
        const char* operator()(const SendRemoteControlEvent&) const { return "SendRemoteControlEvent"; }
        const char* operator()(const DisconnectRemoteControl&) const { return "DisconnectRemoteControl"; }
        const char* operator()(const SendScreenSharingRequest&) const { return "SendScreenSharingRequest"; }
        const char* operator()(const RespondToScreenSharingRequest&) const { return "RespondToScreenSharingRequest"; }
        const char* operator()(const StartScreenSharing&) const { return "StartScreenSharing"; }
        const char* operator()(const StopScreenSharing&) const { return "StopScreenSharing"; }
        const char* operator()(const StopScreenReceiving&) const { return "StopScreenReceiving"; }
        const char* operator()(const DisconnectScreenSharing&) const { return "DisconnectScreenSharing"; }
        const char* operator()(const SendScreenSharingSignal&) const { return "SendScreenSharingSignal"; }
    };

    constexpr const char* BLOCKED_REASON = "User blocked";

    int64_t elapsedMs(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since).count();
    }
}

const char* commandName(const Command& command) {
    return std::visit(CommandNameVisitor{}, command);
}

//=============================================================================
// Construction
//=============================================================================

P2LanService::P2LanService(ServiceOptions options)
    : m_options(std::move(options))
    , m_ownedRecordStore(m_options.recordStore
                             ? nullptr
                             : std::make_unique<JsonFileRecordStore>(m_options.dataDir.empty()
                                                                         ? AppPaths::dataDir()
                                                                         : m_options.dataDir))
    , m_ownedProbe(m_options.securityProbe ? nullptr : std::make_unique<InterfaceSecurityProbe>())
    , m_recordStore(m_options.recordStore ? m_options.recordStore : m_ownedRecordStore.get())
    , m_probe(m_options.securityProbe ? m_options.securityProbe : m_ownedProbe.get())
    , m_settings(m_options.configPath)
    , m_store(*m_recordStore, &m_bus)
    , m_sessions(m_store, m_bus, m_dispatcher)
    , m_discovery(m_store)
    , m_pairing(m_store, m_sessions, m_bus, m_timers, m_options.pairingTimeouts)
    , m_transfers(m_store, m_sessions, m_bus, m_timers, m_options.transferTimeouts)
    , m_remoteControl(m_store, m_sessions, m_bus, m_timers, m_options.relayTimeouts)
    , m_screenSharing(m_store, m_sessions, m_bus, m_timers, m_options.relayTimeouts)
{
    m_sessions.setPortRange(m_options.firstPort, m_options.lastPort);
    m_discovery.setPortRange(m_options.firstPort, m_options.lastPort);

    m_pairing.registerHandlers(m_dispatcher);
    m_transfers.registerHandlers(m_dispatcher);
    m_remoteControl.registerHandlers(m_dispatcher);
    m_screenSharing.registerHandlers(m_dispatcher);
}

P2LanService::~P2LanService() {
    shutdown();
}

bool P2LanService::initialize(std::string& errorMsg) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_initialized.load()) {
        return true;
    }

    if (m_options.initializeTraceLog) {
        const auto logPath = m_options.dataDir.empty()
            ? AppPaths::traceLogPath()
            : m_options.dataDir / "logs" / "p2lan_trace.txt";
        ThreadSafeLog::initialize(logPath);
    }
    LogService("=== P2LanService::initialize START ===");

    if (!m_settings.load(errorMsg)) {
        errorMsg = "Failed to load settings: " + errorMsg;
        LOG_ERROR("[Service] " << errorMsg);
        return false;
    }
    if (!m_store.load(errorMsg)) {
        errorMsg = "Failed to load peer store: " + errorMsg;
        LOG_ERROR("[Service] " << errorMsg);
        return false;
    }

    std::unique_ptr<IdentityKey> identityKey = IdentityKey::fromPrivateHex(m_settings.settings().identityKey, errorMsg);
    if (!identityKey) {
        errorMsg = "Failed to load identity key: " + errorMsg;
        LOG_ERROR("[Service] " << errorMsg);
        return false;
    }
    IdentityKey::Ptr sharedKey(std::move(identityKey));
    m_sessions.setIdentityKey(sharedKey);
    m_transfers.setIdentityKey(sharedKey);

    applySettings(m_settings.settings());

    if (!m_timers.start()) {
        errorMsg = "Failed to start timer queue";
        LOG_ERROR("[Service] " << errorMsg);
        return false;
    }
    if (!m_transfers.start()) {
        m_timers.stop();
        errorMsg = "Failed to start transfer engine";
        LOG_ERROR("[Service] " << errorMsg);
        return false;
    }

    m_subscription = m_bus.subscribe([this](const ServiceEvent& event) { onEvent(event); });
    m_initialized.store(true);

    m_linkUp = m_probe->check().hasConnection;
    m_polledConnection.store(m_linkUp);
    scheduleConnectivityPoll();

    LogService("[Service] Initialized as " + m_settings.identity().id);
    LogService("=== P2LanService::initialize END ===");
    return true;
}

void P2LanService::shutdown() {
    {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (!m_initialized.load()) {
            return;
        }
        cancelRecoveryLocked();
        m_resumeOnConnectivity = false;
    }

    const auto stopBegin = std::chrono::steady_clock::now();
    LogService("=== P2LanService::shutdown START ===");

    // Joined without the lifecycle lock: a recovery callback may be waiting for it
    m_timers.stop();

    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (m_networkState.load() == NetworkState::Enabled) {
        stopNetworkingLocked(NetworkState::Disabled);
    }

    const auto transferStart = std::chrono::steady_clock::now();
    m_transfers.stop();
    LogService("  shutdown: transfer engine stopped in " + std::to_string(elapsedMs(transferStart)) + "ms");

    m_pairing.clear();
    m_remoteControl.clear();
    m_screenSharing.clear();

    m_bus.unsubscribe(m_subscription);
    m_subscription = 0;
    m_initialized.store(false);

    LogService("  shutdown: total " + std::to_string(elapsedMs(stopBegin)) + "ms");
    LogService("=== P2LanService::shutdown END ===");
}

//=============================================================================
// Command dispatch
//=============================================================================

CommandResult P2LanService::execute(const Command& command) {
    if (!m_initialized.load()) {
        return CommandResult::fail(ErrorCodes::NETWORK_NOT_STARTED, "Service is not initialized");
    }
    LOG_DEBUG("[Service] Executing " << commandName(command));

    CommandResult result = std::visit([this](const auto& cmd) { return handle(cmd); }, command);
    if (!result) {
        LOG_INFO("[Service] " << commandName(command) << " failed: " << result.errorCode
                 << " " << result.message);
    }
    return result;
}

CommandResult P2LanService::requireNetworking() const {
    if (m_networkState.load() != NetworkState::Enabled) {
        return CommandResult::fail(ErrorCodes::NETWORK_NOT_STARTED, "Networking is not enabled");
    }
    return CommandResult::ok();
}

//=============================================================================
// Networking
//=============================================================================

CommandResult P2LanService::handle(const StartNetworking&) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    // An explicit start supersedes a pending recovery
    cancelRecoveryLocked();
    m_resumeOnConnectivity = false;
    return startNetworkingLocked();
}

CommandResult P2LanService::handle(const StopNetworking&) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    cancelRecoveryLocked();
    m_resumeOnConnectivity = false;

    const NetworkState state = m_networkState.load();
    if (state == NetworkState::WaitingForConnectivity) {
        setNetworkState(NetworkState::Disabled, "Stopped by user");
        return CommandResult::ok();
    }
    if (state != NetworkState::Enabled) {
        return CommandResult::ok("Networking is not running");
    }
    stopNetworkingLocked(NetworkState::Disabled);
    return CommandResult::ok();
}

CommandResult P2LanService::startNetworkingLocked(NetworkState failureState) {
    if (m_networkState.load() == NetworkState::Enabled) {
        return CommandResult::ok("Networking already enabled");
    }

    LogService("=== P2LanService::startNetworking START ===");
    setNetworkState(NetworkState::Enabling);

    const NetworkInfo info = m_probe->check();
    if (!info.hasConnection) {
        setNetworkState(failureState, "No network connection");
        return CommandResult::fail(ErrorCodes::NETWORK_NO_CONNECTIVITY, "No network connection");
    }

    const bool allowUnverified = m_settings.settings().allowUnverifiedNetworks;
    const bool acceptable = info.securityLevel == NetworkSecurityLevel::Secure
        || (info.securityLevel == NetworkSecurityLevel::Unknown && allowUnverified);
    if (!acceptable) {
        const std::string detail = "Network " + info.interfaceName + " is "
            + securityLevelToString(info.securityLevel);
        LOG_WARNING("[Service] Refusing to enable networking: " << detail);
        setNetworkState(failureState, detail);
        return CommandResult::fail(ErrorCodes::NETWORK_INSECURE, detail);
    }

    const LocalIdentity identity = m_settings.identity();
    m_sessions.setIdentity(identity);
    m_discovery.setIdentity(identity);

    std::string errorMsg;
    if (!m_sessions.start(errorMsg)) {
        setNetworkState(failureState, errorMsg);
        return CommandResult::fail(ErrorCodes::NETWORK_START_FAILED,
                                   "Failed to start session listener: " + errorMsg);
    }

    // Advertise the session port in beacons before discovery starts
    m_discovery.setTcpPort(m_sessions.listenPort());
    if (!m_discovery.enable(errorMsg)) {
        m_sessions.stop();
        setNetworkState(failureState, errorMsg);
        return CommandResult::fail(ErrorCodes::NETWORK_START_FAILED,
                                   "Failed to start discovery: " + errorMsg);
    }

    setNetworkState(NetworkState::Enabled, info.interfaceName);
    LogService("[Service] Networking enabled on " + info.interfaceName + " (" + info.ipAddress
               + "), session port " + std::to_string(m_sessions.listenPort())
               + ", discovery port " + std::to_string(m_discovery.boundPort()));
    LogService("=== P2LanService::startNetworking END ===");
    return CommandResult::ok();
}

void P2LanService::stopNetworkingLocked(NetworkState finalState) {
    const auto stopBegin = std::chrono::steady_clock::now();
    LogService("=== P2LanService::stopNetworking START ===");
    setNetworkState(NetworkState::Disabling);

    m_transfers.cancelAllTransfers();
    m_remoteControl.clear();
    m_screenSharing.clear();
    m_pairing.clear();

    const auto discoveryStart = std::chrono::steady_clock::now();
    m_discovery.disable();
    LogService("  stopNetworking: discovery stopped in " + std::to_string(elapsedMs(discoveryStart)) + "ms");

    const auto sessionStart = std::chrono::steady_clock::now();
    m_sessions.stop();
    LogService("  stopNetworking: sessions stopped in " + std::to_string(elapsedMs(sessionStart)) + "ms");

    m_store.markAllOffline();
    setNetworkState(finalState);

    LogService("  stopNetworking: total " + std::to_string(elapsedMs(stopBegin)) + "ms");
    LogService("=== P2LanService::stopNetworking END ===");
}

void P2LanService::onConnectivityChanged(bool hasConnection) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (!m_initialized.load()) {
        return;
    }
    m_linkUp = hasConnection;

    if (!hasConnection) {
        cancelRecoveryLocked();
        m_recoveryAttempts = 0;
        if (m_networkState.load() == NetworkState::Enabled) {
            LogService("[Service] Connectivity lost; stopping networking until it returns");
            stopNetworkingLocked(NetworkState::WaitingForConnectivity);
            m_resumeOnConnectivity = true;
        }
        return;
    }

    if (!m_resumeOnConnectivity || m_recoveryTimer != 0) {
        return;
    }
    LogService("[Service] Connectivity restored; re-enabling in "
               + std::to_string(m_options.connectivityRecoveryDelay.count()) + "ms");
    m_recoveryAttempts = 0;
    scheduleRecoveryLocked();
}

void P2LanService::scheduleRecoveryLocked() {
    const uint64_t generation = ++m_recoveryGeneration;
    m_recoveryTimer = m_timers.scheduleAfter(m_options.connectivityRecoveryDelay,
        [this, generation]() { recoverNetworking(generation); }, "connectivity-recovery");
    if (m_recoveryTimer == 0) {
        LOG_WARNING("[Service] Timer queue not running; networking stays disabled");
    }
}

void P2LanService::cancelRecoveryLocked() {
    ++m_recoveryGeneration;
    if (m_recoveryTimer != 0) {
        m_timers.cancel(m_recoveryTimer);
        m_recoveryTimer = 0;
    }
}

void P2LanService::recoverNetworking(uint64_t generation) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (generation != m_recoveryGeneration) {
        return;
    }
    m_recoveryTimer = 0;
    if (!m_resumeOnConnectivity || m_networkState.load() != NetworkState::WaitingForConnectivity) {
        return;
    }
    if (!m_linkUp) {
        LOG_DEBUG("[Service] Connectivity dropped again before recovery; waiting");
        return;
    }

    ++m_recoveryAttempts;
    CommandResult result = startNetworkingLocked(NetworkState::WaitingForConnectivity);
    if (result) {
        m_resumeOnConnectivity = false;
        m_recoveryAttempts = 0;
        return;
    }

    LOG_WARNING("[Service] Networking recovery attempt " << m_recoveryAttempts
                << " failed: " << result.message);
    m_bus.publish(ServiceError{"Service", result.errorCode, result.message});
    if (m_recoveryAttempts < CONNECTIVITY_RECOVERY_MAX_ATTEMPTS) {
        scheduleRecoveryLocked();
    } else {
        LogService("[Service] Giving up on recovery until connectivity changes again");
    }
}

void P2LanService::scheduleConnectivityPoll() {
    if (m_options.connectivityPollInterval.count() <= 0) {
        return;
    }
    if (m_timers.scheduleAfter(m_options.connectivityPollInterval,
                               [this]() { pollConnectivity(); }, "connectivity-poll") == 0) {
        LOG_DEBUG("[Service] Connectivity poll not scheduled; timer queue stopped");
    }
}

void P2LanService::pollConnectivity() {
    const bool connected = m_probe->check().hasConnection;
    if (m_polledConnection.exchange(connected) != connected) {
        LogService(std::string("[Service] Interface poll: connectivity ") + (connected ? "up" : "down"));
        onConnectivityChanged(connected);
    }
    scheduleConnectivityPoll();
}

CommandResult P2LanService::handle(const ManualDiscovery&) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    std::string errorMsg;
    if (!m_discovery.manualScan(errorMsg)) {
        return CommandResult::fail(ErrorCodes::SEND_FAILED, "Discovery scan failed: " + errorMsg);
    }
    return CommandResult::ok();
}

CommandResult P2LanService::handle(const ConnectToAddress& cmd) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    if (cmd.ip.empty()) {
        return CommandResult::fail(ErrorCodes::INVALID_ARGUMENT, "Address is empty");
    }
    std::string peerId;
    std::string errorMsg;
    if (!m_sessions.connectToAddress(cmd.ip, peerId, errorMsg)) {
        return CommandResult::fail(ErrorCodes::NETWORK_CONNECT_FAILED, errorMsg);
    }
    return CommandResult::ok(peerId);
}

//=============================================================================
// Pairing and trust
//=============================================================================

CommandResult P2LanService::handle(const SendPairingRequest& cmd) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    return m_pairing.sendPairingRequest(cmd.peerId, cmd.trustUser, cmd.saveConnection);
}

CommandResult P2LanService::handle(const RespondToPairingRequest& cmd) {
    return m_pairing.respondToPairingRequest(cmd.requestId, cmd.accept, cmd.trustUser, cmd.saveConnection);
}

CommandResult P2LanService::handle(const AddTrust& cmd) {
    return m_pairing.addTrust(cmd.peerId);
}

CommandResult P2LanService::handle(const RemoveTrust& cmd) {
    return m_pairing.removeTrust(cmd.peerId);
}

CommandResult P2LanService::handle(const UnpairUser& cmd) {
    return m_pairing.unpair(cmd.peerId);
}

CommandResult P2LanService::handle(const BlockUser& cmd) {
    if (!m_store.has(cmd.peerId)) {
        return CommandResult::fail(ErrorCodes::PEER_UNKNOWN, "Unknown peer: " + cmd.peerId);
    }
    std::string errorMsg;
    if (!m_store.setBlocked(cmd.peerId, cmd.blocked, errorMsg)) {
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED, "Failed to update block list: " + errorMsg);
    }
    if (!cmd.blocked) {
        LogService("[Service] Unblocked " + cmd.peerId);
        return CommandResult::ok();
    }

    // Blocked dominates everything the peer still has in flight
    size_t rejected = m_pairing.rejectPendingFrom(cmd.peerId, "blocked");
    rejected += m_transfers.rejectPendingFrom(cmd.peerId, RejectReason::PeerBlocked, BLOCKED_REASON);
    rejected += m_remoteControl.rejectPendingFrom(cmd.peerId, BLOCKED_REASON);
    rejected += m_screenSharing.rejectPendingFrom(cmd.peerId, BLOCKED_REASON);

    if (m_sessions.isConnected(cmd.peerId) && !m_sessions.disconnectPeer(cmd.peerId, "Peer blocked")) {
        LOG_WARNING("[Service] Session with blocked peer " << cmd.peerId << " was already closed");
    }
    LogService("[Service] Blocked " + cmd.peerId + ", rejected " + std::to_string(rejected)
               + " pending request(s)");
    return CommandResult::ok();
}

//=============================================================================
// File transfer
//=============================================================================

CommandResult P2LanService::handle(const SendFilesToUser& cmd) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    return m_transfers.sendFiles(cmd.paths, cmd.peerId);
}

CommandResult P2LanService::handle(const RespondToFileTransferRequest& cmd) {
    return m_transfers.respondToFileTransferRequest(cmd.requestId, cmd.accept, cmd.rejectMessage);
}

CommandResult P2LanService::handle(const CancelTransfer& cmd) {
    return m_transfers.cancelTransfer(cmd.taskId);
}

CommandResult P2LanService::handle(const PauseTransfer& cmd) {
    return m_transfers.pauseTransfer(cmd.taskId);
}

CommandResult P2LanService::handle(const ResumeTransfer& cmd) {
    return m_transfers.resumeTransfer(cmd.taskId);
}

CommandResult P2LanService::handle(const ClearTransfer& cmd) {
    return m_transfers.clearTransfer(cmd.taskId, cmd.deleteFileIfIncomplete);
}

CommandResult P2LanService::handle(const ClearAllTransfers& cmd) {
    return m_transfers.clearAllTransfers(cmd.deleteFiles);
}

CommandResult P2LanService::handle(const ClearBatch& cmd) {
    return m_transfers.clearBatch(cmd.batchId, cmd.deleteFiles);
}

//=============================================================================
// Remote control
//=============================================================================

CommandResult P2LanService::handle(const SendRemoteControlRequest& cmd) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    return m_remoteControl.sendRemoteControlRequest(cmd.peerId);
}

CommandResult P2LanService::handle(const RespondToRemoteControlRequest& cmd) {
    return m_remoteControl.respondToRemoteControlRequest(cmd.requestId, cmd.accept);
}

CommandResult P2LanService::handle(const SendRemoteControlEvent& cmd) {
    return m_remoteControl.sendEvent(cmd.event);
}

CommandResult P2LanService::handle(const DisconnectRemoteControl&) {
    return m_remoteControl.disconnect();
}

//=============================================================================
// Screen sharing
//=============================================================================

CommandResult P2LanService::handle(const SendScreenSharingRequest& cmd) {
    CommandResult ready = requireNetworking();
    if (!ready) {
        return ready;
    }
    return m_screenSharing.sendScreenSharingRequest(cmd.peerId, cmd.quality);
}

CommandResult P2LanService::handle(const RespondToScreenSharingRequest& cmd) {
    return m_screenSharing.respondToScreenSharingRequest(cmd.requestId, cmd.accept);
}

CommandResult P2LanService::handle(const StartScreenSharing& cmd) {
    return m_screenSharing.startSharing(cmd.screenIndex);
}

CommandResult P2LanService::handle(const StopScreenSharing&) {
    return m_screenSharing.stopSharing();
}

CommandResult P2LanService::handle(const StopScreenReceiving&) {
    return m_screenSharing.stopReceiving();
}

CommandResult P2LanService::handle(const DisconnectScreenSharing&) {
    return m_screenSharing.disconnect();
}

CommandResult P2LanService::handle(const SendScreenSharingSignal& cmd) {
    return m_screenSharing.sendSignal(cmd.type, cmd.data);
}

//=============================================================================
// Settings
//=============================================================================

CommandResult P2LanService::updateSettings(const AppSettings& settings) {
    std::string errorMsg;
    if (!m_settings.update(settings, errorMsg)) {
        return CommandResult::fail(ErrorCodes::PERSISTENCE_FAILED, "Failed to save settings: " + errorMsg);
    }
    applySettings(m_settings.settings());
    return CommandResult::ok();
}

void P2LanService::applySettings(const AppSettings& settings) {
    const LocalIdentity identity = m_settings.identity();
    m_sessions.setIdentity(identity);
    m_discovery.setIdentity(identity);
    m_pairing.setIdentity(identity);
    m_transfers.setIdentity(identity);
    m_remoteControl.setIdentity(identity);
    m_screenSharing.setIdentity(identity);

    m_transfers.setSettings(settings.transfer);
    m_remoteControl.setAutoAcceptTrusted(settings.autoAcceptTrustedRemoteControl);
    m_screenSharing.setAutoAcceptTrusted(settings.autoAcceptTrustedScreenSharing);
}

//=============================================================================
// Events
//=============================================================================

void P2LanService::setNetworkState(NetworkState state, const std::string& detail) {
    if (m_networkState.exchange(state) == state) {
        return;
    }
    LOG_INFO("[Service] Network state: " << networkStateToString(state)
             << (detail.empty() ? "" : " (" + detail + ")"));
    m_bus.publish(NetworkStateChanged{state, detail});
}

void P2LanService::onEvent(const ServiceEvent& event) {
    if (const auto* disconnected = std::get_if<PeerDisconnected>(&event)) {
        m_pairing.onPeerDisconnected(disconnected->peerId);
        m_transfers.onPeerDisconnected(disconnected->peerId);
        m_remoteControl.onPeerDisconnected(disconnected->peerId);
        m_screenSharing.onPeerDisconnected(disconnected->peerId);
    }
}

//=============================================================================
// Queries
//=============================================================================

std::vector<PeerInfo> P2LanService::peers(PeerFilter filter) const {
    return m_store.list(filter);
}

std::optional<PeerInfo> P2LanService::peer(const std::string& peerId) const {
    return m_store.get(peerId);
}

std::vector<PairingRequestInfo> P2LanService::pendingPairingRequests() const {
    return m_pairing.pendingRequests();
}

std::vector<FileTransferRequestInfo> P2LanService::pendingFileTransferRequests() const {
    return m_transfers.pendingRequests();
}

std::vector<RelayRequestInfo> P2LanService::pendingRemoteControlRequests() const {
    return m_remoteControl.pendingRequests();
}

std::vector<RelayRequestInfo> P2LanService::pendingScreenSharingRequests() const {
    return m_screenSharing.pendingRequests();
}

std::vector<DataTransferTask> P2LanService::transfers() const {
    return m_transfers.transfers();
}

std::optional<RelaySession> P2LanService::remoteControlSession() const {
    return m_remoteControl.activeSession();
}

std::optional<RelaySession> P2LanService::screenSharingSession() const {
    return m_screenSharing.activeSession();
}

LocalIdentity P2LanService::localIdentity() const {
    return m_settings.identity();
}

AppSettings P2LanService::settings() const {
    return m_settings.settings();
}

uint16_t P2LanService::sessionPort() const {
    return m_sessions.listenPort();
}

}  // namespace P2Lan
