/**
 * @file P2LanService.h
 * @brief Service context: owns every component and executes commands
 */

#pragma once

#include "CommandResult.h"
#include "Commands.h"
#include "DiscoveryService.h"
#include "EventBus.h"
#include "MessageDispatcher.h"
#include "NetworkSecurityProbe.h"
#include "PairingManager.h"
#include "RecordStore.h"
#include "RemoteControlRelay.h"
#include "ScreenSharingRelay.h"
#include "SessionManager.h"
#include "SettingsManager.h"
#include "TimerQueue.h"
#include "TransferEngine.h"
#include "TrustStore.h"
#include "config.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace P2Lan {

/**
 * @brief Construction-time options
 *
 * Null collaborators are replaced with the production implementations:
 * a JsonFileRecordStore under the data directory and an
 * InterfaceSecurityProbe.
 */
struct ServiceOptions {
    std::filesystem::path configPath;              ///< Empty = AppPaths::configJsonPath()
    std::filesystem::path dataDir;                 ///< Empty = AppPaths::dataDir()
    RecordStore* recordStore = nullptr;            ///< Not owned
    NetworkSecurityProbe* securityProbe = nullptr; ///< Not owned
    bool initializeTraceLog = true;

    uint16_t firstPort = P2P_BASE_PORT;
    uint16_t lastPort = P2P_MAX_PORT;

    PairingTimeouts pairingTimeouts;
    TransferTimeouts transferTimeouts;
    RelayTimeouts relayTimeouts;
    std::chrono::milliseconds connectivityRecoveryDelay{CONNECTIVITY_RECOVERY_DELAY_MS};
    std::chrono::milliseconds connectivityPollInterval{CONNECTIVITY_POLL_INTERVAL_MS};  ///< 0 = no polling
};

/**
 * @class P2LanService
 * @brief The one object the presentation layer talks to
 *
 * Architecture:
 * - SessionManager owns the sockets and feeds a MessageDispatcher; the
 *   pairing, transfer and relay components register their message types
 *   on it and send through the PeerMessenger interface only
 * - Every state change reaches observers through the EventBus
 * - PeerDisconnected events are forwarded to every component that keeps
 *   per-peer state
 *
 * Thread Safety:
 * - execute() and the queries are thread-safe
 * - initialize() and shutdown() must not be called concurrently
 */
class P2LanService {
public:
    explicit P2LanService(ServiceOptions options = ServiceOptions());
    ~P2LanService();

    P2LanService(const P2LanService&) = delete;
    P2LanService& operator=(const P2LanService&) = delete;

    /**
     * @brief Load settings and the peer store, start logging and timers
     *
     * All-or-nothing: on failure nothing keeps running.
     */
    bool initialize(std::string& errorMsg);

    /**
     * @brief Stop networking and every background thread
     */
    void shutdown();

    bool isInitialized() const { return m_initialized.load(); }

    CommandResult execute(const Command& command);

    /**
     * @brief Connectivity monitor input
     *
     * Loss while enabled stops networking temporarily; the return of
     * connectivity re-enables it after the recovery delay. A restart that
     * fails is retried up to CONNECTIVITY_RECOVERY_MAX_ATTEMPTS times and
     * the service keeps waiting in the meantime. Called by the built-in
     * interface poll, or directly by an embedder with its own monitor.
     */
    void onConnectivityChanged(bool hasConnection);

    /**
     * @brief Replace the settings, save them and apply them live
     */
    CommandResult updateSettings(const AppSettings& settings);

    //=========================================================================
    // Queries
    //=========================================================================

    std::vector<PeerInfo> peers(PeerFilter filter = PeerFilter::All) const;
    std::optional<PeerInfo> peer(const std::string& peerId) const;
    std::vector<PairingRequestInfo> pendingPairingRequests() const;
    std::vector<FileTransferRequestInfo> pendingFileTransferRequests() const;
    std::vector<RelayRequestInfo> pendingRemoteControlRequests() const;
    std::vector<RelayRequestInfo> pendingScreenSharingRequests() const;
    std::vector<DataTransferTask> transfers() const;
    std::optional<RelaySession> remoteControlSession() const;
    std::optional<RelaySession> screenSharingSession() const;
    NetworkState networkState() const { return m_networkState.load(); }
    LocalIdentity localIdentity() const;
    AppSettings settings() const;
    uint16_t sessionPort() const;

    EventBus& events() { return m_bus; }

private:
    // Networking
    CommandResult handle(const StartNetworking& cmd);
    CommandResult handle(const StopNetworking& cmd);
    CommandResult handle(const ManualDiscovery& cmd);
    CommandResult handle(const ConnectToAddress& cmd);

    // Pairing and trust
    CommandResult handle(const SendPairingRequest& cmd);
    CommandResult handle(const RespondToPairingRequest& cmd);
    CommandResult handle(const AddTrust& cmd);
    CommandResult handle(const RemoveTrust& cmd);
    CommandResult handle(const UnpairUser& cmd);
    CommandResult handle(const BlockUser& cmd);

    // File transfer
    CommandResult handle(const SendFilesToUser& cmd);
    CommandResult handle(const RespondToFileTransferRequest& cmd);
    CommandResult handle(const CancelTransfer& cmd);
    CommandResult handle(const PauseTransfer& cmd);
    CommandResult handle(const ResumeTransfer& cmd);
    CommandResult handle(const ClearTransfer& cmd);
    CommandResult handle(const ClearAllTransfers& cmd);
    CommandResult handle(const ClearBatch& cmd);

    // Remote control
    CommandResult handle(const SendRemoteControlRequest& cmd);
    CommandResult handle(const RespondToRemoteControlRequest& cmd);
    CommandResult handle(const SendRemoteControlEvent& cmd);
    CommandResult handle(const DisconnectRemoteControl& cmd);

    // Screen sharing
    CommandResult handle(const SendScreenSharingRequest& cmd);
    CommandResult handle(const RespondToScreenSharingRequest& cmd);
    CommandResult handle(const StartScreenSharing& cmd);
    CommandResult handle(const StopScreenSharing& cmd);
    CommandResult handle(const StopScreenReceiving& cmd);
    CommandResult handle(const DisconnectScreenSharing& cmd);
    CommandResult handle(const SendScreenSharingSignal& cmd);

    CommandResult startNetworkingLocked(NetworkState failureState = NetworkState::Disabled);
    void stopNetworkingLocked(NetworkState finalState);
    void scheduleRecoveryLocked();
    void cancelRecoveryLocked();
    void recoverNetworking(uint64_t generation);
    void scheduleConnectivityPoll();
    void pollConnectivity();
    CommandResult requireNetworking() const;

    void applySettings(const AppSettings& settings);
    void setNetworkState(NetworkState state, const std::string& detail = {});
    void onEvent(const ServiceEvent& event);

    ServiceOptions m_options;

    // Owned defaults for null collaborators
    std::unique_ptr<RecordStore> m_ownedRecordStore;
    std::unique_ptr<NetworkSecurityProbe> m_ownedProbe;
    RecordStore* m_recordStore;
    NetworkSecurityProbe* m_probe;

    // Declaration order is construction order
    EventBus m_bus;
    MessageDispatcher m_dispatcher;
    SettingsManager m_settings;
    TrustStore m_store;
    TimerQueue m_timers;
    SessionManager m_sessions;
    DiscoveryService m_discovery;
    PairingManager m_pairing;
    TransferEngine m_transfers;
    RemoteControlRelay m_remoteControl;
    ScreenSharingRelay m_screenSharing;

    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_initialized{false};
    std::atomic<NetworkState> m_networkState{NetworkState::Disabled};
    bool m_resumeOnConnectivity = false;     ///< Set from a loss while enabled until a restart succeeds
    bool m_linkUp = true;                    ///< Last reported connectivity
    uint64_t m_recoveryGeneration = 0;       ///< Bumped to disown a recovery callback already in flight
    uint32_t m_recoveryAttempts = 0;
    TimerQueue::TimerId m_recoveryTimer = 0;
    std::atomic<bool> m_polledConnection{true};
    EventBus::SubscriptionId m_subscription = 0;
};

}  // namespace P2Lan
