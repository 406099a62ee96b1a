/**
 * @file ServiceEvents.h
 * @brief Typed events published on the EventBus
 */

#pragma once

#include "PeerInfo.h"
#include "TransferTask.h"

#include <cstdint>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @brief Networking lifecycle as seen by the presentation layer
 */
enum class NetworkState {
    Disabled,
    Enabling,
    Enabled,
    Disabling,
    WaitingForConnectivity   ///< Stopped by connectivity loss, re-enables on return
};

std::string networkStateToString(NetworkState state);

//=============================================================================
// Peers
//=============================================================================

struct PeerUpdated {
    PeerInfo peer;
};

struct PeerRemoved {
    std::string peerId;
};

struct PeerDisconnected {
    std::string peerId;
    std::string reason;
};

//=============================================================================
// Pairing
//=============================================================================

struct PairingRequestReceived {
    std::string requestId;
    std::string peerId;
    std::string displayName;
    bool wantsTrust = false;
    bool wantsSave = false;
};

struct PairingRequestExpired {
    std::string requestId;
    std::string peerId;
    bool outgoing = false;
};

struct PairingCompleted {
    std::string peerId;
    bool trusted = false;
    bool saved = false;
};

struct PairingRejected {
    std::string requestId;
    std::string peerId;
    std::string reason;
    bool byRemote = false;
};

//=============================================================================
// File transfer
//=============================================================================

struct FileTransferRequestReceived {
    std::string requestId;
    std::string batchId;
    std::string peerId;
    std::string senderName;
    size_t fileCount = 0;
    int64_t totalSize = 0;
};

struct FileTransferRequestExpired {
    std::string requestId;
    std::string peerId;
};

struct TransferStatusChanged {
    std::string taskId;
    std::string peerId;
    TransferStatus status = TransferStatus::Pending;
    std::string errorMessage;
};

struct TransferProgress {
    std::string taskId;
    int64_t transferredBytes = 0;
    int64_t totalBytes = 0;
};

struct TransferRemoved {
    std::string taskId;
};

//=============================================================================
// Remote control
//=============================================================================

struct RemoteControlRequestReceived {
    std::string requestId;
    std::string peerId;
    std::string peerName;
};

struct RemoteControlRequestRejected {
    std::string requestId;
    std::string peerId;
    std::string reason;
};

struct RemoteControlSessionStarted {
    std::string sessionId;
    std::string peerId;
    bool isController = false;
};

struct RemoteControlSessionEnded {
    std::string sessionId;
    std::string peerId;
    std::string reason;
};

struct RemoteControlEventReceived {
    std::string sessionId;
    std::string peerId;
    nlohmann::json event;
};

//=============================================================================
// Screen sharing
//=============================================================================

struct ScreenSharingRequestReceived {
    std::string requestId;
    std::string peerId;
    std::string peerName;
    std::string quality;
};

struct ScreenSharingRequestRejected {
    std::string requestId;
    std::string peerId;
    std::string reason;
};

struct ScreenSharingSessionStarted {
    std::string sessionId;
    std::string peerId;
    bool isSharer = false;
};

struct ScreenSharingSessionEnded {
    std::string sessionId;
    std::string peerId;
    std::string reason;
};

struct ScreenSharingSignalReceived {
    std::string sessionId;
    std::string peerId;
    std::string signalType;
    nlohmann::json data;
};

//=============================================================================
// Service
//=============================================================================

struct NetworkStateChanged {
    NetworkState state = NetworkState::Disabled;
    std::string detail;
};

struct ServiceError {
    std::string component;
    std::string errorCode;
    std::string message;
};

using ServiceEvent = std::variant<
    PeerUpdated,
    PeerRemoved,
    PeerDisconnected,
    PairingRequestReceived,
    PairingRequestExpired,
    PairingCompleted,
    PairingRejected,
    FileTransferRequestReceived,
    FileTransferRequestExpired,
    TransferStatusChanged,
    TransferProgress,
    TransferRemoved,
    RemoteControlRequestReceived,
    RemoteControlRequestRejected,
    RemoteControlSessionStarted,
    RemoteControlSessionEnded,
    RemoteControlEventReceived,
    ScreenSharingRequestReceived,
    ScreenSharingRequestRejected,
    ScreenSharingSessionStarted,
    ScreenSharingSessionEnded,
    ScreenSharingSignalReceived,
    NetworkStateChanged,
    ServiceError>;

/**
 * @brief Short name of the event alternative, for logs
 */
const char* eventName(const ServiceEvent& event);

}  // namespace P2Lan
