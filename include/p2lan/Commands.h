/**
 * @file Commands.h
 * @brief Commands accepted by P2LanService::execute()
 */

#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace P2Lan {

//=============================================================================
// Networking
//=============================================================================

struct StartNetworking {};
struct StopNetworking {};
struct ManualDiscovery {};

/**
 * @brief Probe the session port range of one address
 */
struct ConnectToAddress {
    std::string ip;
};

//=============================================================================
// Pairing and trust
//=============================================================================

struct SendPairingRequest {
    std::string peerId;
    bool trustUser = false;
    bool saveConnection = false;
};

struct RespondToPairingRequest {
    std::string requestId;
    bool accept = false;
    bool trustUser = false;
    bool saveConnection = false;
};

struct AddTrust {
    std::string peerId;
};

struct RemoveTrust {
    std::string peerId;
};

struct UnpairUser {
    std::string peerId;
};

/**
 * @brief Block (or unblock) a peer; blocking rejects everything it has pending
 */
struct BlockUser {
    std::string peerId;
    bool blocked = true;
};

//=============================================================================
// File transfer
//=============================================================================

struct SendFilesToUser {
    std::string peerId;
    std::vector<std::string> paths;
};

struct RespondToFileTransferRequest {
    std::string requestId;
    bool accept = false;
    std::string rejectMessage;
};

struct CancelTransfer {
    std::string taskId;
};

struct PauseTransfer {
    std::string taskId;
};

struct ResumeTransfer {
    std::string taskId;
};

struct ClearTransfer {
    std::string taskId;
    bool deleteFileIfIncomplete = false;
};

struct ClearAllTransfers {
    bool deleteFiles = false;
};

struct ClearBatch {
    std::string batchId;
    bool deleteFiles = false;
};

//=============================================================================
// Remote control
//=============================================================================

struct SendRemoteControlRequest {
    std::string peerId;
};

struct RespondToRemoteControlRequest {
    std::string requestId;
    bool accept = false;
};

struct SendRemoteControlEvent {
    nlohmann::json event;   ///< {type, x, y, deltaX, deltaY, fingerCount, direction, keyCode, text}
};

struct DisconnectRemoteControl {};

//=============================================================================
// Screen sharing
//=============================================================================

struct SendScreenSharingRequest {
    std::string peerId;
    std::string quality = "auto";
};

struct RespondToScreenSharingRequest {
    std::string requestId;
    bool accept = false;
};

struct StartScreenSharing {
    int screenIndex = 0;
};

struct StopScreenSharing {};
struct StopScreenReceiving {};
struct DisconnectScreenSharing {};

struct SendScreenSharingSignal {
    std::string type;       ///< offer | answer | ice-candidate
    nlohmann::json data;
};

using Command = std::variant<
    StartNetworking,
    StopNetworking,
    ManualDiscovery,
    ConnectToAddress,
    SendPairingRequest,
    RespondToPairingRequest,
    AddTrust,
    RemoveTrust,
    UnpairUser,
    BlockUser,
    SendFilesToUser,
    RespondToFileTransferRequest,
    CancelTransfer,
    PauseTransfer,
    ResumeTransfer,
    ClearTransfer,
    ClearAllTransfers,
    ClearBatch,
    SendRemoteControlRequest,
    RespondToRemoteControlRequest,
    SendRemoteControlEvent,
    DisconnectRemoteControl,
    SendScreenSharingRequest,
    RespondToScreenSharingRequest,
    StartScreenSharing,
    StopScreenSharing,
    StopScreenReceiving,
    DisconnectScreenSharing,
    SendScreenSharingSignal>;

/**
 * @brief Name of the command alternative, for logs
 */
const char* commandName(const Command& command);

}  // namespace P2Lan
