/**
 * @file WireMessage.h
 * @brief Typed message envelope carried over peer sessions
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @brief Message type tags
 *
 * Unknown is produced by the decoder for tags this build does not know;
 * the original tag is kept in WireMessage::rawType.
 */
enum class MessageType {
    // Session handshake and discovery
    Discovery,
    DiscoveryResponse,
    DiscoveryScanRequest,
    HandshakeConfirm,

    // Pairing and trust
    PairingRequest,
    PairingResponse,
    TrustRequest,
    TrustResponse,

    // Session housekeeping
    Heartbeat,
    Disconnect,

    // File transfer
    FileTransferRequest,
    FileTransferResponse,
    DataChunk,
    DataChunkAck,
    DataTransferComplete,
    DataTransferCompleteAck,
    DataTransferCancel,
    KeyExchangeRequest,
    KeyExchangeResponse,
    EncryptedDataChunk,

    // Remote control
    RemoteControlRequest,
    RemoteControlResponse,
    RemoteControlEvent,
    RemoteControlDisconnect,

    // Screen sharing
    ScreenSharingRequest,
    ScreenSharingResponse,
    ScreenSharingData,
    ScreenSharingDisconnect,

    Unknown
};

const char* messageTypeToString(MessageType type);
MessageType messageTypeFromString(const std::string& tag);

/**
 * @brief Envelope `{type, fromUserId, toUserId, data}`
 */
struct WireMessage {
    MessageType type = MessageType::Unknown;
    std::string rawType;       ///< Tag exactly as received (or written)
    std::string fromUserId;
    std::string toUserId;
    nlohmann::json data = nlohmann::json::object();

    static WireMessage make(MessageType type,
                            const std::string& fromUserId,
                            const std::string& toUserId,
                            nlohmann::json data = nlohmann::json::object());

    nlohmann::json toJson() const;

    bool operator==(const WireMessage& other) const;
    bool operator!=(const WireMessage& other) const { return !(*this == other); }
};

}  // namespace P2Lan
