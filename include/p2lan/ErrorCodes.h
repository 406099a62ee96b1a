/**
 * @file ErrorCodes.h
 * @brief Stable, user-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace P2Lan {
namespace ErrorCodes {

// Networking lifecycle
inline constexpr const char* NETWORK_NOT_STARTED = "P2L-NET-1000";
inline constexpr const char* NETWORK_INSECURE = "P2L-NET-1001";
inline constexpr const char* NETWORK_NO_CONNECTIVITY = "P2L-NET-1002";
inline constexpr const char* NETWORK_START_FAILED = "P2L-NET-1003";
inline constexpr const char* NETWORK_NO_PORT = "P2L-NET-1004";
inline constexpr const char* NETWORK_CONNECT_FAILED = "P2L-NET-1005";

// Peers and trust
inline constexpr const char* PEER_UNKNOWN = "P2L-PEER-2000";
inline constexpr const char* PEER_OFFLINE = "P2L-PEER-2001";
inline constexpr const char* PEER_NOT_PAIRED = "P2L-PEER-2002";
inline constexpr const char* PEER_BLOCKED = "P2L-PEER-2003";
inline constexpr const char* PEER_NOT_DELETABLE = "P2L-PEER-2004";
inline constexpr const char* PEER_INVALID_STATE = "P2L-PEER-2005";

// Pairing
inline constexpr const char* PAIRING_ALREADY_PENDING = "P2L-PAIR-3000";
inline constexpr const char* PAIRING_NO_SUCH_REQUEST = "P2L-PAIR-3001";
inline constexpr const char* PAIRING_ALREADY_PAIRED = "P2L-PAIR-3002";
inline constexpr const char* PAIRING_REJECTED_REMOTE = "P2L-PAIR-3003";
inline constexpr const char* PAIRING_TIMED_OUT = "P2L-PAIR-3004";

// File transfer
inline constexpr const char* TRANSFER_FILE_NOT_FOUND = "P2L-XFER-4000";
inline constexpr const char* TRANSFER_FILE_TOO_LARGE = "P2L-XFER-4001";
inline constexpr const char* TRANSFER_BATCH_TOO_LARGE = "P2L-XFER-4002";
inline constexpr const char* TRANSFER_TOO_MANY_FILES = "P2L-XFER-4003";
inline constexpr const char* TRANSFER_NOT_FOUND = "P2L-XFER-4004";
inline constexpr const char* TRANSFER_NOT_CANCELLABLE = "P2L-XFER-4005";
inline constexpr const char* TRANSFER_NOT_RESUMABLE = "P2L-XFER-4006";
inline constexpr const char* TRANSFER_NO_SUCH_REQUEST = "P2L-XFER-4007";
inline constexpr const char* TRANSFER_IO_ERROR = "P2L-XFER-4008";
inline constexpr const char* TRANSFER_NOT_PAUSABLE = "P2L-XFER-4009";

// Signaling relays (remote control / screen sharing)
inline constexpr const char* SESSION_ALREADY_ACTIVE = "P2L-SIG-5000";
inline constexpr const char* SESSION_NOT_ACTIVE = "P2L-SIG-5001";
inline constexpr const char* SESSION_NO_SUCH_REQUEST = "P2L-SIG-5002";
inline constexpr const char* SESSION_REQUEST_PENDING = "P2L-SIG-5003";
inline constexpr const char* SESSION_WRONG_ROLE = "P2L-SIG-5004";
inline constexpr const char* SESSION_INVALID_SIGNAL = "P2L-SIG-5005";

// Generic
inline constexpr const char* SEND_FAILED = "P2L-GEN-9000";
inline constexpr const char* INVALID_ARGUMENT = "P2L-GEN-9001";
inline constexpr const char* PERSISTENCE_FAILED = "P2L-GEN-9002";
inline constexpr const char* INTERNAL_ERROR = "P2L-GEN-9003";

}  // namespace ErrorCodes
}  // namespace P2Lan
