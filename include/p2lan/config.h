/**
 * @file config.h
 * @brief Configuration constants for P2Lan
 *
 * This file contains all compile-time configuration constants used throughout
 * the P2Lan core, including the LAN port range, timing values, transfer
 * limits and protocol identifiers.
 *
 * Runtime-adjustable values (download path, size limits, concurrency,
 * auto-cleanup) start from the defaults below and are overridden by
 * SettingsManager from config.json.
 *
 * @note Changes to these constants may affect protocol compatibility.
 *       Ensure all peers use compatible configurations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace P2Lan
 * @brief P2Lan namespace containing all public APIs
 */
namespace P2Lan {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief Inclusive LAN port range shared by discovery (UDP) and sessions (TCP)
 *
 * Each instance binds the first free port of the range, so several instances
 * can run on one host. Discovery beacons are sent to EVERY port of the range
 * and manual connect probes every port of the range in order.
 * @{
 */

constexpr uint16_t P2P_BASE_PORT = 8080;  ///< First port of the range
constexpr uint16_t P2P_MAX_PORT = 8090;   ///< Last port of the range (inclusive)

/** @} */ // end of NetworkPorts

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Timing intervals and timeouts (in milliseconds)
 * @{
 */

/**
 * @brief Steady-state interval between discovery beacon broadcasts.
 *
 * The first DISCOVERY_STARTUP_BURST_COUNT beacons use
 * DISCOVERY_STARTUP_INTERVAL_MS so peers appear quickly after enable().
 */
constexpr uint32_t DISCOVERY_INTERVAL_MS = 5000;
constexpr uint32_t DISCOVERY_STARTUP_INTERVAL_MS = 1000;
constexpr int DISCOVERY_STARTUP_BURST_COUNT = 3;

/**
 * @brief Jitter applied to the beacon interval, in percent of the interval.
 */
constexpr int BEACON_JITTER_MAX_PERCENT = 20;

/**
 * @brief Peer inactivity timeout
 *
 * A peer that sends no beacon and has no live session for this long is
 * marked offline. Saved records are kept.
 */
constexpr uint32_t PEER_TIMEOUT_MS = 20000;

/**
 * @brief Interval of the discovery garbage collector.
 */
constexpr uint32_t GC_INTERVAL_MS = 5000;

constexpr int GOODBYE_BROADCAST_COUNT = 3;
constexpr uint32_t GOODBYE_BROADCAST_DELAY_MS = 50;

/**
 * @brief Lifetime of an inbound request awaiting an operator decision.
 *
 * Applies to pairing, file-transfer, remote-control and screen-sharing
 * requests. On expiry the origin peer receives a "timeout" rejection.
 */
constexpr uint32_t PENDING_REQUEST_EXPIRY_MS = 60000;

/**
 * @brief How long a sender waits for the response to its own request.
 *
 * Slightly longer than PENDING_REQUEST_EXPIRY_MS so the receiver's timeout
 * rejection normally arrives first.
 */
constexpr uint32_t OUTGOING_REQUEST_TIMEOUT_MS = 65000;

/**
 * @brief TCP connect timeout for outbound session connections.
 */
constexpr uint32_t CONNECT_TIMEOUT_MS = 3000;

/**
 * @brief Idle write interval after which a heartbeat is sent.
 */
constexpr uint32_t HEARTBEAT_INTERVAL_MS = 10000;

/**
 * @brief Read timeout on a session socket; a silent peer is disconnected.
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;

/**
 * @brief Maximum wait for a chunk acknowledgement before failing a transfer.
 */
constexpr uint32_t CHUNK_ACK_TIMEOUT_MS = 30000;

/**
 * @brief Interval of the transfer auto-cleanup scan.
 */
constexpr uint32_t TRANSFER_CLEANUP_INTERVAL_MS = 1000;

/**
 * @brief Progress events are throttled to this interval per task.
 */
constexpr uint32_t PROGRESS_THROTTLE_MS = 100;

/**
 * @brief Delay before networking is re-enabled after connectivity returns.
 */
constexpr uint32_t CONNECTIVITY_RECOVERY_DELAY_MS = 2000;

/**
 * @brief Interval at which the service re-checks the network interface.
 *
 * A change in the presence of a usable connection is fed to the
 * connectivity handler. Zero disables polling.
 */
constexpr uint32_t CONNECTIVITY_POLL_INTERVAL_MS = 3000;

/**
 * @brief Failed restarts tolerated after connectivity returns.
 *
 * Each retry waits one recovery delay. Once exhausted the service stays
 * waiting until the next connectivity change.
 */
constexpr uint32_t CONNECTIVITY_RECOVERY_MAX_ATTEMPTS = 5;

/** @} */ // end of Timing

//=========================================================================
// Buffer Sizes and Limits
//=========================================================================

/** @defgroup Limits Buffer Sizes and Limits
 * @{
 */

constexpr size_t BUFFER_SIZE = 262144;               ///< File read buffer for hashing
constexpr size_t MAX_BEACON_SIZE = 4096;             ///< Max UDP beacon datagram
constexpr size_t MAX_DISPLAY_NAME = 64;              ///< Display names are truncated to this
constexpr size_t MAX_UUID_LENGTH = 64;               ///< Longest accepted device id
constexpr size_t MAX_FILENAME_LENGTH = 255;          ///< Longest accepted received file name
constexpr size_t HASH_SIZE = 32;                     ///< SHA-256 digest length

/**
 * @brief Largest frame payload accepted on a session socket.
 *
 * A declared length above this is treated as stream corruption and the
 * connection is reset. Must exceed the base64 size of the largest chunk.
 */
constexpr uint32_t MAX_FRAME_SIZE = 4u * 1024u * 1024u;

constexpr size_t FRAME_HEADER_SIZE = 4;              ///< Big-endian length prefix

/**
 * @brief Default and bounds for the transfer chunk size (KiB).
 */
constexpr uint32_t DEFAULT_CHUNK_SIZE_KB = 512;
constexpr uint32_t MIN_CHUNK_SIZE_KB = 1;
constexpr uint32_t MAX_CHUNK_SIZE_KB = 2048;

/**
 * @brief Chunks a sender may have in flight without acknowledgement.
 */
constexpr size_t CHUNK_WINDOW = 4;

/**
 * @brief A compressed chunk is sent only if raw/compressed reaches this ratio.
 */
constexpr double COMPRESSION_MIN_RATIO = 1.1;

/**
 * @brief Chunks smaller than this are never compressed.
 */
constexpr size_t COMPRESSION_MIN_INPUT = 256;

/**
 * @brief Default per-file receive limit (1 GiB).
 */
constexpr int64_t DEFAULT_MAX_FILE_SIZE_BYTES = 1073741824LL;

/**
 * @brief Default total limit for one request; -1 means unlimited.
 */
constexpr int64_t DEFAULT_MAX_TOTAL_SIZE_BYTES = -1;

/**
 * @brief Default number of concurrently streaming outgoing tasks.
 */
constexpr size_t MAX_CONCURRENT_TRANSFERS = 3;
constexpr size_t MAX_CONCURRENT_TRANSFERS_LIMIT = 10;

/**
 * @brief Max files in a single file-transfer request.
 */
constexpr size_t MAX_FILES_PER_REQUEST = 1000;

/**
 * @brief Bound on queued outbound frames per peer.
 */
constexpr size_t MAX_OUTBOUND_QUEUE = 256;

constexpr int DEFAULT_AUTO_CLEANUP_DELAY_SECONDS = 5;

/** @} */ // end of Limits

//=========================================================================
// Protocol
//=========================================================================

/** @defgroup Protocol Protocol Identifiers
 * @{
 */

constexpr const char* PROTOCOL_ID = "P2LAN_V1";
constexpr int PROTOCOL_VERSION = 1;

constexpr const char* BEACON_TYPE_ANNOUNCE = "announce";  ///< Normal presence beacon
constexpr const char* BEACON_TYPE_GOODBYE = "goodbye";    ///< Departure notification
constexpr const char* BEACON_TYPE_SCAN = "scan";          ///< Ask listeners to announce now

constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/** @} */ // end of Protocol

}  // namespace P2Lan
