/**
 * @file PeerInfo.h
 * @brief Peer record for discovered, paired and saved devices
 */

#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace P2Lan {

    /**
     * @brief Platform tag announced by a peer
     */
    enum class UserPlatform {
        Android,
        Ios,
        Windows,
        MacOs,
        Linux,
        Web,
        Unknown
    };

    std::string platformToString(UserPlatform platform);
    UserPlatform platformFromString(const std::string& value);

    /**
     * @brief Platform of this build
     */
    UserPlatform localPlatform();

    /**
     * @brief Per-peer connection state
     *
     * Legal transitions:
     * - Disconnected -> Discovering (beacon seen)
     * - Discovering|Disconnected -> Connected (session socket up)
     * - Connected -> Pairing -> Paired
     * - Pairing -> Connected (pairing rejected or expired)
     * - Connected -> Paired (reconnect of an already-paired peer)
     * - any -> Disconnected
     */
    enum class ConnectionStatus {
        Disconnected,
        Discovering,
        Connected,
        Pairing,
        Paired
    };

    std::string connectionStatusToString(ConnectionStatus status);

    /**
     * @brief Check a ConnectionStatus transition against the legal set above
     *
     * Same-state "transitions" are accepted as no-ops.
     */
    bool isValidConnectionTransition(ConnectionStatus from, ConnectionStatus to);

    /**
     * @brief This device as announced to peers
     */
    struct LocalIdentity {
        std::string id;
        std::string displayName;
        std::string profileId;
        UserPlatform platform = UserPlatform::Unknown;
        std::string identityKey;         ///< Ed25519 public key, hex
    };

    /**
     * @brief Filters accepted by TrustStore::list()
     */
    enum class PeerFilter {
        All,
        Online,
        Paired,
        Trusted,
        Blocked,
        Saved,
        NewDevices
    };

    /**
     * @brief Everything the core knows about one peer device
     *
     * Persisted fields: identity, address, platform, timestamps, the pinned
     * identity key and the isStored/isTempStored/isTrusted/isBlocked/isPaired
     * flags.
     * isOnline and connectionStatus are runtime state and are never loaded
     * from disk.
     *
     * Legal flag combinations (checked by validate()):
     * - isTrusted requires isPaired
     * - isStored and isTempStored are mutually exclusive
     * - isBlocked may coexist with isTrusted, but blocked always wins
     */
    struct PeerInfo {
        std::string id;                  ///< Stable device id (UUID)
        std::string displayName;         ///< Human-readable device name
        std::string profileId;           ///< Optional profile id of the peer's user
        std::string ipAddress;           ///< Last known IPv4 address
        uint16_t port = 0;               ///< Session (TCP) port of the peer
        UserPlatform platform = UserPlatform::Unknown;
        std::string identityKey;         ///< Pinned at the first verified session handshake, hex
        int64_t lastSeenMs = 0;          ///< Wall clock, ms since epoch
        int64_t pairedAtMs = 0;          ///< Wall clock, 0 if never paired

        bool isStored = false;           ///< Saved by the user ("save connection")
        bool isTempStored = false;       ///< Ephemeral record, collectable unless blocked
        bool isTrusted = false;          ///< Auto-accept future requests
        bool isBlocked = false;          ///< Never auto-accept, reject everything
        bool isPaired = false;           ///< Pairing handshake completed

        bool isOnline = false;           ///< Seen recently or connected
        ConnectionStatus connectionStatus = ConnectionStatus::Disconnected;

        bool isNewDevice() const { return !isStored && isOnline && !isPaired; }
        bool isOnlineSaved() const { return isStored && isOnline; }
        bool isOfflineSaved() const { return isStored && !isOnline; }

        /**
         * @brief Whether an inbound request from this peer may skip the operator
         *
         * Blocked dominates trusted.
         */
        bool canAutoAccept() const { return isPaired && isTrusted && !isBlocked; }

        /**
         * @brief Temp records that are not blocked may be dropped at any time
         */
        bool isGarbageCollectable() const { return isTempStored && !isBlocked; }

        /**
         * @brief Whether the record must survive a restart
         */
        bool isPersistable() const { return isStored || isPaired || isBlocked || isTempStored; }

        bool matches(PeerFilter filter) const;

        /**
         * @brief Validate identity and flag combinations
         * @param errorMsg Reason on failure
         */
        bool validate(std::string& errorMsg) const;

        nlohmann::json toJson() const;
        static bool fromJson(const nlohmann::json& j, PeerInfo& out, std::string& errorMsg);
    };

}  // namespace P2Lan
