/**
 * @file TrustStore.h
 * @brief Transactional peer roster: paired, trusted, blocked and saved devices
 */

#pragma once

#include "PeerInfo.h"
#include "RecordStore.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace P2Lan {

class EventBus;

/**
 * @brief Identity fields learned from a beacon or a session handshake
 */
struct PeerSighting {
    std::string id;
    std::string displayName;
    std::string profileId;
    std::string ipAddress;
    uint16_t port = 0;
    UserPlatform platform = UserPlatform::Unknown;
};

/**
 * @brief Trust and identity store
 *
 * Model:
 * - Keyed by peer device id.
 * - Every flag mutation runs on a copy of the record, persists the full
 *   snapshot through the RecordStore and only then commits in memory.
 *   A failed save leaves both memory and disk untouched.
 * - Runtime state (online, connection status, last seen, address) is
 *   updated in memory only and reaches disk with the next real mutation.
 * - Committed changes are published as PeerUpdated / PeerRemoved.
 *
 * Thread-safe.
 */
class TrustStore {
public:
    static constexpr const char* STORE_KEY = "peers";

    explicit TrustStore(RecordStore& store, EventBus* bus = nullptr);

    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;

    /**
     * @brief Load the persisted roster
     *
     * Garbage-collectable records (temp-stored, not blocked) are dropped.
     * Invalid entries are logged and skipped.
     */
    bool load(std::string& errorMsg);

    //=========================================================================
    // Queries
    //=========================================================================

    bool has(const std::string& peerId) const;
    std::optional<PeerInfo> get(const std::string& peerId) const;
    std::vector<PeerInfo> list(PeerFilter filter = PeerFilter::All) const;
    bool canAutoAccept(const std::string& peerId) const;
    bool isBlocked(const std::string& peerId) const;

    /**
     * @brief Whether a presented identity key agrees with the pinned one
     *
     * Peers without a pinned key accept any key.
     */
    bool matchesPinnedKey(const std::string& peerId, const std::string& identityKey) const;
    size_t size() const;

    //=========================================================================
    // Transactional mutations (persisted)
    //=========================================================================

    /**
     * @brief Insert or replace a full record
     *
     * Runtime state of an existing record is kept.
     */
    bool upsert(const PeerInfo& peer, std::string& errorMsg);

    bool setTrusted(const std::string& peerId, bool trusted, std::string& errorMsg);

    /**
     * @brief Block or unblock a peer
     *
     * Blocking an unknown peer creates a temp-stored blocked record.
     * Unblocking a temp-stored record that is neither paired nor saved
     * deletes it.
     */
    bool setBlocked(const std::string& peerId, bool blocked, std::string& errorMsg);

    /**
     * @brief Set or clear the paired flag (clearing also clears trust)
     */
    bool setPaired(const std::string& peerId, bool paired, std::string& errorMsg);

    bool setStored(const std::string& peerId, bool stored, std::string& errorMsg);

    /**
     * @brief Pin a peer's identity key on first verified contact
     *
     * Creates a temp-stored record for an unknown peer. Re-pinning the same
     * key is a no-op; a different key is refused and the pin is kept.
     */
    bool pinIdentityKey(const std::string& peerId, const std::string& identityKey, std::string& errorMsg);

    /**
     * @brief Commit a successful pairing in one transaction
     * @param trusted Trust flag to store
     * @param saveConnection Promote the record to saved
     */
    bool applyPairing(const std::string& peerId, bool trusted, bool saveConnection,
                      std::string& errorMsg);

    /**
     * @brief Clear paired and trusted; an unsaved, unblocked record becomes temp
     */
    bool unpair(const std::string& peerId, std::string& errorMsg);

    /**
     * @brief Delete a record
     *
     * Only temp-stored, non-blocked, non-paired records may be deleted.
     */
    bool remove(const std::string& peerId, std::string& errorMsg);

    //=========================================================================
    // Runtime state (memory only)
    //=========================================================================

    /**
     * @brief Record a peer seen on the network
     *
     * Unknown peers get a temp-stored record. Existing records keep their
     * flags; identity and address are refreshed and the peer goes online.
     * @return Updated copy of the record
     */
    PeerInfo recordSighting(const PeerSighting& sighting, int64_t nowMs);

    bool setOnline(const std::string& peerId, bool online);

    /**
     * @brief Move a peer's ConnectionStatus along a legal transition
     * @return false (and logs) if the peer is unknown or the transition is illegal
     */
    bool setConnectionStatus(const std::string& peerId, ConnectionStatus status);

    /**
     * @brief Mark every peer offline and disconnected
     */
    void markAllOffline();

private:
    using Map = std::unordered_map<std::string, PeerInfo>;
    using Mutator = std::function<bool(PeerInfo&, std::string&)>;

    bool mutate(const std::string& peerId, bool createIfMissing,
                const Mutator& mutator, std::string& errorMsg);
    bool eraseLocked(const std::string& peerId, std::string& errorMsg);
    bool persistLocked(const Map& snapshot, std::string& errorMsg);

    static nlohmann::json snapshotToJson(const Map& snapshot);
    void publishUpdated(const PeerInfo& peer);
    void publishRemoved(const std::string& peerId);

    RecordStore& m_store;
    EventBus* m_bus;

    mutable std::mutex m_mutex;
    Map m_peers;
};

}  // namespace P2Lan
