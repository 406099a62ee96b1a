/**
 * @file TrustStore.cpp
 * @brief Transactional peer roster
 */

#include "p2lan/TrustStore.h"
#include "p2lan/EventBus.h"
#include "p2lan/Debug.h"

#include <chrono>

namespace P2Lan {

namespace {

int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

TrustStore::TrustStore(RecordStore& store, EventBus* bus)
    : m_store(store)
    , m_bus(bus)
{
}

bool TrustStore::load(std::string& errorMsg) {
    nlohmann::json doc;
    if (!m_store.load(STORE_KEY, doc, errorMsg)) {
        return false;
    }

    Map loaded;
    size_t collected = 0;

    if (doc.is_object() && doc.contains("peers") && doc["peers"].is_object()) {
        const auto& peers = doc["peers"];
        for (auto it = peers.begin(); it != peers.end(); ++it) {
            PeerInfo peer;
            std::string entryError;
            if (!PeerInfo::fromJson(it.value(), peer, entryError)) {
                LOG_WARNING("[TrustStore] Skipping invalid entry " << it.key() << ": " << entryError);
                continue;
            }
            if (peer.isGarbageCollectable()) {
                ++collected;
                continue;
            }
            peer.isOnline = false;
            peer.connectionStatus = ConnectionStatus::Disconnected;
            loaded[peer.id] = std::move(peer);
        }
    } else if (!doc.is_null()) {
        LOG_WARNING("[TrustStore] Unexpected document layout, starting with an empty roster");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_peers = std::move(loaded);
    LOG_INFO("[TrustStore] Loaded " << m_peers.size() << " peers (" << collected << " temp records collected)");
    return true;
}

//=============================================================================
// Queries
//=============================================================================

bool TrustStore::has(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.find(peerId) != m_peers.end();
}

std::optional<PeerInfo> TrustStore::get(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peerId);
    if (it == m_peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerInfo> TrustStore::list(PeerFilter filter) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PeerInfo> out;
    for (const auto& pair : m_peers) {
        if (pair.second.matches(filter)) {
            out.push_back(pair.second);
        }
    }
    return out;
}

bool TrustStore::canAutoAccept(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peerId);
    return it != m_peers.end() && it->second.canAutoAccept();
}

bool TrustStore::isBlocked(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peerId);
    return it != m_peers.end() && it->second.isBlocked;
}

bool TrustStore::matchesPinnedKey(const std::string& peerId, const std::string& identityKey) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(peerId);
    return it == m_peers.end() || it->second.identityKey.empty() || it->second.identityKey == identityKey;
}

size_t TrustStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.size();
}

//=============================================================================
// Transactional mutations
//=============================================================================

bool TrustStore::mutate(const std::string& peerId, bool createIfMissing,
                        const Mutator& mutator, std::string& errorMsg)
{
    PeerInfo committed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        PeerInfo working;
        auto it = m_peers.find(peerId);
        if (it != m_peers.end()) {
            working = it->second;
        } else if (createIfMissing) {
            working.id = peerId;
            working.isTempStored = true;
            working.lastSeenMs = wallClockMs();
        } else {
            errorMsg = "Unknown peer: " + peerId;
            return false;
        }

        if (!mutator(working, errorMsg)) {
            return false;
        }
        if (!working.validate(errorMsg)) {
            LOG_WARNING("[TrustStore] Refusing illegal record for " << peerId << ": " << errorMsg);
            return false;
        }

        Map snapshot = m_peers;
        snapshot[peerId] = working;
        if (!persistLocked(snapshot, errorMsg)) {
            return false;
        }

        m_peers[peerId] = working;
        committed = std::move(working);
    }

    publishUpdated(committed);
    return true;
}

bool TrustStore::upsert(const PeerInfo& peer, std::string& errorMsg) {
    return mutate(peer.id, true, [&peer](PeerInfo& rec, std::string&) {
        const bool online = rec.isOnline;
        const ConnectionStatus status = rec.connectionStatus;
        const std::string pinned = rec.identityKey;
        rec = peer;
        rec.isOnline = online;
        rec.connectionStatus = status;
        if (!pinned.empty()) {
            rec.identityKey = pinned;
        }
        return true;
    }, errorMsg);
}

bool TrustStore::setTrusted(const std::string& peerId, bool trusted, std::string& errorMsg) {
    return mutate(peerId, false, [trusted](PeerInfo& rec, std::string& err) {
        if (trusted && !rec.isPaired) {
            err = "Peer is not paired";
            return false;
        }
        rec.isTrusted = trusted;
        return true;
    }, errorMsg);
}

bool TrustStore::pinIdentityKey(const std::string& peerId, const std::string& identityKey,
                                std::string& errorMsg)
{
    if (identityKey.empty()) {
        errorMsg = "Empty identity key";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peerId);
        if (it != m_peers.end() && it->second.identityKey == identityKey) {
            return true;
        }
    }
    return mutate(peerId, true, [&identityKey](PeerInfo& rec, std::string& err) {
        if (!rec.identityKey.empty() && rec.identityKey != identityKey) {
            err = "Identity key mismatch";
            return false;
        }
        rec.identityKey = identityKey;
        return true;
    }, errorMsg);
}

bool TrustStore::setBlocked(const std::string& peerId, bool blocked, std::string& errorMsg) {
    if (!blocked) {
        bool removed = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_peers.find(peerId);
            if (it == m_peers.end()) {
                errorMsg = "Unknown peer: " + peerId;
                return false;
            }
            const PeerInfo& rec = it->second;
            if (rec.isTempStored && !rec.isPaired && !rec.isStored) {
                if (!eraseLocked(peerId, errorMsg)) {
                    return false;
                }
                removed = true;
            }
        }
        if (removed) {
            publishRemoved(peerId);
            return true;
        }
    }

    return mutate(peerId, blocked, [blocked](PeerInfo& rec, std::string&) {
        rec.isBlocked = blocked;
        return true;
    }, errorMsg);
}

bool TrustStore::setPaired(const std::string& peerId, bool paired, std::string& errorMsg) {
    return mutate(peerId, false, [paired](PeerInfo& rec, std::string&) {
        rec.isPaired = paired;
        if (paired) {
            rec.isTempStored = false;
            if (rec.pairedAtMs == 0) {
                rec.pairedAtMs = wallClockMs();
            }
        } else {
            rec.isTrusted = false;
            rec.pairedAtMs = 0;
        }
        return true;
    }, errorMsg);
}

bool TrustStore::setStored(const std::string& peerId, bool stored, std::string& errorMsg) {
    return mutate(peerId, false, [stored](PeerInfo& rec, std::string&) {
        rec.isStored = stored;
        if (stored) {
            rec.isTempStored = false;
        } else if (!rec.isPaired) {
            rec.isTempStored = true;
        }
        return true;
    }, errorMsg);
}

bool TrustStore::applyPairing(const std::string& peerId, bool trusted, bool saveConnection,
                              std::string& errorMsg)
{
    return mutate(peerId, false, [trusted, saveConnection](PeerInfo& rec, std::string&) {
        rec.isPaired = true;
        rec.isTrusted = trusted;
        rec.isTempStored = false;
        if (saveConnection) {
            rec.isStored = true;
        }
        rec.pairedAtMs = wallClockMs();
        if (rec.isOnline &&
            isValidConnectionTransition(rec.connectionStatus, ConnectionStatus::Paired)) {
            rec.connectionStatus = ConnectionStatus::Paired;
        }
        return true;
    }, errorMsg);
}

bool TrustStore::unpair(const std::string& peerId, std::string& errorMsg) {
    return mutate(peerId, false, [](PeerInfo& rec, std::string&) {
        rec.isPaired = false;
        rec.isTrusted = false;
        rec.pairedAtMs = 0;
        if (!rec.isStored) {
            rec.isTempStored = true;
        }
        if (rec.connectionStatus == ConnectionStatus::Paired) {
            // Still connected at socket level
            rec.connectionStatus = ConnectionStatus::Connected;
        }
        return true;
    }, errorMsg);
}

bool TrustStore::remove(const std::string& peerId, std::string& errorMsg) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peerId);
        if (it == m_peers.end()) {
            errorMsg = "Unknown peer: " + peerId;
            return false;
        }
        const PeerInfo& rec = it->second;
        if (!rec.isTempStored || rec.isBlocked || rec.isPaired || rec.isStored) {
            errorMsg = "Only unsaved, unpaired, unblocked peers can be deleted";
            return false;
        }
        if (!eraseLocked(peerId, errorMsg)) {
            return false;
        }
    }
    publishRemoved(peerId);
    return true;
}

bool TrustStore::eraseLocked(const std::string& peerId, std::string& errorMsg) {
    Map snapshot = m_peers;
    snapshot.erase(peerId);
    if (!persistLocked(snapshot, errorMsg)) {
        return false;
    }
    m_peers.erase(peerId);
    return true;
}

//=============================================================================
// Runtime state
//=============================================================================

PeerInfo TrustStore::recordSighting(const PeerSighting& sighting, int64_t nowMs) {
    PeerInfo updated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(sighting.id);
        if (it == m_peers.end()) {
            PeerInfo rec;
            rec.id = sighting.id;
            rec.isTempStored = true;
            it = m_peers.emplace(sighting.id, std::move(rec)).first;
        }

        PeerInfo& rec = it->second;
        if (!sighting.displayName.empty()) {
            rec.displayName = sighting.displayName;
        }
        if (!sighting.profileId.empty()) {
            rec.profileId = sighting.profileId;
        }
        if (!sighting.ipAddress.empty()) {
            rec.ipAddress = sighting.ipAddress;
        }
        if (sighting.port != 0) {
            rec.port = sighting.port;
        }
        if (sighting.platform != UserPlatform::Unknown) {
            rec.platform = sighting.platform;
        }
        rec.lastSeenMs = nowMs;
        rec.isOnline = true;
        if (rec.connectionStatus == ConnectionStatus::Disconnected) {
            rec.connectionStatus = ConnectionStatus::Discovering;
        }
        updated = rec;
    }

    publishUpdated(updated);
    return updated;
}

bool TrustStore::setOnline(const std::string& peerId, bool online) {
    PeerInfo updated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peerId);
        if (it == m_peers.end()) {
            return false;
        }
        if (it->second.isOnline == online) {
            return true;
        }
        it->second.isOnline = online;
        if (!online) {
            it->second.connectionStatus = ConnectionStatus::Disconnected;
        }
        updated = it->second;
    }

    publishUpdated(updated);
    return true;
}

bool TrustStore::setConnectionStatus(const std::string& peerId, ConnectionStatus status) {
    PeerInfo updated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(peerId);
        if (it == m_peers.end()) {
            return false;
        }
        PeerInfo& rec = it->second;
        if (rec.connectionStatus == status) {
            return true;
        }
        if (!isValidConnectionTransition(rec.connectionStatus, status)) {
            LOG_WARNING("[TrustStore] Illegal transition for " << peerId << ": "
                        << connectionStatusToString(rec.connectionStatus) << " -> "
                        << connectionStatusToString(status));
            return false;
        }
        if (status == ConnectionStatus::Paired && !rec.isPaired) {
            LOG_WARNING("[TrustStore] Refusing paired status for unpaired peer " << peerId);
            return false;
        }
        rec.connectionStatus = status;
        if (status != ConnectionStatus::Disconnected) {
            rec.isOnline = true;
        }
        updated = rec;
    }

    publishUpdated(updated);
    return true;
}

void TrustStore::markAllOffline() {
    std::vector<PeerInfo> changed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& pair : m_peers) {
            PeerInfo& rec = pair.second;
            if (rec.isOnline || rec.connectionStatus != ConnectionStatus::Disconnected) {
                rec.isOnline = false;
                rec.connectionStatus = ConnectionStatus::Disconnected;
                changed.push_back(rec);
            }
        }
    }

    for (const auto& peer : changed) {
        publishUpdated(peer);
    }
}

//=============================================================================
// Persistence
//=============================================================================

nlohmann::json TrustStore::snapshotToJson(const Map& snapshot) {
    nlohmann::json peers = nlohmann::json::object();
    for (const auto& pair : snapshot) {
        if (pair.second.isPersistable()) {
            peers[pair.first] = pair.second.toJson();
        }
    }

    nlohmann::json doc;
    doc["version"] = 1;
    doc["peers"] = std::move(peers);
    return doc;
}

bool TrustStore::persistLocked(const Map& snapshot, std::string& errorMsg) {
    std::string saveError;
    if (!m_store.save(STORE_KEY, snapshotToJson(snapshot), saveError)) {
        errorMsg = "Failed to persist peer store: " + saveError;
        LOG_ERROR("[TrustStore] " << errorMsg);
        return false;
    }
    return true;
}

void TrustStore::publishUpdated(const PeerInfo& peer) {
    if (m_bus) {
        m_bus->publish(PeerUpdated{peer});
    }
}

void TrustStore::publishRemoved(const std::string& peerId) {
    if (m_bus) {
        m_bus->publish(PeerRemoved{peerId});
    }
}

}  // namespace P2Lan
