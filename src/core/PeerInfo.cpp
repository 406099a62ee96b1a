/**
 * @file PeerInfo.cpp
 * @brief Peer record helpers and serialization
 */

#include "p2lan/PeerInfo.h"
#include "p2lan/config.h"

namespace P2Lan {

std::string platformToString(UserPlatform platform) {
    switch (platform) {
        case UserPlatform::Android: return "android";
        case UserPlatform::Ios:     return "ios";
        case UserPlatform::Windows: return "windows";
        case UserPlatform::MacOs:   return "macos";
        case UserPlatform::Linux:   return "linux";
        case UserPlatform::Web:     return "web";
        case UserPlatform::Unknown: return "unknown";
    }
    return "unknown";
}

UserPlatform platformFromString(const std::string& value) {
    if (value == "android") return UserPlatform::Android;
    if (value == "ios")     return UserPlatform::Ios;
    if (value == "windows") return UserPlatform::Windows;
    if (value == "macos")   return UserPlatform::MacOs;
    if (value == "linux")   return UserPlatform::Linux;
    if (value == "web")     return UserPlatform::Web;
    return UserPlatform::Unknown;
}

UserPlatform localPlatform() {
#if defined(__APPLE__)
    return UserPlatform::MacOs;
#elif defined(__linux__)
    return UserPlatform::Linux;
#else
    return UserPlatform::Unknown;
#endif
}

std::string connectionStatusToString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Discovering:  return "discovering";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Pairing:      return "pairing";
        case ConnectionStatus::Paired:       return "paired";
    }
    return "disconnected";
}

bool isValidConnectionTransition(ConnectionStatus from, ConnectionStatus to) {
    if (from == to) {
        return true;
    }
    if (to == ConnectionStatus::Disconnected) {
        return true;
    }

    switch (from) {
        case ConnectionStatus::Disconnected:
            return to == ConnectionStatus::Discovering || to == ConnectionStatus::Connected;
        case ConnectionStatus::Discovering:
            return to == ConnectionStatus::Connected;
        case ConnectionStatus::Connected:
            return to == ConnectionStatus::Pairing || to == ConnectionStatus::Paired;
        case ConnectionStatus::Pairing:
            return to == ConnectionStatus::Paired || to == ConnectionStatus::Connected;
        case ConnectionStatus::Paired:
            return false;
    }
    return false;
}

bool PeerInfo::matches(PeerFilter filter) const {
    switch (filter) {
        case PeerFilter::All:        return true;
        case PeerFilter::Online:     return isOnline;
        case PeerFilter::Paired:     return isPaired;
        case PeerFilter::Trusted:    return isTrusted;
        case PeerFilter::Blocked:    return isBlocked;
        case PeerFilter::Saved:      return isStored;
        case PeerFilter::NewDevices: return isNewDevice();
    }
    return false;
}

bool PeerInfo::validate(std::string& errorMsg) const {
    if (id.empty() || id.size() > MAX_UUID_LENGTH) {
        errorMsg = "Invalid peer id";
        return false;
    }
    if (isTrusted && !isPaired) {
        errorMsg = "A trusted peer must be paired";
        return false;
    }
    if (isStored && isTempStored) {
        errorMsg = "A peer cannot be both stored and temp-stored";
        return false;
    }
    return true;
}

nlohmann::json PeerInfo::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["displayName"] = displayName;
    j["profileId"] = profileId;
    j["ipAddress"] = ipAddress;
    j["port"] = port;
    j["platform"] = platformToString(platform);
    if (!identityKey.empty()) {
        j["identityKey"] = identityKey;
    }
    j["lastSeen"] = lastSeenMs;
    j["pairedAt"] = pairedAtMs;
    j["isStored"] = isStored;
    j["isTempStored"] = isTempStored;
    j["isTrusted"] = isTrusted;
    j["isBlocked"] = isBlocked;
    j["isPaired"] = isPaired;
    return j;
}

bool PeerInfo::fromJson(const nlohmann::json& j, PeerInfo& out, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "Peer entry is not an object";
        return false;
    }

    PeerInfo peer;
    if (!j.contains("id") || !j["id"].is_string()) {
        errorMsg = "Peer entry has no id";
        return false;
    }
    peer.id = j["id"].get<std::string>();

    if (j.contains("displayName") && j["displayName"].is_string()) {
        peer.displayName = j["displayName"].get<std::string>();
    }
    if (j.contains("profileId") && j["profileId"].is_string()) {
        peer.profileId = j["profileId"].get<std::string>();
    }
    if (j.contains("ipAddress") && j["ipAddress"].is_string()) {
        peer.ipAddress = j["ipAddress"].get<std::string>();
    }
    if (j.contains("port") && j["port"].is_number_unsigned() && j["port"].get<uint32_t>() <= 65535) {
        peer.port = static_cast<uint16_t>(j["port"].get<uint32_t>());
    }
    if (j.contains("platform") && j["platform"].is_string()) {
        peer.platform = platformFromString(j["platform"].get<std::string>());
    }
    if (j.contains("identityKey") && j["identityKey"].is_string()) {
        peer.identityKey = j["identityKey"].get<std::string>();
    }
    if (j.contains("lastSeen") && j["lastSeen"].is_number_integer()) {
        peer.lastSeenMs = j["lastSeen"].get<int64_t>();
    }
    if (j.contains("pairedAt") && j["pairedAt"].is_number_integer()) {
        peer.pairedAtMs = j["pairedAt"].get<int64_t>();
    }

    auto readFlag = [&j](const char* key, bool& flag) {
        if (j.contains(key) && j[key].is_boolean()) {
            flag = j[key].get<bool>();
        }
    };
    readFlag("isStored", peer.isStored);
    readFlag("isTempStored", peer.isTempStored);
    readFlag("isTrusted", peer.isTrusted);
    readFlag("isBlocked", peer.isBlocked);
    readFlag("isPaired", peer.isPaired);

    if (!peer.validate(errorMsg)) {
        return false;
    }

    out = std::move(peer);
    return true;
}

}  // namespace P2Lan
