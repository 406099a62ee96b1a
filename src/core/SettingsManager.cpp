/**
 * @file SettingsManager.cpp
 * @brief Settings persistence manager implementation
 */

#include "p2lan/SettingsManager.h"
#include "p2lan/AppPaths.h"
#include "p2lan/AtomicFile.h"
#include "p2lan/Debug.h"
#include "p2lan/SessionCrypto.h"
#include "p2lan/ThreadSafeLog.h"
#include "p2lan/UuidGenerator.h"
#include "p2lan/config.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>  // For gethostname

namespace P2Lan {

namespace {

    template <typename T>
    void readNumber(const nlohmann::json& j, const char* key, T& out) {
        if (j.contains(key) && j[key].is_number_integer()) {
            out = j[key].get<T>();
        }
    }

    void readBool(const nlohmann::json& j, const char* key, bool& out) {
        if (j.contains(key) && j[key].is_boolean()) {
            out = j[key].get<bool>();
        }
    }

    void readString(const nlohmann::json& j, const char* key, std::string& out) {
        if (j.contains(key) && j[key].is_string()) {
            out = j[key].get<std::string>();
        }
    }

    // -1 means unlimited; any other non-positive value is invalid
    int64_t clampSizeLimit(int64_t value, int64_t fallback) {
        if (value == -1 || value > 0) {
            return value;
        }
        return fallback;
    }

} // anonymous namespace

SettingsManager::SettingsManager(std::filesystem::path configPath)
    : m_configPath(configPath.empty() ? AppPaths::configJsonPath() : std::move(configPath))
{
    m_settings.displayName = defaultDisplayName();
}

std::string SettingsManager::defaultDisplayName() {
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        return std::string(host).substr(0, MAX_DISPLAY_NAME);
    }
    return "P2Lan device";
}

//=============================================================================
// Persistence Operations
//=============================================================================

bool SettingsManager::load(std::string& errorMsg) {
    AppSettings loaded;
    bool needsSave = false;

    std::error_code ec;
    if (!std::filesystem::exists(m_configPath, ec)) {
        // First run
        ThreadSafeLog::log("[Settings] No config at " + m_configPath.string() + "; creating defaults");
        loaded = fromJson(nlohmann::json::object());
        needsSave = true;
    } else {
        std::ifstream in(m_configPath, std::ios::binary);
        if (!in) {
            errorMsg = "Cannot open " + m_configPath.string();
            return false;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        nlohmann::json j = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            LOG_WARNING("[Settings] " << m_configPath.string() << " is not valid JSON; resetting to defaults");
            ThreadSafeLog::log("[Settings] Invalid config.json replaced with defaults");
            j = nlohmann::json::object();
            needsSave = true;
        }
        loaded = fromJson(j);
        // Re-save whenever validation changed something
        if (!needsSave && toJson(loaded) != j) {
            needsSave = true;
        }
    }

    if (loaded.deviceUuid.empty()) {
        loaded.deviceUuid = UuidGenerator::generate();
        if (loaded.deviceUuid.empty()) {
            errorMsg = "Failed to generate device UUID";
            return false;
        }
        needsSave = true;
    }
    if (loaded.displayName.empty()) {
        loaded.displayName = defaultDisplayName();
        needsSave = true;
    }
    if (loaded.identityKey.empty()) {
        auto key = IdentityKey::generate(errorMsg);
        if (!key) {
            errorMsg = "Failed to generate identity key: " + errorMsg;
            return false;
        }
        loaded.identityKey = key->privateKeyHex();
        needsSave = true;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = loaded;
    }

    if (needsSave) {
        return save(errorMsg);
    }
    return true;
}

bool SettingsManager::save(std::string& errorMsg) {
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        j = toJson(m_settings);
    }
    if (!writeFileAtomically(m_configPath, j.dump(4), errorMsg)) {
        LOG_ERROR("[Settings] Failed to save " << m_configPath.string() << ": " << errorMsg);
        return false;
    }
    return true;
}

AppSettings SettingsManager::settings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settings;
}

bool SettingsManager::update(const AppSettings& settings, std::string& errorMsg) {
    AppSettings previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_settings;
        const std::string uuid = m_settings.deviceUuid;
        const std::string identityKey = m_settings.identityKey;
        m_settings = settings;
        m_settings.deviceUuid = uuid;
        m_settings.identityKey = identityKey;
        clamp(m_settings);
        if (m_settings.displayName.empty()) {
            m_settings.displayName = previous.displayName;
        }
    }
    if (!save(errorMsg)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = previous;
        return false;
    }
    return true;
}

LocalIdentity SettingsManager::identity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    LocalIdentity identity;
    identity.id = m_settings.deviceUuid;
    identity.displayName = m_settings.displayName;
    identity.profileId = m_settings.profileId;
    identity.platform = localPlatform();
    std::string keyError;
    if (auto key = IdentityKey::fromPrivateHex(m_settings.identityKey, keyError)) {
        identity.identityKey = key->publicKeyHex();
    }
    return identity;
}

//=============================================================================
// JSON mapping
//=============================================================================

AppSettings SettingsManager::fromJson(const nlohmann::json& j) {
    AppSettings s;
    if (!j.is_object()) {
        return s;
    }

    readString(j, "device_uuid", s.deviceUuid);
    if (s.deviceUuid.size() > MAX_UUID_LENGTH) {
        s.deviceUuid.clear();
    }
    readString(j, "identity_key", s.identityKey);
    if (!s.identityKey.empty()) {
        std::string keyError;
        if (!IdentityKey::fromPrivateHex(s.identityKey, keyError)) {
            LOG_WARNING("[Settings] Stored identity key rejected (" << keyError << "); a new one is generated");
            s.identityKey.clear();
        }
    }
    readString(j, "display_name", s.displayName);
    readString(j, "profile_id", s.profileId);

    TransferSettings& t = s.transfer;
    readString(j, "download_path", t.downloadPath);
    readBool(j, "create_date_folders", t.createDateFolders);
    readBool(j, "create_sender_folders", t.createSenderFolders);
    readNumber(j, "max_receive_file_size", t.maxReceiveFileSize);
    readNumber(j, "max_total_receive_size", t.maxTotalReceiveSize);

    int64_t concurrent = static_cast<int64_t>(t.maxConcurrentTasks);
    readNumber(j, "max_concurrent_tasks", concurrent);
    t.maxConcurrentTasks = concurrent < 1 ? 1 : static_cast<size_t>(concurrent);

    int64_t chunkKb = t.maxChunkSizeKb;
    readNumber(j, "max_chunk_size_kb", chunkKb);
    t.maxChunkSizeKb = chunkKb < 1 ? MIN_CHUNK_SIZE_KB : static_cast<uint32_t>(std::min<int64_t>(chunkKb, MAX_CHUNK_SIZE_KB));

    readBool(j, "auto_cleanup_completed", t.autoCleanupCompleted);
    readBool(j, "auto_cleanup_cancelled", t.autoCleanupCancelled);
    readBool(j, "auto_cleanup_failed", t.autoCleanupFailed);
    readNumber(j, "auto_cleanup_delay_seconds", t.autoCleanupDelaySeconds);
    readBool(j, "encrypt_transfers", t.encryptTransfers);
    readBool(j, "compress_chunks", t.compressChunks);

    readBool(j, "auto_accept_trusted_remote_control", s.autoAcceptTrustedRemoteControl);
    readBool(j, "auto_accept_trusted_screen_sharing", s.autoAcceptTrustedScreenSharing);
    readBool(j, "allow_unverified_networks", s.allowUnverifiedNetworks);

    clamp(s);
    return s;
}

nlohmann::json SettingsManager::toJson(const AppSettings& s) {
    const TransferSettings& t = s.transfer;
    return nlohmann::json{
        {"device_uuid", s.deviceUuid},
        {"identity_key", s.identityKey},
        {"display_name", s.displayName},
        {"profile_id", s.profileId},
        {"download_path", t.downloadPath},
        {"create_date_folders", t.createDateFolders},
        {"create_sender_folders", t.createSenderFolders},
        {"max_receive_file_size", t.maxReceiveFileSize},
        {"max_total_receive_size", t.maxTotalReceiveSize},
        {"max_concurrent_tasks", t.maxConcurrentTasks},
        {"max_chunk_size_kb", t.maxChunkSizeKb},
        {"auto_cleanup_completed", t.autoCleanupCompleted},
        {"auto_cleanup_cancelled", t.autoCleanupCancelled},
        {"auto_cleanup_failed", t.autoCleanupFailed},
        {"auto_cleanup_delay_seconds", t.autoCleanupDelaySeconds},
        {"encrypt_transfers", t.encryptTransfers},
        {"compress_chunks", t.compressChunks},
        {"auto_accept_trusted_remote_control", s.autoAcceptTrustedRemoteControl},
        {"auto_accept_trusted_screen_sharing", s.autoAcceptTrustedScreenSharing},
        {"allow_unverified_networks", s.allowUnverifiedNetworks}
    };
}

void SettingsManager::clamp(AppSettings& s) {
    if (s.displayName.size() > MAX_DISPLAY_NAME) {
        s.displayName.resize(MAX_DISPLAY_NAME);
    }

    TransferSettings& t = s.transfer;
    t.maxReceiveFileSize = clampSizeLimit(t.maxReceiveFileSize, DEFAULT_MAX_FILE_SIZE_BYTES);
    t.maxTotalReceiveSize = clampSizeLimit(t.maxTotalReceiveSize, DEFAULT_MAX_TOTAL_SIZE_BYTES);
    t.maxConcurrentTasks = std::clamp<size_t>(t.maxConcurrentTasks, 1, MAX_CONCURRENT_TRANSFERS_LIMIT);
    t.maxChunkSizeKb = std::clamp<uint32_t>(t.maxChunkSizeKb, MIN_CHUNK_SIZE_KB, MAX_CHUNK_SIZE_KB);
    t.autoCleanupDelaySeconds = std::clamp(t.autoCleanupDelaySeconds, 0, 3600);
}

}  // namespace P2Lan
