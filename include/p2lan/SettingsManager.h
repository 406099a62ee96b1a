/**
 * @file SettingsManager.h
 * @brief Settings persistence manager (config.json)
 */

#pragma once

#include "PeerInfo.h"
#include "TransferEngine.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @brief Every runtime setting of a node
 */
struct AppSettings {
    std::string deviceUuid;          ///< Generated once, never changes
    std::string identityKey;         ///< Ed25519 private key, hex; generated once, never changes
    std::string displayName;
    std::string profileId;

    TransferSettings transfer;

    bool autoAcceptTrustedRemoteControl = true;
    bool autoAcceptTrustedScreenSharing = true;
    bool allowUnverifiedNetworks = false;
};

/**
 * @class SettingsManager
 * @brief Loads, validates and saves config.json
 *
 * Features:
 * - Automatic UUID and identity key generation on first run
 * - Missing or invalid values fall back to defaults; numeric values are clamped
 * - Unparseable files are replaced with defaults and re-saved
 * - Writes go through writeFileAtomically (temp file then rename)
 */
class SettingsManager {
public:
    /**
     * @param configPath Empty = AppPaths::configJsonPath()
     */
    explicit SettingsManager(std::filesystem::path configPath = {});

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    /**
     * @brief Load settings from disk, creating the file on first run
     * @return false only if the file could not be (re)written
     */
    bool load(std::string& errorMsg);

    bool save(std::string& errorMsg);

    AppSettings settings() const;

    /**
     * @brief Replace all settings (device UUID and identity key are kept) and save
     */
    bool update(const AppSettings& settings, std::string& errorMsg);

    /**
     * @brief Identity announced to peers, derived from the settings
     */
    LocalIdentity identity() const;

    const std::filesystem::path& configPath() const { return m_configPath; }

    static AppSettings fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const AppSettings& settings);

    /**
     * @brief Clamp every numeric setting into its valid range
     */
    static void clamp(AppSettings& settings);

    static std::string defaultDisplayName();

private:
    std::filesystem::path m_configPath;

    mutable std::mutex m_mutex;
    AppSettings m_settings;
};

}  // namespace P2Lan
