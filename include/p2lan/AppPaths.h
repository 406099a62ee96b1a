/**
 * @file AppPaths.h
 * @brief Canonical storage paths for P2Lan (XDG layout).
 *
 * This module provides a stable, testable path contract:
 * - Config: $P2LAN_CONFIG_DIR/config.json, else $XDG_CONFIG_HOME/p2lan/config.json,
 *           else ~/.config/p2lan/config.json
 * - Data:   $XDG_DATA_HOME/p2lan, else ~/.local/share/p2lan (peer store, logs)
 * - Downloads: ~/Downloads/P2Lan
 */

#pragma once

#include <filesystem>

namespace P2Lan {

class AppPaths {
public:
    /**
     * @brief Returns $HOME, or the passwd entry of the current user.
     */
    static std::filesystem::path homeDir();

    /**
     * @brief Returns the configuration directory.
     */
    static std::filesystem::path configDir();

    /**
     * @brief Returns canonical config.json path.
     */
    static std::filesystem::path configJsonPath();

    /**
     * @brief Returns the data directory holding the peer store.
     */
    static std::filesystem::path dataDir();

    /**
     * @brief Returns canonical logs directory.
     */
    static std::filesystem::path logsDir();

    /**
     * @brief Returns the trace log path used by ThreadSafeLog.
     */
    static std::filesystem::path traceLogPath();

    /**
     * @brief Returns the default download directory.
     */
    static std::filesystem::path defaultDownloadDir();
};

}  // namespace P2Lan
