/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for P2Lan.
 */

#include "p2lan/AppPaths.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace P2Lan {

static std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return {};
    }
    return std::filesystem::path(value);
}

std::filesystem::path AppPaths::homeDir() {
    auto home = envPath("HOME");
    if (!home.empty()) {
        return home;
    }

    const passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
    return std::filesystem::temp_directory_path();
}

std::filesystem::path AppPaths::configDir() {
    auto overrideDir = envPath("P2LAN_CONFIG_DIR");
    if (!overrideDir.empty()) {
        return overrideDir;
    }

    auto xdg = envPath("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return xdg / "p2lan";
    }
    return homeDir() / ".config" / "p2lan";
}

std::filesystem::path AppPaths::configJsonPath() {
    return configDir() / "config.json";
}

std::filesystem::path AppPaths::dataDir() {
    auto xdg = envPath("XDG_DATA_HOME");
    if (!xdg.empty()) {
        return xdg / "p2lan";
    }
    return homeDir() / ".local" / "share" / "p2lan";
}

std::filesystem::path AppPaths::logsDir() {
    return dataDir() / "logs";
}

std::filesystem::path AppPaths::traceLogPath() {
    return logsDir() / "p2lan_trace.txt";
}

std::filesystem::path AppPaths::defaultDownloadDir() {
    return homeDir() / "Downloads" / "P2Lan";
}

}  // namespace P2Lan
