/**
 * @file NetworkSecurityProbe.h
 * @brief Precondition check: is the current link acceptable to run on
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace P2Lan {

enum class NetworkSecurityLevel {
    Secure,
    Unsecure,
    Unknown
};

std::string securityLevelToString(NetworkSecurityLevel level);

struct NetworkInfo {
    bool hasConnection = false;
    NetworkSecurityLevel securityLevel = NetworkSecurityLevel::Unknown;
    std::string interfaceName;
    std::string ipAddress;
};

/**
 * @brief Collaborator answering whether networking may be enabled
 */
class NetworkSecurityProbe {
public:
    virtual ~NetworkSecurityProbe() = default;
    virtual NetworkInfo check() = 0;
};

/**
 * @brief Probe based on the local interface list
 *
 * - First up, non-loopback IPv4 interface wins
 * - Wired interface: Secure
 * - Wireless interface (listed in /proc/net/wireless): Unknown, the
 *   encryption of the access point cannot be read portably
 * - No such interface: no connection
 */
class InterfaceSecurityProbe : public NetworkSecurityProbe {
public:
    NetworkInfo check() override;

    static bool isWirelessInterface(const std::string& name);
};

/**
 * @brief Probe with a fixed, settable answer
 *
 * Used by tests and by hosts that get the answer from the platform.
 */
class StaticSecurityProbe : public NetworkSecurityProbe {
public:
    explicit StaticSecurityProbe(NetworkInfo info);

    NetworkInfo check() override;
    void set(NetworkInfo info);

private:
    std::mutex m_mutex;
    NetworkInfo m_info;
};

}  // namespace P2Lan
