/**
 * @file NetworkSecurityProbe.cpp
 * @brief Interface-based network security probe
 */

#include "p2lan/NetworkSecurityProbe.h"
#include "p2lan/SocketUtils.h"

#include <fstream>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace P2Lan {

std::string securityLevelToString(NetworkSecurityLevel level) {
    switch (level) {
        case NetworkSecurityLevel::Secure:   return "secure";
        case NetworkSecurityLevel::Unsecure: return "unsecure";
        case NetworkSecurityLevel::Unknown:  return "unknown";
    }
    return "unknown";
}

bool InterfaceSecurityProbe::isWirelessInterface(const std::string& name) {
    std::ifstream wireless("/proc/net/wireless");
    if (!wireless.is_open()) {
        return false;
    }

    // Two header lines, then "  wlan0: ..." per wireless interface
    std::string line;
    while (std::getline(wireless, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string ifname = line.substr(0, colon);
        const auto first = ifname.find_first_not_of(' ');
        if (first == std::string::npos) {
            continue;
        }
        if (ifname.substr(first) == name) {
            return true;
        }
    }
    return false;
}

NetworkInfo InterfaceSecurityProbe::check() {
    NetworkInfo info;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        return info;
    }

    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_RUNNING) ||
            (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        info.hasConnection = true;
        info.interfaceName = ifa->ifa_name ? ifa->ifa_name : "";
        info.ipAddress = addressToString(*reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr));
        info.securityLevel = isWirelessInterface(info.interfaceName)
            ? NetworkSecurityLevel::Unknown
            : NetworkSecurityLevel::Secure;
        break;
    }

    ::freeifaddrs(list);
    return info;
}

StaticSecurityProbe::StaticSecurityProbe(NetworkInfo info)
    : m_info(std::move(info))
{
}

NetworkInfo StaticSecurityProbe::check() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_info;
}

void StaticSecurityProbe::set(NetworkInfo info) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_info = std::move(info);
}

}  // namespace P2Lan
