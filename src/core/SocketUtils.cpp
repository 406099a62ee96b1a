/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers
 */

#include "p2lan/SocketUtils.h"
#include "p2lan/config.h"
#include "p2lan/Debug.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace P2Lan {

std::string socketErrorString(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

void closeSocket(int& fd) {
    if (fd == INVALID_SOCKET_FD) {
        return;
    }
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
    fd = INVALID_SOCKET_FD;
}

void shutdownSocket(int fd) {
    if (fd != INVALID_SOCKET_FD) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

bool sendExact(int fd, const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!data || size == 0) {
        return true;  // Nothing to send
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        ssize_t sent = ::send(fd, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errorMsg = "send() timed out";
                return false;
            }
            errorMsg = "send() failed: " + socketErrorString(errno);
            return false;
        }
        if (sent == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return true;
}

bool recvSome(int fd, uint8_t* buffer, size_t size, size_t& received,
              bool& timedOut, std::string& errorMsg)
{
    received = 0;
    timedOut = false;

    for (;;) {
        ssize_t n = ::recv(fd, buffer, size, 0);
        if (n > 0) {
            received = static_cast<size_t>(n);
            return true;
        }
        if (n == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            timedOut = true;
            return true;
        }
        errorMsg = "recv() failed: " + socketErrorString(errno);
        return false;
    }
}

namespace {

bool setTimeoutOption(int fd, int option, int timeoutMs) {
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

bool makeAddress(const std::string& ip, uint16_t port, sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    return ::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

}  // namespace

bool setRecvTimeout(int fd, int timeoutMs) {
    return setTimeoutOption(fd, SO_RCVTIMEO, timeoutMs);
}

bool setSendTimeout(int fd, int timeoutMs) {
    return setTimeoutOption(fd, SO_SNDTIMEO, timeoutMs);
}

int connectWithTimeout(const std::string& ip, uint16_t port, int timeoutMs,
                       std::string& errorMsg)
{
    sockaddr_in addr{};
    if (!makeAddress(ip, port, addr)) {
        errorMsg = "Invalid IPv4 address: " + ip;
        return INVALID_SOCKET_FD;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        errorMsg = "socket() failed: " + socketErrorString(errno);
        return INVALID_SOCKET_FD;
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        errorMsg = "fcntl() failed: " + socketErrorString(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        errorMsg = "connect() to " + ip + ":" + std::to_string(port) + " failed: " + socketErrorString(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready;
        do {
            ready = ::poll(&pfd, 1, timeoutMs);
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            errorMsg = "connect() to " + ip + ":" + std::to_string(port) + " timed out";
            ::close(fd);
            return INVALID_SOCKET_FD;
        }
        if (ready < 0) {
            errorMsg = "poll() failed: " + socketErrorString(errno);
            ::close(fd);
            return INVALID_SOCKET_FD;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
            errorMsg = "connect() to " + ip + ":" + std::to_string(port) + " failed: " +
                       socketErrorString(soError != 0 ? soError : errno);
            ::close(fd);
            return INVALID_SOCKET_FD;
        }
    }

    if (::fcntl(fd, F_SETFL, flags) < 0) {
        errorMsg = "fcntl() failed: " + socketErrorString(errno);
        ::close(fd);
        return INVALID_SOCKET_FD;
    }

    int noDelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
    return fd;
}

int bindTcpListener(uint16_t firstPort, uint16_t lastPort, uint16_t& boundPort,
                    std::string& errorMsg)
{
    for (uint32_t port = firstPort; port <= lastPort; ++port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            errorMsg = "socket() failed: " + socketErrorString(errno);
            return INVALID_SOCKET_FD;
        }

        // Allows rebinding over TIME_WAIT, never over a live listener
        int reuse = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            ::listen(fd, SOMAXCONN) == 0) {
            boundPort = static_cast<uint16_t>(port);
            return fd;
        }

        LOG_DEBUG("[Socket] TCP port " << port << " unavailable: " << socketErrorString(errno));
        ::close(fd);
    }

    errorMsg = "No free TCP port in range " + std::to_string(firstPort) + "-" + std::to_string(lastPort);
    return INVALID_SOCKET_FD;
}

int bindUdpBroadcastSocket(uint16_t firstPort, uint16_t lastPort, uint16_t& boundPort,
                           std::string& errorMsg)
{
    for (uint32_t port = firstPort; port <= lastPort; ++port) {
        int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (fd < 0) {
            errorMsg = "socket() failed: " + socketErrorString(errno);
            return INVALID_SOCKET_FD;
        }

        int broadcastEnable = 1;
        if (::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &broadcastEnable, sizeof(broadcastEnable)) < 0) {
            errorMsg = "SO_BROADCAST failed: " + socketErrorString(errno);
            ::close(fd);
            return INVALID_SOCKET_FD;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
            boundPort = static_cast<uint16_t>(port);
            return fd;
        }

        LOG_DEBUG("[Socket] UDP port " << port << " unavailable: " << socketErrorString(errno));
        ::close(fd);
    }

    errorMsg = "No free UDP port in range " + std::to_string(firstPort) + "-" + std::to_string(lastPort);
    return INVALID_SOCKET_FD;
}

std::vector<std::string> getBroadcastAddresses() {
    std::vector<std::string> result;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) == 0) {
        for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
                continue;
            }
            if (!(ifa->ifa_flags & IFF_BROADCAST) || !ifa->ifa_broadaddr) {
                continue;
            }

            const auto* bcast = reinterpret_cast<const sockaddr_in*>(ifa->ifa_broadaddr);
            std::string ip = addressToString(*bcast);
            if (!ip.empty() && std::find(result.begin(), result.end(), ip) == result.end()) {
                result.push_back(ip);
            }
        }
        ::freeifaddrs(list);
    } else {
        LOG_WARNING("[Socket] getifaddrs() failed: " << socketErrorString(errno));
    }

    if (std::find(result.begin(), result.end(), BROADCAST_ADDRESS) == result.end()) {
        result.push_back(BROADCAST_ADDRESS);
    }
    return result;
}

std::string addressToString(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {};
    if (!::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return {};
    }
    return buf;
}

bool isValidIpv4(const std::string& ip) {
    in_addr addr{};
    return ::inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

}  // namespace P2Lan
