/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers shared by discovery and sessions
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct sockaddr_in;

namespace P2Lan {

constexpr int INVALID_SOCKET_FD = -1;

/**
 * @brief strerror() text for an errno value
 */
std::string socketErrorString(int err);

/**
 * @brief shutdown(SHUT_RDWR) + close(), then reset the handle
 *
 * Safe to call on INVALID_SOCKET_FD.
 */
void closeSocket(int& fd);

/**
 * @brief Wake any thread blocked in recv() on this socket without closing it
 */
void shutdownSocket(int fd);

/**
 * @brief Send exact number of bytes
 * @return true if all bytes sent
 */
bool sendExact(int fd, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Receive up to `size` bytes
 * @param received Bytes received (0 on orderly close)
 * @param timedOut Set when the receive timeout expired with no data
 * @return false on socket error or peer close
 */
bool recvSome(int fd, uint8_t* buffer, size_t size, size_t& received,
              bool& timedOut, std::string& errorMsg);

bool setRecvTimeout(int fd, int timeoutMs);
bool setSendTimeout(int fd, int timeoutMs);

/**
 * @brief Non-blocking connect bounded by a timeout
 * @return Connected blocking socket, or INVALID_SOCKET_FD
 */
int connectWithTimeout(const std::string& ip, uint16_t port, int timeoutMs,
                       std::string& errorMsg);

/**
 * @brief Bind a TCP listener to the first free port of an inclusive range
 * @param boundPort Port that was bound
 * @return Listening socket, or INVALID_SOCKET_FD if every port is taken
 */
int bindTcpListener(uint16_t firstPort, uint16_t lastPort, uint16_t& boundPort,
                    std::string& errorMsg);

/**
 * @brief Bind a broadcast-capable UDP socket to the first free port of a range
 */
int bindUdpBroadcastSocket(uint16_t firstPort, uint16_t lastPort, uint16_t& boundPort,
                           std::string& errorMsg);

/**
 * @brief IPv4 broadcast addresses of every up, non-loopback interface
 *
 * Always ends with the limited broadcast address 255.255.255.255.
 */
std::vector<std::string> getBroadcastAddresses();

std::string addressToString(const sockaddr_in& addr);
bool isValidIpv4(const std::string& ip);

}  // namespace P2Lan
