/**
 * @file PeerMessenger.h
 * @brief "Send message to peer X" capability handed to subsystems
 */

#pragma once

#include "WireMessage.h"

#include <string>

namespace P2Lan {

/**
 * @brief Outbound half of a peer session
 *
 * Subsystems never see sockets; they submit messages here and the
 * implementation serializes them per peer. fromUserId and toUserId are
 * filled in by the implementation.
 */
class PeerMessenger {
public:
    virtual ~PeerMessenger() = default;

    virtual std::string localId() const = 0;

    /**
     * @brief Queue a message for a peer (single attempt, no retry)
     * @return false if the peer is unreachable or its queue is closed
     */
    virtual bool sendMessageToUser(const std::string& peerId, const WireMessage& message) = 0;

    /**
     * @brief Queue a message and wait until it has been written to the socket
     * @return Actual write result
     */
    virtual bool sendMessageAndWait(const std::string& peerId, const WireMessage& message,
                                    std::string& errorMsg) = 0;

    virtual bool isConnected(const std::string& peerId) const = 0;
};

}  // namespace P2Lan
