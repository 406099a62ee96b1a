/**
 * @file MessageDispatcher.h
 * @brief Routing table from message type to the owning subsystem
 */

#pragma once

#include "WireMessage.h"

#include <functional>
#include <map>
#include <shared_mutex>

namespace P2Lan {

/**
 * @brief One handler per MessageType
 *
 * Handlers run on the connection reader thread of the sending peer, so a
 * slow handler only delays that peer.
 */
class MessageDispatcher {
public:
    using Handler = std::function<void(const WireMessage&)>;

    /**
     * @return false if a handler is already registered for the type
     */
    bool registerHandler(MessageType type, Handler handler);

    bool hasHandler(MessageType type) const;

    /**
     * @brief Route a decoded message
     * @return false if the type is unknown or has no handler (logged, dropped)
     */
    bool dispatch(const WireMessage& message) const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<MessageType, Handler> m_handlers;
};

}  // namespace P2Lan
