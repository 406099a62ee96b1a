/**
 * @file MessageDispatcher.cpp
 * @brief MessageDispatcher implementation
 */

#include "p2lan/MessageDispatcher.h"
#include "p2lan/Debug.h"

#include <mutex>

namespace P2Lan {

bool MessageDispatcher::registerHandler(MessageType type, Handler handler) {
    if (type == MessageType::Unknown || !handler) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_handlers.emplace(type, std::move(handler)).second;
}

bool MessageDispatcher::hasHandler(MessageType type) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_handlers.find(type) != m_handlers.end();
}

bool MessageDispatcher::dispatch(const WireMessage& message) const {
    if (message.type == MessageType::Unknown) {
        LOG_WARNING("[Dispatch] Unknown message type '" << message.rawType << "' from "
                    << message.fromUserId << ", dropped");
        return false;
    }

    Handler handler;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_handlers.find(message.type);
        if (it == m_handlers.end()) {
            LOG_WARNING("[Dispatch] No handler for '" << messageTypeToString(message.type)
                        << "', dropped");
            return false;
        }
        handler = it->second;
    }

    try {
        handler(message);
    } catch (const nlohmann::json::exception& e) {
        // Missing or mistyped payload field
        LOG_WARNING("[Dispatch] Bad '" << messageTypeToString(message.type) << "' payload from "
                    << message.fromUserId << ": " << e.what());
        return false;
    }
    return true;
}

}  // namespace P2Lan
