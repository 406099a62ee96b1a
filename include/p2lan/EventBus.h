/**
 * @file EventBus.h
 * @brief Typed publish/subscribe channel between the core and its observers
 */

#pragma once

#include "ServiceEvents.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace P2Lan {

/**
 * @brief Fan-out of ServiceEvent values to registered handlers
 *
 * Handlers run on the publishing thread, outside the bus lock, so a handler
 * may publish or unsubscribe without deadlocking. A handler that throws is
 * logged and the remaining handlers still run.
 */
class EventBus {
public:
    using SubscriptionId = uint64_t;
    using Handler = std::function<void(const ServiceEvent&)>;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler
     * @return Id to pass to unsubscribe(), never 0
     */
    SubscriptionId subscribe(Handler handler);

    /**
     * @brief Remove a handler
     * @return false if the id is unknown
     */
    bool unsubscribe(SubscriptionId id);

    void publish(const ServiceEvent& event);

    size_t subscriberCount() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<Handler> handler;
    };

    mutable std::shared_mutex m_mutex;
    std::vector<Subscription> m_subscriptions;
    SubscriptionId m_nextId = 1;
};

}  // namespace P2Lan
