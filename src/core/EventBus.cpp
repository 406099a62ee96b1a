/**
 * @file EventBus.cpp
 * @brief EventBus implementation and event naming
 */

#include "p2lan/EventBus.h"
#include "p2lan/Debug.h"

#include <algorithm>
#include <mutex>

namespace P2Lan {

std::string networkStateToString(NetworkState state) {
    switch (state) {
        case NetworkState::Disabled:               return "disabled";
        case NetworkState::Enabling:               return "enabling";
        case NetworkState::Enabled:                return "enabled";
        case NetworkState::Disabling:              return "disabling";
        case NetworkState::WaitingForConnectivity: return "waiting_for_connectivity";
    }
    return "disabled";
}

namespace {

struct EventNameVisitor {
    const char* operator()(const PeerUpdated&) const { return "PeerUpdated"; }
    const char* operator()(const PeerRemoved&) const { return "PeerRemoved"; }
    const char* operator()(const PeerDisconnected&) const { return "PeerDisconnected"; }
    const char* operator()(const PairingRequestReceived&) const { return "PairingRequestReceived"; }
    const char* operator()(const PairingRequestExpired&) const { return "PairingRequestExpired"; }
    const char* operator()(const PairingCompleted&) const { return "PairingCompleted"; }
    const char* operator()(const PairingRejected&) const { return "PairingRejected"; }
    const char* operator()(const FileTransferRequestReceived&) const { return "FileTransferRequestReceived"; }
    const char* operator()(const FileTransferRequestExpired&) const { return "FileTransferRequestExpired"; }
    const char* operator()(const TransferStatusChanged&) const { return "TransferStatusChanged"; }
    const char* operator()(const TransferProgress&) const { return "TransferProgress"; }
    const char* operator()(const TransferRemoved&) const { return "TransferRemoved"; }
    const char* operator()(const RemoteControlRequestReceived&) const { return "RemoteControlRequestReceived"; }
    const char* operator()(const RemoteControlRequestRejected&) const { return "RemoteControlRequestRejected"; }
    const char* operator()(const RemoteControlSessionStarted&) const { return "RemoteControlSessionStarted"; }
    const char* operator()(const RemoteControlSessionEnded&) const { return "RemoteControlSessionEnded"; }
    const char* operator()(const RemoteControlEventReceived&) const { return "RemoteControlEventReceived"; }
    const char* operator()(const ScreenSharingRequestReceived&) const { return "ScreenSharingRequestReceived"; }
    const char* operator()(const ScreenSharingRequestRejected&) const { return "ScreenSharingRequestRejected"; }
    const char* operator()(const ScreenSharingSessionStarted&) const { return "ScreenSharingSessionStarted"; }
    const char* operator()(const ScreenSharingSessionEnded&) const { return "ScreenSharingSessionEnded"; }
    const char* operator()(const ScreenSharingSignalReceived&) const { return "ScreenSharingSignalReceived"; }
    const char* operator()(const NetworkStateChanged&) const { return "NetworkStateChanged"; }
    const char* operator()(const ServiceError&) const { return "ServiceError"; }
};

}  // namespace

const char* eventName(const ServiceEvent& event) {
    return std::visit(EventNameVisitor{}, event);
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    SubscriptionId id = m_nextId++;
    m_subscriptions.push_back({id, std::make_shared<Handler>(std::move(handler))});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == m_subscriptions.end()) {
        return false;
    }
    m_subscriptions.erase(it);
    return true;
}

void EventBus::publish(const ServiceEvent& event) {
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        handlers.reserve(m_subscriptions.size());
        for (const auto& sub : m_subscriptions) {
            handlers.push_back(sub.handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            LOG_ERROR("[EventBus] Handler for " << eventName(event) << " threw: " << e.what());
        }
    }
}

size_t EventBus::subscriberCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_subscriptions.size();
}

}  // namespace P2Lan
