/**
 * @file RemoteControlRelay.h
 * @brief Remote-control session signaling (controller -> controlled input events)
 */

#pragma once

#include "SignalingRelay.h"

#include <string>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @class RemoteControlRelay
 * @brief Carries opaque input events from the controlling peer
 *
 * The requester becomes the controller. Events are neither interpreted nor
 * injected here; a platform collaborator consumes RemoteControlEventReceived.
 */
class RemoteControlRelay : public SignalingRelay {
public:
    RemoteControlRelay(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                       TimerQueue& timers, RelayTimeouts timeouts = RelayTimeouts());

    CommandResult sendRemoteControlRequest(const std::string& peerId);
    CommandResult respondToRemoteControlRequest(const std::string& requestId, bool accept);

    /**
     * @brief Relay one input event to the controlled peer
     *
     * A "disconnect" event is delivered and then ends the session.
     */
    CommandResult sendEvent(const nlohmann::json& event);

    static bool isValidEventType(const std::string& type);

protected:
    void onSessionData(const RelaySession& session, const WireMessage& message) override;
    void publishRequestReceived(const RelayRequestInfo& request) override;
    void publishRequestRejected(const std::string& requestId, const std::string& peerId,
                                const std::string& reason) override;
    void publishSessionStarted(const RelaySession& session) override;
    void publishSessionEnded(const RelaySession& session, const std::string& reason) override;
};

}  // namespace P2Lan
