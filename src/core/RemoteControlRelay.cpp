/**
 * @file RemoteControlRelay.cpp
 * @brief Remote-control signaling
 */

#include "p2lan/RemoteControlRelay.h"
#include "p2lan/Debug.h"
#include "p2lan/ErrorCodes.h"
#include "p2lan/EventBus.h"
#include "p2lan/ServiceEvents.h"

#include <algorithm>
#include <array>

namespace P2Lan {

namespace {
    constexpr const char* EVENT_DISCONNECT = "disconnect";

    const std::array<const char*, 27> EVENT_TYPES = {
        "mouseMove", "leftClick", "rightClick", "middleClick",
        "startLeftLongClick", "stopLeftLongClick",
        "startMiddleLongClick", "stopMiddleLongClick",
        "startRightLongClick", "stopRightLongClick",
        "scroll", "scrollUp", "scrollDown", "disconnect",
        "twoFingerScroll", "twoFingerTap", "twoFingerSlowTap", "twoFingerDragDrop",
        "threeFingerSwipeUp", "threeFingerSwipeDown", "threeFingerSwipeLeft", "threeFingerSwipeRight",
        "threeFingerTap", "fourFingerTap",
        "keyDown", "keyUp", "sendText"
    };

    const SignalingRelay::Protocol REMOTE_CONTROL_PROTOCOL = {
        MessageType::RemoteControlRequest,
        MessageType::RemoteControlResponse,
        MessageType::RemoteControlEvent,
        MessageType::RemoteControlDisconnect,
        "RemoteControl",
        "rc_"
    };
}

RemoteControlRelay::RemoteControlRelay(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                                       TimerQueue& timers, RelayTimeouts timeouts)
    : SignalingRelay(REMOTE_CONTROL_PROTOCOL, store, messenger, bus, timers, timeouts)
{
}

bool RemoteControlRelay::isValidEventType(const std::string& type) {
    return std::any_of(EVENT_TYPES.begin(), EVENT_TYPES.end(),
                       [&type](const char* known) { return type == known; });
}

CommandResult RemoteControlRelay::sendRemoteControlRequest(const std::string& peerId) {
    return sendRequest(peerId, nlohmann::json::object());
}

CommandResult RemoteControlRelay::respondToRemoteControlRequest(const std::string& requestId, bool accept) {
    return respondToRequest(requestId, accept);
}

CommandResult RemoteControlRelay::sendEvent(const nlohmann::json& event) {
    if (!event.is_object() || !event.contains("type") || !event["type"].is_string()) {
        return CommandResult::fail(ErrorCodes::SESSION_INVALID_SIGNAL, "Event must be an object with a type");
    }
    const std::string type = event["type"].get<std::string>();
    if (!isValidEventType(type)) {
        return CommandResult::fail(ErrorCodes::SESSION_INVALID_SIGNAL, "Unknown event type: " + type);
    }

    CommandResult result = sendSessionData({{"event", event}}, true);
    if (result && type == EVENT_DISCONNECT) {
        endSession("Disconnected by controller", false);
    }
    return result;
}

void RemoteControlRelay::onSessionData(const RelaySession& session, const WireMessage& message) {
    if (session.isRequester) {
        LOG_WARNING("[RemoteControl] Controller received an event from " << message.fromUserId << "; dropped");
        return;
    }
    const auto it = message.data.find("event");
    if (it == message.data.end() || !it->is_object()) {
        LOG_WARNING("[RemoteControl] Dropping event without payload from " << message.fromUserId);
        return;
    }
    const std::string type = it->value("type", "");
    if (!isValidEventType(type)) {
        LOG_WARNING("[RemoteControl] Dropping unknown event type '" << type << "'");
        return;
    }

    bus().publish(RemoteControlEventReceived{session.sessionId, session.peerId, *it});
    if (type == EVENT_DISCONNECT) {
        endSession("Disconnected by controller", false);
    }
}

void RemoteControlRelay::publishRequestReceived(const RelayRequestInfo& request) {
    bus().publish(RemoteControlRequestReceived{request.requestId, request.peerId, request.peerName});
}

void RemoteControlRelay::publishRequestRejected(const std::string& requestId, const std::string& peerId,
                                                const std::string& reason)
{
    bus().publish(RemoteControlRequestRejected{requestId, peerId, reason});
}

void RemoteControlRelay::publishSessionStarted(const RelaySession& session) {
    bus().publish(RemoteControlSessionStarted{session.sessionId, session.peerId, session.isRequester});
}

void RemoteControlRelay::publishSessionEnded(const RelaySession& session, const std::string& reason) {
    bus().publish(RemoteControlSessionEnded{session.sessionId, session.peerId, reason});
}

}  // namespace P2Lan
