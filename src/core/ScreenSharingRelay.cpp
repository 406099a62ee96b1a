/**
 * @file ScreenSharingRelay.cpp
 * @brief Screen-sharing signaling
 */

#include "p2lan/ScreenSharingRelay.h"
#include "p2lan/Debug.h"
#include "p2lan/ErrorCodes.h"
#include "p2lan/EventBus.h"
#include "p2lan/ServiceEvents.h"
#include "p2lan/ThreadSafeLog.h"

namespace P2Lan {

namespace {
    constexpr const char* SIGNAL_OFFER = "offer";
    constexpr const char* SIGNAL_ANSWER = "answer";
    constexpr const char* SIGNAL_ICE_CANDIDATE = "ice-candidate";

    const SignalingRelay::Protocol SCREEN_SHARING_PROTOCOL = {
        MessageType::ScreenSharingRequest,
        MessageType::ScreenSharingResponse,
        MessageType::ScreenSharingData,
        MessageType::ScreenSharingDisconnect,
        "ScreenSharing",
        "ss_"
    };
}

std::optional<ScreenSharingQuality> screenSharingQualityFromName(const std::string& name) {
    if (name == "low") {
        return ScreenSharingQuality{"low", 640, 480, 15, 500};
    }
    if (name == "medium") {
        return ScreenSharingQuality{"medium", 1280, 720, 20, 1000};
    }
    if (name == "high") {
        return ScreenSharingQuality{"high", 1920, 1080, 25, 2000};
    }
    if (name == "auto") {
        return ScreenSharingQuality{"auto", 0, 0, 0, 0};
    }
    return std::nullopt;
}

ScreenSharingRelay::ScreenSharingRelay(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                                       TimerQueue& timers, RelayTimeouts timeouts)
    : SignalingRelay(SCREEN_SHARING_PROTOCOL, store, messenger, bus, timers, timeouts)
{
}

bool ScreenSharingRelay::isValidSignalType(const std::string& type) {
    return type == SIGNAL_OFFER || type == SIGNAL_ANSWER || type == SIGNAL_ICE_CANDIDATE;
}

CommandResult ScreenSharingRelay::sendScreenSharingRequest(const std::string& peerId,
                                                           const std::string& quality)
{
    auto preset = screenSharingQualityFromName(quality.empty() ? "auto" : quality);
    if (!preset) {
        return CommandResult::fail(ErrorCodes::INVALID_ARGUMENT, "Unknown quality preset: " + quality);
    }
    return sendRequest(peerId, {{"quality", preset->name}});
}

CommandResult ScreenSharingRelay::respondToScreenSharingRequest(const std::string& requestId, bool accept) {
    return respondToRequest(requestId, accept);
}

CommandResult ScreenSharingRelay::startSharing(int screenIndex) {
    if (screenIndex < 0) {
        return CommandResult::fail(ErrorCodes::INVALID_ARGUMENT, "Screen index must not be negative");
    }
    auto session = activeSession();
    if (!session) {
        return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "No accepted screen-sharing session");
    }
    if (!session->isRequester) {
        return CommandResult::fail(ErrorCodes::SESSION_WRONG_ROLE, "Only the sharer can start sharing");
    }
    if (!updateSessionParams({{"screenIndex", screenIndex}})) {
        return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "Session ended");
    }
    ThreadSafeLog::log("[ScreenSharing] Sharing screen " + std::to_string(screenIndex)
                       + " in session " + session->sessionId);
    return CommandResult::ok(session->sessionId);
}

CommandResult ScreenSharingRelay::sendSignal(const std::string& type, const nlohmann::json& data) {
    if (!isValidSignalType(type)) {
        return CommandResult::fail(ErrorCodes::SESSION_INVALID_SIGNAL, "Unknown signal type: " + type);
    }
    std::optional<bool> role;
    if (type == SIGNAL_OFFER) {
        role = true;
    } else if (type == SIGNAL_ANSWER) {
        role = false;
    }
    return sendSessionData({{"type", type}, {"data", data}}, role);
}

CommandResult ScreenSharingRelay::stopSharing() {
    auto session = activeSession();
    if (!session) {
        return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "No active screen-sharing session");
    }
    if (!session->isRequester) {
        return CommandResult::fail(ErrorCodes::SESSION_WRONG_ROLE, "This device is not sharing");
    }
    return disconnect("Sharing stopped");
}

CommandResult ScreenSharingRelay::stopReceiving() {
    auto session = activeSession();
    if (!session) {
        return CommandResult::fail(ErrorCodes::SESSION_NOT_ACTIVE, "No active screen-sharing session");
    }
    if (session->isRequester) {
        return CommandResult::fail(ErrorCodes::SESSION_WRONG_ROLE, "This device is not receiving");
    }
    return disconnect("Viewer stopped");
}

void ScreenSharingRelay::onSessionData(const RelaySession& session, const WireMessage& message) {
    const std::string type = message.data.value("type", "");
    if (!isValidSignalType(type)) {
        LOG_WARNING("[ScreenSharing] Dropping signal of unknown type '" << type << "' from "
                    << message.fromUserId);
        return;
    }
    nlohmann::json data = message.data.contains("data") ? message.data["data"] : nlohmann::json();
    bus().publish(ScreenSharingSignalReceived{session.sessionId, session.peerId, type, data});
}

void ScreenSharingRelay::publishRequestReceived(const RelayRequestInfo& request) {
    bus().publish(ScreenSharingRequestReceived{request.requestId, request.peerId, request.peerName,
                                               request.params.value("quality", "auto")});
}

void ScreenSharingRelay::publishRequestRejected(const std::string& requestId, const std::string& peerId,
                                                const std::string& reason)
{
    bus().publish(ScreenSharingRequestRejected{requestId, peerId, reason});
}

void ScreenSharingRelay::publishSessionStarted(const RelaySession& session) {
    bus().publish(ScreenSharingSessionStarted{session.sessionId, session.peerId, session.isRequester});
}

void ScreenSharingRelay::publishSessionEnded(const RelaySession& session, const std::string& reason) {
    bus().publish(ScreenSharingSessionEnded{session.sessionId, session.peerId, reason});
}

}  // namespace P2Lan
