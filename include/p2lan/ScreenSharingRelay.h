/**
 * @file ScreenSharingRelay.h
 * @brief Screen-sharing signaling (offer / answer / ice-candidate relay)
 */

#pragma once

#include "SignalingRelay.h"

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @brief Negotiated stream profile
 *
 * "auto" carries zero dimensions and lets the capture side decide.
 */
struct ScreenSharingQuality {
    std::string name;
    int width = 0;
    int height = 0;
    int fps = 0;
    int bitrateKbps = 0;
};

/**
 * @brief Look up a preset by name (low, medium, high, auto)
 */
std::optional<ScreenSharingQuality> screenSharingQualityFromName(const std::string& name);

/**
 * @class ScreenSharingRelay
 * @brief Bootstraps an out-of-band media channel between two peers
 *
 * The requester is the sharer; the accepting peer is the viewer. Only the
 * sharer may send an offer and only the viewer may send an answer; both
 * sides may send ICE candidates.
 */
class ScreenSharingRelay : public SignalingRelay {
public:
    ScreenSharingRelay(TrustStore& store, PeerMessenger& messenger, EventBus& bus,
                       TimerQueue& timers, RelayTimeouts timeouts = RelayTimeouts());

    CommandResult sendScreenSharingRequest(const std::string& peerId, const std::string& quality);
    CommandResult respondToScreenSharingRequest(const std::string& requestId, bool accept);

    /**
     * @brief Select the capture source for the accepted session
     */
    CommandResult startSharing(int screenIndex);

    CommandResult sendSignal(const std::string& type, const nlohmann::json& data);

    CommandResult stopSharing();
    CommandResult stopReceiving();

    static bool isValidSignalType(const std::string& type);

protected:
    void onSessionData(const RelaySession& session, const WireMessage& message) override;
    void publishRequestReceived(const RelayRequestInfo& request) override;
    void publishRequestRejected(const std::string& requestId, const std::string& peerId,
                                const std::string& reason) override;
    void publishSessionStarted(const RelaySession& session) override;
    void publishSessionEnded(const RelaySession& session, const std::string& reason) override;
};

}  // namespace P2Lan
