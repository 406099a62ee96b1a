/**
 * @file signaling_relay_test.cpp
 * @brief Remote-control and screen-sharing relay tests between in-process peers
 */

#include "p2lan/ErrorCodes.h"
#include "support/FakeNetwork.h"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace P2Lan;
using namespace P2Lan::Testing;

class SignalingRelayTest : public ::testing::Test {
protected:
    FakeNetwork network;
    std::unique_ptr<TestPeer> alice;
    std::unique_ptr<TestPeer> bob;

    void createPeers(TestTimeouts aliceTimeouts = TestTimeouts(),
                     TestTimeouts bobTimeouts = TestTimeouts()) {
        alice = std::make_unique<TestPeer>(network, "alice", "Alice", aliceTimeouts);
        bob = std::make_unique<TestPeer>(network, "bob", "Bob", bobTimeouts);
    }

    void TearDown() override {
        alice.reset();
        bob.reset();
    }

    /**
     * @brief Alice asks Bob for remote control and Bob accepts
     */
    std::string startRemoteControl() {
        auto sent = alice->remoteControl.sendRemoteControlRequest("bob");
        EXPECT_TRUE(sent) << sent.message;
        auto request = bob->events.waitFor<RemoteControlRequestReceived>();
        EXPECT_TRUE(request.has_value());
        if (!request) {
            return "";
        }
        auto accepted = bob->remoteControl.respondToRemoteControlRequest(request->requestId, true);
        EXPECT_TRUE(accepted) << accepted.message;
        EXPECT_TRUE(alice->events.waitFor<RemoteControlSessionStarted>().has_value());
        return request->requestId;
    }

    /**
     * @brief Alice offers her screen to Bob and Bob accepts
     */
    std::string startScreenSharing(const std::string& quality = "medium") {
        auto sent = alice->screenSharing.sendScreenSharingRequest("bob", quality);
        EXPECT_TRUE(sent) << sent.message;
        auto request = bob->events.waitFor<ScreenSharingRequestReceived>();
        EXPECT_TRUE(request.has_value());
        if (!request) {
            return "";
        }
        auto accepted = bob->screenSharing.respondToScreenSharingRequest(request->requestId, true);
        EXPECT_TRUE(accepted) << accepted.message;
        EXPECT_TRUE(alice->events.waitFor<ScreenSharingSessionStarted>().has_value());
        return request->requestId;
    }
};

//=============================================================================
// Command preconditions
//=============================================================================

TEST_F(SignalingRelayTest, RequestNeedsKnownPairedUnblockedPeer) {
    createPeers();

    EXPECT_EQ(alice->remoteControl.sendRemoteControlRequest("bob").errorCode, ErrorCodes::PEER_UNKNOWN);

    introduce(*alice, *bob);
    EXPECT_EQ(alice->remoteControl.sendRemoteControlRequest("bob").errorCode, ErrorCodes::PEER_NOT_PAIRED);
    EXPECT_EQ(alice->screenSharing.sendScreenSharingRequest("bob", "low").errorCode,
              ErrorCodes::PEER_NOT_PAIRED);

    std::string err;
    ASSERT_TRUE(alice->trust.applyPairing("bob", false, false, err)) << err;
    ASSERT_TRUE(alice->trust.setBlocked("bob", true, err)) << err;
    EXPECT_EQ(alice->remoteControl.sendRemoteControlRequest("bob").errorCode, ErrorCodes::PEER_BLOCKED);
    EXPECT_FALSE(alice->remoteControl.hasOutgoingRequest());
}

TEST_F(SignalingRelayTest, OnlyOneOutgoingRequestAtATime) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    auto first = alice->remoteControl.sendRemoteControlRequest("bob");
    ASSERT_TRUE(first) << first.message;
    EXPECT_EQ(first.message.rfind("rc_", 0), 0u);
    EXPECT_TRUE(alice->remoteControl.hasOutgoingRequest());

    EXPECT_EQ(alice->remoteControl.sendRemoteControlRequest("bob").errorCode,
              ErrorCodes::SESSION_REQUEST_PENDING);
}

TEST_F(SignalingRelayTest, UnknownQualityPresetIsRefused) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    EXPECT_EQ(alice->screenSharing.sendScreenSharingRequest("bob", "ultra").errorCode,
              ErrorCodes::INVALID_ARGUMENT);
    EXPECT_FALSE(alice->screenSharing.hasOutgoingRequest());

    auto high = screenSharingQualityFromName("high");
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->width, 1920);
    EXPECT_FALSE(screenSharingQualityFromName("").has_value());
}

//=============================================================================
// Handshake
//=============================================================================

TEST_F(SignalingRelayTest, AcceptedRemoteControlMakesRequesterTheController) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    auto sent = alice->remoteControl.sendRemoteControlRequest("bob");
    ASSERT_TRUE(sent) << sent.message;

    auto request = bob->events.waitFor<RemoteControlRequestReceived>();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->requestId, sent.message);
    EXPECT_EQ(request->peerId, "alice");
    EXPECT_EQ(request->peerName, "Alice");
    ASSERT_EQ(bob->remoteControl.pendingRequests().size(), 1u);

    ASSERT_TRUE(bob->remoteControl.respondToRemoteControlRequest(request->requestId, true));

    auto controller = alice->events.waitFor<RemoteControlSessionStarted>();
    ASSERT_TRUE(controller.has_value());
    EXPECT_TRUE(controller->isController);
    EXPECT_EQ(controller->sessionId, sent.message);

    auto controlled = bob->events.waitFor<RemoteControlSessionStarted>();
    ASSERT_TRUE(controlled.has_value());
    EXPECT_FALSE(controlled->isController);
    EXPECT_EQ(controlled->peerId, "alice");

    EXPECT_TRUE(bob->remoteControl.pendingRequests().empty());
    EXPECT_FALSE(alice->remoteControl.hasOutgoingRequest());
    ASSERT_TRUE(alice->remoteControl.activeSession().has_value());
    EXPECT_EQ(alice->remoteControl.activeSession()->peerId, "bob");
}

TEST_F(SignalingRelayTest, RejectedRequestReachesRequester) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    auto request = bob->events.waitFor<RemoteControlRequestReceived>();
    ASSERT_TRUE(request.has_value());

    ASSERT_TRUE(bob->remoteControl.respondToRemoteControlRequest(request->requestId, false));

    auto rejected = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "Rejected by user");
    EXPECT_FALSE(alice->remoteControl.hasOutgoingRequest());
    EXPECT_FALSE(alice->remoteControl.activeSession().has_value());
    EXPECT_FALSE(bob->remoteControl.activeSession().has_value());

    // Answering twice is an error
    EXPECT_EQ(bob->remoteControl.respondToRemoteControlRequest(request->requestId, true).errorCode,
              ErrorCodes::SESSION_NO_SUCH_REQUEST);
}

TEST_F(SignalingRelayTest, ReceiverRejectsPeersItDoesNotTrustWithRelays) {
    createPeers();
    std::string err;

    // Bob has never seen Alice
    alice->sees(*bob);
    ASSERT_TRUE(alice->trust.applyPairing("bob", false, false, err)) << err;
    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    auto unknown = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->reason, "Unknown user");
    alice->events.clear();

    // Bob knows Alice but never paired
    bob->sees(*alice);
    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    auto unpaired = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(unpaired.has_value());
    EXPECT_EQ(unpaired->reason, "User not paired");
    alice->events.clear();

    // Bob blocked Alice after pairing
    ASSERT_TRUE(bob->trust.applyPairing("alice", true, false, err)) << err;
    ASSERT_TRUE(bob->trust.setBlocked("alice", true, err)) << err;
    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    auto blocked = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(blocked.has_value());
    EXPECT_EQ(blocked->reason, "User blocked");

    EXPECT_EQ(bob->events.count<RemoteControlRequestReceived>(), 0u);
}

TEST_F(SignalingRelayTest, TrustedPeerIsAcceptedWithoutPrompt) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));

    auto started = alice->events.waitFor<RemoteControlSessionStarted>();
    ASSERT_TRUE(started.has_value());
    EXPECT_TRUE(started->isController);
    ASSERT_TRUE(bob->events.waitFor<RemoteControlSessionStarted>().has_value());
    EXPECT_EQ(bob->events.count<RemoteControlRequestReceived>(), 0u);
}

TEST_F(SignalingRelayTest, AutoAcceptCanBeTurnedOff) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    bob->screenSharing.setAutoAcceptTrusted(false);

    ASSERT_TRUE(alice->screenSharing.sendScreenSharingRequest("bob", "high"));

    auto request = bob->events.waitFor<ScreenSharingRequestReceived>();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->quality, "high");
    EXPECT_FALSE(bob->screenSharing.activeSession().has_value());
}

TEST_F(SignalingRelayTest, DuplicateInboundRequestIsRejected) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    ASSERT_TRUE(bob->events.waitFor<RemoteControlRequestReceived>().has_value());

    // Forget the first request locally so a second one can go out
    alice->remoteControl.clear();
    auto second = alice->remoteControl.sendRemoteControlRequest("bob");
    ASSERT_TRUE(second) << second.message;

    auto rejected = alice->events.waitFor<RemoteControlRequestRejected>(
        [&second](const RemoteControlRequestRejected& e) { return e.requestId == second.message; });
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "Request already pending");
    EXPECT_EQ(bob->remoteControl.pendingRequests().size(), 1u);
}

TEST_F(SignalingRelayTest, StaleRequestIsHiddenButStillAnswerable) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    const int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    nlohmann::json data = {
        {"requestId", "rc_stale"},
        {"senderName", "Alice"},
        {"requestTime", now - 10 * PENDING_REQUEST_EXPIRY_MS}
    };
    bob->dispatcher.dispatch(WireMessage::make(MessageType::RemoteControlRequest, "alice", "bob", data));

    EXPECT_TRUE(bob->remoteControl.pendingRequests().empty());
    EXPECT_EQ(bob->events.count<RemoteControlRequestReceived>(), 0u);

    // Hidden, not forgotten: the decision still reaches the requester
    EXPECT_TRUE(bob->remoteControl.respondToRemoteControlRequest("rc_stale", false));
    EXPECT_FALSE(bob->remoteControl.respondToRemoteControlRequest("rc_stale", false));

    // A fresh request from the same peer is listed normally
    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    ASSERT_TRUE(bob->events.waitFor<RemoteControlRequestReceived>().has_value());
    EXPECT_EQ(bob->remoteControl.pendingRequests().size(), 1u);
}

TEST_F(SignalingRelayTest, SecondPeerIsRejectedWhileSessionIsActive) {
    createPeers();
    TestPeer carol(network, "carol", "Carol");
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_TRUE(pairDirectly(carol, *bob, false));

    const std::string sessionId = startRemoteControl();
    ASSERT_FALSE(sessionId.empty());

    ASSERT_TRUE(carol.remoteControl.sendRemoteControlRequest("bob"));
    auto rejected = carol.events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "Session already active");

    EXPECT_EQ(alice->remoteControl.sendRemoteControlRequest("bob").errorCode,
              ErrorCodes::SESSION_ALREADY_ACTIVE);
    EXPECT_EQ(bob->remoteControl.activeSession()->sessionId, sessionId);
}

//=============================================================================
// Timeouts
//=============================================================================

TEST_F(SignalingRelayTest, UnansweredRequestExpiresOnBothSides) {
    TestTimeouts bobTimeouts;
    bobTimeouts.relay.pendingExpiry = std::chrono::milliseconds(150);
    createPeers(TestTimeouts(), bobTimeouts);
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    ASSERT_TRUE(alice->screenSharing.sendScreenSharingRequest("bob", "low"));
    auto request = bob->events.waitFor<ScreenSharingRequestReceived>();
    ASSERT_TRUE(request.has_value());

    auto expiredOnBob = bob->events.waitFor<ScreenSharingRequestRejected>();
    ASSERT_TRUE(expiredOnBob.has_value());
    EXPECT_EQ(expiredOnBob->reason, "Request timed out");
    EXPECT_TRUE(bob->screenSharing.pendingRequests().empty());

    auto expiredOnAlice = alice->events.waitFor<ScreenSharingRequestRejected>();
    ASSERT_TRUE(expiredOnAlice.has_value());
    EXPECT_EQ(expiredOnAlice->reason, "Request timed out");
    EXPECT_FALSE(alice->screenSharing.hasOutgoingRequest());
}

TEST_F(SignalingRelayTest, OutgoingRequestGivesUpWithoutResponse) {
    TestTimeouts aliceTimeouts;
    aliceTimeouts.relay.outgoingTimeout = std::chrono::milliseconds(150);
    createPeers(aliceTimeouts);
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    network.setDropFilter([](const WireMessage& m) {
        return m.type == MessageType::RemoteControlRequest;
    });

    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    auto rejected = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "No response");
    EXPECT_FALSE(alice->remoteControl.hasOutgoingRequest());
    EXPECT_GE(network.droppedCount(), 1u);
}

//=============================================================================
// Remote-control session
//=============================================================================

TEST_F(SignalingRelayTest, ControllerEventsReachControlledDevice) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const std::string sessionId = startRemoteControl();
    ASSERT_FALSE(sessionId.empty());

    nlohmann::json move = {{"type", "mouseMove"}, {"x", 12}, {"y", -3}};
    ASSERT_TRUE(alice->remoteControl.sendEvent(move));

    auto received = bob->events.waitFor<RemoteControlEventReceived>();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->sessionId, sessionId);
    EXPECT_EQ(received->event.value("type", ""), "mouseMove");
    EXPECT_EQ(received->event.value("x", 0), 12);

    // The controlled side cannot inject events
    EXPECT_EQ(bob->remoteControl.sendEvent({{"type", "leftClick"}}).errorCode, ErrorCodes::SESSION_WRONG_ROLE);
}

TEST_F(SignalingRelayTest, MalformedEventsAreRefused) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    EXPECT_EQ(alice->remoteControl.sendEvent({{"type", "leftClick"}}).errorCode, ErrorCodes::SESSION_NOT_ACTIVE);

    ASSERT_FALSE(startRemoteControl().empty());
    EXPECT_EQ(alice->remoteControl.sendEvent({{"type", "selfDestruct"}}).errorCode,
              ErrorCodes::SESSION_INVALID_SIGNAL);
    EXPECT_EQ(alice->remoteControl.sendEvent({{"x", 1}}).errorCode, ErrorCodes::SESSION_INVALID_SIGNAL);
    EXPECT_EQ(alice->remoteControl.sendEvent(nlohmann::json::array()).errorCode,
              ErrorCodes::SESSION_INVALID_SIGNAL);

    EXPECT_TRUE(RemoteControlRelay::isValidEventType("threeFingerSwipeLeft"));
    EXPECT_TRUE(RemoteControlRelay::isValidEventType("sendText"));
    EXPECT_FALSE(RemoteControlRelay::isValidEventType("MouseMove"));
}

TEST_F(SignalingRelayTest, DisconnectEventEndsBothSides) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_FALSE(startRemoteControl().empty());

    ASSERT_TRUE(alice->remoteControl.sendEvent({{"type", "disconnect"}}));
    EXPECT_FALSE(alice->remoteControl.activeSession().has_value());

    auto ended = bob->events.waitFor<RemoteControlSessionEnded>();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(ended->peerId, "alice");
    EXPECT_TRUE(waitUntil([this] { return !bob->remoteControl.activeSession().has_value(); }));
}

TEST_F(SignalingRelayTest, ExplicitDisconnectNotifiesPeer) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_FALSE(startRemoteControl().empty());

    ASSERT_TRUE(bob->remoteControl.disconnect());
    auto local = bob->events.waitFor<RemoteControlSessionEnded>();
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->reason, "Disconnected by user");

    auto remote = alice->events.waitFor<RemoteControlSessionEnded>();
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->reason, "Disconnected by peer");

    EXPECT_EQ(bob->remoteControl.disconnect().errorCode, ErrorCodes::SESSION_NOT_ACTIVE);
}

//=============================================================================
// Screen-sharing session
//=============================================================================

TEST_F(SignalingRelayTest, RequesterBecomesTheSharer) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_FALSE(startScreenSharing("high").empty());

    auto sharer = alice->events.waitFor<ScreenSharingSessionStarted>();
    ASSERT_TRUE(sharer.has_value());
    EXPECT_TRUE(sharer->isSharer);

    auto viewer = bob->events.waitFor<ScreenSharingSessionStarted>();
    ASSERT_TRUE(viewer.has_value());
    EXPECT_FALSE(viewer->isSharer);
    EXPECT_EQ(bob->screenSharing.activeSession()->params.value("quality", ""), "high");

    EXPECT_EQ(bob->screenSharing.startSharing(0).errorCode, ErrorCodes::SESSION_WRONG_ROLE);
    EXPECT_EQ(alice->screenSharing.startSharing(-1).errorCode, ErrorCodes::INVALID_ARGUMENT);

    auto started = alice->screenSharing.startSharing(1);
    ASSERT_TRUE(started) << started.message;
    EXPECT_EQ(alice->screenSharing.activeSession()->params.value("screenIndex", -1), 1);
}

TEST_F(SignalingRelayTest, SignalsFollowSessionRoles) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    const std::string sessionId = startScreenSharing();
    ASSERT_FALSE(sessionId.empty());

    EXPECT_EQ(alice->screenSharing.sendSignal("answer", {{"sdp", "v=0"}}).errorCode,
              ErrorCodes::SESSION_WRONG_ROLE);
    EXPECT_EQ(bob->screenSharing.sendSignal("offer", {{"sdp", "v=0"}}).errorCode,
              ErrorCodes::SESSION_WRONG_ROLE);
    EXPECT_EQ(alice->screenSharing.sendSignal("renegotiate", {}).errorCode,
              ErrorCodes::SESSION_INVALID_SIGNAL);

    ASSERT_TRUE(alice->screenSharing.sendSignal("offer", {{"sdp", "offer-sdp"}}));
    auto offer = bob->events.waitFor<ScreenSharingSignalReceived>();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->sessionId, sessionId);
    EXPECT_EQ(offer->signalType, "offer");
    EXPECT_EQ(offer->data.value("sdp", ""), "offer-sdp");

    ASSERT_TRUE(bob->screenSharing.sendSignal("answer", {{"sdp", "answer-sdp"}}));
    auto answer = alice->events.waitFor<ScreenSharingSignalReceived>();
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(answer->signalType, "answer");

    // Candidates flow both ways
    ASSERT_TRUE(bob->screenSharing.sendSignal("ice-candidate", {{"candidate", "c1"}}));
    ASSERT_TRUE(alice->screenSharing.sendSignal("ice-candidate", {{"candidate", "c2"}}));
    EXPECT_TRUE(waitUntil([this] {
        return bob->events.count<ScreenSharingSignalReceived>() == 2 &&
               alice->events.count<ScreenSharingSignalReceived>() == 2;
    }));
}

TEST_F(SignalingRelayTest, StopMatchesTheLocalRole) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_FALSE(startScreenSharing().empty());

    EXPECT_EQ(alice->screenSharing.stopReceiving().errorCode, ErrorCodes::SESSION_WRONG_ROLE);
    EXPECT_EQ(bob->screenSharing.stopSharing().errorCode, ErrorCodes::SESSION_WRONG_ROLE);

    ASSERT_TRUE(bob->screenSharing.stopReceiving());
    auto ended = alice->events.waitFor<ScreenSharingSessionEnded>();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(ended->reason, "Disconnected by peer");
    EXPECT_TRUE(waitUntil([this] { return !alice->screenSharing.activeSession().has_value(); }));
    EXPECT_EQ(alice->screenSharing.stopSharing().errorCode, ErrorCodes::SESSION_NOT_ACTIVE);
}

TEST_F(SignalingRelayTest, RelaysAreIndependent) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_FALSE(startRemoteControl().empty());
    ASSERT_FALSE(startScreenSharing().empty());

    EXPECT_TRUE(alice->remoteControl.activeSession().has_value());
    EXPECT_TRUE(alice->screenSharing.activeSession().has_value());
}

//=============================================================================
// Peer loss
//=============================================================================

TEST_F(SignalingRelayTest, PeerDisconnectEndsSessionAndFailsRequest) {
    createPeers();
    TestPeer carol(network, "carol", "Carol");
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));
    ASSERT_TRUE(pairDirectly(*alice, carol, false));
    ASSERT_FALSE(startRemoteControl().empty());

    ASSERT_TRUE(alice->screenSharing.sendScreenSharingRequest("carol", "auto"));
    ASSERT_TRUE(carol.events.waitFor<ScreenSharingRequestReceived>().has_value());

    alice->remoteControl.onPeerDisconnected("bob");
    auto ended = alice->events.waitFor<RemoteControlSessionEnded>();
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(ended->reason, "Peer disconnected");
    EXPECT_FALSE(alice->remoteControl.activeSession().has_value());

    alice->screenSharing.onPeerDisconnected("carol");
    auto failed = alice->events.waitFor<ScreenSharingRequestRejected>();
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->peerId, "carol");
    EXPECT_EQ(failed->reason, "Peer disconnected");
    EXPECT_FALSE(alice->screenSharing.hasOutgoingRequest());
}

TEST_F(SignalingRelayTest, RejectPendingFromAnswersEveryRequestOfPeer) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, false));

    ASSERT_TRUE(alice->remoteControl.sendRemoteControlRequest("bob"));
    ASSERT_TRUE(bob->events.waitFor<RemoteControlRequestReceived>().has_value());

    EXPECT_EQ(bob->remoteControl.rejectPendingFrom("alice", "User blocked"), 1u);
    EXPECT_TRUE(bob->remoteControl.pendingRequests().empty());

    auto rejected = alice->events.waitFor<RemoteControlRequestRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "User blocked");
}
