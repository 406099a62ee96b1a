/**
 * @file pairing_manager_test.cpp
 * @brief Pairing handshake tests between two in-process peers
 */

#include "p2lan/ErrorCodes.h"
#include "support/FakeNetwork.h"
#include <gtest/gtest.h>

#include <memory>

using namespace P2Lan;
using namespace P2Lan::Testing;

class PairingManagerTest : public ::testing::Test {
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

    PairingRequestReceived requestBobReceives(bool trustUser = false, bool save = false) {
        auto sent = alice->pairing.sendPairingRequest("bob", trustUser, save);
        EXPECT_TRUE(sent) << sent.message;
        auto received = bob->events.waitFor<PairingRequestReceived>();
        EXPECT_TRUE(received.has_value());
        return received.value_or(PairingRequestReceived{});
    }
};

//=============================================================================
// Command preconditions
//=============================================================================

TEST_F(PairingManagerTest, RequestNeedsKnownUnblockedUnpairedPeer) {
    createPeers();

    EXPECT_EQ(alice->pairing.sendPairingRequest("bob", false, false).errorCode, ErrorCodes::PEER_UNKNOWN);

    introduce(*alice, *bob);
    std::string err;
    ASSERT_TRUE(alice->trust.setBlocked("bob", true, err));
    EXPECT_EQ(alice->pairing.sendPairingRequest("bob", false, false).errorCode, ErrorCodes::PEER_BLOCKED);
    ASSERT_TRUE(alice->trust.setBlocked("bob", false, err));

    // Unblocking an unpaired temp record forgets it
    introduce(*alice, *bob);
    ASSERT_TRUE(alice->trust.applyPairing("bob", false, false, err));
    EXPECT_EQ(alice->pairing.sendPairingRequest("bob", false, false).errorCode,
              ErrorCodes::PAIRING_ALREADY_PAIRED);
}

TEST_F(PairingManagerTest, OnlyOneOutgoingRequestPerPeer) {
    createPeers();
    introduce(*alice, *bob);

    auto first = alice->pairing.sendPairingRequest("bob", false, false);
    ASSERT_TRUE(first) << first.message;
    EXPECT_EQ(first.message.rfind("pair_", 0), 0u);
    EXPECT_TRUE(alice->pairing.hasOutgoingRequest("bob"));
    EXPECT_EQ(alice->trust.get("bob")->connectionStatus, ConnectionStatus::Pairing);

    EXPECT_EQ(alice->pairing.sendPairingRequest("bob", false, false).errorCode,
              ErrorCodes::PAIRING_ALREADY_PENDING);
}

//=============================================================================
// Handshake
//=============================================================================

TEST_F(PairingManagerTest, AcceptedRequestPairsBothSides) {
    createPeers();
    introduce(*alice, *bob);

    auto request = requestBobReceives(false, true);
    EXPECT_EQ(request.peerId, "alice");
    EXPECT_EQ(request.displayName, "Alice");
    EXPECT_TRUE(request.wantsSave);
    EXPECT_EQ(bob->trust.get("alice")->connectionStatus, ConnectionStatus::Pairing);
    ASSERT_EQ(bob->pairing.pendingRequests().size(), 1u);

    ASSERT_TRUE(bob->pairing.respondToPairingRequest(request.requestId, true, true, false));

    auto bobSide = bob->events.waitFor<PairingCompleted>();
    ASSERT_TRUE(bobSide.has_value());
    EXPECT_TRUE(bobSide->trusted);

    auto aliceSide = alice->events.waitFor<PairingCompleted>();
    ASSERT_TRUE(aliceSide.has_value());
    EXPECT_EQ(aliceSide->peerId, "bob");
    // Bob chose to trust, which carries over to the requester
    EXPECT_TRUE(aliceSide->trusted);
    EXPECT_TRUE(aliceSide->saved);

    auto onAlice = alice->trust.get("bob");
    EXPECT_TRUE(onAlice->isPaired);
    EXPECT_TRUE(onAlice->isStored);
    EXPECT_EQ(onAlice->connectionStatus, ConnectionStatus::Paired);
    EXPECT_FALSE(alice->pairing.hasOutgoingRequest("bob"));

    auto onBob = bob->trust.get("alice");
    EXPECT_TRUE(onBob->isPaired);
    EXPECT_TRUE(onBob->isTrusted);
    EXPECT_FALSE(onBob->isStored);
    EXPECT_TRUE(bob->pairing.pendingRequests().empty());
}

TEST_F(PairingManagerTest, RejectedRequestLeavesBothUnpaired) {
    createPeers();
    introduce(*alice, *bob);

    auto request = requestBobReceives();
    ASSERT_TRUE(bob->pairing.respondToPairingRequest(request.requestId, false, false, false));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "rejected");
    EXPECT_TRUE(rejected->byRemote);

    EXPECT_FALSE(alice->trust.get("bob")->isPaired);
    EXPECT_FALSE(bob->trust.get("alice")->isPaired);
    EXPECT_EQ(alice->trust.get("bob")->connectionStatus, ConnectionStatus::Connected);
    EXPECT_EQ(bob->trust.get("alice")->connectionStatus, ConnectionStatus::Connected);

    // A decision is one-shot
    EXPECT_EQ(bob->pairing.respondToPairingRequest(request.requestId, true, false, false).errorCode,
              ErrorCodes::PAIRING_NO_SUCH_REQUEST);
}

TEST_F(PairingManagerTest, BlockedPeerIsRejectedWithoutPrompt) {
    createPeers();
    introduce(*alice, *bob);
    std::string err;
    ASSERT_TRUE(bob->trust.setBlocked("alice", true, err));

    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", false, false));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "blocked");
    EXPECT_EQ(bob->events.count<PairingRequestReceived>(), 0u);
    EXPECT_TRUE(bob->pairing.pendingRequests().empty());
}

TEST_F(PairingManagerTest, TrustedPeerIsAcceptedWithoutPrompt) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    // Alice lost the pairing (e.g. reinstalled) but Bob still trusts her
    std::string err;
    ASSERT_TRUE(alice->trust.unpair("bob", err));

    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", false, false));

    auto completed = alice->events.waitFor<PairingCompleted>();
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed->trusted);
    EXPECT_EQ(bob->events.count<PairingRequestReceived>(), 0u);
    EXPECT_TRUE(alice->trust.get("bob")->isPaired);
}

TEST_F(PairingManagerTest, BlockedDominatesTrustOnInboundRequest) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));
    std::string err;
    ASSERT_TRUE(alice->trust.unpair("bob", err));
    ASSERT_TRUE(bob->trust.setBlocked("alice", true, err));

    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", false, false));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "blocked");
    EXPECT_EQ(bob->events.count<PairingCompleted>(), 0u);
}

TEST_F(PairingManagerTest, PairingRequestFromUnseenPeerCreatesRecord) {
    createPeers();
    // Only Alice has seen Bob
    alice->sees(*bob);

    auto request = requestBobReceives();
    EXPECT_EQ(request.peerId, "alice");

    auto record = bob->trust.get("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->displayName, "Alice");
    EXPECT_TRUE(record->isTempStored);
}

//=============================================================================
// Expiry and disconnects
//=============================================================================

TEST_F(PairingManagerTest, UnansweredRequestExpires) {
    TestTimeouts quick;
    quick.pairing.pendingExpiry = std::chrono::milliseconds(150);
    createPeers(TestTimeouts(), quick);
    introduce(*alice, *bob);

    auto request = requestBobReceives();

    auto expired = bob->events.waitFor<PairingRequestExpired>();
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->requestId, request.requestId);
    EXPECT_FALSE(expired->outgoing);
    EXPECT_FALSE(bob->pairing.hasPendingRequest(request.requestId));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "timeout");
    EXPECT_FALSE(alice->pairing.hasOutgoingRequest("bob"));
}

TEST_F(PairingManagerTest, OutgoingRequestTimesOutWithoutResponse) {
    TestTimeouts quick;
    quick.pairing.outgoingTimeout = std::chrono::milliseconds(150);
    createPeers(quick);
    introduce(*alice, *bob);
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::PairingRequest; });

    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", false, false));

    auto expired = alice->events.waitFor<PairingRequestExpired>();
    ASSERT_TRUE(expired.has_value());
    EXPECT_TRUE(expired->outgoing);
    EXPECT_FALSE(alice->pairing.hasOutgoingRequest("bob"));
    EXPECT_EQ(alice->trust.get("bob")->connectionStatus, ConnectionStatus::Connected);
}

TEST_F(PairingManagerTest, DuplicateInboundRequestIsRejected) {
    createPeers();
    introduce(*alice, *bob);
    auto first = requestBobReceives();

    // Alice forgot her outgoing request and asks again
    alice->pairing.clear();
    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", false, false));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "duplicate");
    EXPECT_TRUE(bob->pairing.hasPendingRequest(first.requestId));
    EXPECT_EQ(bob->pairing.pendingRequests().size(), 1u);
}

TEST_F(PairingManagerTest, CrossedRequestsPairBothSides) {
    createPeers();
    introduce(*alice, *bob);
    // Alice's request is still in flight when Bob asks her
    network.setDropFilter([](const WireMessage& m) {
        return m.type == MessageType::PairingRequest && m.fromUserId == "alice";
    });

    ASSERT_TRUE(alice->pairing.sendPairingRequest("bob", true, false));
    ASSERT_TRUE(bob->pairing.sendPairingRequest("alice", false, false));

    ASSERT_TRUE(alice->events.waitFor<PairingCompleted>().has_value());
    ASSERT_TRUE(bob->events.waitFor<PairingCompleted>().has_value());

    EXPECT_TRUE(alice->pairing.pendingRequests().empty());
    EXPECT_EQ(alice->events.count<PairingRequestReceived>(), 0u);
    EXPECT_FALSE(alice->pairing.hasOutgoingRequest("bob"));
    EXPECT_FALSE(bob->pairing.hasOutgoingRequest("alice"));

    ASSERT_TRUE(waitUntil([&] { return bob->trust.get("alice")->isPaired; }));
    EXPECT_TRUE(alice->trust.get("bob")->isPaired);
    // Trust asked for by either side applies to the crossed pairing
    EXPECT_TRUE(alice->trust.get("bob")->isTrusted);
    EXPECT_TRUE(bob->trust.get("alice")->isTrusted);
}

TEST_F(PairingManagerTest, DisconnectFailsOutgoingRequest) {
    createPeers();
    introduce(*alice, *bob);
    network.setDropFilter([](const WireMessage& m) { return m.type == MessageType::PairingRequest; });

    auto sent = alice->pairing.sendPairingRequest("bob", false, false);
    ASSERT_TRUE(sent);

    alice->pairing.onPeerDisconnected("bob");
    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->requestId, sent.message);
    EXPECT_EQ(rejected->reason, "Peer disconnected");
    EXPECT_FALSE(alice->pairing.hasOutgoingRequest("bob"));
}

TEST_F(PairingManagerTest, RejectPendingFromAnswersEveryRequestOfPeer) {
    createPeers();
    introduce(*alice, *bob);
    auto request = requestBobReceives();

    EXPECT_EQ(bob->pairing.rejectPendingFrom("alice", "blocked"), 1u);
    EXPECT_FALSE(bob->pairing.hasPendingRequest(request.requestId));

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "blocked");
}

//=============================================================================
// Trust commands
//=============================================================================

TEST_F(PairingManagerTest, UnpairTellsThePeer) {
    createPeers();
    ASSERT_TRUE(pairDirectly(*alice, *bob, true));

    ASSERT_TRUE(alice->pairing.unpair("bob"));
    EXPECT_FALSE(alice->trust.get("bob")->isPaired);

    ASSERT_TRUE(waitUntil([&] { return !bob->trust.get("alice")->isPaired; }));
    EXPECT_FALSE(bob->trust.get("alice")->isTrusted);

    EXPECT_EQ(alice->pairing.unpair("bob").errorCode, ErrorCodes::PEER_NOT_PAIRED);
    EXPECT_EQ(alice->pairing.unpair("carol").errorCode, ErrorCodes::PEER_UNKNOWN);
}

TEST_F(PairingManagerTest, TrustCanOnlyBeAddedToPairedPeers) {
    createPeers();
    introduce(*alice, *bob);

    EXPECT_EQ(alice->pairing.addTrust("bob").errorCode, ErrorCodes::PEER_NOT_PAIRED);

    std::string err;
    ASSERT_TRUE(alice->trust.applyPairing("bob", false, false, err));
    ASSERT_TRUE(alice->pairing.addTrust("bob"));
    EXPECT_TRUE(alice->trust.canAutoAccept("bob"));

    ASSERT_TRUE(alice->pairing.removeTrust("bob"));
    EXPECT_FALSE(alice->trust.canAutoAccept("bob"));
    EXPECT_TRUE(alice->trust.get("bob")->isPaired);
}

TEST_F(PairingManagerTest, StoreFailureOnAcceptReportsPersistenceError) {
    createPeers();
    introduce(*alice, *bob);
    auto request = requestBobReceives();

    bob->records.setFailSaves(true);
    auto result = bob->pairing.respondToPairingRequest(request.requestId, true, false, false);
    EXPECT_EQ(result.errorCode, ErrorCodes::PERSISTENCE_FAILED);
    EXPECT_FALSE(bob->trust.get("alice")->isPaired);

    auto rejected = alice->events.waitFor<PairingRejected>();
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->reason, "error");
}
