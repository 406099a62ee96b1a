#include <gtest/gtest.h>
#include "p2lan/DiscoveryService.h"
#include "p2lan/RecordStore.h"
#include "p2lan/SocketUtils.h"
#include "p2lan/TrustStore.h"
#include "p2lan/config.h"
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <vector>

using namespace P2Lan;
using json = nlohmann::json;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    InMemoryRecordStore records;
    TrustStore store{records};
    DiscoveryService discovery{store};

    void SetUp() override {
        LocalIdentity self;
        self.id = "self-uuid";
        self.displayName = "Self";
        self.platform = UserPlatform::Linux;
        discovery.setIdentity(self);
        discovery.setTcpPort(8081);
    }

    void TearDown() override {
        discovery.disable();
        for (int fd : m_prebound) {
            ::close(fd);
        }
    }

    static json beacon(const std::string& uuid, const std::string& type = BEACON_TYPE_ANNOUNCE) {
        json b;
        b["protocol_id"] = PROTOCOL_ID;
        b["proto_version"] = PROTOCOL_VERSION;
        b["beacon_type"] = type;
        b["device_uuid"] = uuid;
        b["display_name"] = "Peer " + uuid;
        b["platform"] = "android";
        b["tcp_port"] = 8083;
        return b;
    }

    bool prebindUdpPort(uint16_t port) {
        int s = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (s < 0) return false;
        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port        = htons(port);
        if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(s);
            return false;
        }
        m_prebound.push_back(s);
        return true;
    }

    std::vector<int> m_prebound;
};

//=============================================================================
// Beacon handling
//=============================================================================

TEST_F(DiscoveryServiceTest, AnnounceCreatesOnlineTempRecord) {
    discovery.simulateIncomingBeacon(beacon("peer-1").dump(), "192.168.1.20");

    auto peer = store.get("peer-1");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->displayName, "Peer peer-1");
    EXPECT_EQ(peer->ipAddress, "192.168.1.20");
    EXPECT_EQ(peer->port, 8083);
    EXPECT_EQ(peer->platform, UserPlatform::Android);
    EXPECT_TRUE(peer->isOnline);
    EXPECT_TRUE(peer->isTempStored);
    EXPECT_EQ(peer->connectionStatus, ConnectionStatus::Discovering);
    EXPECT_GT(peer->lastSeenMs, 0);

    // Sightings are runtime-only until something worth keeping happens
    EXPECT_EQ(records.saveCount(), 0u);
}

TEST_F(DiscoveryServiceTest, RepeatedBeaconsDoNotDuplicatePeers) {
    discovery.simulateIncomingBeacon(beacon("peer-1").dump(), "192.168.1.20");
    discovery.simulateIncomingBeacon(beacon("peer-1").dump(), "192.168.1.21");

    EXPECT_EQ(store.list(PeerFilter::All).size(), 1u);
    EXPECT_EQ(store.get("peer-1")->ipAddress, "192.168.1.21");
}

TEST_F(DiscoveryServiceTest, OwnBeaconIsIgnored) {
    discovery.simulateIncomingBeacon(discovery.generateBeaconJsonForTesting(BEACON_TYPE_ANNOUNCE),
                                     "192.168.1.10");
    EXPECT_TRUE(store.list(PeerFilter::All).empty());
}

TEST_F(DiscoveryServiceTest, ForeignAndMalformedBeaconsAreIgnored) {
    json other = beacon("peer-x");
    other["protocol_id"] = "SOMETHING_ELSE";
    discovery.simulateIncomingBeacon(other.dump(), "192.168.1.30");

    json noId = beacon("peer-y");
    noId.erase("device_uuid");
    discovery.simulateIncomingBeacon(noId.dump(), "192.168.1.30");

    json longId = beacon(std::string(MAX_UUID_LENGTH + 1, 'u'));
    discovery.simulateIncomingBeacon(longId.dump(), "192.168.1.30");

    discovery.simulateIncomingBeacon("{not json", "192.168.1.30");
    discovery.simulateIncomingBeacon("[1,2,3]", "192.168.1.30");

    EXPECT_TRUE(store.list(PeerFilter::All).empty());
}

TEST_F(DiscoveryServiceTest, LongDisplayNameIsTruncated) {
    json b = beacon("peer-2");
    b["display_name"] = std::string(MAX_DISPLAY_NAME + 40, 'n');
    discovery.simulateIncomingBeacon(b.dump(), "10.0.0.5");

    auto peer = store.get("peer-2");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->displayName.size(), MAX_DISPLAY_NAME);
}

TEST_F(DiscoveryServiceTest, GeneratedBeaconCarriesIdentity) {
    json b = json::parse(discovery.generateBeaconJsonForTesting(BEACON_TYPE_SCAN));
    EXPECT_EQ(b["protocol_id"], PROTOCOL_ID);
    EXPECT_EQ(b["beacon_type"], "scan");
    EXPECT_EQ(b["device_uuid"], "self-uuid");
    EXPECT_EQ(b["display_name"], "Self");
    EXPECT_EQ(b["platform"], "linux");
    EXPECT_EQ(b["tcp_port"], 8081);
}

//=============================================================================
// Goodbye
//=============================================================================

TEST_F(DiscoveryServiceTest, GoodbyeFromKnownAddressTakesPeerOffline) {
    discovery.simulateIncomingBeacon(beacon("peer-3").dump(), "192.168.1.40");
    discovery.simulateIncomingBeacon(beacon("peer-3", BEACON_TYPE_GOODBYE).dump(), "192.168.1.40");

    auto peer = store.get("peer-3");
    ASSERT_TRUE(peer.has_value());
    EXPECT_FALSE(peer->isOnline);
}

TEST_F(DiscoveryServiceTest, SpoofedGoodbyeIsIgnored) {
    discovery.simulateIncomingBeacon(beacon("peer-4").dump(), "192.168.1.41");
    discovery.simulateIncomingBeacon(beacon("peer-4", BEACON_TYPE_GOODBYE).dump(), "192.168.1.99");

    EXPECT_TRUE(store.get("peer-4")->isOnline);

    // Goodbye from a device never seen creates nothing
    discovery.simulateIncomingBeacon(beacon("peer-5", BEACON_TYPE_GOODBYE).dump(), "192.168.1.42");
    EXPECT_FALSE(store.get("peer-5").has_value());
}

//=============================================================================
// Garbage collection
//=============================================================================

TEST_F(DiscoveryServiceTest, SilentPeerGoesOfflineButRecordIsKept) {
    discovery.simulateIncomingBeacon(beacon("peer-6").dump(), "192.168.1.50");

    discovery.runGarbageCollectionForTesting(std::chrono::milliseconds(PEER_TIMEOUT_MS / 2));
    EXPECT_TRUE(store.get("peer-6")->isOnline);

    discovery.runGarbageCollectionForTesting(std::chrono::milliseconds(PEER_TIMEOUT_MS + 1000));
    auto peer = store.get("peer-6");
    ASSERT_TRUE(peer.has_value());
    EXPECT_FALSE(peer->isOnline);
}

TEST_F(DiscoveryServiceTest, LiveSessionKeepsPeerOnline) {
    discovery.simulateIncomingBeacon(beacon("peer-7").dump(), "192.168.1.51");
    ASSERT_TRUE(store.setConnectionStatus("peer-7", ConnectionStatus::Connected));

    discovery.runGarbageCollectionForTesting(std::chrono::milliseconds(PEER_TIMEOUT_MS + 1000));
    EXPECT_TRUE(store.get("peer-7")->isOnline);
}

//=============================================================================
// Socket lifecycle
//=============================================================================

TEST_F(DiscoveryServiceTest, SkipsOccupiedPortAndBindsToNext) {
    discovery.setPortRange(18180, 18183);
    ASSERT_TRUE(prebindUdpPort(18180));

    std::string err;
    ASSERT_TRUE(discovery.enable(err)) << err;
    EXPECT_EQ(discovery.boundPort(), 18181);
    EXPECT_EQ(discovery.state(), DiscoveryState::Listening);
}

TEST_F(DiscoveryServiceTest, FailsCleanlyWhenWholeRangeIsBusy) {
    discovery.setPortRange(18190, 18191);
    ASSERT_TRUE(prebindUdpPort(18190));
    ASSERT_TRUE(prebindUdpPort(18191));

    std::string err;
    EXPECT_FALSE(discovery.enable(err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(discovery.state(), DiscoveryState::Disabled);
    EXPECT_EQ(discovery.socketOpenCount(), 0u);
}

TEST_F(DiscoveryServiceTest, EnableIsIdempotentAndDisableMarksPeersOffline) {
    discovery.setPortRange(18200, 18205);

    std::string err;
    ASSERT_TRUE(discovery.enable(err)) << err;
    ASSERT_TRUE(discovery.enable(err)) << err;
    EXPECT_EQ(discovery.socketOpenCount(), 1u);

    discovery.simulateIncomingBeacon(beacon("peer-8").dump(), "192.168.1.60");
    ASSERT_TRUE(discovery.manualScan(err)) << err;

    const auto t0 = std::chrono::steady_clock::now();
    discovery.disable();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    EXPECT_LT(ms, 5000) << "disable() took " << ms << "ms";

    EXPECT_EQ(discovery.state(), DiscoveryState::Disabled);
    EXPECT_EQ(discovery.boundPort(), 0);
    EXPECT_FALSE(store.get("peer-8")->isOnline);
    EXPECT_FALSE(discovery.manualScan(err));

    // Re-enabling opens a fresh socket
    ASSERT_TRUE(discovery.enable(err)) << err;
    EXPECT_EQ(discovery.socketOpenCount(), 2u);
}
