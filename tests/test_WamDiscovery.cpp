#include "TestFakes.h"
#include "WamDiscovery.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>

namespace {

SsdpResult otherDevice(const std::string& host) {
    SsdpResult r;
    r.location = "http://" + host + ":1400/xml/device_description.xml";
    r.deviceType = "urn:schemas-upnp-org:device:ZonePlayer:1";
    r.usn = "uuid:RINCON_000E58::urn:schemas-upnp-org:device:ZonePlayer:1";
    return r;
}

const WamSpeaker* byAddress(const std::vector<WamSpeaker>& speakers, const std::string& address) {
    auto it = std::find_if(speakers.begin(), speakers.end(),
                           [&](const WamSpeaker& s) { return s.address() == address; });
    return it == speakers.end() ? nullptr : &*it;
}

}

class WamDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeTransport>();
        config.searchWindowSeconds = 3;
    }

    std::unique_ptr<WamDiscovery> makeDiscovery(std::vector<SsdpResult> replies,
                                                FakeSearcher** searcherOut = nullptr) {
        auto searcher = std::make_unique<FakeSearcher>(std::move(replies));
        if (searcherOut) {
            *searcherOut = searcher.get();
        }
        auto resolver = std::make_unique<FakeResolver>(MacTable{
            {"192.168.1.20", "aa:bb:cc:dd:ee:20"},
            {"192.168.1.21", "aa:bb:cc:dd:ee:21"},
        });
        return std::make_unique<WamDiscovery>(config, transport, std::move(searcher),
                                              std::move(resolver));
    }

    std::shared_ptr<FakeTransport> transport;
    WamDiscovery::Config config;
};

TEST_F(WamDiscoveryTest, ReturnsOnlyWamDevicesAndKeepsPartialOnes) {
    transport->scriptSpeaker("192.168.1.20", "Living Room", 12);
    transport->scriptSpeaker("192.168.1.21", "Kitchen", 8);
    transport->fail("GetVolume", "192.168.1.21");

    FakeSearcher* searcher = nullptr;
    auto discovery = makeDiscovery({wamReply("192.168.1.20"),
                                    otherDevice("192.168.1.30"),
                                    wamReply("192.168.1.21")}, &searcher);

    std::vector<WamSpeaker> speakers = discovery->discover();

    ASSERT_EQ(speakers.size(), 2u);
    EXPECT_EQ(searcher->lastTarget, WamDiscovery::DEVICE_TYPE);
    EXPECT_EQ(searcher->lastWindow, 3);

    const WamSpeaker* living = byAddress(speakers, "192.168.1.20");
    ASSERT_NE(living, nullptr);
    EXPECT_TRUE(living->state().complete());
    EXPECT_EQ(living->name(), "Living Room");
    EXPECT_EQ(living->state().volume, 12);
    EXPECT_EQ(living->mac(), "aa:bb:cc:dd:ee:20");

    const WamSpeaker* kitchen = byAddress(speakers, "192.168.1.21");
    ASSERT_NE(kitchen, nullptr);
    EXPECT_EQ(kitchen->state().failedFields, std::vector<std::string>{"volume"});
    EXPECT_EQ(kitchen->name(), "Kitchen");
    EXPECT_EQ(kitchen->state().volume, 0);
    EXPECT_EQ(kitchen->mac(), "aa:bb:cc:dd:ee:21");

    EXPECT_EQ(transport->countHost("192.168.1.30"), 0u);
    EXPECT_EQ(transport->countHost("192.168.1.20"), 7u);
}

TEST_F(WamDiscoveryTest, ForeignTransportFailureStaysWithinOneField) {
    transport->scriptSpeaker("192.168.1.20", "Living Room", 12);
    transport->scriptSpeaker("192.168.1.21", "Kitchen", 8);
    transport->failForeign("GetApInfo", "192.168.1.21");
    auto discovery = makeDiscovery({wamReply("192.168.1.20"), wamReply("192.168.1.21")});

    std::vector<WamSpeaker> speakers = discovery->discover();

    ASSERT_EQ(speakers.size(), 2u);
    const WamSpeaker* kitchen = byAddress(speakers, "192.168.1.21");
    ASSERT_NE(kitchen, nullptr);
    EXPECT_EQ(kitchen->state().failedFields, std::vector<std::string>{"apSsid"});
    EXPECT_EQ(kitchen->state().volume, 8);
    EXPECT_TRUE(byAddress(speakers, "192.168.1.20")->state().complete());
}

TEST_F(WamDiscoveryTest, DuplicateRepliesYieldOneSpeaker) {
    transport->scriptSpeaker("192.168.1.20", "Living Room", 12);
    auto discovery = makeDiscovery({wamReply("192.168.1.20"), wamReply("192.168.1.20")});

    std::vector<WamSpeaker> speakers = discovery->discover();

    ASSERT_EQ(speakers.size(), 1u);
    EXPECT_EQ(transport->countHost("192.168.1.20"), 7u);
}

TEST_F(WamDiscoveryTest, NothingFound) {
    auto discovery = makeDiscovery({otherDevice("192.168.1.30")});

    EXPECT_TRUE(discovery->discover().empty());
    EXPECT_EQ(transport->callCount(), 0u);
}

TEST_F(WamDiscoveryTest, UnknownMacIsLeftEmpty) {
    transport->scriptSpeaker("192.168.1.40", "Bath", 5);
    auto discovery = makeDiscovery({wamReply("192.168.1.40")});

    std::vector<WamSpeaker> speakers = discovery->discover();

    ASSERT_EQ(speakers.size(), 1u);
    EXPECT_EQ(speakers[0].mac(), "");
}

TEST_F(WamDiscoveryTest, CancelDuringSearchReturnsNothing) {
    transport->scriptSpeaker("192.168.1.20", "Living Room", 12);
    FakeSearcher* searcher = nullptr;
    auto discovery = makeDiscovery({wamReply("192.168.1.20")}, &searcher);
    WamDiscovery* raw = discovery.get();
    searcher->duringSearch = [raw] { raw->cancel(); };

    EXPECT_TRUE(discovery->discover().empty());
    EXPECT_TRUE(searcher->cancelled);
    EXPECT_EQ(transport->callCount(), 0u);
}

TEST_F(WamDiscoveryTest, MissingCollaboratorsAreRejected) {
    EXPECT_THROW(WamDiscovery(config, nullptr,
                              std::make_unique<FakeSearcher>(std::vector<SsdpResult>()),
                              std::make_unique<FakeResolver>(MacTable())),
                 InvalidArgument);
    EXPECT_THROW(WamDiscovery(config, transport, nullptr,
                              std::make_unique<FakeResolver>(MacTable())),
                 InvalidArgument);
}

TEST(WamDiscoveryStaticTest, MatchesByDeviceTypeServiceTypeOrUsn) {
    SsdpResult r;
    EXPECT_FALSE(WamDiscovery::isWamDevice(r));

    r.deviceType = WamDiscovery::DEVICE_TYPE;
    EXPECT_TRUE(WamDiscovery::isWamDevice(r));

    r = SsdpResult();
    r.serviceType = WamDiscovery::DEVICE_TYPE;
    EXPECT_TRUE(WamDiscovery::isWamDevice(r));

    r = SsdpResult();
    r.usn = std::string("uuid:1234::") + WamDiscovery::DEVICE_TYPE;
    EXPECT_TRUE(WamDiscovery::isWamDevice(r));

    r.usn = "uuid:1234::urn:samsung.com:device:MainTVServerService:1";
    EXPECT_FALSE(WamDiscovery::isWamDevice(r));
}

TEST(WamDiscoveryStaticTest, HostFromLocation) {
    EXPECT_EQ(WamDiscovery::hostFromLocation("http://192.168.1.20:9197/dmr"), "192.168.1.20");
    EXPECT_EQ(WamDiscovery::hostFromLocation("http://192.168.1.20/desc.xml"), "192.168.1.20");
    EXPECT_EQ(WamDiscovery::hostFromLocation("http://speaker.local"), "speaker.local");
    EXPECT_EQ(WamDiscovery::hostFromLocation("http://[fe80::1]:9197/dmr"), "fe80::1");
    EXPECT_EQ(WamDiscovery::hostFromLocation("192.168.1.20:9197"), "");
    EXPECT_EQ(WamDiscovery::hostFromLocation(""), "");
}

TEST(NeighborTableResolverTest, FindsCompleteEntries) {
    std::istringstream table(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.20     0x1         0x2         aa:bb:cc:dd:ee:20     *        eth0\n"
        "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
        "192.168.1.1      0x1         0x2         11:22:33:44:55:66     *        eth0\n");

    EXPECT_EQ(NeighborTableResolver::lookup(table, "192.168.1.20"), "aa:bb:cc:dd:ee:20");
}

TEST(NeighborTableResolverTest, IncompleteOrMissingEntriesAreUnknown) {
    const std::string listing =
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.21     0x1         0x0         00:00:00:00:00:00     *        eth0\n";

    std::istringstream incomplete(listing);
    EXPECT_EQ(NeighborTableResolver::lookup(incomplete, "192.168.1.21"), "");

    std::istringstream missing(listing);
    EXPECT_EQ(NeighborTableResolver::lookup(missing, "10.0.0.1"), "");
}

TEST(NeighborTableResolverTest, UnreadableTableIsUnknown) {
    NeighborTableResolver resolver("/nonexistent/arp");
    EXPECT_EQ(resolver.resolveMac("192.168.1.20"), "");
}
