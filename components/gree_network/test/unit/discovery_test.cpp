#include "gree_network/discovery.hpp"
#include "gree_network/interfaces.hpp"
#include "gree_protocol/error.hpp"
#include "fake_device.hpp"
#include <gtest/gtest.h>
#include <boost/asio.hpp>

using namespace gree_network;
using namespace gree_protocol;
using test::FakeDevice;

class DiscoveryTest : public ::testing::Test {
protected:
    static nlohmann::json identity(const std::string& mac, const std::string& name) {
        return {
            {"t", "dev"},
            {"cid", mac},
            {"bc", "gree"},
            {"brand", "gree"},
            {"catalog", "gree"},
            {"mac", mac},
            {"mid", "10001"},
            {"model", "gree"},
            {"name", name},
            {"series", "gree"},
            {"vender", "1"},
            {"ver", "V1.1.13"},
            {"lock", 0}
        };
    }

    Discovery makeDiscovery(uint16_t devicePort) {
        Discovery::Config config;
        config.devicePort = devicePort;
        config.window = std::chrono::milliseconds(300);
        return Discovery(ioContext_, config, nullptr);
    }

    boost::asio::io_context ioContext_;
    const std::vector<BroadcastTarget> loopback_ = targetsFromAddresses({"127.0.0.1"});
};

TEST_F(DiscoveryTest, FindsRespondingDevice) {
    FakeDevice device([](const FakeDevice::Bytes&) {
        return std::vector<FakeDevice::Bytes>{
            FakeDevice::reply(identity("aabbcc112233", "fake-device"), GENERIC_KEY)};
    });

    auto discovery = makeDiscovery(device.port());
    auto devices = discovery.scan(loopback_);

    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("127.0.0.1", devices[0].ip);
    EXPECT_EQ(device.port(), devices[0].port);
    EXPECT_EQ("aabbcc112233", devices[0].mac);
    EXPECT_EQ("fake-device", devices[0].name);
    EXPECT_EQ("gree", devices[0].brand);
    EXPECT_EQ("gree", devices[0].model);
    EXPECT_EQ("V1.1.13", devices[0].version);

    auto requests = device.payloads(GENERIC_KEY);
    ASSERT_EQ(1u, requests.size());
    EXPECT_EQ(nlohmann::json({{"t", "scan"}}), requests[0]);
}

TEST_F(DiscoveryTest, NoResponderYieldsEmptyList) {
    FakeDevice device([](const FakeDevice::Bytes&) { return std::vector<FakeDevice::Bytes>{}; });

    auto discovery = makeDiscovery(device.port());
    auto started = std::chrono::steady_clock::now();
    std::vector<DeviceInfo> devices;
    EXPECT_NO_THROW(devices = discovery.scan(loopback_));

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
}

TEST_F(DiscoveryTest, DuplicateRepliesAreCollapsedByMac) {
    FakeDevice device([](const FakeDevice::Bytes&) {
        auto first = FakeDevice::reply(identity("aabbcc112233", "first"), GENERIC_KEY);
        auto second = FakeDevice::reply(identity("ddeeff445566", "second"), GENERIC_KEY);
        return std::vector<FakeDevice::Bytes>{first, second, first};
    });

    auto discovery = makeDiscovery(device.port());
    auto devices = discovery.scan(targetsFromAddresses({"127.0.0.1", "127.0.0.1"}));

    ASSERT_EQ(2u, devices.size());
    EXPECT_EQ("aabbcc112233", devices[0].mac);
    EXPECT_EQ("ddeeff445566", devices[1].mac);
}

TEST_F(DiscoveryTest, UndecryptableRepliesAreIgnored) {
    FakeDevice device([](const FakeDevice::Bytes&) {
        return std::vector<FakeDevice::Bytes>{
            FakeDevice::Bytes{'n', 'o', 'i', 's', 'e'},
            FakeDevice::reply(identity("aabbcc112233", "wrong-key"), "0123456789abcdef"),
            FakeDevice::reply(identity("ddeeff445566", "good"), GENERIC_KEY)};
    });

    auto discovery = makeDiscovery(device.port());
    auto devices = discovery.scan(loopback_);

    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("good", devices[0].name);
}

TEST_F(DiscoveryTest, NoTargetsYieldsEmptyList) {
    auto discovery = makeDiscovery(DEFAULT_DEVICE_PORT);
    EXPECT_TRUE(discovery.scan({}).empty());
}

TEST_F(DiscoveryTest, AsyncScanDeliversResultOnLoop) {
    FakeDevice device([](const FakeDevice::Bytes&) {
        return std::vector<FakeDevice::Bytes>{
            FakeDevice::reply(identity("aabbcc112233", "fake-device"), GENERIC_KEY)};
    });

    auto discovery = makeDiscovery(device.port());
    bool called = false;
    std::vector<DeviceInfo> found;
    discovery.asyncScan(loopback_, [&](std::exception_ptr error, std::vector<DeviceInfo> devices) {
        EXPECT_FALSE(error);
        found = std::move(devices);
        called = true;
    });

    EXPECT_FALSE(called);
    ioContext_.run();
    EXPECT_TRUE(called);
    ASSERT_EQ(1u, found.size());
}

TEST_F(DiscoveryTest, ScanOutlivesDiscoveryObject) {
    const std::string siteKey = "0123456789abcdef";
    FakeDevice device([&siteKey](const FakeDevice::Bytes&) {
        return std::vector<FakeDevice::Bytes>{
            FakeDevice::reply(identity("aabbcc112233", "fake-device"), siteKey)};
    });

    Discovery::Config config;
    config.devicePort = device.port();
    config.genericKey = siteKey;
    config.window = std::chrono::milliseconds(300);
    auto discovery = std::make_unique<Discovery>(ioContext_, config, nullptr);

    bool called = false;
    std::vector<DeviceInfo> found;
    discovery->asyncScan(loopback_, [&](std::exception_ptr error, std::vector<DeviceInfo> devices) {
        EXPECT_FALSE(error);
        found = std::move(devices);
        called = true;
    });
    discovery.reset();

    ioContext_.run();
    EXPECT_TRUE(called);
    ASSERT_EQ(1u, found.size());
    EXPECT_EQ("aabbcc112233", found[0].mac);
}

TEST(InterfacesTest, ExplicitAddressesBecomeTargets) {
    auto targets = targetsFromAddresses({"192.168.1.255", "10.0.0.255"});

    ASSERT_EQ(2u, targets.size());
    EXPECT_EQ("192.168.1.255", targets[0].broadcastAddress.to_string());
    EXPECT_EQ("0.0.0.0", targets[0].localAddress.to_string());
    EXPECT_EQ("10.0.0.255", targets[1].broadcastAddress.to_string());
}

TEST(InterfacesTest, InvalidAddressIsRejected) {
    EXPECT_THROW(targetsFromAddresses({"not-an-address"}), std::invalid_argument);
}

TEST(InterfacesTest, EnumeratedTargetsExcludeLoopback) {
    for (const auto& target : listBroadcastTargets()) {
        EXPECT_FALSE(target.localAddress.is_loopback()) << target.interfaceName;
    }
}
