#include "gree_network/datagram_stream.hpp"
#include "gree_network/event_loop.hpp"
#include "gree_protocol/error.hpp"
#include "fake_device.hpp"
#include <gtest/gtest.h>
#include <boost/asio.hpp>

#include <set>

using namespace gree_network;
using namespace gree_protocol;
using boost::asio::ip::udp;
using test::FakeDevice;

class DatagramStreamTest : public ::testing::Test {
protected:
    static std::vector<FakeDevice::Bytes> echo(const FakeDevice::Bytes& request) {
        return {request};
    }

    static std::vector<FakeDevice::Bytes> silent(const FakeDevice::Bytes&) {
        return {};
    }

    std::shared_ptr<DatagramStream> connectTo(uint16_t port) {
        return DatagramStream::openPointToPoint(
            ioContext_, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port), config_, nullptr);
    }

    boost::asio::io_context ioContext_;
    DatagramStream::Config config_;
    const std::vector<uint8_t> hello_{'h', 'e', 'l', 'l', 'o'};
};

TEST_F(DatagramStreamTest, PointToPointSendAndReceive) {
    FakeDevice device(echo);
    auto stream = connectTo(device.port());

    EXPECT_EQ(DatagramStream::Mode::POINT_TO_POINT, stream->getMode());
    ASSERT_TRUE(stream->getRemoteEndpoint().has_value());
    EXPECT_EQ(device.port(), stream->getRemoteEndpoint()->port());

    stream->send(hello_);
    auto datagram = stream->recv(std::chrono::milliseconds(2000));

    EXPECT_EQ(hello_, datagram.payload);
    EXPECT_EQ(device.port(), datagram.sender.port());
    EXPECT_TRUE(stream->isOpen());
}

TEST_F(DatagramStreamTest, DatagramsAreDeliveredInArrivalOrder) {
    FakeDevice device([](const FakeDevice::Bytes& request) {
        return std::vector<FakeDevice::Bytes>{{'1'}, {'2'}, {'3'}, request};
    });
    auto stream = connectTo(device.port());

    stream->send(hello_);
    EXPECT_EQ(FakeDevice::Bytes{'1'}, stream->recv(std::chrono::milliseconds(2000)).payload);
    EXPECT_EQ(FakeDevice::Bytes{'2'}, stream->recv(std::chrono::milliseconds(2000)).payload);
    EXPECT_EQ(FakeDevice::Bytes{'3'}, stream->recv(std::chrono::milliseconds(2000)).payload);
    EXPECT_EQ(hello_, stream->recv(std::chrono::milliseconds(2000)).payload);
}

TEST_F(DatagramStreamTest, BroadcastModeReportsEachSender) {
    FakeDevice first(echo);
    FakeDevice second(echo);

    auto stream = DatagramStream::openBroadcast(
        ioContext_, boost::asio::ip::make_address("127.0.0.1"), config_, nullptr);
    EXPECT_EQ(DatagramStream::Mode::BROADCAST, stream->getMode());
    EXPECT_FALSE(stream->getRemoteEndpoint().has_value());

    auto loopback = boost::asio::ip::make_address("127.0.0.1");
    stream->send(hello_, udp::endpoint(loopback, first.port()));
    stream->send(hello_, udp::endpoint(loopback, second.port()));

    std::set<uint16_t> senders;
    senders.insert(stream->recv(std::chrono::milliseconds(2000)).sender.port());
    senders.insert(stream->recv(std::chrono::milliseconds(2000)).sender.port());

    EXPECT_EQ((std::set<uint16_t>{first.port(), second.port()}), senders);
}

TEST_F(DatagramStreamTest, ReceiveTimesOutWithoutClosing) {
    FakeDevice device(silent);
    auto stream = connectTo(device.port());
    stream->send(hello_);

    EXPECT_THROW(stream->recv(std::chrono::milliseconds(50)), TimeoutError);
    EXPECT_TRUE(stream->isOpen());
}

TEST_F(DatagramStreamTest, LateResponseRemainsQueuedAfterTimeout) {
    FakeDevice device([](const FakeDevice::Bytes& request) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return std::vector<FakeDevice::Bytes>{request};
    });
    auto stream = connectTo(device.port());
    stream->send(hello_);

    EXPECT_THROW(stream->recv(std::chrono::milliseconds(20)), TimeoutError);

    auto datagram = stream->recv(std::chrono::milliseconds(2000));
    EXPECT_EQ(hello_, datagram.payload);
}

TEST_F(DatagramStreamTest, CloseUnblocksPendingReceive) {
    FakeDevice device(silent);
    auto stream = connectTo(device.port());

    bool done = false;
    std::exception_ptr error;
    stream->asyncRecv(std::chrono::seconds(30), [&](std::exception_ptr e, DatagramStream::Datagram) {
        error = e;
        done = true;
    });

    boost::asio::steady_timer closer(ioContext_, std::chrono::milliseconds(20));
    closer.async_wait([stream](const boost::system::error_code&) { stream->close(); });

    auto started = std::chrono::steady_clock::now();
    runUntil(ioContext_, [&done] { return done; });
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), StreamClosedError);
    EXPECT_FALSE(stream->isOpen());
}

TEST_F(DatagramStreamTest, QueuedDataIsReadableAfterClose) {
    FakeDevice device(echo);
    auto stream = connectTo(device.port());
    stream->send(hello_);

    runUntil(ioContext_, [&stream] { return stream->pendingDatagrams() > 0; });
    stream->close();

    EXPECT_FALSE(stream->isDrained());
    EXPECT_EQ(hello_, stream->recv(std::chrono::milliseconds(100)).payload);
    EXPECT_TRUE(stream->isDrained());
    EXPECT_THROW(stream->recv(std::chrono::milliseconds(100)), StreamClosedError);
}

TEST_F(DatagramStreamTest, CloseIsIdempotent) {
    FakeDevice device(silent);
    auto stream = connectTo(device.port());

    stream->close();
    EXPECT_NO_THROW(stream->close());
    EXPECT_THROW(stream->send(hello_), StreamClosedError);
    EXPECT_THROW(stream->recv(std::chrono::milliseconds(100)), StreamClosedError);
}

TEST_F(DatagramStreamTest, UnreachablePortSurfacesTransportError) {
    uint16_t unusedPort;
    {
        udp::socket probe(ioContext_, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        unusedPort = probe.local_endpoint().port();
    }

    auto stream = connectTo(unusedPort);
    stream->send(hello_);

    EXPECT_THROW(stream->recv(std::chrono::milliseconds(2000)), TransportError);
}

TEST_F(DatagramStreamTest, SendRejectsWrongAddressingMode) {
    FakeDevice device(silent);
    auto pointToPoint = connectTo(device.port());
    auto broadcast = DatagramStream::openBroadcast(
        ioContext_, boost::asio::ip::make_address("127.0.0.1"), config_, nullptr);

    udp::endpoint destination(boost::asio::ip::make_address("127.0.0.1"), device.port());
    EXPECT_THROW(pointToPoint->send(hello_, destination), std::invalid_argument);
    EXPECT_THROW(broadcast->send(hello_), std::invalid_argument);
}

TEST_F(DatagramStreamTest, OnlyOneReceiveMayBePending) {
    FakeDevice device(silent);
    auto stream = connectTo(device.port());

    bool done = false;
    stream->asyncRecv(std::chrono::milliseconds(50), [&done](std::exception_ptr, DatagramStream::Datagram) {
        done = true;
    });
    EXPECT_THROW(stream->asyncRecv(std::chrono::milliseconds(50),
                                   [](std::exception_ptr, DatagramStream::Datagram) {}),
                 std::logic_error);

    runUntil(ioContext_, [&done] { return done; });
}

TEST_F(DatagramStreamTest, OversizedDatagramIsDroppedWhole) {
    config_.maxDatagramSize = 8;
    const std::string envelope = R"({"t":"pack","pack":"abcd"})";
    ASSERT_EQ(26u, envelope.size());

    FakeDevice device([&envelope](const FakeDevice::Bytes&) {
        return std::vector<FakeDevice::Bytes>{FakeDevice::Bytes(envelope.begin(), envelope.end())};
    });
    auto stream = connectTo(device.port());
    stream->send(hello_);

    EXPECT_THROW(stream->recv(std::chrono::milliseconds(2000)), TransportError);

    // Nothing partial was queued and the stream keeps receiving
    EXPECT_EQ(0u, stream->pendingDatagrams());
    EXPECT_TRUE(stream->isOpen());
    EXPECT_THROW(stream->recv(std::chrono::milliseconds(50)), TimeoutError);
}

TEST_F(DatagramStreamTest, DatagramAtSizeLimitIsDelivered) {
    config_.maxDatagramSize = 5;
    FakeDevice device(echo);
    auto stream = connectTo(device.port());

    stream->send(hello_);
    EXPECT_EQ(hello_, stream->recv(std::chrono::milliseconds(2000)).payload);
}

TEST_F(DatagramStreamTest, ZeroSizeLimitIsRejected) {
    config_.maxDatagramSize = 0;
    FakeDevice device(silent);

    EXPECT_THROW(connectTo(device.port()), std::invalid_argument);
}
