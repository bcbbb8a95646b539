#include "gree_network/discovery.hpp"
#include "gree_network/event_loop.hpp"
#include "gree_network/logging.hpp"
#include "gree_protocol/error.hpp"

#include <unordered_set>

namespace gree_network {

using boost::asio::ip::udp;
using gree_protocol::DeviceInfo;

struct Discovery::ScanState {
    ScanHandler handler;
    std::string genericKey;
    std::shared_ptr<spdlog::logger> logger;
    std::chrono::steady_clock::time_point deadline;
    size_t activeStreams = 0;
    std::vector<DeviceInfo> devices;
    std::unordered_set<gree_protocol::MacAddress> seen;
};

Discovery::Discovery(
    boost::asio::io_context& ioContext,
    const Config& config,
    std::shared_ptr<spdlog::logger> logger
)
    : ioContext_(ioContext)
    , config_(config)
    , logger_(loggerOrNull(std::move(logger)))
{
    gree_protocol::MessageBuilder::Config builderConfig;
    builderConfig.genericKey = config_.genericKey;
    builder_ = gree_protocol::MessageBuilder(builderConfig);
}

void Discovery::asyncScan(const std::vector<BroadcastTarget>& targets, ScanHandler handler) {
    auto state = std::make_shared<ScanState>();
    state->handler = std::move(handler);
    state->genericKey = config_.genericKey;
    state->logger = logger_;
    state->deadline = std::chrono::steady_clock::now() + config_.window;

    logger_->info("Starting device discovery on {} target(s), window {}ms", targets.size(), config_.window.count());

    const auto request = builder_.buildScanRequest();
    std::vector<std::shared_ptr<DatagramStream>> streams;

    for (const auto& target : targets) {
        try {
            auto stream = DatagramStream::openBroadcast(
                ioContext_, boost::asio::ip::address(target.localAddress), config_.streamConfig, logger_);
            stream->send(request, udp::endpoint(target.broadcastAddress, config_.devicePort));
            streams.push_back(stream);

            logger_->debug("Scan sent on {} ({} -> {}:{})", target.interfaceName,
                           target.localAddress.to_string(), target.broadcastAddress.to_string(), config_.devicePort);
        } catch (const gree_protocol::TransportError& e) {
            logger_->warn("Skipping {} ({}): {}", target.interfaceName, target.broadcastAddress.to_string(), e.what());
        }
    }

    if (streams.empty()) {
        std::exception_ptr error;
        if (!targets.empty()) {
            error = std::make_exception_ptr(gree_protocol::TransportError("no interface could be scanned"));
        }
        boost::asio::post(ioContext_, [state, error] { state->handler(error, {}); });
        return;
    }

    state->activeStreams = streams.size();
    for (const auto& stream : streams) {
        receiveNext(state, stream);
    }
}

std::vector<DeviceInfo> Discovery::scan(const std::vector<BroadcastTarget>& targets) {
    struct SyncState {
        bool done = false;
        std::exception_ptr error;
        std::vector<DeviceInfo> devices;
    };

    auto sync = std::make_shared<SyncState>();
    asyncScan(targets, [sync](std::exception_ptr error, std::vector<DeviceInfo> devices) {
        sync->error = error;
        sync->devices = std::move(devices);
        sync->done = true;
    });

    runUntil(ioContext_, [&sync] { return sync->done; });

    if (sync->error) {
        std::rethrow_exception(sync->error);
    }
    return std::move(sync->devices);
}

void Discovery::receiveNext(const std::shared_ptr<ScanState>& state, const std::shared_ptr<DatagramStream>& stream) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        state->deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero()) {
        finishStream(state, stream);
        return;
    }

    stream->asyncRecv(remaining, [state, stream](std::exception_ptr error, DatagramStream::Datagram datagram) {
        if (!error) {
            handleReply(state, datagram);
            receiveNext(state, stream);
            return;
        }

        try {
            std::rethrow_exception(error);
        } catch (const gree_protocol::TimeoutError&) {
            finishStream(state, stream);
        } catch (const gree_protocol::StreamClosedError&) {
            finishStream(state, stream);
        } catch (const gree_protocol::TransportError& e) {
            state->logger->warn("Discovery receive error: {}", e.what());
            receiveNext(state, stream);
        }
    });
}

void Discovery::handleReply(const std::shared_ptr<ScanState>& state, const DatagramStream::Datagram& datagram) {
    const auto senderAddress = datagram.sender.address().to_string();

    DeviceInfo device;
    try {
        auto payload = gree_protocol::MessageParser::openPayload(datagram.payload, state->genericKey);
        device = gree_protocol::MessageParser::parseScanResponse(payload, senderAddress, datagram.sender.port());
    } catch (const gree_protocol::GreeError& e) {
        state->logger->debug("Ignoring non-device reply from {}: {}", senderAddress, e.what());
        return;
    }

    if (!state->seen.insert(device.mac).second) {
        state->logger->debug("Duplicate reply from {}", device.toString());
        return;
    }

    state->logger->info("Found {}", device.toString());
    state->devices.push_back(device);
}

void Discovery::finishStream(const std::shared_ptr<ScanState>& state, const std::shared_ptr<DatagramStream>& stream) {
    stream->close();

    if (--state->activeStreams > 0) {
        return;
    }

    state->logger->info("Discovery finished, {} device(s) found", state->devices.size());
    state->handler(nullptr, std::move(state->devices));
}

} // namespace gree_network
