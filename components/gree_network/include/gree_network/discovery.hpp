#pragma once

#include "gree_network/datagram_stream.hpp"
#include "gree_network/interfaces.hpp"
#include "gree_protocol/messages.hpp"
#include "gree_protocol/types.hpp"

#include <boost/asio.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gree_network {

/**
 * @class Discovery
 * @brief Finds units on the local subnets by broadcasting a scan request
 *
 * One broadcast stream is opened per target. Replies are collected until the
 * window elapses, decrypted with the generic key, and deduplicated by MAC.
 * A window with no replies yields an empty list, not an error. A scan in
 * flight owns its own state, so the Discovery object may be destroyed before
 * the handler runs; only the io_context must outlive the scan.
 */
class Discovery {
public:
    struct Config {
        uint16_t devicePort = gree_protocol::DEFAULT_DEVICE_PORT;
        std::string genericKey = gree_protocol::GENERIC_KEY;
        std::chrono::milliseconds window{2000};
        DatagramStream::Config streamConfig;
    };

    using ScanHandler = std::function<void(std::exception_ptr, std::vector<gree_protocol::DeviceInfo>)>;

    Discovery(
        boost::asio::io_context& ioContext,
        const Config& config,
        std::shared_ptr<spdlog::logger> logger
    );

    /**
     * @brief Scan the given targets; the handler runs on the io_context
     *
     * Fails with TransportError only when no target could be scanned at all.
     */
    void asyncScan(const std::vector<BroadcastTarget>& targets, ScanHandler handler);

    /**
     * @brief Blocking form of asyncScan()
     */
    std::vector<gree_protocol::DeviceInfo> scan(const std::vector<BroadcastTarget>& targets);

    const Config& getConfig() const { return config_; }

private:
    struct ScanState;

    static void receiveNext(const std::shared_ptr<ScanState>& state, const std::shared_ptr<DatagramStream>& stream);
    static void handleReply(const std::shared_ptr<ScanState>& state, const DatagramStream::Datagram& datagram);
    static void finishStream(const std::shared_ptr<ScanState>& state, const std::shared_ptr<DatagramStream>& stream);

    boost::asio::io_context& ioContext_;
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;
    gree_protocol::MessageBuilder builder_;
};

} // namespace gree_network
