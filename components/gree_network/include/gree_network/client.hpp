#pragma once

#include "gree_network/config.hpp"
#include "gree_network/datagram_stream.hpp"
#include "gree_network/discovery.hpp"
#include "gree_network/interfaces.hpp"
#include "gree_protocol/messages.hpp"
#include "gree_protocol/types.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gree_network {

/**
 * @brief Interface for the per-device session operations
 *
 * Implemented by Client; mocked by higher layers in their tests.
 */
class IDeviceProtocol {
public:
    virtual ~IDeviceProtocol() = default;

    /**
     * @brief Pair with the device and obtain its key
     * @throws BindingTimeoutError if the device does not answer in time
     */
    virtual gree_protocol::DeviceKey bind(const gree_protocol::DeviceInfo& device) = 0;

    /**
     * @brief Accept a previously obtained key; a non-empty key causes no network traffic
     */
    virtual gree_protocol::DeviceKey bind(const gree_protocol::DeviceInfo& device,
                                          const gree_protocol::DeviceKey& key) = 0;

    /**
     * @brief Read the named properties
     * @throws NotBoundError if key is empty
     */
    virtual gree_protocol::PropertyMap requestState(const std::vector<std::string>& names,
                                                    const gree_protocol::DeviceInfo& device,
                                                    const gree_protocol::DeviceKey& key) = 0;

    /**
     * @brief Write properties; returns the values the device acknowledged
     * @throws NotBoundError if key is empty
     */
    virtual gree_protocol::PropertyMap sendState(const gree_protocol::PropertyMap& properties,
                                                 const gree_protocol::DeviceInfo& device,
                                                 const gree_protocol::DeviceKey& key) = 0;
};

/**
 * @class Client
 * @brief Discovery and single request/response exchanges with devices
 *
 * Every exchange opens a fresh point-to-point stream, sends one request and
 * waits for one response. Exchanges with the same device (by MAC) run one at a
 * time in submission order; exchanges with different devices interleave on
 * the shared io_context.
 *
 * Must be owned by a std::shared_ptr. The blocking methods drive the
 * io_context on the calling thread and must not be called from a handler
 * running on it.
 */
class Client : public IDeviceProtocol, public std::enable_shared_from_this<Client> {
public:
    using DiscoverHandler = std::function<void(std::exception_ptr, std::vector<gree_protocol::DeviceInfo>)>;
    using KeyHandler = std::function<void(std::exception_ptr, gree_protocol::DeviceKey)>;
    using StateHandler = std::function<void(std::exception_ptr, gree_protocol::PropertyMap)>;

    Client(
        boost::asio::io_context& ioContext,
        const ClientConfig& config,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    /**
     * @brief Broadcast a scan on the configured addresses, or on every
     *        broadcast-capable interface when none are configured
     */
    void asyncDiscover(DiscoverHandler handler);
    std::vector<gree_protocol::DeviceInfo> discover();

    void asyncBind(const gree_protocol::DeviceInfo& device, KeyHandler handler);

    void asyncRequestState(const std::vector<std::string>& names,
                           const gree_protocol::DeviceInfo& device,
                           const gree_protocol::DeviceKey& key,
                           StateHandler handler);

    void asyncSendState(const gree_protocol::PropertyMap& properties,
                        const gree_protocol::DeviceInfo& device,
                        const gree_protocol::DeviceKey& key,
                        StateHandler handler);

    // IDeviceProtocol
    gree_protocol::DeviceKey bind(const gree_protocol::DeviceInfo& device) override;
    gree_protocol::DeviceKey bind(const gree_protocol::DeviceInfo& device,
                                  const gree_protocol::DeviceKey& key) override;
    gree_protocol::PropertyMap requestState(const std::vector<std::string>& names,
                                            const gree_protocol::DeviceInfo& device,
                                            const gree_protocol::DeviceKey& key) override;
    gree_protocol::PropertyMap sendState(const gree_protocol::PropertyMap& properties,
                                         const gree_protocol::DeviceInfo& device,
                                         const gree_protocol::DeviceKey& key) override;

    /**
     * @brief Exchanges queued or running for a device
     */
    size_t pendingExchanges(const gree_protocol::MacAddress& mac) const;

    const ClientConfig& getConfig() const { return config_; }

private:
    using ResponseHandler = std::function<void(std::exception_ptr, nlohmann::json)>;

    void exchange(const gree_protocol::DeviceInfo& device,
                  std::vector<uint8_t> request,
                  const std::string& key,
                  std::chrono::milliseconds timeout,
                  ResponseHandler handler);
    void startExchange(const gree_protocol::DeviceInfo& device,
                       const std::vector<uint8_t>& request,
                       const std::string& key,
                       std::chrono::milliseconds timeout,
                       const ResponseHandler& handler);

    void enqueue(const gree_protocol::MacAddress& mac, std::function<void()> start);
    void release(const gree_protocol::MacAddress& mac);

    std::vector<BroadcastTarget> broadcastTargets() const;

    boost::asio::io_context& ioContext_;
    ClientConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    gree_protocol::MessageBuilder builder_;
    DatagramStream::Config streamConfig_;
    Discovery discovery_;

    // Per-device exchange queues; the front entry is the running exchange
    std::unordered_map<gree_protocol::MacAddress, std::deque<std::function<void()>>> exchanges_;
};

} // namespace gree_network
