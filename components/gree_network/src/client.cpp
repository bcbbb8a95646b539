#include "gree_network/client.hpp"
#include "gree_network/event_loop.hpp"
#include "gree_network/logging.hpp"
#include "gree_protocol/error.hpp"

#include <stdexcept>
#include <utility>

namespace gree_network {

using boost::asio::ip::udp;
using gree_protocol::DeviceInfo;
using gree_protocol::DeviceKey;
using gree_protocol::MessageParser;
using gree_protocol::PropertyMap;

namespace {

Discovery::Config makeDiscoveryConfig(const ClientConfig& config) {
    Discovery::Config discoveryConfig;
    discoveryConfig.devicePort = config.devicePort;
    discoveryConfig.genericKey = config.genericKey;
    discoveryConfig.window = config.discoveryWindow;
    discoveryConfig.streamConfig.maxDatagramSize = config.maxDatagramSize;
    return discoveryConfig;
}

gree_protocol::MessageBuilder::Config makeBuilderConfig(const ClientConfig& config) {
    gree_protocol::MessageBuilder::Config builderConfig;
    builderConfig.clientId = config.clientId;
    builderConfig.genericKey = config.genericKey;
    return builderConfig;
}

// Run an asynchronous operation to completion on the calling thread
template <typename Result, typename Start>
Result waitFor(boost::asio::io_context& ioContext, Start start) {
    struct SyncState {
        bool done = false;
        std::exception_ptr error;
        Result result;
    };

    auto state = std::make_shared<SyncState>();
    start([state](std::exception_ptr error, Result result) {
        state->error = error;
        state->result = std::move(result);
        state->done = true;
    });

    runUntil(ioContext, [&state] { return state->done; });

    if (state->error) {
        std::rethrow_exception(state->error);
    }
    return std::move(state->result);
}

std::exception_ptr toBindingTimeout(std::exception_ptr error, const DeviceInfo& device) {
    try {
        std::rethrow_exception(error);
    } catch (const gree_protocol::BindingTimeoutError&) {
        return error;
    } catch (const gree_protocol::TimeoutError&) {
        return std::make_exception_ptr(
            gree_protocol::BindingTimeoutError("no bind response from " + device.toString()));
    } catch (...) {
        return error;
    }
}

// Responses must carry the names that were sent, in the same order
void expectNames(const PropertyMap& response, const std::vector<std::string>& sent, const std::string& context) {
    if (response.names() != sent) {
        throw gree_protocol::ProtocolError(context + " response does not match the requested property names");
    }
}

} // namespace

Client::Client(
    boost::asio::io_context& ioContext,
    const ClientConfig& config,
    std::shared_ptr<spdlog::logger> logger
)
    : ioContext_(ioContext)
    , config_(config)
    , logger_(loggerOrNull(std::move(logger)))
    , builder_(makeBuilderConfig(config))
    , discovery_(ioContext, makeDiscoveryConfig(config), logger_)
{
    streamConfig_.maxDatagramSize = config_.maxDatagramSize;
}

void Client::asyncDiscover(DiscoverHandler handler) {
    std::vector<BroadcastTarget> targets;
    try {
        targets = broadcastTargets();
    } catch (const std::exception& e) {
        logger_->error("Cannot determine broadcast targets: {}", e.what());
        boost::asio::post(ioContext_, [handler = std::move(handler), error = std::current_exception()] {
            handler(error, {});
        });
        return;
    }

    discovery_.asyncScan(targets,
        [self = shared_from_this(), handler = std::move(handler)](
            std::exception_ptr error, std::vector<DeviceInfo> devices) {
            handler(error, std::move(devices));
        });
}

std::vector<DeviceInfo> Client::discover() {
    return waitFor<std::vector<DeviceInfo>>(ioContext_, [this](DiscoverHandler handler) {
        asyncDiscover(std::move(handler));
    });
}

void Client::asyncBind(const DeviceInfo& device, KeyHandler handler) {
    std::vector<uint8_t> request;
    try {
        request = builder_.buildBindRequest(device);
    } catch (const std::invalid_argument&) {
        boost::asio::post(ioContext_, [handler = std::move(handler), error = std::current_exception()] {
            handler(error, {});
        });
        return;
    }

    logger_->info("Binding to {}", device.toString());

    exchange(device, std::move(request), config_.genericKey, config_.bindTimeout,
        [self = shared_from_this(), device, handler = std::move(handler)](
            std::exception_ptr error, nlohmann::json payload) {
            DeviceKey key;
            if (!error) {
                try {
                    key = MessageParser::parseBindResponse(payload);
                } catch (const gree_protocol::GreeError&) {
                    error = std::current_exception();
                }
            }

            if (error) {
                handler(toBindingTimeout(error, device), {});
                return;
            }

            self->logger_->info("Bound to {}", device.toString());
            handler(nullptr, key);
        });
}

void Client::asyncRequestState(const std::vector<std::string>& names,
                               const DeviceInfo& device,
                               const DeviceKey& key,
                               StateHandler handler) {
    if (key.empty()) {
        boost::asio::post(ioContext_, [handler = std::move(handler), device] {
            handler(std::make_exception_ptr(gree_protocol::NotBoundError("no key for " + device.toString())), {});
        });
        return;
    }

    std::vector<uint8_t> request;
    try {
        request = builder_.buildStatusRequest(device, names, key);
    } catch (const std::invalid_argument&) {
        boost::asio::post(ioContext_, [handler = std::move(handler), error = std::current_exception()] {
            handler(error, {});
        });
        return;
    }

    logger_->debug("Requesting {} propertie(s) from {}", names.size(), device.toString());

    exchange(device, std::move(request), key, config_.requestTimeout,
        [names, handler = std::move(handler)](std::exception_ptr error, nlohmann::json payload) {
            if (error) {
                handler(error, {});
                return;
            }

            PropertyMap state;
            try {
                state = MessageParser::parseStatusResponse(payload);
                expectNames(state, names, "status");
            } catch (const gree_protocol::GreeError&) {
                handler(std::current_exception(), {});
                return;
            }
            handler(nullptr, std::move(state));
        });
}

void Client::asyncSendState(const PropertyMap& properties,
                            const DeviceInfo& device,
                            const DeviceKey& key,
                            StateHandler handler) {
    if (key.empty()) {
        boost::asio::post(ioContext_, [handler = std::move(handler), device] {
            handler(std::make_exception_ptr(gree_protocol::NotBoundError("no key for " + device.toString())), {});
        });
        return;
    }

    std::vector<uint8_t> request;
    try {
        request = builder_.buildCommandRequest(device, properties, key);
    } catch (const std::invalid_argument&) {
        boost::asio::post(ioContext_, [handler = std::move(handler), error = std::current_exception()] {
            handler(error, {});
        });
        return;
    }

    logger_->debug("Sending {} propertie(s) to {}", properties.size(), device.toString());

    exchange(device, std::move(request), key, config_.requestTimeout,
        [names = properties.names(), handler = std::move(handler)](std::exception_ptr error, nlohmann::json payload) {
            if (error) {
                handler(error, {});
                return;
            }

            PropertyMap acknowledged;
            try {
                acknowledged = MessageParser::parseCommandResponse(payload);
                expectNames(acknowledged, names, "command");
            } catch (const gree_protocol::GreeError&) {
                handler(std::current_exception(), {});
                return;
            }
            handler(nullptr, std::move(acknowledged));
        });
}

DeviceKey Client::bind(const DeviceInfo& device) {
    return waitFor<DeviceKey>(ioContext_, [this, &device](KeyHandler handler) {
        asyncBind(device, std::move(handler));
    });
}

DeviceKey Client::bind(const DeviceInfo& device, const DeviceKey& key) {
    if (!key.empty()) {
        logger_->debug("Using existing key for {}", device.toString());
        return key;
    }
    return bind(device);
}

PropertyMap Client::requestState(const std::vector<std::string>& names,
                                 const DeviceInfo& device,
                                 const DeviceKey& key) {
    if (key.empty()) {
        throw gree_protocol::NotBoundError("no key for " + device.toString());
    }
    return waitFor<PropertyMap>(ioContext_, [&](StateHandler handler) {
        asyncRequestState(names, device, key, std::move(handler));
    });
}

PropertyMap Client::sendState(const PropertyMap& properties,
                              const DeviceInfo& device,
                              const DeviceKey& key) {
    if (key.empty()) {
        throw gree_protocol::NotBoundError("no key for " + device.toString());
    }
    return waitFor<PropertyMap>(ioContext_, [&](StateHandler handler) {
        asyncSendState(properties, device, key, std::move(handler));
    });
}

size_t Client::pendingExchanges(const gree_protocol::MacAddress& mac) const {
    auto it = exchanges_.find(mac);
    return it == exchanges_.end() ? 0 : it->second.size();
}

void Client::exchange(const DeviceInfo& device,
                      std::vector<uint8_t> request,
                      const std::string& key,
                      std::chrono::milliseconds timeout,
                      ResponseHandler handler) {
    auto self = shared_from_this();
    enqueue(device.mac, [self, device, request = std::move(request), key, timeout, handler = std::move(handler)] {
        self->startExchange(device, request, key, timeout, handler);
    });
}

void Client::startExchange(const DeviceInfo& device,
                           const std::vector<uint8_t>& request,
                           const std::string& key,
                           std::chrono::milliseconds timeout,
                           const ResponseHandler& handler) {
    auto self = shared_from_this();
    auto stream = std::make_shared<std::shared_ptr<DatagramStream>>();

    // Single exit point: close the socket, let the next exchange run, report
    auto finish = [self, stream, mac = device.mac, handler](std::exception_ptr error, nlohmann::json payload) {
        if (*stream) {
            (*stream)->close();
        }
        self->release(mac);
        handler(error, std::move(payload));
    };

    try {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(device.ip, ec);
        if (ec) {
            throw std::invalid_argument("invalid device address '" + device.ip + "'");
        }

        *stream = DatagramStream::openPointToPoint(ioContext_, udp::endpoint(address, device.port),
                                                   streamConfig_, logger_);
        (*stream)->send(request);
    } catch (const std::exception& e) {
        logger_->error("Exchange with {} failed before sending: {}", device.toString(), e.what());
        finish(std::current_exception(), {});
        return;
    }

    (*stream)->asyncRecv(timeout, [finish, key, device, self](std::exception_ptr error,
                                                              DatagramStream::Datagram datagram) {
        if (error) {
            finish(error, {});
            return;
        }

        nlohmann::json payload;
        try {
            payload = MessageParser::openPayload(datagram.payload, key);
        } catch (const gree_protocol::GreeError& e) {
            self->logger_->warn("Bad response from {}: {}", device.toString(), e.what());
            finish(std::current_exception(), {});
            return;
        }
        finish(nullptr, std::move(payload));
    });
}

void Client::enqueue(const gree_protocol::MacAddress& mac, std::function<void()> start) {
    auto& queue = exchanges_[mac];
    queue.push_back(std::move(start));

    if (queue.size() == 1) {
        boost::asio::post(ioContext_, queue.front());
    } else {
        logger_->debug("Exchange with {} queued behind {} other(s)", mac, queue.size() - 1);
    }
}

void Client::release(const gree_protocol::MacAddress& mac) {
    auto it = exchanges_.find(mac);
    if (it == exchanges_.end() || it->second.empty()) {
        return;
    }

    it->second.pop_front();
    if (it->second.empty()) {
        exchanges_.erase(it);
        return;
    }
    boost::asio::post(ioContext_, it->second.front());
}

std::vector<BroadcastTarget> Client::broadcastTargets() const {
    if (!config_.broadcastAddresses.empty()) {
        return targetsFromAddresses(config_.broadcastAddresses);
    }
    return listBroadcastTargets();
}

} // namespace gree_network
