/**
 * @file discover_and_query.cpp
 * @brief Discover every unit on the network, then bind and query them all at once
 *
 * The per-device exchanges run interleaved on one io_context.
 */

#include "gree_network/client.hpp"
#include "gree_protocol/error.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

using namespace gree_network;
using gree_protocol::DeviceInfo;

int main() {
    auto logger = spdlog::stdout_color_mt("example");
    logger->set_level(spdlog::level::debug);

    boost::asio::io_context ioContext;
    auto client = std::make_shared<Client>(ioContext, ClientConfig(), logger);

    client->asyncDiscover([client, logger](std::exception_ptr error, std::vector<DeviceInfo> devices) {
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                logger->error("Discovery failed: {}", e.what());
            }
            return;
        }

        for (const auto& device : devices) {
            client->asyncBind(device, [client, device, logger](std::exception_ptr error, gree_protocol::DeviceKey key) {
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        logger->error("Bind to {} failed: {}", device.toString(), e.what());
                    }
                    return;
                }

                client->asyncRequestState({"Pow", "Mod", "SetTem"}, device, key,
                    [device, logger](std::exception_ptr error, gree_protocol::PropertyMap state) {
                        if (error) {
                            logger->error("Status request to {} failed", device.toString());
                            return;
                        }
                        std::cout << device.toString() << ":";
                        for (const auto& entry : state) {
                            std::cout << " " << entry.first << "="
                                      << gree_protocol::propertyValueToString(entry.second);
                        }
                        std::cout << std::endl;
                    });
            });
        }
    });

    ioContext.run();
    return 0;
}
