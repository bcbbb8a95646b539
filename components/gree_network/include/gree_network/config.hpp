/**
 * @file config.hpp
 * @brief Client configuration and its JSON loader
 */

#pragma once

#include "gree_protocol/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gree_network {

/**
 * @brief Settings shared by discovery and the session protocol
 */
struct ClientConfig {
    // Wire settings
    uint16_t devicePort = gree_protocol::DEFAULT_DEVICE_PORT;
    std::string clientId = gree_protocol::DEFAULT_CLIENT_ID;
    std::string genericKey = gree_protocol::GENERIC_KEY;

    // Timeouts
    std::chrono::milliseconds bindTimeout{5000};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds discoveryWindow{2000};

    // Receive buffer per socket; large enough for any UDP datagram
    size_t maxDatagramSize = 65507;

    // Explicit broadcast addresses; empty means every broadcast-capable interface
    std::vector<std::string> broadcastAddresses;
};

/**
 * @brief Logging settings consumed by the command line tool
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

/**
 * @brief Configuration utilities
 */
class ConfigLoader {
public:
    /**
     * @brief Load client configuration from a JSON file
     * @param filepath Path to JSON configuration file
     * @return Client configuration, defaults for absent keys
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static ClientConfig loadClientConfig(const std::string& filepath);

    /**
     * @brief Load logging configuration from a JSON file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static LoggingConfig loadLoggingConfig(const std::string& filepath);

    /**
     * @brief Parse the "client" section of a configuration document
     * @throws std::runtime_error if a present key has the wrong type
     */
    static ClientConfig parseClientConfig(const nlohmann::json& json);

    /**
     * @brief Parse the "logging" section of a configuration document
     * @throws std::runtime_error if a present key has the wrong type
     */
    static LoggingConfig parseLoggingConfig(const nlohmann::json& json);

private:
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace gree_network
