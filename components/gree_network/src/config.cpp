/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "gree_network/config.hpp"

#include <fstream>
#include <stdexcept>

namespace gree_network {

ClientConfig ConfigLoader::loadClientConfig(const std::string& filepath) {
    return parseClientConfig(loadJsonFromFile(filepath));
}

LoggingConfig ConfigLoader::loadLoggingConfig(const std::string& filepath) {
    return parseLoggingConfig(loadJsonFromFile(filepath));
}

ClientConfig ConfigLoader::parseClientConfig(const nlohmann::json& json) {
    ClientConfig config;

    if (!json.contains("client")) {
        return config;
    }

    try {
        const auto& clientJson = json["client"];

        if (clientJson.contains("devicePort")) {
            config.devicePort = clientJson["devicePort"].get<uint16_t>();
        }

        if (clientJson.contains("clientId")) {
            config.clientId = clientJson["clientId"].get<std::string>();
        }

        if (clientJson.contains("genericKey")) {
            config.genericKey = clientJson["genericKey"].get<std::string>();
        }

        if (clientJson.contains("bindTimeoutMs")) {
            config.bindTimeout = std::chrono::milliseconds(clientJson["bindTimeoutMs"].get<int64_t>());
        }

        if (clientJson.contains("requestTimeoutMs")) {
            config.requestTimeout = std::chrono::milliseconds(clientJson["requestTimeoutMs"].get<int64_t>());
        }

        if (clientJson.contains("discoveryWindowMs")) {
            config.discoveryWindow = std::chrono::milliseconds(clientJson["discoveryWindowMs"].get<int64_t>());
        }

        if (clientJson.contains("maxDatagramSize")) {
            config.maxDatagramSize = clientJson["maxDatagramSize"].get<size_t>();
            if (config.maxDatagramSize == 0) {
                throw std::runtime_error("Invalid client configuration: maxDatagramSize must be positive");
            }
        }

        if (clientJson.contains("broadcastAddresses")) {
            config.broadcastAddresses = clientJson["broadcastAddresses"].get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid client configuration: " + std::string(e.what()));
    }

    return config;
}

LoggingConfig ConfigLoader::parseLoggingConfig(const nlohmann::json& json) {
    LoggingConfig config;

    if (!json.contains("logging")) {
        return config;
    }

    try {
        const auto& loggingJson = json["logging"];

        if (loggingJson.contains("level")) {
            config.level = loggingJson["level"].get<std::string>();
        }

        if (loggingJson.contains("file")) {
            config.file = loggingJson["file"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid logging configuration: " + std::string(e.what()));
    }

    return config;
}

nlohmann::json ConfigLoader::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse configuration file: " + std::string(e.what()));
    }
}

} // namespace gree_network
