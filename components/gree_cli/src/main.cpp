#include "gree_device/device.hpp"
#include "gree_device/props.hpp"
#include "gree_network/client.hpp"
#include "gree_network/config.hpp"
#include "gree_protocol/error.hpp"

#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

std::shared_ptr<spdlog::logger> createLogger(const gree_network::LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
    }

    auto logger = std::make_shared<spdlog::logger>("gree", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    return logger;
}

// "name=value" with a wire property name and an integer value
std::pair<gree_device::Property, int64_t> parseAssignment(const std::string& assignment) {
    auto separator = assignment.find('=');
    if (separator == std::string::npos) {
        throw std::invalid_argument("Expected name=value, got '" + assignment + "'");
    }

    auto name = assignment.substr(0, separator);
    auto property = gree_device::propertyFromName(name);
    if (!property) {
        throw std::invalid_argument("Unknown property '" + name + "'");
    }

    auto text = assignment.substr(separator + 1);
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (text.empty() || consumed != text.size()) {
        throw std::invalid_argument("Value for " + name + " must be an integer, got '" + text + "'");
    }

    return {*property, value};
}

void printProperties(const gree_protocol::PropertyMap& properties) {
    for (const auto& entry : properties) {
        std::cout << entry.first << "=" << gree_protocol::propertyValueToString(entry.second) << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger;

    try {
        po::options_description desc("Gree climate client options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("discover,d", po::bool_switch()->default_value(false), "Scan the local network for devices")
            ("host", po::value<std::string>(), "Device IP address")
            ("port,p", po::value<uint16_t>(), "Device UDP port")
            ("mac,m", po::value<std::string>(), "Device MAC; looked up by discovery when omitted")
            ("key,k", po::value<std::string>(), "Device key from an earlier bind")
            ("get,g", po::value<std::vector<std::string>>()->multitoken(), "Property names to read")
            ("set,s", po::value<std::vector<std::string>>()->multitoken(), "Properties to write as name=value")
            ("timeout,t", po::value<uint32_t>(), "Bind and request timeout in milliseconds")
            ("log-file", po::value<std::string>(), "Also write the log to this file")
            ("verbose,v", po::bool_switch()->default_value(false), "Enable debug logging");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            std::cout << "Properties:";
            for (const auto& name : gree_device::allPropertyNames()) {
                std::cout << " " << name;
            }
            std::cout << std::endl;
            return 0;
        }

        gree_network::ClientConfig clientConfig;
        gree_network::LoggingConfig loggingConfig;
        if (vm.count("config")) {
            clientConfig = gree_network::ConfigLoader::loadClientConfig(vm["config"].as<std::string>());
            loggingConfig = gree_network::ConfigLoader::loadLoggingConfig(vm["config"].as<std::string>());
        }

        if (vm.count("timeout")) {
            std::chrono::milliseconds timeout(vm["timeout"].as<uint32_t>());
            clientConfig.bindTimeout = timeout;
            clientConfig.requestTimeout = timeout;
        }
        if (vm.count("log-file")) {
            loggingConfig.file = vm["log-file"].as<std::string>();
        }
        if (vm["verbose"].as<bool>()) {
            loggingConfig.level = "debug";
        }

        logger = createLogger(loggingConfig);

        boost::asio::io_context ioContext;
        auto client = std::make_shared<gree_network::Client>(ioContext, clientConfig, logger);

        std::vector<gree_protocol::DeviceInfo> discovered;
        bool needLookup = vm.count("host") && !vm.count("mac");
        if (vm["discover"].as<bool>() || !vm.count("host") || needLookup) {
            discovered = client->discover();
            if (!vm.count("host")) {
                for (const auto& device : discovered) {
                    std::cout << device.toString() << std::endl;
                }
                if (discovered.empty()) {
                    logger->warn("No devices found");
                }
                return 0;
            }
        }

        const gree_protocol::DeviceInfo info = [&] {
            const auto host = vm["host"].as<std::string>();
            if (vm.count("mac")) {
                return gree_protocol::DeviceInfo(
                    host,
                    vm.count("port") ? vm["port"].as<uint16_t>() : clientConfig.devicePort,
                    vm["mac"].as<std::string>());
            }
            for (const auto& device : discovered) {
                if (device.ip == host) {
                    return device;
                }
            }
            throw std::invalid_argument("No device answered discovery at " + host + "; pass --mac");
        }();

        gree_device::Device::Config deviceConfig;
        deviceConfig.updatePolicy = gree_device::Device::UpdatePolicy::ON_ACKNOWLEDGE;
        gree_device::Device device(info, client, deviceConfig, logger);

        const std::string key = vm.count("key") ? vm["key"].as<std::string>() : "";
        device.bind(key);
        if (key.empty()) {
            std::cout << "key=" << device.getKey() << std::endl;
        }

        if (vm.count("set")) {
            for (const auto& assignment : vm["set"].as<std::vector<std::string>>()) {
                auto change = parseAssignment(assignment);
                device.setProperty(change.first, change.second);
            }
        }

        if (vm.count("get")) {
            printProperties(client->requestState(vm["get"].as<std::vector<std::string>>(), info, device.getKey()));
        } else if (vm.count("set")) {
            printProperties(device.getProperties());
        } else {
            device.updateState();
            printProperties(device.getProperties());
        }

        return 0;
    } catch (const gree_protocol::GreeError& e) {
        if (logger) {
            logger->error("{} ({})", e.what(), gree_protocol::errorCodeToString(e.code()));
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        if (logger) {
            logger->error("{}", e.what());
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return 1;
    }
}
