#pragma once

#include <boost/asio/ip/address_v4.hpp>

#include <string>
#include <vector>

namespace gree_network {

/**
 * @brief A local address and the subnet broadcast address to scan from it
 */
struct BroadcastTarget {
    std::string interfaceName;
    boost::asio::ip::address_v4 localAddress;
    boost::asio::ip::address_v4 broadcastAddress;
};

/**
 * @brief Every IPv4 interface that is up, not loopback, and broadcast capable
 * @throws TransportError if the interface list cannot be read
 */
std::vector<BroadcastTarget> listBroadcastTargets();

/**
 * @brief Targets for explicitly configured broadcast addresses, sent from any local address
 * @throws std::invalid_argument if an address is not a valid IPv4 address
 */
std::vector<BroadcastTarget> targetsFromAddresses(const std::vector<std::string>& addresses);

} // namespace gree_network
