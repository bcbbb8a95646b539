#include "gree_network/interfaces.hpp"
#include "gree_protocol/error.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace gree_network {

namespace {

boost::asio::ip::address_v4 toAddress(const sockaddr* address) {
    const auto* inet = reinterpret_cast<const sockaddr_in*>(address);
    return boost::asio::ip::address_v4(ntohl(inet->sin_addr.s_addr));
}

} // namespace

std::vector<BroadcastTarget> listBroadcastTargets() {
    ifaddrs* rawList = nullptr;
    if (getifaddrs(&rawList) != 0) {
        throw gree_protocol::TransportError(std::string("failed to list network interfaces: ") + std::strerror(errno));
    }
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> list(rawList, &freeifaddrs);

    std::vector<BroadcastTarget> targets;
    for (const ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next) {
        if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        const unsigned int flags = entry->ifa_flags;
        if (!(flags & IFF_UP) || (flags & IFF_LOOPBACK) || !(flags & IFF_BROADCAST)) {
            continue;
        }
        if (entry->ifa_broadaddr == nullptr) {
            continue;
        }

        BroadcastTarget target;
        target.interfaceName = entry->ifa_name;
        target.localAddress = toAddress(entry->ifa_addr);
        target.broadcastAddress = toAddress(entry->ifa_broadaddr);
        targets.push_back(target);
    }
    return targets;
}

std::vector<BroadcastTarget> targetsFromAddresses(const std::vector<std::string>& addresses) {
    std::vector<BroadcastTarget> targets;
    targets.reserve(addresses.size());

    for (const auto& address : addresses) {
        boost::system::error_code ec;
        auto broadcast = boost::asio::ip::make_address_v4(address, ec);
        if (ec) {
            throw std::invalid_argument("Invalid broadcast address: " + address);
        }

        BroadcastTarget target;
        target.interfaceName = "configured";
        target.localAddress = boost::asio::ip::address_v4::any();
        target.broadcastAddress = broadcast;
        targets.push_back(target);
    }
    return targets;
}

} // namespace gree_network
