/**
 * @file
 * @brief Implementation of Asio helper functions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "asio_helpers.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <asio/ip/address_v4.hpp>

#include <ifaddrs.h>
#include <net/if.h> // NOLINT(misc-include-cleaner) bug used for IFF_RUNNING etc
#include <netinet/in.h>
#include <sys/socket.h>

#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::networking;
using namespace beacon::utils;

namespace {
    asio::ip::address_v4 to_address_v4(const struct sockaddr* sockaddr) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto* sockaddr_ipv4 = reinterpret_cast<const struct sockaddr_in*>(sockaddr);
        return asio::ip::address_v4(ntohl(sockaddr_ipv4->sin_addr.s_addr));
    }
} // namespace

std::string beacon::networking::get_hostname() {
    return asio::ip::host_name();
}

std::vector<Interface> beacon::networking::get_interfaces() {
    std::vector<Interface> interfaces {};

    // Obtain linked list of all local network interfaces
    struct ifaddrs* addrs = nullptr;
    if(getifaddrs(&addrs) != 0) {
        throw NetworkError("Unable to get list of interfaces");
    }

    for(struct ifaddrs* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {

        // Select only running interfaces and those providing IPV4
        if(ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr || (ifa->ifa_flags & IFF_RUNNING) == 0U ||
           ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        const auto netmask =
            ifa->ifa_netmask != nullptr ? to_address_v4(ifa->ifa_netmask) : asio::ip::address_v4::broadcast();

        interfaces.emplace_back(
            ifa->ifa_name, to_address_v4(ifa->ifa_addr), netmask, (ifa->ifa_flags & IFF_BROADCAST) != 0U);
    }

    freeifaddrs(addrs);

    return interfaces;
}

Interface beacon::networking::select_outward_interface(const std::vector<Interface>& interfaces) {
    const auto interface_it = std::ranges::find_if(interfaces, [](const auto& interface) {
        return !interface.name.starts_with("lo") && !interface.name.starts_with("docker") &&
               !interface.address.is_loopback() && !interface.address.is_multicast() &&
               !interface.address.is_unspecified();
    });
    if(interface_it == interfaces.end()) {
        throw ResolutionError("no running non-loopback IPv4 interface found among " +
                              quote(range_to_string(interfaces, [](const auto& interface) { return interface.name; })));
    }
    return *interface_it;
}

asio::ip::address_v4 beacon::networking::resolve_local_ipv4() {
    return select_outward_interface(get_interfaces()).address;
}

asio::ip::address_v4 beacon::networking::broadcast_address_for(const asio::ip::address_v4& local_ip,
                                                               const asio::ip::address_v4& subnet_mask) {
    return asio::ip::address_v4(local_ip.to_uint() | ~subnet_mask.to_uint());
}

std::string beacon::networking::to_uri(const asio::ip::address_v4& address, Port port, std::string_view protocol) {
    std::string uri {};
    if(!protocol.empty()) {
        uri += protocol;
        uri += "://";
    }
    uri += address.to_string();
    uri += ":";
    uri += to_string(port);
    return uri;
}
