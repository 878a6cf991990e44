/**
 * @file
 * @brief Asio helper functions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::networking {

    /**
     * @brief Interface containing its name, address and netmask
     */
    struct Interface {
        /** Interface name */
        std::string name;

        /** Interface address */
        asio::ip::address_v4 address;

        /** Subnet mask of the interface address */
        asio::ip::address_v4 netmask;

        /** Whether the interface supports broadcasts */
        bool broadcast;
    };

    /**
     * @brief Get hostname
     */
    BCN_API std::string get_hostname();

    /**
     * @brief Get all running IPv4 interfaces
     *
     * @return List with all interfaces, in the order reported by the operating system
     * @throws NetworkError If the interfaces could not be listed
     */
    BCN_API std::vector<Interface> get_interfaces();

    /**
     * @brief Select the outward-facing interface from a list of interfaces
     *
     * Returns the first interface that is not a loopback interface, not a container bridge (names starting with `docker`
     * or `lo`) and has neither a loopback nor a multicast address. This is a first-match heuristic, hosts with multiple
     * network connections might need to configure the advertised address explicitly.
     *
     * @param interfaces List of interfaces to select from
     * @return Selected interface
     * @throws ResolutionError If no suitable interface is in the list
     */
    BCN_API Interface select_outward_interface(const std::vector<Interface>& interfaces);

    /**
     * @brief Determine the outward-facing IPv4 address of this host
     *
     * Equivalent to `select_outward_interface(get_interfaces()).address`.
     *
     * @throws ResolutionError If no suitable interface is found
     */
    BCN_API asio::ip::address_v4 resolve_local_ipv4();

    /**
     * @brief Calculate the directed broadcast address of a subnet
     *
     * @param local_ip Address of an interface in the subnet
     * @param subnet_mask Subnet mask of the interface
     * @return Broadcast address, e.g. `192.168.1.255` for `192.168.1.20/255.255.255.0`
     */
    BCN_API asio::ip::address_v4 broadcast_address_for(const asio::ip::address_v4& local_ip,
                                                       const asio::ip::address_v4& subnet_mask);

    /**
     * @brief Build a URI from an IP address and a port
     *
     * @param address IPv4 address
     * @param port Port
     * @param protocol Protocol (without `://`), can be empty
     * @return URI in the form `protocol://address:port`
     */
    BCN_API std::string to_uri(const asio::ip::address_v4& address, Port port, std::string_view protocol = "http");

} // namespace beacon::networking
