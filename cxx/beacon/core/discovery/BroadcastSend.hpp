/**
 * @file
 * @brief Beacon broadcast sender
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::discovery {

    /** Broadcast sender for outgoing announcements, sending from an ephemeral port */
    class BroadcastSend {
    public:
        /**
         * Construct broadcast sender
         *
         * @param brd_address Broadcast address for outgoing broadcasts
         * @param port Port for outgoing broadcasts
         * @throws networking::BindError If the socket could not be opened
         */
        BCN_API BroadcastSend(const asio::ip::address_v4& brd_address, networking::Port port);

        /**
         * Construct broadcast sender using a human readable IP address
         *
         * @param brd_ip String containing the broadcast IP for outgoing broadcasts (e.g. `255.255.255.255`)
         * @param port Port for outgoing broadcasts
         */
        BCN_API BroadcastSend(std::string_view brd_ip, networking::Port port);

        /**
         * Send broadcast message from string
         *
         * @param message String with broadcast message
         * @throws networking::SendError If the datagram could not be sent
         */
        BCN_API void sendBroadcast(std::string_view message);

        /**
         * Send broadcast message
         *
         * @param message View of message in bytes
         * @throws networking::SendError If the datagram could not be sent
         */
        BCN_API void sendBroadcast(std::span<const std::byte> message);

        /** Endpoint to which broadcasts are sent */
        const asio::ip::udp::endpoint& getEndpoint() const { return endpoint_; }

    private:
        asio::io_context io_context_;
        asio::ip::udp::endpoint endpoint_;
        asio::ip::udp::socket socket_;
    };

} // namespace beacon::discovery
