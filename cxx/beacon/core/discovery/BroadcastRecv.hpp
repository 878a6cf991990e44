/**
 * @file
 * @brief Beacon broadcast receiver
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::discovery {

    /** Incoming datagram */
    struct BroadcastMessage {
        /** Content of the message in bytes */
        std::vector<std::byte> content;

        /** Endpoint from which the message was received */
        asio::ip::udp::endpoint sender;

        /** Convert the content of the message to a string */
        BCN_API std::string to_string() const;
    };

    /**
     * Receiver for incoming broadcasts and unicast datagrams
     *
     * The socket has broadcasts enabled and can also send replies, such that the same socket can be used to answer
     * requests or to broadcast a request and wait for the replies.
     */
    class BroadcastRecv {
    public:
        /**
         * Construct broadcast receiver
         *
         * @param any_address Address for incoming broadcasts (e.g. `asio::ip::address_v4::any()`)
         * @param port Port for incoming broadcasts, zero to bind an ephemeral port
         * @throws networking::BindError If the socket could not be opened or bound
         */
        BCN_API BroadcastRecv(const asio::ip::address_v4& any_address, networking::Port port);

        /**
         * Construct broadcast receiver using human readable IP address
         *
         * @param any_ip String containing the IP for incoming broadcasts (e.g. `0.0.0.0`)
         * @param port Port for incoming broadcasts, zero to bind an ephemeral port
         */
        BCN_API BroadcastRecv(std::string_view any_ip, networking::Port port);

        /**
         * Get the port to which the socket is bound
         */
        BCN_API networking::Port getPort() const;

        /**
         * Receive message (asynchronously)
         *
         * Messages longer than `protocol::BEACON::MESSAGE_BUFFER` are truncated.
         *
         * @param timeout Duration for which to block function call
         * @return Message if received
         * @throws networking::NetworkError If receiving failed
         */
        BCN_API std::optional<BroadcastMessage> asyncRecvBroadcast(std::chrono::steady_clock::duration timeout);

        /**
         * Send a message from the bound socket
         *
         * @param message String with message
         * @param endpoint Target endpoint, can be a broadcast address
         * @throws networking::SendError If the datagram could not be sent
         */
        BCN_API void sendTo(std::string_view message, const asio::ip::udp::endpoint& endpoint);

    private:
        asio::io_context io_context_;
        asio::ip::udp::endpoint endpoint_;
        asio::ip::udp::socket socket_;
    };

} // namespace beacon::discovery
