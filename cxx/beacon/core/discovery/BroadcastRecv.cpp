/**
 * @file
 * @brief Implementation of the Beacon broadcast receiver
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BroadcastRecv.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <asio.hpp>

#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"

using namespace beacon::discovery;
using namespace beacon::networking;
using namespace beacon::protocol::BEACON;

std::string BroadcastMessage::to_string() const {
    std::string ret;
    ret.resize(content.size());
    for(std::size_t n = 0; n < content.size(); ++n) {
        ret.at(n) = static_cast<char>(content[n]);
    }
    return ret;
}

BroadcastRecv::BroadcastRecv(const asio::ip::address_v4& any_address, Port port)
    : endpoint_(any_address, port), socket_(io_context_) {
    try {
        socket_.open(endpoint_.protocol());

        // Set reusable address and broadcast socket options
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.set_option(asio::socket_base::broadcast(true));

        // Bind socket on receiving side
        socket_.bind(endpoint_);
    } catch(const asio::system_error& error) {
        throw BindError(any_address.to_string(), port, error.code().message());
    }
}

BroadcastRecv::BroadcastRecv(std::string_view any_ip, Port port)
    : BroadcastRecv(asio::ip::make_address_v4(any_ip), port) {}

Port BroadcastRecv::getPort() const {
    return socket_.local_endpoint().port();
}

std::optional<BroadcastMessage> BroadcastRecv::asyncRecvBroadcast(std::chrono::steady_clock::duration timeout) {
    BroadcastMessage message {};
    message.content.resize(MESSAGE_BUFFER);

    // Receive as future
    auto length_future = socket_.async_receive_from(asio::buffer(message.content), message.sender, asio::use_future);

    // Run IO context for timeout
    io_context_.restart();
    io_context_.run_for(timeout);

    // If IO context not stopped, then no message received
    if(!io_context_.stopped()) {
        // Cancel async operations
        socket_.cancel();
        return std::nullopt;
    }

    try {
        message.content.resize(length_future.get());
    } catch(const asio::system_error& error) {
        // ICMP errors from earlier sends are reported on the next receive, they do not affect this socket
        if(error.code() == asio::error::connection_refused) {
            return std::nullopt;
        }
        throw NetworkError(error.what());
    }
    return message;
}

void BroadcastRecv::sendTo(std::string_view message, const asio::ip::udp::endpoint& endpoint) {
    asio::error_code ec {};
    socket_.send_to(asio::buffer(message), endpoint, 0, ec);
    if(ec) {
        throw SendError(to_uri(endpoint.address().to_v4(), endpoint.port(), ""), ec.message());
    }
}
