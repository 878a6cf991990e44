/**
 * @file
 * @brief Implementation of the Beacon broadcast sender
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BroadcastSend.hpp"

#include <cstddef>
#include <span>
#include <string_view>

#include <asio.hpp>

#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"

using namespace beacon::discovery;
using namespace beacon::networking;

BroadcastSend::BroadcastSend(const asio::ip::address_v4& brd_address, Port port)
    : endpoint_(brd_address, port), socket_(io_context_) {
    try {
        socket_.open(endpoint_.protocol());

        // Set reusable address and broadcast socket options
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.set_option(asio::socket_base::broadcast(true));

        // Send from an ephemeral port on all interfaces
        socket_.bind({asio::ip::address_v4::any(), 0});
    } catch(const asio::system_error& error) {
        throw BindError("0.0.0.0", 0, error.code().message());
    }
}

BroadcastSend::BroadcastSend(std::string_view brd_ip, Port port)
    : BroadcastSend(asio::ip::make_address_v4(brd_ip), port) {}

void BroadcastSend::sendBroadcast(std::string_view message) {
    sendBroadcast(std::as_bytes(std::span(message.data(), message.size())));
}

void BroadcastSend::sendBroadcast(std::span<const std::byte> message) {
    asio::error_code ec {};
    socket_.send_to(asio::const_buffer(message.data(), message.size_bytes()), endpoint_, 0, ec);
    if(ec) {
        throw SendError(to_uri(endpoint_.address().to_v4(), endpoint_.port(), ""), ec.message());
    }
}
