/**
 * @file
 * @brief Implementation of the discovery client
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Client.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "beacon/core/discovery/BroadcastRecv.hpp"
#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/discovery/KeyValidator.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/message/BeaconMessage.hpp"
#include "beacon/core/message/exceptions.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/timers.hpp"

using namespace beacon::discovery;
using namespace beacon::message;
using namespace beacon::networking;
using namespace beacon::utils;

std::string DiscoveredService::to_uri() const {
    return networking::to_uri(address, port);
}

Client::Client(Port port, asio::ip::address_v4 broadcast_address, std::optional<std::string> service)
    : logger_("CLIENT"), port_(port), broadcast_address_(broadcast_address), service_(std::move(service)) {}

DiscoveredService Client::discover(std::string_view expected_key, std::chrono::steady_clock::duration timeout) {
    BroadcastRecv receiver {asio::ip::address_v4::any(), port_};
    LOG(logger_, DEBUG) << "Listening for announcements on port " << port_ << " for " << to_string(timeout);

    const TimeoutTimer timer {timeout};
    auto service = await_announcement(receiver, expected_key, timer);
    if(!service.has_value()) {
        throw DiscoveryTimeoutError(timeout);
    }
    return std::move(service.value());
}

DiscoveredService Client::request(std::string_view expected_key, std::chrono::steady_clock::duration timeout) {
    const auto receiver = send_request();

    const TimeoutTimer timer {timeout};
    auto service = await_announcement(*receiver, expected_key, timer);
    if(!service.has_value()) {
        throw DiscoveryTimeoutError(timeout);
    }
    return std::move(service.value());
}

std::vector<DiscoveredService>
Client::discoverAll(std::string_view expected_key, std::chrono::steady_clock::duration timeout, bool active) {
    const auto receiver = active ? send_request() : std::make_unique<BroadcastRecv>(asio::ip::address_v4::any(), port_);

    std::vector<DiscoveredService> services {};
    const TimeoutTimer timer {timeout};
    while(true) {
        auto service = await_announcement(*receiver, expected_key, timer);
        if(!service.has_value()) {
            break;
        }
        const auto known = std::ranges::any_of(services, [&](const auto& known_service) {
            return known_service.address == service->address && known_service.port == service->port;
        });
        if(!known) {
            LOG(logger_, INFO) << "Discovered service " << quote(service->service) << " at " << service->to_uri();
            services.emplace_back(std::move(service.value()));
        }
    }

    LOG(logger_, DEBUG) << "Discovered " << services.size() << " services within " << to_string(timeout);
    return services;
}

std::unique_ptr<BroadcastRecv> Client::send_request() {
    // Bind ephemeral port, replies are sent to the source of the request
    auto receiver = std::make_unique<BroadcastRecv>(asio::ip::address_v4::any(), 0);
    const auto request = DiscoveryRequest(service_).assemble();
    receiver->sendTo(request, {broadcast_address_, port_});
    LOG(logger_, DEBUG) << "Sent discovery request to " << networking::to_uri(broadcast_address_, port_, "")
                        << " from port " << receiver->getPort();
    return receiver;
}

std::optional<DiscoveredService> Client::await_announcement(BroadcastRecv& receiver,
                                                            std::string_view expected_key,
                                                            const TimeoutTimer& timer) {
    while(!timer.timeoutReached()) {
        const auto message = receiver.asyncRecvBroadcast(timer.remaining());
        if(!message.has_value()) {
            continue;
        }
        auto service = check_message(message.value(), expected_key);
        if(service.has_value()) {
            return service;
        }
    }
    return std::nullopt;
}

std::optional<DiscoveredService> Client::check_message(const BroadcastMessage& message, std::string_view expected_key) {
    const auto sender = networking::to_uri(message.sender.address().to_v4(), message.sender.port(), "");
    try {
        const auto beacon_message = disassemble_message(message.content);
        const auto* announcement = std::get_if<Announcement>(&beacon_message);
        if(announcement == nullptr) {
            LOG(logger_, TRACE) << "Ignoring discovery request from " << sender;
            return std::nullopt;
        }
        if(!validate_key(announcement->getKey(), expected_key)) {
            LOG(logger_, TRACE) << "Ignoring announcement with mismatching key from " << sender;
            return std::nullopt;
        }
        if(service_.has_value() && announcement->getService() != service_.value()) {
            LOG(logger_, TRACE) << "Ignoring announcement for service " << quote(announcement->getService()) << " from "
                                << sender;
            return std::nullopt;
        }

        LOG(logger_, DEBUG) << "Received valid announcement from " << sender;
        return DiscoveredService {
            announcement->getAddress(), announcement->getPort(), std::string(announcement->getService())};
    } catch(const MessageDecodingError& error) {
        LOG(logger_, DEBUG) << "Discarding message from " << sender << ": " << error.what();
        return std::nullopt;
    }
}
