/**
 * @file
 * @brief Discovery client locating announced services
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/discovery/BroadcastRecv.hpp"
#include "beacon/core/log/Logger.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"
#include "beacon/core/utils/timers.hpp"

namespace beacon::discovery {

    /** Service found through an announcement with a valid key */
    struct DiscoveredService {
        /** Address at which the service is reachable */
        asio::ip::address_v4 address;

        /** Port at which the service is reachable */
        networking::Port port;

        /** Identifier of the service */
        std::string service;

        /** Get the URI of the service, e.g. `http://192.168.1.20:3000` */
        BCN_API std::string to_uri() const;

        bool operator==(const DiscoveredService& other) const = default;
    };

    /**
     * Discovery client
     *
     * All calls block until a valid announcement arrives or the timeout expires. Announcements with a different key,
     * undecodable datagrams and announcements of other services (if filtering for a service) are ignored.
     */
    class Client {
    public:
        /**
         * @param port Port on which announcements are broadcast and to which requests are sent
         * @param broadcast_address Address to which discovery requests are sent
         * @param service Only accept announcements for this service if set
         */
        BCN_API Client(networking::Port port = protocol::BEACON::DEFAULT_PORT,
                       asio::ip::address_v4 broadcast_address = asio::ip::address_v4::broadcast(),
                       std::optional<std::string> service = std::nullopt);

        /**
         * Wait for a broadcast announcement (passive discovery)
         *
         * @param expected_key Key the announcement has to carry
         * @param timeout Time to wait for an announcement
         * @return Discovered service
         * @throws DiscoveryTimeoutError If no valid announcement was received in time
         * @throws networking::BindError If the announcement port cannot be bound
         */
        BCN_API DiscoveredService discover(std::string_view expected_key, std::chrono::steady_clock::duration timeout);

        /**
         * Send a discovery request and wait for the reply (active discovery)
         *
         * @param expected_key Key the announcement has to carry
         * @param timeout Time to wait for a reply after sending the request
         * @return Discovered service
         * @throws DiscoveryTimeoutError If no valid announcement was received in time
         * @throws networking::BindError If no socket can be opened
         * @throws networking::SendError If the request cannot be sent
         */
        BCN_API DiscoveredService request(std::string_view expected_key, std::chrono::steady_clock::duration timeout);

        /**
         * Collect all services announced within a time window
         *
         * @param expected_key Key the announcements have to carry
         * @param timeout Duration of the time window
         * @param active Whether to send a discovery request first instead of waiting for broadcasts
         * @return Discovered services in order of arrival, each address and port only once
         */
        BCN_API std::vector<DiscoveredService>
        discoverAll(std::string_view expected_key, std::chrono::steady_clock::duration timeout, bool active = false);

    private:
        /** Open an ephemeral socket and broadcast a discovery request from it */
        std::unique_ptr<BroadcastRecv> send_request();

        std::optional<DiscoveredService> await_announcement(BroadcastRecv& receiver,
                                                            std::string_view expected_key,
                                                            const utils::TimeoutTimer& timer);

        std::optional<DiscoveredService> check_message(const BroadcastMessage& message, std::string_view expected_key);

    private:
        log::Logger logger_;
        networking::Port port_;
        asio::ip::address_v4 broadcast_address_;
        std::optional<std::string> service_;
    };

} // namespace beacon::discovery
