/**
 * @file
 * @brief Configuration of an announcement session
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/config/AnnouncementMode.hpp"
#include "beacon/core/log/Logger.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"

namespace beacon::config {

    /**
     * @brief Configuration of an announcement session
     *
     * Holds everything a scheduler needs to announce a service. The configuration is validated on construction and
     * cannot be modified afterwards.
     */
    class SessionConfig {
    public:
        /**
         * @brief Construct a session configuration
         *
         * @param service_name Identifier of the announced service
         * @param shared_key Key put into each announcement
         * @param advertised_port Port at which the announced service is reachable
         * @param mode Announcement mode
         * @param port Port to which announcements are broadcast and on which requests are received
         * @param advertised_address Address put into announcements instead of the resolved local address
         * @param broadcast_address Address to which announcements are broadcast
         * @param respond_to_requests Whether broadcasting modes also reply to discovery requests
         * @throws InvalidValueError If a value is out of range
         */
        BCN_API SessionConfig(std::string service_name,
                              std::string shared_key,
                              networking::Port advertised_port,
                              AnnouncementMode mode = Periodic(),
                              networking::Port port = protocol::BEACON::DEFAULT_PORT,
                              std::optional<asio::ip::address_v4> advertised_address = std::nullopt,
                              asio::ip::address_v4 broadcast_address = asio::ip::address_v4::broadcast(),
                              bool respond_to_requests = false);

        /**
         * @brief Read a session configuration from the `[beacon]` table of a TOML document
         *
         * @param toml TOML document
         * @return Session configuration
         * @throws ConfigFileParseError If the document is not valid TOML
         * @throws MissingKeyError If the table or a mandatory key is missing
         * @throws InvalidTypeError If a value has the wrong type
         * @throws InvalidValueError If a value is out of range
         */
        BCN_API static SessionConfig fromToml(std::string_view toml);

        /**
         * @brief Read a session configuration from a TOML file
         *
         * @param file_path Path to the TOML file
         * @return Session configuration
         * @throws ConfigFileNotFoundError If the file cannot be read
         */
        BCN_API static SessionConfig fromFile(const std::filesystem::path& file_path);

        std::string_view getServiceName() const { return service_name_; }
        std::string_view getSharedKey() const { return shared_key_; }
        networking::Port getAdvertisedPort() const { return advertised_port_; }
        const AnnouncementMode& getMode() const { return mode_; }
        networking::Port getPort() const { return port_; }
        const std::optional<asio::ip::address_v4>& getAdvertisedAddress() const { return advertised_address_; }
        const asio::ip::address_v4& getBroadcastAddress() const { return broadcast_address_; }

        /**
         * @brief Check whether the scheduler should listen for discovery requests
         *
         * Always true for `OnRequest` mode, otherwise the value of `respond_to_requests`.
         */
        BCN_API bool isListening() const;

    private:
        static log::Logger& get_logger();

    private:
        std::string service_name_;
        std::string shared_key_;
        networking::Port advertised_port_;
        AnnouncementMode mode_;
        networking::Port port_;
        std::optional<asio::ip::address_v4> advertised_address_;
        asio::ip::address_v4 broadcast_address_;
        bool respond_to_requests_;
    };

} // namespace beacon::config
