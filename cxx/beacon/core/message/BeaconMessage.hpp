/**
 * @file
 * @brief Beacon announcement and discovery request messages
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <asio/ip/address_v4.hpp>
#include <nlohmann/json.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"

namespace beacon::message {

    /**
     * Extension fields of an announcement
     *
     * Fields such as `version` or `capabilities` are opaque to the protocol. They are kept in their original order and
     * written back unchanged when the announcement is assembled again.
     */
    using Extensions = nlohmann::ordered_json;

    /** Announcement advertising the address at which a service is reachable */
    class Announcement {
    public:
        /**
         * @param service Identifier of the service type
         * @param address Address at which the service is reachable
         * @param port Port at which the service is reachable
         * @param key Shared key proving the legitimacy of the announcement
         * @param extensions JSON object with additional fields
         * @throws LogicError If the extensions are not a JSON object or reuse a protocol field name
         */
        BCN_API Announcement(std::string service,
                             asio::ip::address_v4 address,
                             networking::Port port,
                             std::string key,
                             Extensions extensions = Extensions::object());

        std::string_view getService() const { return service_; }
        asio::ip::address_v4 getAddress() const { return address_; }
        networking::Port getPort() const { return port_; }
        std::string_view getKey() const { return key_; }
        const Extensions& getExtensions() const { return extensions_; }

        /**
         * @return Version string if the announcement carries a `version` extension field of string type
         */
        BCN_API std::optional<std::string> getVersion() const;

        /**
         * Assemble the announcement to its wire representation
         *
         * @return JSON text
         */
        BCN_API std::string assemble() const;

        /**
         * Disassemble an announcement from its wire representation
         *
         * @param message View of the received bytes
         * @return Decoded announcement
         * @throws MalformedMessageError If the bytes are not a JSON announcement object
         * @throws MissingFieldError If a mandatory field is absent
         */
        BCN_API static Announcement disassemble(std::span<const std::byte> message);

        /**
         * Disassemble an announcement from its wire representation
         *
         * @param message Received message as text
         */
        BCN_API static Announcement disassemble(std::string_view message);

        BCN_API bool operator==(const Announcement& other) const;

    private:
        std::string service_;
        asio::ip::address_v4 address_;
        networking::Port port_;
        std::string key_;
        Extensions extensions_;
    };

    /** Request asking servers to reply with an announcement */
    class DiscoveryRequest {
    public:
        /**
         * @param service Optional service identifier, servers offering a different service ignore the request
         */
        BCN_API DiscoveryRequest(std::optional<std::string> service = std::nullopt);

        const std::optional<std::string>& getService() const { return service_; }

        /**
         * Check if a server offering a given service should reply to this request
         *
         * @param service Service identifier offered by the server
         * @return True if the request names no service or the given service
         */
        BCN_API bool matches(std::string_view service) const;

        /**
         * Assemble the request to its wire representation
         *
         * @return JSON text
         */
        BCN_API std::string assemble() const;

        /**
         * Disassemble a request from its wire representation
         *
         * Plain text containing `DISCOVER` or `discover` is accepted as a request without service filter.
         *
         * @param message View of the received bytes
         * @return Decoded request
         * @throws MalformedMessageError If the bytes are not a discovery request
         */
        BCN_API static DiscoveryRequest disassemble(std::span<const std::byte> message);

        /**
         * Disassemble a request from its wire representation
         *
         * @param message Received message as text
         */
        BCN_API static DiscoveryRequest disassemble(std::string_view message);

        bool operator==(const DiscoveryRequest& other) const = default;

    private:
        std::optional<std::string> service_;
    };

    /** Any message of the Beacon protocol */
    using BeaconMessage = std::variant<Announcement, DiscoveryRequest>;

    /**
     * Disassemble a message of either type, dispatching on the `type` field
     *
     * @param message View of the received bytes
     * @return Decoded announcement or request
     * @throws MessageDecodingError If the bytes are neither an announcement nor a request
     */
    BCN_API BeaconMessage disassemble_message(std::span<const std::byte> message);

    /**
     * Determine the type of a message without decoding its fields
     *
     * @param message Received message as text
     * @return Message type
     * @throws MalformedMessageError If the type cannot be determined
     */
    BCN_API protocol::BEACON::MessageType get_message_type(std::string_view message);

} // namespace beacon::message
