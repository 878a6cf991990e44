/**
 * @file
 * @brief Implementation of the Beacon messages
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BeaconMessage.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <asio/error.hpp>
#include <asio/ip/address_v4.hpp>
#include <nlohmann/json.hpp>

#include "beacon/core/message/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::message;
using namespace beacon::networking;
using namespace beacon::protocol::BEACON;
using namespace beacon::utils;

namespace {
    /** Fields written by the protocol itself, extensions cannot use these keys */
    constexpr std::array<std::string_view, 5> PROTOCOL_FIELDS {TYPE_FIELD, "service", "ip", "port", "key"};

    std::string_view to_string_view(std::span<const std::byte> message) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return {reinterpret_cast<const char*>(message.data()), message.size()};
    }

    std::string type_name(MessageType type) {
        return transform(enum_name(type), ::tolower);
    }

    bool is_legacy_request(std::string_view message) {
        return message.find(LEGACY_REQUEST_MARKER) != std::string_view::npos ||
               message.find(transform(LEGACY_REQUEST_MARKER, ::tolower)) != std::string_view::npos;
    }

    /** Parse JSON without exceptions, returns a discarded value if the text is not valid JSON */
    Extensions parse_json(std::string_view message) {
        bool too_deep = false;
        auto json = Extensions::parse(
            message.begin(),
            message.end(),
            [&](int depth, Extensions::parse_event_t /*event*/, Extensions& /*parsed*/) {
                if(static_cast<std::size_t>(depth) > MAX_NESTING_DEPTH) {
                    too_deep = true;
                }
                return true;
            },
            false);
        if(too_deep) {
            throw MalformedMessageError("nesting deeper than " + to_string(MAX_NESTING_DEPTH) + " levels");
        }
        return json;
    }

    /** Read the type field if present */
    std::optional<MessageType> read_type(const Extensions& json) {
        const auto type_it = json.find(std::string(TYPE_FIELD));
        if(type_it == json.end()) {
            return std::nullopt;
        }
        if(!type_it->is_string()) {
            throw MalformedMessageError("field \"type\" is not a string");
        }
        const auto type_str = type_it->get<std::string>();
        const auto type = enum_cast<MessageType>(type_str);
        if(!type.has_value()) {
            throw MalformedMessageError("unknown message type " + quote(type_str));
        }
        return type.value();
    }

    MessageType determine_type(const Extensions& json) {
        const auto type = read_type(json);
        if(type.has_value()) {
            return type.value();
        }
        // Announcements of earlier servers carry no type but the announcement fields
        if(json.contains("service") || json.contains("ip") || json.contains("key")) {
            return ANNOUNCE;
        }
        throw MalformedMessageError("message has no \"type\" field");
    }

    std::string take_string(Extensions& json, const std::string& field) {
        const auto field_it = json.find(field);
        if(field_it == json.end()) {
            throw MissingFieldError(field);
        }
        if(!field_it->is_string()) {
            throw MalformedMessageError("field " + quote(field) + " is not a string");
        }
        auto value = field_it->get<std::string>();
        json.erase(field_it);
        return value;
    }

    Announcement announcement_from_json(Extensions json) {
        if(determine_type(json) != ANNOUNCE) {
            throw MalformedMessageError("message is not an announcement");
        }
        json.erase(std::string(TYPE_FIELD));

        // Check presence of all mandatory fields first
        for(const auto* field : {"service", "ip", "port", "key"}) {
            if(!json.contains(field)) {
                throw MissingFieldError(field);
            }
        }

        auto service = take_string(json, "service");

        const auto ip = take_string(json, "ip");
        asio::error_code ec {};
        const auto address = asio::ip::make_address_v4(ip, ec);
        if(ec) {
            throw MalformedMessageError("field \"ip\" is not an IPv4 address: " + quote(ip));
        }

        const auto port_it = json.find("port");
        if(!port_it->is_number_unsigned() || port_it->get<std::uint64_t>() > UINT16_MAX) {
            throw MalformedMessageError("field \"port\" is not a valid port number");
        }
        const auto port = static_cast<Port>(port_it->get<std::uint64_t>());
        json.erase(port_it);

        auto key = take_string(json, "key");

        return {std::move(service), address, port, std::move(key), std::move(json)};
    }

    DiscoveryRequest request_from_json(const Extensions& json) {
        if(read_type(json) != DISCOVER) {
            throw MalformedMessageError("message is not a discovery request");
        }
        const auto service_it = json.find("service");
        if(service_it == json.end()) {
            return {};
        }
        if(!service_it->is_string()) {
            throw MalformedMessageError("field \"service\" is not a string");
        }
        return {service_it->get<std::string>()};
    }
} // namespace

Announcement::Announcement(
    std::string service, asio::ip::address_v4 address, Port port, std::string key, Extensions extensions)
    : service_(std::move(service)), address_(address), port_(port), key_(std::move(key)),
      extensions_(std::move(extensions)) {
    if(!extensions_.is_object()) {
        throw LogicError("Announcement extensions have to be a JSON object");
    }
    for(const auto field : PROTOCOL_FIELDS) {
        if(extensions_.contains(std::string(field))) {
            throw LogicError("Announcement extensions cannot contain the protocol field " + quote(field));
        }
    }
}

std::optional<std::string> Announcement::getVersion() const {
    const auto version_it = extensions_.find("version");
    if(version_it != extensions_.end() && version_it->is_string()) {
        return version_it->get<std::string>();
    }
    return std::nullopt;
}

std::string Announcement::assemble() const {
    auto json = Extensions::object();
    json[std::string(TYPE_FIELD)] = type_name(ANNOUNCE);
    json["service"] = service_;
    json["ip"] = address_.to_string();
    json["port"] = port_;
    json["key"] = key_;
    for(const auto& item : extensions_.items()) {
        json[item.key()] = item.value();
    }
    return json.dump(-1, ' ', false, Extensions::error_handler_t::replace);
}

Announcement Announcement::disassemble(std::span<const std::byte> message) {
    return disassemble(to_string_view(message));
}

Announcement Announcement::disassemble(std::string_view message) {
    auto json = parse_json(message);
    if(json.is_discarded()) {
        throw MalformedMessageError("message is not valid JSON");
    }
    if(!json.is_object()) {
        throw MalformedMessageError("message is not a JSON object");
    }
    return announcement_from_json(std::move(json));
}

bool Announcement::operator==(const Announcement& other) const {
    return service_ == other.service_ && address_ == other.address_ && port_ == other.port_ && key_ == other.key_ &&
           extensions_ == other.extensions_;
}

DiscoveryRequest::DiscoveryRequest(std::optional<std::string> service) : service_(std::move(service)) {}

bool DiscoveryRequest::matches(std::string_view service) const {
    return !service_.has_value() || service_.value() == service;
}

std::string DiscoveryRequest::assemble() const {
    auto json = Extensions::object();
    json[std::string(TYPE_FIELD)] = type_name(DISCOVER);
    if(service_.has_value()) {
        json["service"] = service_.value();
    }
    return json.dump(-1, ' ', false, Extensions::error_handler_t::replace);
}

DiscoveryRequest DiscoveryRequest::disassemble(std::span<const std::byte> message) {
    return disassemble(to_string_view(message));
}

DiscoveryRequest DiscoveryRequest::disassemble(std::string_view message) {
    const auto json = parse_json(message);
    if(json.is_discarded() || !json.is_object()) {
        if(is_legacy_request(message)) {
            return {};
        }
        throw MalformedMessageError("message is not a discovery request");
    }
    return request_from_json(json);
}

BeaconMessage beacon::message::disassemble_message(std::span<const std::byte> message) {
    const auto message_sv = to_string_view(message);
    auto json = parse_json(message_sv);
    if(json.is_discarded() || !json.is_object()) {
        if(is_legacy_request(message_sv)) {
            return DiscoveryRequest();
        }
        throw MalformedMessageError(json.is_discarded() ? "message is not valid JSON" : "message is not a JSON object");
    }
    if(determine_type(json) == DISCOVER) {
        return request_from_json(json);
    }
    return announcement_from_json(std::move(json));
}

MessageType beacon::message::get_message_type(std::string_view message) {
    const auto json = parse_json(message);
    if(json.is_discarded() || !json.is_object()) {
        if(is_legacy_request(message)) {
            return DISCOVER;
        }
        throw MalformedMessageError("message type cannot be determined");
    }
    return determine_type(json);
}
