/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <cstddef>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "beacon/core/message/BeaconMessage.hpp"
#include "beacon/core/message/exceptions.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"
#include "beacon/core/utils/exceptions.hpp"

using namespace Catch::Matchers;
using namespace beacon::message;
using namespace beacon::protocol::BEACON;
using namespace std::string_literals;

namespace {
    std::vector<std::byte> to_bytes(const std::string& string) {
        const auto bytes = std::as_bytes(std::span(string));
        return {bytes.begin(), bytes.end()};
    }
} // namespace

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Assemble announcement", "[message]") {
    const Announcement announcement {"rustlm", asio::ip::make_address_v4("192.168.1.20"), 3000, "SECRETKEY123"};

    REQUIRE_THAT(announcement.assemble(),
                 Equals(R"({"type":"announce","service":"rustlm","ip":"192.168.1.20","port":3000,"key":"SECRETKEY123"})"));
}

TEST_CASE("Disassemble announcement", "[message]") {
    const auto announcement = Announcement::disassemble(
        R"({"type":"announce","service":"rustlm","ip":"192.168.1.20","port":3000,"key":"SECRETKEY123"})");

    REQUIRE(announcement.getService() == "rustlm");
    REQUIRE(announcement.getAddress() == asio::ip::make_address_v4("192.168.1.20"));
    REQUIRE(announcement.getPort() == 3000);
    REQUIRE(announcement.getKey() == "SECRETKEY123");
    REQUIRE(announcement.getExtensions().empty());
    REQUIRE_FALSE(announcement.getVersion().has_value());
}

TEST_CASE("Disassemble announcement without type field", "[message]") {
    const auto announcement =
        Announcement::disassemble(R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":"SECRETKEY123"})");

    REQUIRE(announcement.getAddress() == asio::ip::make_address_v4("10.0.0.5"));
    REQUIRE(announcement.getPort() == 3000);
    REQUIRE(get_message_type(R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":"SECRETKEY123"})") == ANNOUNCE);
}

TEST_CASE("Disassemble announcement from bytes", "[message]") {
    const Announcement announcement {"rustlm", asio::ip::make_address_v4("10.0.0.5"), 3000, "SECRETKEY123"};
    const auto bytes = to_bytes(announcement.assemble());

    REQUIRE(Announcement::disassemble(bytes) == announcement);
}

TEST_CASE("Preserve extension fields", "[message]") {
    const auto announcement = Announcement::disassemble(
        R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":"k","version":"1.2.0","capabilities":["text","shell"]})");

    REQUIRE(announcement.getVersion() == "1.2.0");
    REQUIRE(announcement.getExtensions().size() == 2);
    REQUIRE(announcement.getExtensions().at("capabilities") == Extensions::array({"text", "shell"}));

    // Extensions are re-emitted after the protocol fields in their original order
    REQUIRE_THAT(announcement.assemble(),
                 EndsWith(R"("key":"k","version":"1.2.0","capabilities":["text","shell"]})"));
    REQUIRE(Announcement::disassemble(announcement.assemble()) == announcement);
}

TEST_CASE("Extensions cannot reuse protocol fields", "[message]") {
    const auto field = GENERATE(as<std::string> {}, "type", "service", "ip", "port", "key");
    const Extensions extensions {{field, 1}, {"version", "2.0"}};

    REQUIRE_THROWS_MATCHES(
        Announcement("rustlm", asio::ip::make_address_v4("10.0.0.5"), 3000, "k", extensions),
        beacon::utils::LogicError,
        Message("Announcement extensions cannot contain the protocol field \"" + field + "\""));
}

TEST_CASE("Announcement survives assemble and disassemble", "[message]") {
    const auto extensions = GENERATE(Extensions::object(),
                                     Extensions {{"version", "2.0"}},
                                     Extensions {{"capabilities", Extensions::array({"text", "shell"})}, {"version", "1.0.0"}},
                                     Extensions {{"host", {{"name", "node-3"}, {"cores", 16}}}},
                                     Extensions {{"weight", 0.25}, {"priority", -3}, {"count", 12}},
                                     Extensions {{"tls", true}, {"note", nullptr}},
                                     Extensions {{"label", "caf\u00e9 \"quoted\""}});
    const Announcement announcement {"rustlm", asio::ip::make_address_v4("172.16.4.2"), 65535, "SECRETKEY123", extensions};

    const auto decoded = Announcement::disassemble(announcement.assemble());
    REQUIRE(decoded == announcement);
    REQUIRE(decoded.getExtensions() == extensions);
}

TEST_CASE("Extensions have to be an object", "[message]") {
    REQUIRE_THROWS_AS(Announcement("rustlm", asio::ip::make_address_v4("10.0.0.5"), 3000, "k", Extensions::array()),
                      beacon::utils::LogicError);
}

TEST_CASE("Announcement missing a field", "[message]") {
    for(const auto* field : {"service", "ip", "port", "key"}) {
        auto json = nlohmann::ordered_json::parse(R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":"k"})");
        json.erase(field);

        REQUIRE_THROWS_MATCHES(Announcement::disassemble(json.dump()),
                               MissingFieldError,
                               Message("Message is missing mandatory field \""s + field + "\""));
    }
}

TEST_CASE("Announcement with invalid field values", "[message]") {
    const auto invalid = GENERATE(as<std::string> {},
                                  R"({"service":1,"ip":"10.0.0.5","port":3000,"key":"k"})",
                                  R"({"service":"rustlm","ip":"999.0.0.5","port":3000,"key":"k"})",
                                  R"({"service":"rustlm","ip":"::1","port":3000,"key":"k"})",
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":70000,"key":"k"})",
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":-1,"key":"k"})",
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":30.5,"key":"k"})",
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":"3000","key":"k"})",
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":null})",
                                  R"({"type":"discover","service":"rustlm","ip":"10.0.0.5","port":3000,"key":"k"})");

    REQUIRE_THROWS_AS(Announcement::disassemble(invalid), MalformedMessageError);
}

TEST_CASE("Reject undecodable input", "[message]") {
    const auto invalid = GENERATE(""s,
                                  "   "s,
                                  "hello"s,
                                  "[1,2,3]"s,
                                  "\"announce\""s,
                                  R"({"service":"rustlm","ip":"10.0.)"s,
                                  R"({"type":42})"s,
                                  R"({"type":"hello"})"s,
                                  "\xff\xfe\x00\x01"s,
                                  std::string(4096, '{'),
                                  R"({"service":"rustlm","ip":"10.0.0.5","port":3000,"key":"k","x":[[[[[[[[[[1]]]]]]]]]]})"s);

    REQUIRE_THROWS_AS(Announcement::disassemble(invalid), MessageDecodingError);
    REQUIRE_THROWS_AS(disassemble_message(std::as_bytes(std::span(invalid))), MessageDecodingError);
}

TEST_CASE("Truncated datagram is rejected", "[message]") {
    const Announcement announcement {
        "rustlm", asio::ip::make_address_v4("10.0.0.5"), 3000, "k", {{"padding", std::string(2 * MESSAGE_BUFFER, 'x')}}};
    auto assembled = announcement.assemble();
    assembled.resize(MESSAGE_BUFFER);

    REQUIRE_THROWS_AS(Announcement::disassemble(assembled), MalformedMessageError);
}

TEST_CASE("Assemble discovery request", "[message]") {
    REQUIRE_THAT(DiscoveryRequest().assemble(), Equals(R"({"type":"discover"})"));
    REQUIRE_THAT(DiscoveryRequest("rustlm").assemble(), Equals(R"({"type":"discover","service":"rustlm"})"));
}

TEST_CASE("Disassemble discovery request", "[message]") {
    const auto request = DiscoveryRequest::disassemble(R"({"type":"discover","service":"rustlm"})");
    REQUIRE(request.getService() == "rustlm");
    REQUIRE(request.matches("rustlm"));
    REQUIRE_FALSE(request.matches("other"));

    const auto any_request = DiscoveryRequest::disassemble(R"({"type":"discover"})");
    REQUIRE_FALSE(any_request.getService().has_value());
    REQUIRE(any_request.matches("rustlm"));
}

TEST_CASE("Disassemble plain text discovery request", "[message]") {
    REQUIRE(DiscoveryRequest::disassemble("DISCOVER") == DiscoveryRequest());
    REQUIRE(DiscoveryRequest::disassemble("please discover") == DiscoveryRequest());
    REQUIRE(get_message_type("DISCOVER") == DISCOVER);
    REQUIRE_THROWS_AS(DiscoveryRequest::disassemble("Discover"), MalformedMessageError);
}

TEST_CASE("Reject invalid discovery request", "[message]") {
    REQUIRE_THROWS_AS(DiscoveryRequest::disassemble(R"({"type":"discover","service":5})"), MalformedMessageError);
    REQUIRE_THROWS_AS(DiscoveryRequest::disassemble(R"({"type":"announce"})"), MalformedMessageError);
    REQUIRE_THROWS_AS(DiscoveryRequest::disassemble(R"({"service":"rustlm"})"), MalformedMessageError);
}

TEST_CASE("Dispatch on message type", "[message]") {
    const Announcement announcement {"rustlm", asio::ip::make_address_v4("10.0.0.5"), 3000, "k"};
    const auto announcement_str = announcement.assemble();
    const auto request_str = DiscoveryRequest("rustlm").assemble();

    REQUIRE(get_message_type(announcement_str) == ANNOUNCE);
    REQUIRE(get_message_type(request_str) == DISCOVER);

    const auto decoded_announcement = disassemble_message(std::as_bytes(std::span(announcement_str)));
    REQUIRE(std::holds_alternative<Announcement>(decoded_announcement));
    REQUIRE(std::get<Announcement>(decoded_announcement) == announcement);

    const auto decoded_request = disassemble_message(std::as_bytes(std::span(request_str)));
    REQUIRE(std::holds_alternative<DiscoveryRequest>(decoded_request));
    REQUIRE(std::get<DiscoveryRequest>(decoded_request).getService() == "rustlm");
}

TEST_CASE("Type field is case insensitive", "[message]") {
    REQUIRE(get_message_type(R"({"type":"DISCOVER"})") == DISCOVER);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
