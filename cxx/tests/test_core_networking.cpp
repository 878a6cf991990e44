/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <cstddef>
#include <future>
#include <string> // IWYU pragma: keep
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "beacon/core/discovery/BroadcastRecv.hpp"
#include "beacon/core/discovery/BroadcastSend.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"

using namespace Catch::Matchers;
using namespace beacon::discovery;
using namespace beacon::networking;
using namespace std::chrono_literals;
using namespace std::string_literals;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Get interfaces", "[networking]") {
    const auto interfaces = get_interfaces();

    // Every host has at least a running loopback interface
    REQUIRE_FALSE(interfaces.empty());
    for(const auto& interface : interfaces) {
        REQUIRE_FALSE(interface.name.empty());
    }
}

TEST_CASE("Select outward interface", "[networking]") {
    const std::vector<Interface> interfaces {
        {"lo", asio::ip::make_address_v4("127.0.0.1"), asio::ip::make_address_v4("255.0.0.0"), false},
        {"docker0", asio::ip::make_address_v4("172.17.0.1"), asio::ip::make_address_v4("255.255.0.0"), true},
        {"eth0", asio::ip::make_address_v4("192.168.1.20"), asio::ip::make_address_v4("255.255.255.0"), true},
        {"wlan0", asio::ip::make_address_v4("10.0.0.5"), asio::ip::make_address_v4("255.0.0.0"), true},
    };

    const auto interface = select_outward_interface(interfaces);
    REQUIRE(interface.name == "eth0");
    REQUIRE(interface.address == asio::ip::make_address_v4("192.168.1.20"));
}

TEST_CASE("Skip loopback addresses on other interfaces", "[networking]") {
    const std::vector<Interface> interfaces {
        {"veth0", asio::ip::make_address_v4("127.0.1.1"), asio::ip::make_address_v4("255.0.0.0"), false},
        {"eth1", asio::ip::make_address_v4("10.0.0.5"), asio::ip::make_address_v4("255.0.0.0"), true},
    };

    REQUIRE(select_outward_interface(interfaces).name == "eth1");
}

TEST_CASE("No outward interface", "[networking]") {
    const std::vector<Interface> interfaces {
        {"lo", asio::ip::make_address_v4("127.0.0.1"), asio::ip::make_address_v4("255.0.0.0"), false},
        {"docker0", asio::ip::make_address_v4("172.17.0.1"), asio::ip::make_address_v4("255.255.0.0"), true},
    };

    REQUIRE_THROWS_MATCHES(select_outward_interface(interfaces),
                           ResolutionError,
                           Message("Unable to resolve local IPv4 address: no running non-loopback IPv4 interface found "
                                   "among \"lo, docker0\""));
    REQUIRE_THROWS_AS(select_outward_interface({}), ResolutionError);
}

TEST_CASE("Calculate broadcast address", "[networking]") {
    REQUIRE(broadcast_address_for(asio::ip::make_address_v4("192.168.1.20"), asio::ip::make_address_v4("255.255.255.0")) ==
            asio::ip::make_address_v4("192.168.1.255"));
    REQUIRE(broadcast_address_for(asio::ip::make_address_v4("10.1.2.3"), asio::ip::make_address_v4("255.0.0.0")) ==
            asio::ip::make_address_v4("10.255.255.255"));
    REQUIRE(broadcast_address_for(asio::ip::make_address_v4("10.1.2.3"), asio::ip::make_address_v4("255.255.255.255")) ==
            asio::ip::make_address_v4("10.1.2.3"));
}

TEST_CASE("Build URI", "[networking]") {
    REQUIRE_THAT(to_uri(asio::ip::make_address_v4("10.0.0.5"), 3000), Equals("http://10.0.0.5:3000"));
    REQUIRE_THAT(to_uri(asio::ip::make_address_v4("10.0.0.5"), 3000, "tcp"), Equals("tcp://10.0.0.5:3000"));
    REQUIRE_THAT(to_uri(asio::ip::make_address_v4("10.0.0.5"), 3000, ""), Equals("10.0.0.5:3000"));
}

TEST_CASE("Send and receive broadcast containing a string", "[networking][broadcast]") {
    BroadcastRecv receiver {"0.0.0.0", 49152};
    BroadcastSend sender {"127.0.0.1", 49152};

    // Start receiving new message
    auto msg_future = std::async(&BroadcastRecv::asyncRecvBroadcast, &receiver, 1s);
    // Send message (string)
    auto msg_content = "test message"s;
    sender.sendBroadcast(msg_content);
    // Receive message
    const auto msg_opt = msg_future.get();

    REQUIRE(msg_opt.has_value());
    const auto& msg = msg_opt.value(); // NOLINT(bugprone-unchecked-optional-access)
    REQUIRE_THAT(msg.to_string(), Equals(msg_content));
    REQUIRE(msg.sender.address() == asio::ip::make_address_v4("127.0.0.1"));
}

TEST_CASE("Send and receive broadcast containing binary content", "[networking][broadcast]") {
    BroadcastRecv receiver {"0.0.0.0", 49152};
    BroadcastSend sender {"127.0.0.1", 49152};

    auto msg_future = std::async(&BroadcastRecv::asyncRecvBroadcast, &receiver, 1s);
    auto msg_content = std::vector<std::byte>({std::byte('T'), std::byte('E'), std::byte('S'), std::byte('T')});
    sender.sendBroadcast(msg_content);
    const auto msg_opt = msg_future.get();

    REQUIRE(msg_opt.has_value());
    REQUIRE_THAT(msg_opt.value().content, RangeEquals(msg_content)); // NOLINT(bugprone-unchecked-optional-access)
}

TEST_CASE("Reply to the sender of a message", "[networking][broadcast]") {
    BroadcastRecv server {"0.0.0.0", 49153};
    BroadcastRecv client {"0.0.0.0", 0};
    REQUIRE(client.getPort() != 0);

    // Send request from ephemeral port
    client.sendTo("ping", {asio::ip::make_address_v4("127.0.0.1"), 49153});
    const auto request = server.asyncRecvBroadcast(1s);
    REQUIRE(request.has_value());
    REQUIRE(request->sender.port() == client.getPort()); // NOLINT(bugprone-unchecked-optional-access)

    // Reply to the source endpoint of the request
    server.sendTo("pong", request->sender); // NOLINT(bugprone-unchecked-optional-access)
    const auto reply = client.asyncRecvBroadcast(1s);
    REQUIRE(reply.has_value());
    REQUIRE_THAT(reply->to_string(), Equals("pong")); // NOLINT(bugprone-unchecked-optional-access)
}

TEST_CASE("Truncate long messages", "[networking][broadcast]") {
    BroadcastRecv receiver {"0.0.0.0", 49154};
    BroadcastSend sender {"127.0.0.1", 49154};

    sender.sendBroadcast(std::string(4096, 'x'));
    const auto msg_opt = receiver.asyncRecvBroadcast(1s);

    REQUIRE(msg_opt.has_value());
    REQUIRE(msg_opt->content.size() == 1024); // NOLINT(bugprone-unchecked-optional-access)
}

TEST_CASE("Get timeout on asynchronous broadcast receive", "[networking][broadcast]") {
    BroadcastRecv receiver {"0.0.0.0", 49152};

    // Try receiving new message
    auto msg_opt = receiver.asyncRecvBroadcast(10ms);

    // No message send, thus check for timeout that there is no message
    REQUIRE_FALSE(msg_opt.has_value());
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
