/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "beacon/core/config/AnnouncementMode.hpp"
#include "beacon/core/config/SessionConfig.hpp"
#include "beacon/core/discovery/BroadcastRecv.hpp"
#include "beacon/core/discovery/Scheduler.hpp"
#include "beacon/core/message/BeaconMessage.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/exceptions.hpp"

using namespace Catch::Matchers;
using namespace beacon::config;
using namespace beacon::discovery;
using namespace beacon::message;
using namespace beacon::networking;
using namespace beacon::utils;
using namespace std::chrono_literals;

namespace {
    const auto localhost = asio::ip::make_address_v4("127.0.0.1");
    const auto advertised = asio::ip::make_address_v4("10.0.0.5");

    SessionConfig make_config(AnnouncementMode mode, Port port, bool respond_to_requests = false) {
        return {"rustlm", "SECRETKEY123", 3000, mode, port, advertised, localhost, respond_to_requests};
    }

    /** Receive messages until no message arrives within the silence period */
    std::vector<BroadcastMessage> receive_all(BroadcastRecv& receiver, std::chrono::steady_clock::duration silence) {
        std::vector<BroadcastMessage> messages {};
        while(true) {
            auto message = receiver.asyncRecvBroadcast(silence);
            if(!message.has_value()) {
                break;
            }
            messages.emplace_back(std::move(message.value()));
        }
        return messages;
    }

    /** Send a request from an ephemeral port and return the replies */
    std::vector<BroadcastMessage> send_request(const std::string& request, Port port) {
        BroadcastRecv client {"0.0.0.0", 0};
        client.sendTo(request, {localhost, port});
        return receive_all(client, 300ms);
    }
} // namespace

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Scheduler state transitions", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(Limited {10ms, 2}, 49160)};
    REQUIRE(scheduler.getState() == SchedulerState::IDLE);
    REQUIRE_FALSE(scheduler.getAdvertisedAddress().has_value());

    scheduler.start();
    REQUIRE(scheduler.getAdvertisedAddress() == advertised);

    // Limited scheduler stops on its own
    while(scheduler.getState() == SchedulerState::RUNNING) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE(scheduler.getAnnouncementCount() == 2);
}

TEST_CASE("Scheduler cannot be started twice", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(Periodic {1s}, 49160)};
    scheduler.start();
    REQUIRE_THROWS_MATCHES(scheduler.start(), LogicError, Message("Scheduler can only be started once"));

    scheduler.stop();
    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE_THROWS_AS(scheduler.start(), LogicError);
}

TEST_CASE("Stop scheduler that was never started", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(Periodic {1s}, 49160)};
    scheduler.stop();
    REQUIRE(scheduler.getState() == SchedulerState::IDLE);
    REQUIRE(scheduler.getAnnouncementCount() == 0);
}

TEST_CASE("Limited mode sends exactly the requested number of announcements", "[discovery][scheduler]") {
    BroadcastRecv receiver {"0.0.0.0", 49161};
    Scheduler scheduler {make_config(Limited {50ms, 3}, 49161)};
    scheduler.start();

    const auto messages = receive_all(receiver, 500ms);

    REQUIRE(messages.size() == 3);
    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE(scheduler.getAnnouncementCount() == 3);

    for(const auto& message : messages) {
        const auto announcement = Announcement::disassemble(message.content);
        REQUIRE(announcement.getService() == "rustlm");
        REQUIRE(announcement.getAddress() == advertised);
        REQUIRE(announcement.getPort() == 3000);
        REQUIRE(announcement.getKey() == "SECRETKEY123");
    }
}

TEST_CASE("Periodic mode sends immediately and then every interval", "[discovery][scheduler]") {
    BroadcastRecv receiver {"0.0.0.0", 49162};
    Scheduler scheduler {make_config(Periodic {200ms}, 49162)};

    const auto start_time = std::chrono::steady_clock::now();
    scheduler.start();

    std::vector<std::chrono::steady_clock::time_point> arrival_times {};
    while(arrival_times.size() < 4) {
        const auto message = receiver.asyncRecvBroadcast(1s);
        REQUIRE(message.has_value());
        arrival_times.emplace_back(std::chrono::steady_clock::now());
    }
    scheduler.stop();

    // First announcement without waiting for the interval
    REQUIRE(arrival_times.front() - start_time < 100ms);

    // Gaps equal the interval within scheduling jitter
    for(std::size_t n = 1; n < arrival_times.size(); ++n) {
        const auto gap = arrival_times[n] - arrival_times[n - 1];
        REQUIRE(gap > 150ms);
        REQUIRE(gap < 350ms);
    }

    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE(scheduler.getAnnouncementCount() >= 4);
}

TEST_CASE("Stop interrupts the wait for the next announcement", "[discovery][scheduler]") {
    BroadcastRecv receiver {"0.0.0.0", 49163};
    Scheduler scheduler {make_config(Periodic {30s}, 49163)};
    scheduler.start();
    REQUIRE(receiver.asyncRecvBroadcast(1s).has_value());

    const auto stop_start = std::chrono::steady_clock::now();
    scheduler.stop();
    REQUIRE(std::chrono::steady_clock::now() - stop_start < 200ms);

    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE(scheduler.getAnnouncementCount() == 1);
    REQUIRE_FALSE(receiver.asyncRecvBroadcast(100ms).has_value());
}

TEST_CASE("Scheduler stops on destruction", "[discovery][scheduler]") {
    BroadcastRecv receiver {"0.0.0.0", 49164};
    {
        Scheduler scheduler {make_config(Periodic {30s}, 49164)};
        scheduler.start();
        REQUIRE(receiver.asyncRecvBroadcast(1s).has_value());
    }
    REQUIRE_FALSE(receiver.asyncRecvBroadcast(100ms).has_value());
}

TEST_CASE("OnRequest mode sends nothing without a request", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(OnRequest {}, 49165)};
    scheduler.start();

    std::this_thread::sleep_for(300ms);
    REQUIRE(scheduler.getAnnouncementCount() == 0);
    REQUIRE(scheduler.getState() == SchedulerState::RUNNING);
}

TEST_CASE("OnRequest mode replies exactly once to each request", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(OnRequest {}, 49166)};
    scheduler.start();

    const auto replies = send_request(DiscoveryRequest().assemble(), 49166);
    REQUIRE(replies.size() == 1);
    const auto announcement = Announcement::disassemble(replies.front().content);
    REQUIRE(announcement.getAddress() == advertised);
    REQUIRE(announcement.getPort() == 3000);
    REQUIRE(scheduler.getAnnouncementCount() == 1);

    // Second request gets its own reply
    REQUIRE(send_request(DiscoveryRequest("rustlm").assemble(), 49166).size() == 1);
    REQUIRE(scheduler.getAnnouncementCount() == 2);
}

TEST_CASE("OnRequest mode replies to plain text requests", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(OnRequest {}, 49167)};
    scheduler.start();

    REQUIRE(send_request("DISCOVER", 49167).size() == 1);
    REQUIRE(send_request("discover", 49167).size() == 1);
}

TEST_CASE("OnRequest mode ignores invalid and foreign requests", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(OnRequest {}, 49168)};
    scheduler.start();

    // Garbage is discarded
    REQUIRE(send_request("garbage", 49168).empty());
    REQUIRE(send_request(R"({"type":"hello"})", 49168).empty());

    // Requests for a different service are ignored
    REQUIRE(send_request(DiscoveryRequest("other").assemble(), 49168).empty());

    // Announcements of other servers are not answered
    const Announcement other {"other", localhost, 4000, "k"};
    REQUIRE(send_request(other.assemble(), 49168).empty());

    REQUIRE(scheduler.getAnnouncementCount() == 0);

    // Scheduler keeps working after discarding messages
    REQUIRE(send_request(DiscoveryRequest().assemble(), 49168).size() == 1);
}

TEST_CASE("Periodic mode can also reply to requests", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(Periodic {30s}, 49169, true)};
    scheduler.start();

    // Wait for the first broadcast, which is received by the scheduler itself and ignored
    while(scheduler.getAnnouncementCount() == 0) {
        std::this_thread::sleep_for(10ms);
    }

    REQUIRE(send_request(DiscoveryRequest().assemble(), 49169).size() == 1);
    REQUIRE(scheduler.getAnnouncementCount() == 2);
}

TEST_CASE("Limited mode stops replying after the last announcement", "[discovery][scheduler]") {
    Scheduler scheduler {make_config(Limited {10ms, 1}, 49170, true)};
    scheduler.start();

    while(scheduler.getState() == SchedulerState::RUNNING) {
        std::this_thread::sleep_for(10ms);
    }

    REQUIRE(send_request(DiscoveryRequest().assemble(), 49170).empty());
    REQUIRE(scheduler.getAnnouncementCount() == 1);
}

TEST_CASE("Multiple schedulers coexist", "[discovery][scheduler]") {
    BroadcastRecv receiver {"0.0.0.0", 49171};
    Scheduler scheduler_a {{"service_a", "k", 3000, Limited {10ms, 1}, 49171, advertised, localhost}};
    Scheduler scheduler_b {{"service_b", "k", 3001, Limited {10ms, 1}, 49171, advertised, localhost}};
    scheduler_a.start();
    scheduler_b.start();

    const auto messages = receive_all(receiver, 300ms);
    REQUIRE(messages.size() == 2);

    std::vector<std::string> services {};
    for(const auto& message : messages) {
        services.emplace_back(Announcement::disassemble(message.content).getService());
    }
    std::ranges::sort(services);
    REQUIRE(services == std::vector<std::string>({"service_a", "service_b"}));
}

TEST_CASE("Scheduler stays idle if the port cannot be bound", "[discovery][scheduler]") {
    // Socket without address reuse blocks the port for everyone else
    asio::io_context io_context {};
    const asio::ip::udp::socket blocker {io_context, {asio::ip::address_v4::any(), 49172}};

    Scheduler scheduler {make_config(OnRequest {}, 49172)};
    REQUIRE_THROWS_WITH(scheduler.start(), StartsWith("Unable to bind socket to 0.0.0.0:49172"));
    REQUIRE_THROWS_AS(scheduler.start(), BindError);
    REQUIRE(scheduler.getState() == SchedulerState::IDLE);
    REQUIRE_FALSE(scheduler.getAdvertisedAddress().has_value());
}

TEST_CASE("Failed announcements do not stop a limited scheduler", "[discovery][scheduler]") {
    // Announcement does not fit into a single UDP datagram
    Scheduler scheduler {
        {std::string(70000, 's'), "SECRETKEY123", 3000, Limited {10ms, 3}, 49173, advertised, localhost}};
    scheduler.start();

    while(scheduler.getState() == SchedulerState::RUNNING) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(scheduler.getState() == SchedulerState::STOPPED);
    REQUIRE(scheduler.getAnnouncementCount() == 0);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
