/**
 * @file
 * @brief Implementation of the broadcast scheduler
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <variant>

#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "beacon/core/config/AnnouncementMode.hpp"
#include "beacon/core/config/SessionConfig.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/message/BeaconMessage.hpp"
#include "beacon/core/message/exceptions.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/thread.hpp"
#include "beacon/core/utils/timers.hpp"

using namespace beacon::config;
using namespace beacon::discovery;
using namespace beacon::message;
using namespace beacon::networking;
using namespace beacon::utils;
using namespace std::chrono_literals;

namespace {
    /** Maximum time a listening scheduler blocks before checking for a stop request */
    constexpr auto POLL_INTERVAL = 50ms;

    std::string endpoint_to_string(const asio::ip::udp::endpoint& endpoint) {
        return beacon::networking::to_uri(endpoint.address().to_v4(), endpoint.port(), "");
    }
} // namespace

Scheduler::Scheduler(SessionConfig config) : logger_("SCHEDULER"), config_(std::move(config)) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if(state_ != SchedulerState::IDLE) {
        throw LogicError("Scheduler can only be started once");
    }

    // Resolve address once, it is kept for the lifetime of the scheduler
    const auto advertised_address =
        config_.getAdvertisedAddress().has_value() ? config_.getAdvertisedAddress().value() : resolve_local_ipv4();
    announcement_ = Announcement(std::string(config_.getServiceName()),
                                 advertised_address,
                                 config_.getAdvertisedPort(),
                                 std::string(config_.getSharedKey()))
                        .assemble();

    std::unique_ptr<BroadcastSend> sender {};
    std::unique_ptr<BroadcastRecv> receiver {};
    if(is_broadcasting(config_.getMode())) {
        sender = std::make_unique<BroadcastSend>(config_.getBroadcastAddress(), config_.getPort());
    }
    if(config_.isListening()) {
        receiver = std::make_unique<BroadcastRecv>(asio::ip::address_v4::any(), config_.getPort());
    }
    sender_ = std::move(sender);
    receiver_ = std::move(receiver);
    advertised_address_ = advertised_address;

    LOG(logger_, INFO) << "Announcing service " << quote(config_.getServiceName()) << " at "
                       << networking::to_uri(advertised_address, config_.getAdvertisedPort(), "") << " in "
                       << config::to_string(config_.getMode()) << " mode on port " << config_.getPort();
    LOG_IF(logger_, DEBUG, sender_ != nullptr) << "Broadcasting to " << endpoint_to_string(sender_->getEndpoint());
    LOG_IF(logger_, DEBUG, receiver_ != nullptr) << "Listening for discovery requests on port " << receiver_->getPort();

    state_ = SchedulerState::RUNNING;

    // jthread immediately starts on construction
    main_loop_thread_ = std::jthread(std::bind_front(&Scheduler::main_loop, this));
    set_thread_name(main_loop_thread_, "BeaconScheduler");
}

void Scheduler::stop() {
    main_loop_thread_.request_stop();
    if(main_loop_thread_.joinable()) {
        main_loop_thread_.join();
    }
}

void Scheduler::send_broadcast() {
    try {
        sender_->sendBroadcast(announcement_);
        ++announcement_count_;
        LOG(logger_, TRACE) << "Sent announcement " << announcement_;
    } catch(const SendError& error) {
        LOG(logger_, WARNING) << error.what();
    }
}

void Scheduler::handle_incoming_message(const BroadcastMessage& message) {
    const auto sender = endpoint_to_string(message.sender);
    try {
        const auto beacon_message = disassemble_message(message.content);
        const auto* request = std::get_if<DiscoveryRequest>(&beacon_message);
        if(request == nullptr) {
            LOG(logger_, TRACE) << "Ignoring announcement from " << sender;
            return;
        }
        if(!request->matches(config_.getServiceName())) {
            LOG(logger_, TRACE) << "Ignoring discovery request from " << sender << " for service "
                                << quote(request->getService().value());
            return;
        }

        LOG(logger_, DEBUG) << "Replying to discovery request from " << sender;
        receiver_->sendTo(announcement_, message.sender);
        ++announcement_count_;
    } catch(const MessageDecodingError& error) {
        LOG(logger_, DEBUG) << "Discarding message from " << sender << ": " << error.what();
    } catch(const SendError& error) {
        LOG(logger_, WARNING) << error.what();
    }
}

void Scheduler::main_loop(const std::stop_token& stop_token) {
    const auto& mode = config_.getMode();
    const auto broadcasting = is_broadcasting(mode);

    std::chrono::steady_clock::duration interval {};
    std::optional<std::size_t> remaining_broadcasts {};
    if(const auto* periodic = std::get_if<Periodic>(&mode)) {
        interval = periodic->interval;
    } else if(const auto* limited = std::get_if<Limited>(&mode)) {
        interval = limited->interval;
        remaining_broadcasts = limited->count;
    }

    TimeoutTimer broadcast_timer {interval};
    const auto broadcast = [&]() {
        send_broadcast();
        broadcast_timer.reset();
        if(remaining_broadcasts.has_value()) {
            --remaining_broadcasts.value();
        }
    };

    // First announcement is sent immediately
    if(broadcasting) {
        broadcast();
    }

    while(!stop_token.stop_requested()) {
        if(remaining_broadcasts == 0U) {
            LOG(logger_, INFO) << "All announcements sent, stopping";
            break;
        }

        if(receiver_ != nullptr) {
            // Listen for requests until the next broadcast is due
            const std::chrono::steady_clock::duration timeout =
                broadcasting ? std::min<std::chrono::steady_clock::duration>(broadcast_timer.remaining(), POLL_INTERVAL)
                             : POLL_INTERVAL;
            try {
                const auto message = receiver_->asyncRecvBroadcast(timeout);
                if(message.has_value()) {
                    handle_incoming_message(message.value());
                }
            } catch(const NetworkError& error) {
                LOG(logger_, WARNING) << error.what();
            }
        } else {
            // Wait until the next broadcast is due, returns early on stop request
            std::unique_lock wait_lock {wait_mutex_};
            wait_cv_.wait_for(wait_lock, stop_token, broadcast_timer.remaining(), [] { return false; });
        }

        if(broadcasting && !stop_token.stop_requested() && broadcast_timer.timeoutReached()) {
            broadcast();
        }
    }

    state_ = SchedulerState::STOPPED;
    LOG(logger_, DEBUG) << "Scheduler stopped after " << announcement_count_.load() << " announcements";
}
