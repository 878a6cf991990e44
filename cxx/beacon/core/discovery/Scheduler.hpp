/**
 * @file
 * @brief Broadcast scheduler announcing a service
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/config/SessionConfig.hpp"
#include "beacon/core/discovery/BroadcastRecv.hpp"
#include "beacon/core/discovery/BroadcastSend.hpp"
#include "beacon/core/log/Logger.hpp"

namespace beacon::discovery {

    /** State of a scheduler */
    enum class SchedulerState : std::uint8_t {
        /** Constructed, not started yet */
        IDLE,
        /** Background thread running */
        RUNNING,
        /** Stopped or all limited announcements sent, cannot be restarted */
        STOPPED,
    };

    /**
     * Broadcast scheduler
     *
     * Announces a service according to the announcement mode of its session configuration. All network activity happens
     * in a background thread, which is started with `start()` and stopped with `stop()` or on destruction.
     */
    class Scheduler {
    public:
        /**
         * @param config Session configuration, copied for the lifetime of the scheduler
         */
        BCN_API explicit Scheduler(config::SessionConfig config);

        /** Stops the background thread */
        BCN_API ~Scheduler();

        /// @cond doxygen_suppress
        Scheduler(const Scheduler& other) = delete;
        Scheduler& operator=(const Scheduler& other) = delete;
        Scheduler(Scheduler&& other) = delete;
        Scheduler& operator=(Scheduler&& other) = delete;
        /// @endcond

        /**
         * Start announcing
         *
         * Resolves the advertised address, opens the sockets and starts the background thread. If an exception is thrown,
         * the scheduler remains idle.
         *
         * @throws networking::ResolutionError If no advertised address is configured and none can be resolved
         * @throws networking::BindError If a socket cannot be opened or bound
         * @throws utils::LogicError If the scheduler has already been started
         */
        BCN_API void start();

        /**
         * Stop announcing and join the background thread
         *
         * Does nothing if the scheduler has not been started.
         */
        BCN_API void stop();

        /** Get the current state of the scheduler */
        SchedulerState getState() const { return state_.load(); }

        /** Get the number of announcements sent so far, both broadcast and unicast replies */
        std::size_t getAnnouncementCount() const { return announcement_count_.load(); }

        /** Get the address put into announcements, only available after `start()` */
        const std::optional<asio::ip::address_v4>& getAdvertisedAddress() const { return advertised_address_; }

        const config::SessionConfig& getConfig() const { return config_; }

    private:
        /**
         * Main loop sending announcements and listening for requests
         *
         * @param stop_token Token to stop loop via `std::jthread`
         */
        void main_loop(const std::stop_token& stop_token);

        void send_broadcast();

        void handle_incoming_message(const BroadcastMessage& message);

    private:
        log::Logger logger_;
        config::SessionConfig config_;

        std::optional<asio::ip::address_v4> advertised_address_;
        std::string announcement_;

        std::unique_ptr<BroadcastSend> sender_;
        std::unique_ptr<BroadcastRecv> receiver_;

        std::atomic<SchedulerState> state_ {SchedulerState::IDLE};
        std::atomic_size_t announcement_count_ {0};

        std::mutex wait_mutex_;
        std::condition_variable_any wait_cv_;
        std::jthread main_loop_thread_;
    };

} // namespace beacon::discovery
