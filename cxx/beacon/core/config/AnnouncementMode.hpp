/**
 * @file
 * @brief Announcement modes of the broadcast scheduler
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "beacon/build.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"

namespace beacon::config {

    /** Broadcast an announcement immediately and then every interval until stopped */
    struct Periodic {
        std::chrono::steady_clock::duration interval {protocol::BEACON::DEFAULT_INTERVAL};

        bool operator==(const Periodic& other) const = default;
    };

    /** Never broadcast, reply to each discovery request with a unicast announcement */
    struct OnRequest {
        bool operator==(const OnRequest& other) const = default;
    };

    /** Broadcast like `Periodic`, but stop permanently after a number of announcements */
    struct Limited {
        std::chrono::steady_clock::duration interval {protocol::BEACON::DEFAULT_INTERVAL};
        std::size_t count {1};

        bool operator==(const Limited& other) const = default;
    };

    /** Announcement mode, fixed for the lifetime of a scheduler */
    using AnnouncementMode = std::variant<Periodic, OnRequest, Limited>;

    /** Names of the announcement modes as used in configuration files and on the command line */
    enum class ModeType : std::uint8_t {
        PERIODIC,
        ON_REQUEST,
        LIMITED,
    };
    using enum ModeType;

    /** Get the type of an announcement mode */
    BCN_API ModeType get_mode_type(const AnnouncementMode& mode);

    /**
     * @brief Build an announcement mode from its type
     *
     * @param type Type of the mode
     * @param interval Interval between broadcasts, ignored for `ON_REQUEST`
     * @param count Number of broadcasts, only used for `LIMITED`
     * @return Announcement mode
     */
    BCN_API AnnouncementMode make_mode(ModeType type, std::chrono::steady_clock::duration interval, std::size_t count);

    /** Check whether an announcement mode broadcasts announcements on its own */
    BCN_API bool is_broadcasting(const AnnouncementMode& mode);

    /** Describe an announcement mode, e.g. `limited (3 times every 2s)` */
    BCN_API std::string to_string(const AnnouncementMode& mode);

} // namespace beacon::config
