/**
 * @file
 * @brief Beacon discovery protocol definitions
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "beacon/core/networking/Port.hpp"

namespace beacon::protocol::BEACON {

    /** Default port on which announcements are broadcast and requests are received */
    constexpr networking::Port DEFAULT_PORT = 8888;

    /** Default interval between two periodic announcements */
    constexpr std::chrono::seconds DEFAULT_INTERVAL {30};

    /** Size of the receive buffer, longer datagrams are truncated */
    constexpr std::size_t MESSAGE_BUFFER = 1024;

    /** Maximum nesting depth accepted when decoding a message */
    constexpr std::size_t MAX_NESTING_DEPTH = 8;

    /** Name of the discriminator field of all messages */
    constexpr std::string_view TYPE_FIELD = "type";

    /** Marker identifying a plain-text discovery request of earlier clients */
    constexpr std::string_view LEGACY_REQUEST_MARKER = "DISCOVER";

    /** Beacon message type */
    enum class MessageType : std::uint8_t {
        /** An ANNOUNCE message advertises the address at which a service is reachable */
        ANNOUNCE,

        /** A DISCOVER message asks servers to reply with an ANNOUNCE message */
        DISCOVER,
    };
    using enum MessageType;

} // namespace beacon::protocol::BEACON
