/**
 * @file
 * @brief Log levels
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <spdlog/common.h>

namespace beacon::log {
    /**
     * Log levels of Beacon
     *
     * The numeric values match spdlog::level::level_enum, with STATUS taking the place of spdlog's error level.
     */
    enum class Level : int { // NOLINT(performance-enum-size)
        /** Every received datagram and every decision taken on it */
        TRACE = 0,

        /** Socket setup, discarded messages and other details for debugging */
        DEBUG = 1,

        /** Discovered services and scheduler lifecycle */
        INFO = 2,

        /** Failed sends and other recoverable problems */
        WARNING = 3,

        /** Rare messages the user should always see, such as the version at startup */
        STATUS = 4,

        /** Errors which stop a tool */
        CRITICAL = 5,

        /** No logging */
        OFF = 6,
    };
    using enum Level;

    /** Convert a Beacon log level to the spdlog level */
    constexpr spdlog::level::level_enum to_spdlog_level(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** Convert an spdlog level to the Beacon log level */
    constexpr Level from_spdlog_level(spdlog::level::level_enum level) {
        return static_cast<Level>(level);
    }
} // namespace beacon::log
