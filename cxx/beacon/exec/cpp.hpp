/**
 * @file
 * @brief Functions to build executables hosting Beacon components
 *
 * @copyright Copyright (c) 2025 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "beacon/build.hpp"
#include "beacon/core/discovery/Scheduler.hpp"
#include "beacon/core/log/Level.hpp"

namespace beacon::exec {

    /**
     * @brief Setup Logging
     *
     * @param default_level Default log level for the console output
     */
    BCN_API void beacon_setup_logging(log::Level default_level);

    /**
     * @brief Join a scheduler
     *
     * Registers signal handlers and waits until a signal is received or the scheduler stopped on its own, then stops the
     * scheduler.
     *
     * @param scheduler Running scheduler
     */
    BCN_API void join_scheduler(discovery::Scheduler& scheduler);

} // namespace beacon::exec
