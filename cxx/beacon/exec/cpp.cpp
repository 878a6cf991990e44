/**
 * @file
 * @brief Implementation of functions to build executables hosting Beacon components
 *
 * @copyright Copyright (c) 2025 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "cpp.hpp"

#include <chrono> // IWYU pragma: keep
#include <csignal>
#include <thread>

#include "beacon/build.hpp"
#include "beacon/core/discovery/Scheduler.hpp"
#include "beacon/core/log/Level.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/log/SinkManager.hpp"

using namespace beacon;
using namespace beacon::discovery;
using namespace beacon::exec;
using namespace beacon::log;
using namespace std::chrono_literals;

// Global variable for signal handler
namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    volatile std::sig_atomic_t signal_v {0};
} // namespace

// The only safe thing a signal handler can do is setting an atomic int
extern "C" void signal_handler(int signal) {
    signal_v = signal;
}

void beacon::exec::beacon_setup_logging(Level default_level) {
    // Set default log level
    SinkManager::getInstance().setConsoleLevels(default_level);

    // Log version
    LOG(STATUS) << "Beacon " << BCN_VERSION_FULL;
}

void beacon::exec::join_scheduler(Scheduler& scheduler) {
    // Register signal handler
    std::signal(SIGTERM, &signal_handler); // NOLINT(cert-err33-c)
    std::signal(SIGINT, &signal_handler);  // NOLINT(cert-err33-c)

    // Wait for signal or scheduler termination
    while(signal_v == 0 && scheduler.getState() == SchedulerState::RUNNING) {
        std::this_thread::sleep_for(50ms);
    }

    LOG_IF(STATUS, signal_v != 0) << "Stopping announcements";
    scheduler.stop();
    LOG(STATUS) << "Sent " << scheduler.getAnnouncementCount() << " announcements";
}
