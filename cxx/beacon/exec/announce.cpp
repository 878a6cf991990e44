/**
 * @file
 * @brief Implementation of the main function for the announcing executable
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "announce.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "beacon/core/discovery/Scheduler.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/exec/cli.hpp"
#include "beacon/exec/cpp.hpp"

using namespace beacon::discovery;
using namespace beacon::exec;
using namespace beacon::networking;

int beacon::exec::announce_main(std::span<const char*> args, std::string_view program) noexcept {
    try {
        // Get parser and setup
        auto parser = AnnounceParser(std::string(program));
        parser.setup();

        // Parse options
        std::optional<AnnounceParser::AnnounceOptions> options {};
        try {
            options = parser.parse(args);
        } catch(const std::exception& error) {
            LOG(CRITICAL) << "Argument parsing failed: " << error.what() << "\n\n" << parser.help();
            return 1;
        }

        // Set log level
        beacon_setup_logging(options->log_level);

        // Create and start scheduler
        Scheduler scheduler {options->session};
        try {
            scheduler.start();
        } catch(const NetworkError& error) {
            LOG(CRITICAL) << "Failed to start announcements: " << error.what();
            return 1;
        }

        // Wait until interrupted
        join_scheduler(scheduler);

        return 0;

    } catch(const std::exception& error) {
        std::cerr << "Critical failure: " << error.what() << "\n" << std::flush;
    } catch(...) {
        std::cerr << "Critical failure: <unknown exception>\n" << std::flush;
    }
    return 1;
}
