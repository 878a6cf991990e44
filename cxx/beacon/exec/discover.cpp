/**
 * @file
 * @brief Implementation of the main function for the discovering executable
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "discover.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "beacon/core/discovery/Client.hpp"
#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/exec/cli.hpp"
#include "beacon/exec/cpp.hpp"

using namespace beacon::discovery;
using namespace beacon::exec;
using namespace beacon::networking;

int beacon::exec::discover_main(std::span<const char*> args, std::string_view program) noexcept {
    try {
        // Get parser and setup
        auto parser = DiscoverParser(std::string(program));
        parser.setup();

        // Parse options
        std::optional<DiscoverParser::DiscoverOptions> options {};
        try {
            options = parser.parse(args);
        } catch(const std::exception& error) {
            LOG(CRITICAL) << "Argument parsing failed: " << error.what() << "\n\n" << parser.help();
            return 1;
        }

        // Set log level
        beacon_setup_logging(options->log_level);

        Client client {options->port, options->broadcast_address, options->service};
        const auto active = options->method == DiscoverParser::Method::ACTIVE;

        std::vector<DiscoveredService> services {};
        try {
            if(options->all) {
                services = client.discoverAll(options->key, options->timeout, active);
            } else if(active) {
                services.emplace_back(client.request(options->key, options->timeout));
            } else {
                services.emplace_back(client.discover(options->key, options->timeout));
            }
        } catch(const DiscoveryTimeoutError& error) {
            LOG(WARNING) << error.what();
            return 1;
        } catch(const NetworkError& error) {
            LOG(CRITICAL) << "Discovery failed: " << error.what();
            return 1;
        }

        if(services.empty()) {
            LOG(WARNING) << "No services discovered";
            return 1;
        }

        for(const auto& service : services) {
            std::cout << service.service << " " << service.to_uri() << "\n";
        }
        std::cout << std::flush;

        return 0;

    } catch(const std::exception& error) {
        std::cerr << "Critical failure: " << error.what() << "\n" << std::flush;
    } catch(...) {
        std::cerr << "Critical failure: <unknown exception>\n" << std::flush;
    }
    return 1;
}
