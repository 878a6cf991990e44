/**
 * @file
 * @brief Implementation of command-line interface parser
 *
 * @copyright Copyright (c) 2025 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "cli.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <argparse/argparse.hpp>
#include <asio/error.hpp>
#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/config/AnnouncementMode.hpp"
#include "beacon/core/config/SessionConfig.hpp"
#include "beacon/core/log/Level.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/timers.hpp"
#include "beacon/exec/exceptions.hpp"

using namespace beacon::config;
using namespace beacon::exec;
using namespace beacon::log;
using namespace beacon::networking;
using namespace beacon::utils;

namespace {
    std::chrono::steady_clock::duration to_duration(std::string_view name, double seconds) {
        const auto duration = seconds_to_duration(seconds);
        if(!duration.has_value()) {
            throw CommandLineInterfaceError("Argument " + utils::to_string(name) +
                                            " has to be a finite number of seconds within range");
        }
        return duration.value();
    }
} // namespace

BaseParser::BaseParser(std::string program)
    : argparse::ArgumentParser(std::move(program), BCN_VERSION_FULL, argparse::default_arguments::help) {
    // Provide own version printout
    add_argument("-v", "--version")
        .action([](const auto& /*unused*/) {
            std::cout << "Beacon " << BCN_VERSION_FULL << "\n"         //
                      << "\tBuild type:\t" << BCN_BUILD_TYPE << "\n" //
                      << std::flush;
            std::exit(0); // NOLINT(concurrency-mt-unsafe)
        })
        .default_value(false)
        .help("shows version information and exits")
        .implicit_value(true)
        .nargs(0);
}

void BaseParser::setup() {
    // Console log level (-l)
    add_argument("-l", "--level").help("log level").default_value("INFO");
}

BaseParser::BaseOptions BaseParser::parse(std::span<const char*> args) {
    // Parse args, argparse reports invalid numbers with std::invalid_argument
    try {
        parse_args(static_cast<int>(args.size()), args.data());
    } catch(const std::runtime_error& error) {
        throw CommandLineInterfaceError(error.what());
    } catch(const std::invalid_argument& error) {
        throw CommandLineInterfaceError(error.what());
    }

    // Get log level
    const auto level_str = get("level");
    const auto level = enum_cast<Level>(level_str);
    if(!level.has_value()) {
        throw CommandLineInterfaceError(quote(level_str) + " is not a valid log level, possible value are " +
                                        list_enum_names<Level>());
    }

    return {level.value()};
}

std::string BaseParser::help() const {
    return argparse::ArgumentParser::help().str();
}

asio::ip::address_v4 BaseParser::parse_address(std::string_view name, const std::string& value) {
    asio::error_code ec {};
    const auto address = asio::ip::make_address_v4(value, ec);
    if(ec) {
        throw CommandLineInterfaceError(quote(value) + " is not a valid IPv4 address for argument " + utils::to_string(name));
    }
    return address;
}

AnnounceParser::AnnounceParser(std::string program) : BaseParser(std::move(program)) {}

void AnnounceParser::setup() {
    // Configuration file (-c)
    add_argument("-c", "--config").help("TOML file with a [beacon] table, replaces all session options");

    // Session options
    add_argument("-s", "--service").help("service name");
    add_argument("-k", "--key").help("shared key");
    add_argument("-a", "--advertised-port").help("port at which the service is reachable").scan<'u', Port>();
    add_argument("-p", "--port")
        .help("announcement port")
        .default_value(protocol::BEACON::DEFAULT_PORT)
        .scan<'u', Port>();
    add_argument("-m", "--mode").help("announcement mode (periodic, on_request, limited)").default_value("periodic");
    add_argument("--interval")
        .help("seconds between announcements")
        .default_value(static_cast<double>(protocol::BEACON::DEFAULT_INTERVAL.count()))
        .scan<'g', double>();
    add_argument("--count")
        .help("number of announcements in limited mode")
        .default_value(std::size_t(1))
        .scan<'u', std::size_t>();
    add_argument("--address").help("advertised address instead of the local address");
    add_argument("--broadcast").help("broadcast address").default_value("255.255.255.255");
    add_argument("--respond")
        .help("also reply to discovery requests in periodic and limited mode")
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    // Add base options
    BaseParser::setup();
}

AnnounceParser::AnnounceOptions AnnounceParser::parse(std::span<const char*> args) {
    // Parse base args
    auto base_options = BaseParser::parse(args);

    // Read session from file if requested
    const auto config_file = present("config");
    if(config_file.has_value()) {
        return {std::move(base_options), SessionConfig::fromFile(config_file.value())};
    }

    auto service = present("service");
    auto key = present("key");
    const auto advertised_port = present<Port>("advertised-port");
    if(!service.has_value() || !key.has_value() || !advertised_port.has_value()) {
        throw CommandLineInterfaceError(
            "Arguments --service, --key and --advertised-port are required without --config");
    }

    // Get announcement mode
    const auto mode_str = get("mode");
    const auto mode_type = enum_cast<ModeType>(mode_str);
    if(!mode_type.has_value()) {
        throw CommandLineInterfaceError(quote(mode_str) + " is not a valid announcement mode, possible values are " +
                                        list_enum_names<ModeType>());
    }
    const auto interval = to_duration("--interval", get<double>("interval"));
    const auto mode = make_mode(mode_type.value(), interval, get<std::size_t>("count"));

    // Get optional addresses
    const auto address_str = present("address");
    const auto advertised_address =
        address_str.has_value() ? std::optional(parse_address("--address", address_str.value())) : std::nullopt;
    const auto broadcast_address = parse_address("--broadcast", get("broadcast"));

    return {std::move(base_options),
            SessionConfig(std::move(service.value()),
                          std::move(key.value()),
                          advertised_port.value(),
                          mode,
                          get<Port>("port"),
                          advertised_address,
                          broadcast_address,
                          get<bool>("respond"))};
}

DiscoverParser::DiscoverParser(std::string program) : BaseParser(std::move(program)) {}

void DiscoverParser::setup() {
    add_argument("-k", "--key").help("expected shared key").required();
    add_argument("-p", "--port")
        .help("announcement port")
        .default_value(protocol::BEACON::DEFAULT_PORT)
        .scan<'u', Port>();
    add_argument("-b", "--broadcast")
        .help("address to which discovery requests are sent")
        .default_value("255.255.255.255");
    add_argument("-s", "--service").help("only accept announcements for this service");
    add_argument("-t", "--timeout").help("seconds to wait for announcements").default_value(5.0).scan<'g', double>();
    add_argument("-m", "--method").help("discovery method (passive, active)").default_value("passive");
    add_argument("-a", "--all")
        .help("collect all services within the timeout")
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    // Add base options
    BaseParser::setup();
}

DiscoverParser::DiscoverOptions DiscoverParser::parse(std::span<const char*> args) {
    // Parse base args
    auto base_options = BaseParser::parse(args);

    auto key = get("key");
    const auto broadcast_address = parse_address("--broadcast", get("broadcast"));
    auto service = present("service");

    const auto timeout_s = get<double>("timeout");
    if(timeout_s < 0.) {
        throw CommandLineInterfaceError("Timeout cannot be negative");
    }

    const auto method_str = get("method");
    const auto method = enum_cast<Method>(method_str);
    if(!method.has_value()) {
        throw CommandLineInterfaceError(quote(method_str) + " is not a valid discovery method, possible values are " +
                                        list_enum_names<Method>());
    }

    return {std::move(base_options),
            std::move(key),
            get<Port>("port"),
            broadcast_address,
            std::move(service),
            to_duration("--timeout", timeout_s),
            method.value(),
            get<bool>("all")};
}
