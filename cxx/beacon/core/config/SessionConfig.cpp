/**
 * @file
 * @brief Implementation of the session configuration
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SessionConfig.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <asio/error.hpp>
#include <asio/ip/address_v4.hpp>
#include <toml++/toml.hpp>

#include "beacon/core/config/AnnouncementMode.hpp"
#include "beacon/core/config/exceptions.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/protocol/BEACON_definitions.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/timers.hpp"

using namespace beacon::config;
using namespace beacon::networking;
using namespace beacon::utils;

namespace {
    std::optional<std::string> get_optional_string(const toml::table& table, std::string_view key) {
        const auto* node = table.get(key);
        if(node == nullptr) {
            return std::nullopt;
        }
        if(!node->is_string()) {
            throw InvalidTypeError(key, "string");
        }
        return node->as_string()->get();
    }

    std::string get_string(const toml::table& table, std::string_view key) {
        auto value = get_optional_string(table, key);
        if(!value.has_value()) {
            throw MissingKeyError(key);
        }
        return std::move(value.value());
    }

    std::optional<std::int64_t> get_optional_integer(const toml::table& table, std::string_view key) {
        const auto* node = table.get(key);
        if(node == nullptr) {
            return std::nullopt;
        }
        if(!node->is_integer()) {
            throw InvalidTypeError(key, "integer");
        }
        return node->as_integer()->get();
    }

    std::optional<Port> get_optional_port(const toml::table& table, std::string_view key) {
        const auto value = get_optional_integer(table, key);
        if(!value.has_value()) {
            return std::nullopt;
        }
        if(value.value() < 1 || value.value() > UINT16_MAX) {
            throw InvalidValueError(key, "port has to be between 1 and 65535");
        }
        return static_cast<Port>(value.value());
    }

    std::optional<asio::ip::address_v4> get_optional_address(const toml::table& table, std::string_view key) {
        const auto value = get_optional_string(table, key);
        if(!value.has_value()) {
            return std::nullopt;
        }
        asio::error_code ec {};
        const auto address = asio::ip::make_address_v4(value.value(), ec);
        if(ec) {
            throw InvalidValueError(key, quote(value.value()) + " is not an IPv4 address");
        }
        return address;
    }

    std::chrono::steady_clock::duration get_interval(const toml::table& table) {
        constexpr std::string_view key = "interval";
        const auto* node = table.get(key);
        if(node == nullptr) {
            return protocol::BEACON::DEFAULT_INTERVAL;
        }
        double seconds {};
        if(node->is_integer()) {
            seconds = static_cast<double>(node->as_integer()->get());
        } else if(node->is_floating_point()) {
            seconds = node->as_floating_point()->get();
        } else {
            throw InvalidTypeError(key, "number of seconds");
        }
        if(seconds < 0.) {
            throw InvalidValueError(key, "interval cannot be negative");
        }
        const auto interval = seconds_to_duration(seconds);
        if(!interval.has_value()) {
            throw InvalidValueError(key, "interval has to be a finite number of seconds within range");
        }
        return interval.value();
    }

    AnnouncementMode get_mode(const toml::table& table) {
        const auto mode_str = get_optional_string(table, "mode");
        const auto mode_type = mode_str.has_value() ? enum_cast<ModeType>(mode_str.value()) : PERIODIC;
        if(!mode_type.has_value()) {
            throw InvalidValueError("mode", "possible values are " + list_enum_names<ModeType>());
        }

        const auto interval = get_interval(table);
        std::size_t count {};
        if(mode_type.value() == LIMITED) {
            const auto count_value = get_optional_integer(table, "count");
            if(!count_value.has_value()) {
                throw MissingKeyError("count");
            }
            if(count_value.value() < 0) {
                throw InvalidValueError("count", "count cannot be negative");
            }
            count = static_cast<std::size_t>(count_value.value());
        }
        return make_mode(mode_type.value(), interval, count);
    }
} // namespace

SessionConfig::SessionConfig(std::string service_name,
                             std::string shared_key,
                             Port advertised_port,
                             AnnouncementMode mode,
                             Port port,
                             std::optional<asio::ip::address_v4> advertised_address,
                             asio::ip::address_v4 broadcast_address,
                             bool respond_to_requests)
    : service_name_(std::move(service_name)), shared_key_(std::move(shared_key)), advertised_port_(advertised_port),
      mode_(mode), port_(port), advertised_address_(advertised_address), broadcast_address_(broadcast_address),
      respond_to_requests_(respond_to_requests) {
    if(service_name_.empty()) {
        throw InvalidValueError("service", "service name cannot be empty");
    }
    if(shared_key_.empty()) {
        throw InvalidValueError("key", "shared key cannot be empty");
    }
    if(advertised_port_ == 0) {
        throw InvalidValueError("advertised_port", "port has to be between 1 and 65535");
    }
    if(port_ == 0) {
        throw InvalidValueError("port", "port has to be between 1 and 65535");
    }
    if(const auto* periodic = std::get_if<Periodic>(&mode_)) {
        if(periodic->interval <= std::chrono::steady_clock::duration::zero()) {
            throw InvalidValueError("interval", "periodic announcements require a positive interval");
        }
    } else if(const auto* limited = std::get_if<Limited>(&mode_)) {
        if(limited->interval < std::chrono::steady_clock::duration::zero()) {
            throw InvalidValueError("interval", "interval cannot be negative");
        }
        if(limited->count == 0) {
            throw InvalidValueError("count", "limited announcements require at least one announcement");
        }
    }
}

SessionConfig SessionConfig::fromToml(std::string_view toml) {
    toml::table tbl {};
    try {
        tbl = toml::parse(toml);
    } catch(const toml::parse_error& err) {
        std::stringstream s;
        s << err;
        throw ConfigFileParseError(s.str());
    }

    const auto* beacon_node = tbl.get("beacon");
    if(beacon_node == nullptr) {
        throw MissingKeyError("beacon");
    }
    if(!beacon_node->is_table()) {
        throw InvalidTypeError("beacon", "table");
    }
    const auto& table = *beacon_node->as_table();

    auto service = get_string(table, "service");
    auto key = get_string(table, "key");
    const auto advertised_port = get_optional_port(table, "advertised_port");
    if(!advertised_port.has_value()) {
        throw MissingKeyError("advertised_port");
    }
    const auto mode = get_mode(table);
    const auto port = get_optional_port(table, "port").value_or(protocol::BEACON::DEFAULT_PORT);
    const auto advertised_address = get_optional_address(table, "advertised_address");
    const auto broadcast_address =
        get_optional_address(table, "broadcast_address").value_or(asio::ip::address_v4::broadcast());

    bool respond_to_requests = false;
    if(const auto* node = table.get("respond_to_requests"); node != nullptr) {
        if(!node->is_boolean()) {
            throw InvalidTypeError("respond_to_requests", "bool");
        }
        respond_to_requests = node->as_boolean()->get();
    }

    // Warn about keys that have no effect
    table.for_each([](const toml::key& key, auto&& /*value*/) {
        static constexpr std::array<std::string_view, 10> known_keys {"service",
                                                                      "key",
                                                                      "port",
                                                                      "advertised_port",
                                                                      "mode",
                                                                      "interval",
                                                                      "count",
                                                                      "advertised_address",
                                                                      "broadcast_address",
                                                                      "respond_to_requests"};
        LOG_IF(get_logger(), WARNING, std::ranges::find(known_keys, key.str()) == known_keys.end())
            << "Ignoring unknown key " << std::quoted(key.str());
    });

    return {std::move(service),
            std::move(key),
            advertised_port.value(),
            mode,
            port,
            advertised_address,
            broadcast_address,
            respond_to_requests};
}

SessionConfig SessionConfig::fromFile(const std::filesystem::path& file_path) {
    std::error_code ec {};
    if(!std::filesystem::is_regular_file(file_path, ec)) {
        throw ConfigFileNotFoundError(file_path);
    }

    LOG(get_logger(), DEBUG) << "Parsing configuration file " << std::quoted(file_path.string());

    std::ifstream file(file_path);
    if(!file) {
        throw ConfigFileNotFoundError(file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return fromToml(buffer.str());
}

bool SessionConfig::isListening() const {
    return std::holds_alternative<OnRequest>(mode_) || respond_to_requests_;
}

beacon::log::Logger& SessionConfig::get_logger() {
    static log::Logger logger {"CONFIG"};
    return logger;
}
