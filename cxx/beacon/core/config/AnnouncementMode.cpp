/**
 * @file
 * @brief Implementation of the announcement modes
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "AnnouncementMode.hpp"

#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <variant>

#include "beacon/core/utils/string.hpp"

using namespace beacon::config;
using namespace beacon::utils;

ModeType beacon::config::get_mode_type(const AnnouncementMode& mode) {
    return static_cast<ModeType>(mode.index());
}

AnnouncementMode beacon::config::make_mode(ModeType type, std::chrono::steady_clock::duration interval, std::size_t count) {
    if(type == ON_REQUEST) {
        return OnRequest {};
    }
    if(type == LIMITED) {
        return Limited {interval, count};
    }
    return Periodic {interval};
}

bool beacon::config::is_broadcasting(const AnnouncementMode& mode) {
    return !std::holds_alternative<OnRequest>(mode);
}

std::string beacon::config::to_string(const AnnouncementMode& mode) {
    auto out = transform(enum_name(get_mode_type(mode)), ::tolower);
    if(const auto* periodic = std::get_if<Periodic>(&mode)) {
        out += " (every " + utils::to_string(periodic->interval) + ")";
    } else if(const auto* limited = std::get_if<Limited>(&mode)) {
        out += " (" + utils::to_string(limited->count) + " times every " + utils::to_string(limited->interval) + ")";
    }
    return out;
}
