/**
 * @file
 * @brief Log macros
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "beacon/core/log/Level.hpp"  // IWYU pragma: export
#include "beacon/core/log/Logger.hpp" // IWYU pragma: keep

using enum beacon::log::Level; // Forward log level enum

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// @cond doxygen_suppress

#define LOG_TO(logger, level)                                                                                               \
    if((logger).shouldLog(level))                                                                                           \
    (logger).log(level)

#define LOG_DEFAULT(level) LOG_TO(beacon::log::Logger::getDefault(), level)

#define LOG_IF_TO(logger, level, condition)                                                                                 \
    if((logger).shouldLog(level) && (condition))                                                                            \
    (logger).log(level)

#define LOG_IF_DEFAULT(level, condition) LOG_IF_TO(beacon::log::Logger::getDefault(), level, condition)

/* Pick the variant with explicit logger if one more argument is given */
#define LOG_SELECT(_1, _2, NAME, ...) NAME
#define LOG_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/// @endcond

/**
 * Logs a message for a given level, as `LOG(level)` to the default logger or as `LOG(logger, level)` to a
 * \ref beacon::log::Logger. Nothing after `<<` is evaluated if the level is disabled.
 */
#define LOG(...) LOG_SELECT(__VA_ARGS__, LOG_TO, LOG_DEFAULT, )(__VA_ARGS__)

/**
 * Logs a message only if a condition holds, as `LOG_IF(level, condition)` or `LOG_IF(logger, level, condition)`.
 * The condition is not evaluated if the level is disabled.
 */
#define LOG_IF(...) LOG_IF_SELECT(__VA_ARGS__, LOG_IF_TO, LOG_IF_DEFAULT, )(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
