/**
 * @file
 * @brief Root of the Beacon exception hierarchy
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

/**
 * @defgroup Exceptions Exception classes
 * @brief Exceptions thrown by Beacon
 */

#pragma once

#include <exception>
#include <string>
#include <utility>

#include "beacon/build.hpp"

namespace beacon::utils {

    /**
     * @ingroup Exceptions
     * @brief Base class of every exception thrown by Beacon
     *
     * Derived exceptions without a message argument assemble `error_message_` in their constructor.
     */
    class BCN_API Exception : public std::exception {
    public:
        explicit Exception(std::string what_arg) : error_message_(std::move(what_arg)) {}

        const char* what() const noexcept override { return error_message_.c_str(); }

    protected:
        Exception() = default;

        // NOLINTNEXTLINE(misc-non-private-member-variables-in-classes)
        std::string error_message_;
    };

    /**
     * @ingroup Exceptions
     * @brief Error caused by the environment, such as the network, received data or configuration input
     */
    class BCN_API RuntimeError : public Exception {
    public:
        explicit RuntimeError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        RuntimeError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Error caused by using an API incorrectly, such as starting a scheduler twice
     */
    class BCN_API LogicError : public Exception {
    public:
        explicit LogicError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        LogicError() = default;
    };

} // namespace beacon::utils
