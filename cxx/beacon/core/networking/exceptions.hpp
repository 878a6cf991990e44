/**
 * @file
 * @brief Network communication exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"

namespace beacon::networking {

    /**
     * @ingroup Exceptions
     * @brief Errors related to network communication
     */
    class BCN_API NetworkError : public utils::RuntimeError {
    public:
        /**
         * @brief Creates exception with the given network problem
         * @param what_arg Text describing the problem
         */
        explicit NetworkError(std::string what_arg) : RuntimeError(std::move(what_arg)) {}

    protected:
        /**
         * @brief Internal constructor for exceptions setting the error message indirectly
         */
        NetworkError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief No network interface is suitable to determine the local address
     */
    class BCN_API ResolutionError : public NetworkError {
    public:
        explicit ResolutionError(std::string_view reason) {
            error_message_ = "Unable to resolve local IPv4 address: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief A socket could not be opened or bound
     */
    class BCN_API BindError : public NetworkError {
    public:
        explicit BindError(std::string_view address, Port port, std::string_view reason) {
            error_message_ = "Unable to bind socket to ";
            error_message_ += address;
            error_message_ += ":";
            error_message_ += utils::to_string(port);
            error_message_ += ": ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Sending a datagram failed
     */
    class BCN_API SendError : public NetworkError {
    public:
        explicit SendError(std::string_view target, std::string_view reason) {
            error_message_ = "Failed sending to ";
            error_message_ += target;
            error_message_ += ": ";
            error_message_ += reason;
        }
    };

} // namespace beacon::networking
