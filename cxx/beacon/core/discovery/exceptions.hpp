/**
 * @file
 * @brief Discovery exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"

namespace beacon::discovery {

    /**
     * @ingroup Exceptions
     * @brief No announcement with a valid key was received in time
     */
    class BCN_API DiscoveryTimeoutError : public utils::RuntimeError {
    public:
        explicit DiscoveryTimeoutError(std::chrono::steady_clock::duration timeout) {
            error_message_ = "No valid announcement received within ";
            error_message_ += utils::to_string(timeout);
        }
    };

} // namespace beacon::discovery
