/**
 * @file
 * @brief Exceptions of the executables
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <utility>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"

namespace beacon::exec {

    /**
     * @ingroup Exceptions
     * @brief Error while parsing the command line
     */
    class BCN_API CommandLineInterfaceError : public utils::RuntimeError {
    public:
        explicit CommandLineInterfaceError(std::string what_arg) : RuntimeError(std::move(what_arg)) {}
    };

} // namespace beacon::exec
