/**
 * @file
 * @brief Main function for the discovering executable
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <span>
#include <string_view>

#include "beacon/build.hpp"

namespace beacon::exec {

    /**
     * @brief Main function discovering services and printing them to stdout
     *
     * @param args Command line arguments
     * @param program Name of the program
     * @return Exit code, non-zero if no service was discovered
     */
    BCN_API int discover_main(std::span<const char*> args, std::string_view program) noexcept;

} // namespace beacon::exec
