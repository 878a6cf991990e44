/**
 * @file
 * @brief Executable discovering services on the local network
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "beacon/exec/cli.hpp"
#include "beacon/exec/discover.hpp"

using namespace beacon::exec;

int main(int argc, char* argv[]) {
    return discover_main(to_span(argc, argv), "beacon_discover");
}
