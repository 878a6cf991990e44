/**
 * @file
 * @brief Network port definition
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>

namespace beacon::networking {

    /** Port number for a network connection */
    using Port = std::uint16_t;

} // namespace beacon::networking
