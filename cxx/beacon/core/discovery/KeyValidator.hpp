/**
 * @file
 * @brief Validation of the shared key of announcements
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string_view>

namespace beacon::discovery {

    /**
     * @brief Check if the key of a received announcement matches the expected key
     *
     * The comparison is an exact, case-sensitive string comparison. The key only filters announcements of unrelated
     * services on the same network, it does not protect against an attacker who can read the traffic.
     *
     * @param received Key carried by the announcement
     * @param expected Key the client was configured with
     * @return True if both keys are identical
     */
    constexpr bool validate_key(std::string_view received, std::string_view expected) noexcept {
        return received == expected;
    }

} // namespace beacon::discovery
