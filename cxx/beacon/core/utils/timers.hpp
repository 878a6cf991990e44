/**
 * @file
 * @brief Timer utilities
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

namespace beacon::utils {

    /** Timer that can be used to wait for timeouts */
    class TimeoutTimer {
    public:
        TimeoutTimer(std::chrono::steady_clock::duration timeout) : timeout_(timeout) {}
        void reset() { start_time_ = std::chrono::steady_clock::now(); }
        bool timeoutReached() const { return start_time_ + timeout_ <= std::chrono::steady_clock::now(); }
        std::chrono::steady_clock::time_point startTime() const { return start_time_; }

        /** Time left until the timeout is reached, zero if already reached */
        std::chrono::steady_clock::duration remaining() const {
            const auto left = start_time_ + timeout_ - std::chrono::steady_clock::now();
            return std::max(left, std::chrono::steady_clock::duration::zero());
        }

    private:
        std::chrono::steady_clock::time_point start_time_ {std::chrono::steady_clock::now()};
        std::chrono::steady_clock::duration timeout_;
    };

    /**
     * @brief Convert a number of seconds to a steady clock duration
     *
     * @return Duration, or empty if the value is not finite or exceeds the range of the clock
     */
    inline std::optional<std::chrono::steady_clock::duration> seconds_to_duration(double seconds) {
        const std::chrono::duration<double, std::chrono::steady_clock::period> value =
            std::chrono::duration<double>(seconds);
        // The tick count is exact in double here, so a strict bound keeps the integer cast defined
        if(!std::isfinite(value.count()) ||
           std::abs(value.count()) >= static_cast<double>(std::chrono::steady_clock::duration::max().count())) {
            return std::nullopt;
        }
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(value);
    }

} // namespace beacon::utils
