/**
 * @file
 * @brief Thread utilities
 *
 * @copyright Copyright (c) 2025 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <thread>

#ifdef __linux__
#include <pthread.h>
#endif

namespace beacon::utils {

    /** Name a thread for debuggers and `top`, truncated to the 15 characters Linux allows */
    inline void set_thread_name([[maybe_unused]] std::jthread& thread, [[maybe_unused]] const std::string& name) {
#ifdef __linux__
        pthread_setname_np(thread.native_handle(), name.substr(0, 15).c_str());
#endif
    }

} // namespace beacon::utils
