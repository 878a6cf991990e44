/**
 * @file
 * @brief Implementation of Logger
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <string_view>
#include <thread>

#include "beacon/core/log/SinkManager.hpp"

using namespace beacon::log;
using namespace std::chrono_literals;

Logger::Logger(std::string_view topic) : Logger(SinkManager::getInstance().getLogger(topic)) {}

Logger& Logger::getDefault() {
    // Destroyed and thus flushed at exit
    static Logger default_logger {SinkManager::getInstance().getDefaultLogger()};
    return default_logger;
}

Logger::~Logger() {
    flush();
}

void Logger::flush() {
    // Give the thread pool a moment to pass on queued messages
    std::this_thread::sleep_for(1ms);
    std::ranges::for_each(spdlog_logger_->sinks(), [](const auto& sink) { sink->flush(); });
}
