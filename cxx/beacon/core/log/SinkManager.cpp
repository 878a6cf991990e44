/**
 * @file
 * @brief Implementation of the Log Sink Manager
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SinkManager.hpp"

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "beacon/core/log/Level.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::log;
using namespace beacon::utils;

SinkManager::BeaconLevelFormatter::BeaconLevelFormatter(bool format_short) : format_short_(format_short) {}

void SinkManager::BeaconLevelFormatter::format(const spdlog::details::log_msg& msg,
                                               const std::tm& /*tm*/,
                                               spdlog::memory_buf_t& dest) {
    auto level_name = to_string(from_spdlog_level(msg.level));
    if(format_short_) {
        // Short format: only first letter
        level_name = level_name.substr(0, 1);
    } else {
        // Long format: pad to 8 characters
        level_name.insert(0, 8 - level_name.size(), ' ');
    }
    dest.append(level_name.data(), level_name.data() + level_name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> SinkManager::BeaconLevelFormatter::clone() const {
    return std::make_unique<BeaconLevelFormatter>(format_short_);
}

void SinkManager::BeaconTopicFormatter::format(const spdlog::details::log_msg& msg,
                                               const std::tm& /*tm*/,
                                               spdlog::memory_buf_t& dest) {
    if(msg.logger_name.size() > 0) { // NOLINT(readability-container-size-empty) might be fmt string
        auto topic = "[" + std::string(msg.logger_name.data(), msg.logger_name.size()) + "]";
        dest.append(topic.data(), topic.data() + topic.size());
    }
}

std::unique_ptr<spdlog::custom_flag_formatter> SinkManager::BeaconTopicFormatter::clone() const {
    return std::make_unique<BeaconTopicFormatter>();
}

SinkManager& SinkManager::getInstance() {
    static SinkManager instance {};
    return instance;
}

SinkManager::SinkManager() : console_global_level_(INFO) {
    // Own thread pool with 1k queue size on 1 thread, kept alive as long as the manager
    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(1000, 1);

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(to_spdlog_level(TRACE));

    // Set console format, e.g. |2024-01-10 00:16:40.922| WARNING [SCHEDULER] message
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<BeaconLevelFormatter>('l', false);
    formatter->add_flag<BeaconLevelFormatter>('L', true);
    formatter->add_flag<BeaconTopicFormatter>('n');
    formatter->set_pattern("|%Y-%m-%d %H:%M:%S.%e| %^%l%$ %n %v");
    console_sink_->set_formatter(std::move(formatter));

    console_sink_->set_color(to_spdlog_level(CRITICAL), "\x1B[31;1m"); // Bold red
    console_sink_->set_color(to_spdlog_level(STATUS), "\x1B[32;1m");   // Bold green
    console_sink_->set_color(to_spdlog_level(WARNING), "\x1B[33;1m");  // Bold yellow
    console_sink_->set_color(to_spdlog_level(INFO), "\x1B[36;1m");     // Bold cyan
    console_sink_->set_color(to_spdlog_level(DEBUG), "\x1B[36m");      // Cyan
    console_sink_->set_color(to_spdlog_level(TRACE), "\x1B[90m");      // Grey

    // Default logger has no topic
    default_logger_ = create_logger("");
}

SinkManager::~SinkManager() {
    const std::lock_guard loggers_lock {loggers_mutex_};
    console_sink_->flush();
    loggers_.clear();
    default_logger_.reset();
}

std::shared_ptr<spdlog::async_logger> SinkManager::getLogger(std::string_view topic) {
    const auto topic_uc = transform(topic, ::toupper);

    std::unique_lock loggers_lock {loggers_mutex_};
    for(const auto& logger : loggers_) {
        if(logger->name() == topic_uc) {
            return logger;
        }
    }
    loggers_lock.unlock();
    return create_logger(topic_uc);
}

std::shared_ptr<spdlog::async_logger> SinkManager::create_logger(std::string_view topic) {
    auto logger = std::make_shared<spdlog::async_logger>(transform(topic, ::toupper),
                                                         console_sink_,
                                                         thread_pool_,
                                                         spdlog::async_overflow_policy::overrun_oldest);

    std::unique_lock loggers_lock {loggers_mutex_};
    loggers_.push_back(logger);
    loggers_lock.unlock();

    calculate_log_level(logger);

    return logger;
}

void SinkManager::calculate_log_level(std::shared_ptr<spdlog::async_logger>& logger) {
    const std::lock_guard levels_lock {levels_mutex_};

    Level new_level = console_global_level_;
    const auto topic_it = console_topic_levels_.find(logger->name());
    if(topic_it != console_topic_levels_.end()) {
        new_level = topic_it->second;
    }

    logger->set_level(to_spdlog_level(new_level));
}

void SinkManager::setConsoleLevels(Level global_level, std::map<std::string, Level> topic_levels) {
    std::unique_lock levels_lock {levels_mutex_};
    console_global_level_ = global_level;
    console_topic_levels_.clear();
    for(auto& [topic, level] : topic_levels) {
        console_topic_levels_.emplace(transform(topic, ::toupper), level);
    }
    levels_lock.unlock();

    // Re-calculate the log level for every logger
    const std::lock_guard loggers_lock {loggers_mutex_};
    for(auto& logger : loggers_) {
        calculate_log_level(logger);
    }
}

Level SinkManager::getGlobalConsoleLevel() {
    const std::lock_guard levels_lock {levels_mutex_};
    return console_global_level_;
}
