/**
 * @file
 * @brief Log Sink Manager
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "beacon/build.hpp"
#include "beacon/core/log/Level.hpp"

namespace beacon::log {
    /**
     * @brief Global sink manager
     *
     * This class manages the console sink and creates new spdlog loggers. All loggers share a single asynchronous thread
     * pool, such that logging never blocks the network loops for longer than queueing the message.
     */
    class SinkManager {
    private:
        // Formatter for the log level (overwrites spdlog defaults)
        class BeaconLevelFormatter : public spdlog::custom_flag_formatter {
        public:
            BeaconLevelFormatter(bool format_short);
            void format(const spdlog::details::log_msg& msg, const std::tm& tm, spdlog::memory_buf_t& dest) override;
            std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;

        private:
            bool format_short_;
        };

        // Formatter for the topic (adds brackets except for the default logger)
        class BeaconTopicFormatter : public spdlog::custom_flag_formatter {
        public:
            void format(const spdlog::details::log_msg& msg, const std::tm& tm, spdlog::memory_buf_t& dest) override;
            std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
        };

    public:
        /**
         * @brief Get the global instance of the sink manager
         */
        BCN_API static SinkManager& getInstance();

        /// @cond doxygen_suppress
        SinkManager(const SinkManager& other) = delete;
        SinkManager& operator=(const SinkManager& other) = delete;
        SinkManager(SinkManager&& other) = delete;
        SinkManager& operator=(SinkManager&& other) = delete;
        /// @endcond

        BCN_API ~SinkManager();

        /**
         * @brief Get an asynchronous spdlog logger with a given topic
         *
         * This creates a new logger if no logger with the given topic exists
         *
         * @param topic Topic of the logger
         * @return Shared pointer to the logger
         */
        BCN_API std::shared_ptr<spdlog::async_logger> getLogger(std::string_view topic);

        /**
         * @brief Return the default logger
         */
        std::shared_ptr<spdlog::async_logger> getDefaultLogger() const { return default_logger_; }

        /**
         * @brief Set the console log levels
         *
         * @param global_level Global log level for console output
         * @param topic_levels Log level overwrites for specific topics (upper case)
         */
        BCN_API void setConsoleLevels(Level global_level, std::map<std::string, Level> topic_levels = {});

        /**
         * @brief Get the global console log level
         */
        BCN_API Level getGlobalConsoleLevel();

    private:
        SinkManager();

        /**
         * @brief Create a new asynchronous spdlog logger
         *
         * @param topic Topic of the logger
         * @return Shared pointer to the new logger
         */
        std::shared_ptr<spdlog::async_logger> create_logger(std::string_view topic);

        /**
         * @brief Calculate the console log level for a particular logger given the current topic overwrites
         *
         * @param logger Logger for which to set the log level
         */
        void calculate_log_level(std::shared_ptr<spdlog::async_logger>& logger);

    private:
        std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;

        std::shared_ptr<spdlog::async_logger> default_logger_;

        std::vector<std::shared_ptr<spdlog::async_logger>> loggers_;
        std::mutex loggers_mutex_;

        Level console_global_level_;
        std::map<std::string, Level> console_topic_levels_;
        std::mutex levels_mutex_;
    };
} // namespace beacon::log
