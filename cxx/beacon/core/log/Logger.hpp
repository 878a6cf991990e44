/**
 * @file
 * @brief Logger
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <memory>
#include <source_location>
#include <sstream>
#include <string_view>
#include <utility>

#include <spdlog/async_logger.h>

#include "beacon/build.hpp"
#include "beacon/core/log/Level.hpp"

namespace beacon::log {

    /**
     * Topic logger of the scheduler, the client and the executables
     *
     * Messages are streamed with `<<` via the `LOG` macros and handed to the asynchronous spdlog logger of the topic,
     * which is shared by all loggers with the same topic.
     */
    class Logger {
    public:
        /** Collects a streamed message and logs it when the statement ends */
        class LogStream final : public std::ostringstream {
        public:
            LogStream(const Logger& logger, Level level, std::source_location src_loc)
                : logger_(logger), level_(level), src_loc_(src_loc) {}
            ~LogStream() final { logger_.write(level_, this->view(), src_loc_); } // NOLINT(bugprone-exception-escape)

            /// @cond doxygen_suppress
            LogStream(const LogStream& other) = delete;
            LogStream& operator=(const LogStream& other) = delete;
            LogStream(LogStream&& other) = delete;
            LogStream& operator=(LogStream&& other) = delete;
            /// @endcond

        private:
            const Logger& logger_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
            Level level_;
            std::source_location src_loc_;
        };

        /**
         * @param topic Topic of the logger, log levels of topics are matched case-insensitive
         */
        BCN_API explicit Logger(std::string_view topic);

        /** Logger without topic used by `LOG(level)` */
        BCN_API static Logger& getDefault();

        BCN_API ~Logger();

        /// @cond doxygen_suppress
        Logger(const Logger& other) = delete;
        Logger& operator=(const Logger& other) = delete;
        Logger(Logger&& other) = delete;
        Logger& operator=(Logger&& other) = delete;
        /// @endcond

        bool shouldLog(Level level) const { return spdlog_logger_->should_log(to_spdlog_level(level)); }

        /** Level currently applied to the topic, either the global level or its topic override */
        Level getLogLevel() const { return from_spdlog_level(spdlog_logger_->level()); }

        /**
         * @param level Level of the message
         * @param src_loc Location reported with the message
         * @return Stream that logs its content when destroyed
         */
        LogStream log(Level level, std::source_location src_loc = std::source_location::current()) const {
            return {*this, level, src_loc};
        }

        /**
         * @brief Flush the console sinks
         *
         * Pending messages are handed to the sinks by the spdlog thread pool, this waits briefly for them first.
         */
        BCN_API void flush();

    private:
        explicit Logger(std::shared_ptr<spdlog::async_logger> spdlog_logger) : spdlog_logger_(std::move(spdlog_logger)) {}

        void write(Level level, std::string_view message, std::source_location src_loc) const {
            spdlog_logger_->log({src_loc.file_name(), static_cast<int>(src_loc.line()), src_loc.function_name()},
                                to_spdlog_level(level),
                                message);
        }

        std::shared_ptr<spdlog::async_logger> spdlog_logger_;
    };

} // namespace beacon::log
