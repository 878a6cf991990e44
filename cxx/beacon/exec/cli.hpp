/**
 * @file
 * @brief Command-line interface parser
 *
 * @copyright Copyright (c) 2025 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <argparse/argparse.hpp>
#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/config/SessionConfig.hpp"
#include "beacon/core/log/Level.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::exec {

    /**
     * @brief Cast C-style main argument to C++ span
     *
     * @param argc Argument count
     * @param argv Pointer to arguments
     * @return Span of arguments
     */
    inline std::span<const char*> to_span(int argc, char** argv) {
        return {const_cast<const char**>(argv), static_cast<std::size_t>(argc)};
    };

    class BCN_API BaseParser : protected argparse::ArgumentParser {
    public:
        struct BaseOptions {
            /** Console log level */
            log::Level log_level;
        };

    public:
        /**
         * @brief Construct a new parser
         *
         * @param program Name of the program to display in help
         */
        BaseParser(std::string program);

        virtual ~BaseParser() = default;

        /// @cond doxygen_suppress
        // No copy/move constructor/assignment
        BaseParser(const BaseParser& other) = delete;
        BaseParser& operator=(const BaseParser& other) = delete;
        BaseParser(BaseParser&& other) = delete;
        BaseParser& operator=(BaseParser&& other) = delete;
        /// @endcond

        /**
         * @brief Add the CLI options to the parser
         *
         * This add the `--level` option
         *
         * @note Inheriting classes might override this function but have to call `BaseParser::setup()` to add the CLI
         *       options from the base parser.
         */
        virtual void setup();

        /**
         * @brief Parse options from the command line
         *
         * @note Inheriting classes might override this function but have to call `BaseParser::parse()` to add parse the
         *       options from the base parser.
         *
         * @return Parsed options
         * @throws CommandLineInterfaceError If the arguments cannot be parsed
         */
        BaseOptions parse(std::span<const char*> args);

        /**
         * @brief Get program help
         *
         * @return String containing the program help
         */
        std::string help() const;

    protected:
        /**
         * @brief Parse the value of an argument as IPv4 address
         *
         * @param name Name of the argument
         * @param value Value of the argument
         * @return Parsed address
         * @throws CommandLineInterfaceError If the value is not an IPv4 address
         */
        static asio::ip::address_v4 parse_address(std::string_view name, const std::string& value);
    };

    class BCN_API AnnounceParser : public BaseParser {
    public:
        struct AnnounceOptions : BaseOptions {
            /** Session to announce */
            config::SessionConfig session;
        };

    public:
        /**
         * @brief Construct a new parser
         *
         * @param program Name of the program to display in help
         */
        AnnounceParser(std::string program);

        virtual ~AnnounceParser() = default;

        /// @cond doxygen_suppress
        // No copy/move constructor/assignment
        AnnounceParser(const AnnounceParser& other) = delete;
        AnnounceParser& operator=(const AnnounceParser& other) = delete;
        AnnounceParser(AnnounceParser&& other) = delete;
        AnnounceParser& operator=(AnnounceParser&& other) = delete;
        /// @endcond

        /**
         * @brief Add the CLI options to the parser
         *
         * This adds the `--config` option to read the session from a TOML file, and options to define the session
         * directly in addition to the options from the `BaseParser`.
         */
        void setup() override;

        /**
         * @brief Parse options from the command line
         *
         * @return Parsed options
         * @throws CommandLineInterfaceError If the arguments cannot be parsed
         * @throws config::ConfigurationError If the session configuration is invalid
         */
        AnnounceOptions parse(std::span<const char*> args);
    };

    class BCN_API DiscoverParser : public BaseParser {
    public:
        /** How to discover services */
        enum class Method : std::uint8_t {
            /** Listen for broadcast announcements */
            PASSIVE,
            /** Send a discovery request and wait for replies */
            ACTIVE,
        };

        struct DiscoverOptions : BaseOptions {
            /** Expected shared key */
            std::string key;

            /** Announcement port */
            networking::Port port;

            /** Address to which discovery requests are sent */
            asio::ip::address_v4 broadcast_address;

            /** Only accept announcements for this service */
            std::optional<std::string> service;

            /** Time to wait for announcements */
            std::chrono::steady_clock::duration timeout;

            /** Discovery method */
            Method method;

            /** Whether to collect all services within the timeout instead of returning the first */
            bool all;
        };

    public:
        /**
         * @brief Construct a new parser
         *
         * @param program Name of the program to display in help
         */
        DiscoverParser(std::string program);

        virtual ~DiscoverParser() = default;

        /// @cond doxygen_suppress
        // No copy/move constructor/assignment
        DiscoverParser(const DiscoverParser& other) = delete;
        DiscoverParser& operator=(const DiscoverParser& other) = delete;
        DiscoverParser(DiscoverParser&& other) = delete;
        DiscoverParser& operator=(DiscoverParser&& other) = delete;
        /// @endcond

        /**
         * @brief Add the CLI options to the parser
         *
         * This add the `--key`, `--port`, `--broadcast`, `--service`, `--timeout`, `--method` and `--all` options in
         * addition to the options from the `BaseParser`.
         */
        void setup() override;

        /**
         * @brief Parse options from the command line
         *
         * @return Parsed options
         * @throws CommandLineInterfaceError If the arguments cannot be parsed
         */
        DiscoverOptions parse(std::span<const char*> args);
    };

} // namespace beacon::exec
