/**
 * @file
 * @brief Collection of all configuration exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string_view>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"

namespace beacon::config {

    /**
     * @ingroup Exceptions
     * @brief Base class for all configurations exceptions
     */
    class BCN_API ConfigurationError : public utils::RuntimeError {};

    /**
     * @ingroup Exceptions
     * @brief Informs of a missing key that should have been defined
     */
    class BCN_API MissingKeyError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a missing key
         * @param key Name of the problematic key
         */
        explicit MissingKeyError(std::string_view key);
    };

    /**
     * @ingroup Exceptions
     * @brief Indicates a problem converting the value of a configuration key to the value it should represent
     */
    class BCN_API InvalidTypeError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a value with an invalid type
         * @param key Name of the problematic key
         * @param type Type the value should have been converted to
         */
        InvalidTypeError(std::string_view key, std::string_view type);
    };

    /**
     * @ingroup Exceptions
     * @brief Indicates an error with the contents of value
     *
     * Should be raised if the data contains valid data for its type (otherwise an \ref InvalidTypeError should have been
     * raised earlier), but the value is not in the range of allowed values.
     */
    class BCN_API InvalidValueError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for an invalid value
         * @param key Name of the problematic key
         * @param reason Reason why the value is invalid
         */
        InvalidValueError(std::string_view key, std::string_view reason);
    };

    /**
     * @ingroup Exceptions
     * @brief Notifies of a missing configuration file
     */
    class BCN_API ConfigFileNotFoundError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a configuration that is not found
         * @param file_name Name of the configuration file
         */
        explicit ConfigFileNotFoundError(const std::filesystem::path& file_name);
    };

    /**
     * @ingroup Exceptions
     * @brief Error with parsing the file content to TOML
     */
    class BCN_API ConfigFileParseError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a configuration that cannot correctly be parsed as TOML
         * @param error Error message returned by the TOML parser
         */
        explicit ConfigFileParseError(std::string_view error);
    };

} // namespace beacon::config
