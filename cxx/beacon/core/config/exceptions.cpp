/**
 * @file
 * @brief Implementation of configuration exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "exceptions.hpp"

#include <filesystem>
#include <string_view>

#include "beacon/core/utils/string.hpp"

using namespace beacon::config;
using namespace beacon::utils;

MissingKeyError::MissingKeyError(std::string_view key) {
    error_message_ = "Key " + quote(key) + " does not exist";
}

InvalidTypeError::InvalidTypeError(std::string_view key, std::string_view type) {
    error_message_ = "Could not convert value to type " + quote(type) + " for key " + quote(key);
}

InvalidValueError::InvalidValueError(std::string_view key, std::string_view reason) {
    error_message_ = "Value of key " + quote(key) + " is not valid: ";
    error_message_ += reason;
}

ConfigFileNotFoundError::ConfigFileNotFoundError(const std::filesystem::path& file_name) {
    error_message_ = "Could not read configuration file " + quote(file_name.string());
}

ConfigFileParseError::ConfigFileParseError(std::string_view error) {
    error_message_ = "Could not parse content of configuration file: ";
    error_message_ += error;
}
