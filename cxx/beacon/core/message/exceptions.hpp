/**
 * @file
 * @brief Message decoding exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"

namespace beacon::message {

    /**
     * @ingroup Exceptions
     * @brief Error thrown when a received message could not be decoded
     */
    class BCN_API MessageDecodingError : public utils::RuntimeError {
    public:
        explicit MessageDecodingError(std::string_view reason) {
            error_message_ = "Error decoding message: ";
            error_message_ += reason;
        }

    protected:
        MessageDecodingError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Message is not a JSON object of the expected shape
     */
    class BCN_API MalformedMessageError : public MessageDecodingError {
    public:
        explicit MalformedMessageError(std::string_view reason) {
            error_message_ = "Malformed message: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Mandatory field is absent from a message
     */
    class BCN_API MissingFieldError : public MessageDecodingError {
    public:
        explicit MissingFieldError(std::string_view field) : field_(field) {
            error_message_ = "Message is missing mandatory field \"";
            error_message_ += field;
            error_message_ += "\"";
        }

        /** Name of the missing field */
        const std::string& getField() const { return field_; }

    private:
        std::string field_;
    };

} // namespace beacon::message
