/**
 * @file
 * @brief Collection of all configuration exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string_view>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/utils/exceptions.hpp"

namespace lnhrdac::config {

    /**
     * @ingroup Exceptions
     * @brief Base class for all configuration exceptions
     */
    class LNHRDAC_API ConfigurationError : public utils::RuntimeError {
    protected:
        ConfigurationError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Key not found in configuration
     *
     * Indicates that a requested key is not defined in the configuration and no default value was provided.
     */
    class LNHRDAC_API MissingKeyError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a missing key
         * @param key Name of the missing key
         */
        explicit MissingKeyError(std::string_view key) {
            error_message_ = "Key \"";
            error_message_ += key;
            error_message_ += "\" does not exist";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Invalid type of a configuration value
     *
     * Indicates that a value cannot be converted to the type requested by the caller.
     */
    class LNHRDAC_API InvalidTypeError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a value with an invalid type
         * @param key Name of the corresponding key
         * @param vtype Type of the stored value
         * @param type Requested type
         */
        InvalidTypeError(std::string_view key, std::string_view vtype, std::string_view type) {
            error_message_ = "Could not convert value of type \"";
            error_message_ += vtype;
            error_message_ += "\" to type \"";
            error_message_ += type;
            error_message_ += "\" for key \"";
            error_message_ += key;
            error_message_ += "\"";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Invalid value of a configuration key
     *
     * Indicates that a value has the correct type but is not acceptable, e.g. out of range.
     */
    class LNHRDAC_API InvalidValueError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for an invalid value
         * @param key Name of the corresponding key
         * @param value Value as string
         * @param reason Reason why the value is invalid
         */
        InvalidValueError(std::string_view key, std::string_view value, std::string_view reason) {
            error_message_ = "Value ";
            error_message_ += value;
            error_message_ += " of key \"";
            error_message_ += key;
            error_message_ += "\" is not valid: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Configuration file could not be read or parsed
     */
    class LNHRDAC_API ConfigFileError : public ConfigurationError {
    public:
        /**
         * @brief Construct an error for a configuration file
         * @param source File name and position of the problem
         * @param issue Description of the problem
         */
        ConfigFileError(std::string_view source, std::string_view issue) {
            error_message_ = "Error parsing configuration \"";
            error_message_ += source;
            error_message_ += "\": ";
            error_message_ += issue;
        }
    };

} // namespace lnhrdac::config
