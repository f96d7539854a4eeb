/**
 * @file
 * @brief Configuration class
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/config/Value.hpp"

namespace lnhrdac::config {

    /**
     * @brief Generic configuration object storing keys
     *
     * The configuration stores values of a small set of types (see `Value`) and converts them on access:
     * integers to any integral type with range check, integers to floating point, strings to enums.
     */
    class Configuration {
    public:
        Configuration() = default;

        /**
         * @brief Check if key is defined
         * @param key Key to check for existence
         * @return True if key exists, false otherwise
         */
        LNHRDAC_API bool has(std::string_view key) const;

        /**
         * @brief Get value of a key in requested type
         *
         * @param key Key to get value of
         * @return Value of the key in the type of the requested template parameter
         * @throws MissingKeyError If the requested key is not defined
         * @throws InvalidTypeError If the conversion to the requested type did not succeed
         * @throws InvalidValueError If the value is out of range for the requested type
         */
        template <typename T> T get(std::string_view key) const;

        /**
         * @brief Get value of a key in requested type or default value if it does not exists
         *
         * @param key Key to get value of
         * @param def Default value to use if key is not defined
         * @return Value of the key in the type of the requested template parameter
         */
        template <typename T> T get(std::string_view key, const T& def) const;

        /**
         * @brief Set value for a key in a given type
         *
         * @param key Key to set value of
         * @param val Value to assign to the key
         */
        template <typename T> void set(std::string key, const T& val);

        /**
         * @brief Set default value for a key only if it is not defined yet
         *
         * @param key Key to possibly set value of
         * @param val Value to assign if the key is not defined yet
         */
        template <typename T> void setDefault(std::string key, const T& val);

        /**
         * @brief Get all keys of the configuration
         */
        LNHRDAC_API std::vector<std::string> getKeys() const;

        /**
         * @brief Number of keys in the configuration
         */
        std::size_t size() const { return values_.size(); }

    private:
        LNHRDAC_API const Value& at(std::string_view key) const;

    private:
        std::map<std::string, Value, std::less<>> values_;
    };

} // namespace lnhrdac::config

// Include template members
#include "Configuration.ipp" // IWYU pragma: keep
