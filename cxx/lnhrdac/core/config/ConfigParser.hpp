/**
 * @file
 * @brief Configuration file parser
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/config/Configuration.hpp"

namespace lnhrdac::config {

    /**
     * @brief Reader class for configuration files
     *
     * Read TOML configuration file and provide access methods to obtain the configuration of individual devices. Each
     * top-level table is one configuration, keys outside of any table form the header configuration:
     *
     * @code{.toml}
     * log_level = "DEBUG"
     *
     * [dac]
     * host = "192.168.0.5"
     * port = 23
     * @endcode
     */
    class ConfigParser {
    public:
        /**
         * @brief Constructs a config parser from a file
         * @param file Path to the TOML file
         * @throws ConfigFileError If the file cannot be read or is not valid TOML
         */
        LNHRDAC_API explicit ConfigParser(const std::filesystem::path& file);

        /**
         * @brief Constructs a config parser from a TOML document in memory
         * @param content TOML document
         * @param source Name of the source used in error messages
         */
        LNHRDAC_API static ConfigParser fromString(std::string_view content, std::string_view source = "string");

        /**
         * @brief Check if a configuration exists
         * @param name Name of a configuration table to search for
         * @return True if a table with this name exists, false otherwise
         */
        LNHRDAC_API bool hasConfiguration(std::string_view name) const;

        /**
         * @brief Get configuration of all keys outside of a table
         * @return Configuration object for the header
         */
        Configuration getHeaderConfiguration() const { return header_; }

        /**
         * @brief Get the configuration of a table
         * @param name Name of the table
         * @return Configuration with the keys of the table
         * @throws ConfigFileError If no table with this name exists
         */
        LNHRDAC_API Configuration getConfiguration(std::string_view name) const;

        /**
         * @brief Get the names of all tables
         */
        LNHRDAC_API std::vector<std::string> getConfigurationNames() const;

    private:
        ConfigParser() = default;

        void parse(std::string_view content, std::string_view source);

    private:
        std::string source_;
        Configuration header_;
        std::map<std::string, Configuration, std::less<>> configurations_;
    };

} // namespace lnhrdac::config
