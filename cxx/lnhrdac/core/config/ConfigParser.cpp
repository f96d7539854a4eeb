/**
 * @file
 * @brief Configuration file parser implementation
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ConfigParser.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.hpp>

#include "lnhrdac/core/config/Configuration.hpp"
#include "lnhrdac/core/config/exceptions.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::config;
using namespace lnhrdac::utils;

namespace {
    std::string source_to_string(const toml::source_region& source) {
        std::stringstream s;
        if(source.path) {
            s << *source.path << ":";
        }
        s << source.begin.line << ":" << source.begin.column;
        return s.str();
    }

    // Store a TOML node in a configuration, tables are not allowed below the top level
    void store_node(Configuration& config, const std::string& key, const toml::node& node) {
        switch(node.type()) {
        case toml::node_type::boolean: config.set(key, node.as_boolean()->get()); break;
        case toml::node_type::integer: config.set(key, node.as_integer()->get()); break;
        case toml::node_type::floating_point: config.set(key, node.as_floating_point()->get()); break;
        case toml::node_type::string: config.set(key, node.as_string()->get()); break;
        case toml::node_type::array: {
            std::vector<std::string> list {};
            for(const auto& element : *node.as_array()) {
                const auto* string = element.as_string();
                if(string == nullptr) {
                    throw ConfigFileError(source_to_string(element.source()), "array \"" + key + "\" may only contain strings");
                }
                list.emplace_back(string->get());
            }
            config.set(key, list);
            break;
        }
        default: {
            throw ConfigFileError(source_to_string(node.source()), "unsupported value type for key \"" + key + "\"");
        }
        }
    }
} // namespace

ConfigParser::ConfigParser(const std::filesystem::path& file) {
    std::ifstream stream {file};
    if(!stream.good()) {
        throw ConfigFileError(file.string(), "file cannot be opened");
    }
    std::stringstream buffer {};
    buffer << stream.rdbuf();
    parse(buffer.str(), file.string());
}

ConfigParser ConfigParser::fromString(std::string_view content, std::string_view source) {
    ConfigParser parser {};
    parser.parse(content, source);
    return parser;
}

void ConfigParser::parse(std::string_view content, std::string_view source) {
    source_ = to_string(source);

    toml::table tbl;
    try {
        tbl = toml::parse(content, source);
    } catch(const toml::parse_error& err) {
        throw ConfigFileError(source_to_string(err.source()), err.description());
    }

    for(const auto& [key, node] : tbl) {
        const auto key_str = to_string(key.str());
        if(const auto* table = node.as_table()) {
            Configuration config {};
            for(const auto& [sub_key, sub_node] : *table) {
                store_node(config, to_string(sub_key.str()), sub_node);
            }
            configurations_.emplace(key_str, std::move(config));
        } else {
            store_node(header_, key_str, node);
        }
    }
}

bool ConfigParser::hasConfiguration(std::string_view name) const {
    return configurations_.contains(name);
}

Configuration ConfigParser::getConfiguration(std::string_view name) const {
    const auto config_it = configurations_.find(name);
    if(config_it == configurations_.end()) {
        throw ConfigFileError(source_, "no table \"" + to_string(name) + "\"");
    }
    return config_it->second;
}

std::vector<std::string> ConfigParser::getConfigurationNames() const {
    std::vector<std::string> names {};
    names.reserve(configurations_.size());
    for(const auto& [name, config] : configurations_) {
        names.emplace_back(name);
    }
    return names;
}
