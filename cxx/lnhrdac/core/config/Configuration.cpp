/**
 * @file
 * @brief Implementation of configuration
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Configuration.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "lnhrdac/core/config/exceptions.hpp"
#include "lnhrdac/core/config/Value.hpp"

using namespace lnhrdac::config;

bool Configuration::has(std::string_view key) const {
    return values_.contains(key);
}

const Value& Configuration::at(std::string_view key) const {
    const auto value_it = values_.find(key);
    if(value_it == values_.end()) {
        throw MissingKeyError(key);
    }
    return value_it->second;
}

std::vector<std::string> Configuration::getKeys() const {
    std::vector<std::string> keys {};
    keys.reserve(values_.size());
    for(const auto& [key, value] : values_) {
        keys.emplace_back(key);
    }
    return keys;
}
