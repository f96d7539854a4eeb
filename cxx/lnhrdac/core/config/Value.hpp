/**
 * @file
 * @brief Value type for configurations
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "lnhrdac/core/utils/string.hpp"

namespace lnhrdac::config {

    /** Value of a configuration key */
    using Value = std::variant<bool, std::int64_t, double, std::string, std::vector<std::string>>;

    /** Name of the type held by a value */
    inline std::string_view value_type_name(const Value& value) {
        switch(value.index()) {
        case 0: return "bool";
        case 1: return "integer";
        case 2: return "float";
        case 3: return "string";
        default: return "string list";
        }
    }

    /** Convert a value to a string for error messages */
    inline std::string value_to_string(const Value& value) {
        return std::visit(
            [](const auto& held) -> std::string {
                using T = std::decay_t<decltype(held)>;
                if constexpr(std::same_as<T, std::string>) {
                    return "\"" + held + "\"";
                } else if constexpr(std::same_as<T, std::vector<std::string>>) {
                    return "[" + utils::list_to_string(held) + "]";
                } else {
                    return utils::to_string(held);
                }
            },
            value);
    }

} // namespace lnhrdac::config
