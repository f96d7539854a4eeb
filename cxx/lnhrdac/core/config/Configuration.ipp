/**
 * @file
 * @brief Template implementation of configuration
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "Configuration.hpp" // NOLINT(misc-header-include-cycle)

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <magic_enum.hpp>

#include "lnhrdac/core/config/exceptions.hpp"
#include "lnhrdac/core/config/Value.hpp"
#include "lnhrdac/core/utils/string.hpp"
#include "lnhrdac/core/utils/type.hpp"

namespace lnhrdac::config {

    template <typename T> T Configuration::get(std::string_view key) const {
        const auto& value = at(key);

        if constexpr(std::same_as<T, bool>) {
            if(const auto* held = std::get_if<bool>(&value)) {
                return *held;
            }
        } else if constexpr(std::is_integral_v<T>) {
            if(const auto* held = std::get_if<std::int64_t>(&value)) {
                if(!std::in_range<T>(*held)) {
                    throw InvalidValueError(key, value_to_string(value), "out of range for " + utils::to_string(utils::demangle<T>()));
                }
                return static_cast<T>(*held);
            }
        } else if constexpr(std::is_floating_point_v<T>) {
            if(const auto* held = std::get_if<double>(&value)) {
                return static_cast<T>(*held);
            }
            if(const auto* held = std::get_if<std::int64_t>(&value)) {
                return static_cast<T>(*held);
            }
        } else if constexpr(std::same_as<T, std::string>) {
            if(const auto* held = std::get_if<std::string>(&value)) {
                return *held;
            }
        } else if constexpr(std::same_as<T, std::vector<std::string>>) {
            if(const auto* held = std::get_if<std::vector<std::string>>(&value)) {
                return *held;
            }
            // Single string is a list with one element
            if(const auto* held = std::get_if<std::string>(&value)) {
                return {*held};
            }
        } else if constexpr(std::is_enum_v<T>) {
            if(const auto* held = std::get_if<std::string>(&value)) {
                const auto enum_opt = magic_enum::enum_cast<T>(*held, magic_enum::case_insensitive);
                if(!enum_opt.has_value()) {
                    throw InvalidValueError(
                        key, value_to_string(value), "possible values are " + utils::list_enum_names<T>());
                }
                return enum_opt.value();
            }
        } else {
            static_assert(std::is_void_v<T>, "Unsupported configuration value type");
        }

        throw InvalidTypeError(key, value_type_name(value), utils::demangle<T>());
    }

    template <typename T> T Configuration::get(std::string_view key, const T& def) const {
        if(has(key)) {
            return get<T>(key);
        }
        return def;
    }

    template <typename T> void Configuration::set(std::string key, const T& val) {
        Value value {};
        if constexpr(std::same_as<T, bool>) {
            value = val;
        } else if constexpr(std::is_integral_v<T>) {
            if(!std::in_range<std::int64_t>(val)) {
                throw InvalidValueError(key, utils::to_string(val), "out of range for integer");
            }
            value = static_cast<std::int64_t>(val);
        } else if constexpr(std::is_floating_point_v<T>) {
            value = static_cast<double>(val);
        } else if constexpr(std::is_enum_v<T>) {
            value = utils::to_string(val);
        } else if constexpr(std::convertible_to<T, std::string_view>) {
            value = utils::to_string(val);
        } else if constexpr(std::same_as<T, std::vector<std::string>>) {
            value = val;
        } else {
            static_assert(std::is_void_v<T>, "Unsupported configuration value type");
        }
        values_.insert_or_assign(std::move(key), std::move(value));
    }

    template <typename T> void Configuration::setDefault(std::string key, const T& val) {
        if(!has(key)) {
            set<T>(std::move(key), val);
        }
    }

} // namespace lnhrdac::config
