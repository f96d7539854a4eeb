/**
 * @file
 * @brief Utilities for manipulating strings
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

#include <magic_enum.hpp>

#include "lnhrdac/core/utils/chrono.hpp"

namespace lnhrdac::utils {

    template <typename T> inline std::string transform(std::string_view string, const T& operation) {
        std::string out {};
        out.reserve(string.size());
        for(auto character : string) {
            out += static_cast<char>(operation(static_cast<unsigned char>(character)));
        }
        return out;
    }

    /** Remove leading and trailing whitespace */
    inline std::string_view trim(std::string_view string) {
        const auto is_space = [](char character) { return std::isspace(static_cast<unsigned char>(character)) != 0; };
        while(!string.empty() && is_space(string.front())) {
            string.remove_prefix(1);
        }
        while(!string.empty() && is_space(string.back())) {
            string.remove_suffix(1);
        }
        return string;
    }

    /** Case-insensitive prefix check */
    inline bool starts_with_icase(std::string_view string, std::string_view prefix) {
        if(prefix.size() > string.size()) {
            return false;
        }
        return std::ranges::equal(string.substr(0, prefix.size()), prefix, [](char lhs, char rhs) {
            return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
        });
    }

    /** Escape CR and LF so that protocol lines can be logged on a single line */
    inline std::string escape_line(std::string_view string) {
        std::string out {};
        out.reserve(string.size());
        for(const auto character : string) {
            if(character == '\r') {
                out += "\\r";
            } else if(character == '\n') {
                out += "\\n";
            } else {
                out += character;
            }
        }
        return out;
    }

    template <typename T>
        requires std::convertible_to<T, std::string_view>
    inline std::string to_string(T string_like) {
        const std::string_view string_view {string_like};
        return {string_view.data(), string_view.size()};
    }

    template <typename T>
        requires std::is_arithmetic_v<T>
    inline std::string to_string(T number) {
        if constexpr(std::same_as<T, bool>) {
            return number ? "true" : "false";
        }
        return std::to_string(number);
    }

    template <typename T>
        requires chrono_duration<T>
    std::string to_string(T duration) {
        return duration_to_string(duration);
    }

    template <typename E>
        requires std::is_enum_v<E>
    inline std::string to_string(E enum_val) {
        return to_string(magic_enum::enum_name<E>(enum_val));
    }

    template <typename T>
    concept convertible_to_string = requires(T t) {
        { to_string(t) } -> std::same_as<std::string>;
    };

    template <typename R, typename F>
        requires std::ranges::range<R> && std::is_invocable_r_v<std::string, F, std::ranges::range_value_t<R>>
    inline std::string list_to_string(const R& range, F to_string_func, const std::string& delim = ", ") {
        std::string out {};
        if(!std::ranges::empty(range)) {
            std::ranges::for_each(std::ranges::subrange(std::cbegin(range), std::ranges::prev(std::ranges::cend(range))),
                                  [&](const auto& element) { out += to_string_func(element) + delim; });
            out += to_string_func(*std::ranges::crbegin(range));
        }
        return out;
    }

    template <typename R>
        requires std::ranges::range<R> && convertible_to_string<std::ranges::range_value_t<R>>
    inline std::string list_to_string(const R& range, const std::string& delim = ", ") {
        return list_to_string(
            range, [](const auto& element) { return to_string(element); }, delim);
    }

    template <typename E>
        requires std::is_enum_v<E>
    inline std::string list_enum_names() {
        return list_to_string(magic_enum::enum_names<E>());
    }

} // namespace lnhrdac::utils
