/**
 * @file
 * @brief Tags for type dispatching and run time type identification
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <source_location>
#include <string_view>

namespace lnhrdac::utils {

    /** Helpers for compile-time demangling using source_location */
    struct dummy_type {};
    template <typename T> constexpr std::string_view embed_type() {
        return std::string_view {std::source_location::current().function_name()};
    }

    /**
     * @brief Human-readable name of a type, used in error messages
     */
    template <typename T> inline std::string_view demangle() {
        const auto dummy_sig = embed_type<dummy_type>();
        const auto start = dummy_sig.find("lnhrdac::utils::dummy_type");
        const auto embed_sig = embed_type<T>();
        const auto type_length = embed_sig.size() - dummy_sig.size() + 26;
        return embed_sig.substr(start, type_length);
    }

} // namespace lnhrdac::utils
