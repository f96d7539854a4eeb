/**
 * @file
 * @brief Utilities for std::chrono objects
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

namespace lnhrdac::utils {

    template <typename T>
    concept chrono_duration = requires(T t) { std::chrono::duration(t); };

    /**
     * @brief Format a duration in milliseconds, or microseconds if below one millisecond
     */
    template <typename T>
        requires chrono_duration<T>
    inline std::string duration_to_string(T d) {
        if(d > T::zero() && d < std::chrono::milliseconds(1)) {
            return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(d).count()) + "us";
        }
        return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(d).count()) + "ms";
    }

    /**
     * @brief Sleep for a duration, returning immediately for zero or negative durations
     */
    template <typename T>
        requires chrono_duration<T>
    inline void sleep_for(T d) {
        if(d > T::zero()) {
            std::this_thread::sleep_for(d);
        }
    }

} // namespace lnhrdac::utils
