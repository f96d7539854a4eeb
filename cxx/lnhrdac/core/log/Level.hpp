/**
 * @file
 * @brief Log level
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>
#include <type_traits>

#include <spdlog/common.h>

namespace lnhrdac::log {

    /** Log levels */
    enum class Level : std::uint8_t {
        /** Verbose information, e.g. every line sent to or received from the device */
        TRACE = 0,
        /** Information relevant to developers, e.g. session lifecycle */
        DEBUG = 1,
        /** Information relevant for users */
        INFO = 2,
        /** Unexpected behavior which is not an error, e.g. an unrecognized answer to a write command */
        WARNING = 3,
        /** Important status information, e.g. connection to a device */
        STATUS = 4,
        /** Errors which abort the current operation */
        CRITICAL = 5,
        /** Disable logging */
        OFF = 6,
    };
    using enum Level;

    /** Convert to spdlog level, STATUS is mapped to spdlog's error level */
    constexpr spdlog::level::level_enum to_spdlog_level(Level level) {
        return static_cast<spdlog::level::level_enum>(static_cast<std::underlying_type_t<Level>>(level));
    }

    /** Convert from spdlog level */
    constexpr Level from_spdlog_level(spdlog::level::level_enum level) {
        return static_cast<Level>(level);
    }

} // namespace lnhrdac::log
