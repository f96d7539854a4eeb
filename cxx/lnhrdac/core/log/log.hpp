/**
 * @file
 * @brief Logging macros
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "lnhrdac/core/log/Level.hpp"
#include "lnhrdac/core/log/Logger.hpp"

/**
 * Log a message to a logger at a given level
 *
 * The stream is only evaluated if the message would be printed.
 */
#define LOG(logger, level)                                                                                                  \
    if(!(logger).shouldLog(lnhrdac::log::level)) {                                                                         \
    } else                                                                                                                  \
        (logger).log(lnhrdac::log::level)

/**
 * Log a message to a logger at a given level if a condition is met
 */
#define LOG_IF(logger, level, condition)                                                                                    \
    if(!((condition) && (logger).shouldLog(lnhrdac::log::level))) {                                                        \
    } else                                                                                                                  \
        (logger).log(lnhrdac::log::level)
