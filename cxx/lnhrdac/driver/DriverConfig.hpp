/**
 * @file
 * @brief Driver configuration
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/config/Configuration.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/utils/networking.hpp"

namespace lnhrdac::driver {

    /**
     * @brief Timings applied by the command channel
     */
    struct ChannelTimings {
        /** Timeout for connecting, writing and reading a single answer */
        std::chrono::milliseconds timeout {3000};
        /** Delay after closing a one-shot session */
        std::chrono::milliseconds disconnect_delay {3};
        /** Delay after a control command */
        std::chrono::milliseconds control_delay {200};
        /** Additional delay after a control command writing to non-volatile memory */
        std::chrono::milliseconds memory_write_delay {300};
    };

    /**
     * @brief Configuration of a driver instance
     */
    struct DriverConfig {
        /** Hostname or IP address of the device */
        std::string host;
        /** Port of the device */
        utils::Port port {utils::TELNET_PORT};
        /** Name of the device, used in log messages */
        std::string name {"LNHR"};
        /** Timings of the command channel */
        ChannelTimings timings {};
        /** Default interval between two polls */
        std::chrono::milliseconds poll_interval {100};
        /** Error tokens recognized by the response classifier */
        std::vector<std::string> error_tokens {protocol::ResponseClassifier::defaultErrorTokens()};

        /**
         * @brief Read the driver configuration
         *
         * The key `host` is required, all other keys are optional and default to the values above. Durations are given
         * in milliseconds.
         *
         * @param config Configuration to read from
         * @return Driver configuration
         * @throws MissingKeyError If the host is not configured
         * @throws InvalidTypeError If a key has the wrong type
         * @throws InvalidValueError If a value is out of range
         */
        LNHRDAC_API static DriverConfig fromConfiguration(const config::Configuration& config);
    };

} // namespace lnhrdac::driver
