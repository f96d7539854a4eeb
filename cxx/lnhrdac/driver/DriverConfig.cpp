/**
 * @file
 * @brief Implementation of the driver configuration
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "DriverConfig.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lnhrdac/core/config/Configuration.hpp"
#include "lnhrdac/core/config/exceptions.hpp"
#include "lnhrdac/core/utils/networking.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::config;
using namespace lnhrdac::driver;
using namespace lnhrdac::utils;

namespace {
    std::chrono::milliseconds get_duration(const Configuration& config,
                                           std::string_view key,
                                           std::chrono::milliseconds def,
                                           bool allow_zero = true) {
        const auto value = config.get<std::int64_t>(key, def.count());
        if(value < 0 || (!allow_zero && value == 0)) {
            throw InvalidValueError(key, to_string(value), allow_zero ? "must not be negative" : "must be positive");
        }
        return std::chrono::milliseconds(value);
    }
} // namespace

DriverConfig DriverConfig::fromConfiguration(const Configuration& config) {
    DriverConfig driver_config {};

    driver_config.host = config.get<std::string>("host");
    if(trim(driver_config.host).empty()) {
        throw InvalidValueError("host", driver_config.host, "must not be empty");
    }
    driver_config.port = config.get<Port>("port", TELNET_PORT);
    if(driver_config.port == 0) {
        throw InvalidValueError("port", "0", "must be a valid port number");
    }
    driver_config.name = config.get<std::string>("name", driver_config.name);

    auto& timings = driver_config.timings;
    timings.timeout = get_duration(config, "timeout_ms", timings.timeout, false);
    timings.disconnect_delay = get_duration(config, "disconnect_delay_ms", timings.disconnect_delay);
    timings.control_delay = get_duration(config, "control_delay_ms", timings.control_delay);
    timings.memory_write_delay = get_duration(config, "memory_write_delay_ms", timings.memory_write_delay);
    driver_config.poll_interval = get_duration(config, "poll_interval_ms", driver_config.poll_interval, false);

    driver_config.error_tokens = config.get<std::vector<std::string>>("error_tokens", driver_config.error_tokens);

    return driver_config;
}
