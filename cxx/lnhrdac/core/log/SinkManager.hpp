/**
 * @file
 * @brief Global sink management for loggers
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Level.hpp"

namespace lnhrdac::log {

    /**
     * Global sink manager
     *
     * Owns the console sink shared by all loggers and creates one spdlog logger per topic. The console sink is colored
     * and thread-safe, multiple drivers in the same process can share it.
     */
    class SinkManager {
    public:
        LNHRDAC_API static SinkManager& getInstance();

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        SinkManager(const SinkManager& other) = delete;
        SinkManager& operator=(const SinkManager& other) = delete;
        SinkManager(SinkManager&& other) = delete;
        SinkManager& operator=(SinkManager&& other) = delete;
        /// @endcond

        ~SinkManager() = default;

        /**
         * @brief Get the spdlog logger for a topic, creating it if it does not exist yet
         *
         * @param topic Logger topic, converted to upper case
         * @return Shared pointer to the spdlog logger
         */
        LNHRDAC_API std::shared_ptr<spdlog::logger> getLogger(std::string_view topic);

        /**
         * @brief Set the console log level for all loggers
         *
         * @param level Minimum level printed to the console
         */
        LNHRDAC_API void setGlobalConsoleLevel(Level level);

        /**
         * @brief Get the console log level
         */
        Level getGlobalConsoleLevel() const { return console_level_.load(); }

    private:
        SinkManager();

    private:
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
        std::atomic<Level> console_level_;

        std::map<std::string, std::shared_ptr<spdlog::logger>, std::less<>> loggers_;
        std::mutex loggers_mutex_;
    };

} // namespace lnhrdac::log
