/**
 * @file
 * @brief Logger
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <memory>
#include <source_location>
#include <sstream>
#include <string_view>

#include <spdlog/logger.h>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Level.hpp"

namespace lnhrdac::log {

    /**
     * Logger for a topic
     *
     * Messages are written via the `LOG` macro defined in `log.hpp`:
     *
     * @code
     * LOG(logger_, DEBUG) << "Opened session to " << uri;
     * @endcode
     */
    class Logger {
    private:
        /** Stream collecting a single message, which is logged on destruction */
        class LogStream : public std::ostringstream {
        public:
            LogStream(Logger& logger, Level level, std::source_location src_loc)
                : logger_(logger), level_(level), src_loc_(src_loc) {}

            LogStream(const LogStream& other) = delete;
            LogStream& operator=(const LogStream& other) = delete;
            LogStream(LogStream&& other) = delete;
            LogStream& operator=(LogStream&& other) = delete;

            LNHRDAC_API ~LogStream() override;

        private:
            Logger& logger_;
            Level level_;
            std::source_location src_loc_;
        };

    public:
        /**
         * @brief Construct a new logger for a given topic
         *
         * @param topic Topic of the logger, printed with every message
         */
        LNHRDAC_API explicit Logger(std::string_view topic);

        /**
         * @brief Get the default logger
         */
        LNHRDAC_API static Logger& getDefault();

        /**
         * @brief Check if a message with the given level would be printed
         */
        LNHRDAC_API bool shouldLog(Level level) const;

        /**
         * @brief Log a message
         *
         * @param level Level of the message
         * @param src_loc Source location of the message
         * @return Stream to write the message to
         */
        LogStream log(Level level, std::source_location src_loc = std::source_location::current()) {
            return {*this, level, src_loc};
        }

        /**
         * @brief Flush the underlying sinks
         */
        void flush() { spdlog_logger_->flush(); }

        /**
         * @brief Topic of the logger
         */
        std::string_view getTopic() const { return spdlog_logger_->name(); }

    private:
        std::shared_ptr<spdlog::logger> spdlog_logger_;
    };

} // namespace lnhrdac::log
