/**
 * @file
 * @brief Implementation of the logger
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Logger.hpp"

#include <source_location>
#include <string_view>

#include <spdlog/common.h>

#include "lnhrdac/core/log/Level.hpp"
#include "lnhrdac/core/log/SinkManager.hpp"

using namespace lnhrdac::log;

Logger::LogStream::~LogStream() {
    logger_.spdlog_logger_->log(
        spdlog::source_loc(src_loc_.file_name(), static_cast<int>(src_loc_.line()), src_loc_.function_name()),
        to_spdlog_level(level_),
        this->view());
}

Logger::Logger(std::string_view topic) : spdlog_logger_(SinkManager::getInstance().getLogger(topic)) {}

Logger& Logger::getDefault() {
    static Logger instance {"DEFAULT"};
    return instance;
}

bool Logger::shouldLog(Level level) const {
    return level != OFF && level >= SinkManager::getInstance().getGlobalConsoleLevel();
}
