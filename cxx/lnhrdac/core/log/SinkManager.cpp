/**
 * @file
 * @brief Implementation of the sink manager
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SinkManager.hpp"

#include <cctype>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <magic_enum.hpp>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "lnhrdac/core/log/Level.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::log;
using namespace lnhrdac::utils;

namespace {
    // Prints our level names instead of spdlog's, in particular STATUS instead of "error"
    class LevelFormatter : public spdlog::custom_flag_formatter {
    public:
        void format(const spdlog::details::log_msg& msg, const std::tm& /*tm*/, spdlog::memory_buf_t& dest) override {
            const auto name = magic_enum::enum_name(from_spdlog_level(msg.level));
            dest.append(name.data(), name.data() + name.size());
            for(auto i = name.size(); i < 8; ++i) {
                dest.push_back(' ');
            }
        }

        std::unique_ptr<custom_flag_formatter> clone() const override { return std::make_unique<LevelFormatter>(); }
    };
} // namespace

SinkManager& SinkManager::getInstance() {
    static SinkManager instance {};
    return instance;
}

SinkManager::SinkManager() : console_sink_(std::make_shared<spdlog::sinks::stdout_color_sink_mt>()), console_level_(INFO) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFormatter>('*').set_pattern("|%Y-%m-%d %H:%M:%S.%e| %^%*%$ [%n] %v");
    console_sink_->set_formatter(std::move(formatter));
    console_sink_->set_level(to_spdlog_level(console_level_.load()));

    // STATUS is printed as spdlog's error level, use the info color instead of red
    console_sink_->set_color(spdlog::level::err, console_sink_->green);
}

std::shared_ptr<spdlog::logger> SinkManager::getLogger(std::string_view topic) {
    const auto topic_uc = transform(topic, ::toupper);

    const std::lock_guard loggers_lock {loggers_mutex_};
    const auto logger_it = loggers_.find(topic_uc);
    if(logger_it != loggers_.end()) {
        return logger_it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(topic_uc, console_sink_);
    // Filtering happens in the sink, the logger forwards everything
    logger->set_level(spdlog::level::trace);
    loggers_.emplace(topic_uc, logger);
    return logger;
}

void SinkManager::setGlobalConsoleLevel(Level level) {
    console_level_ = level;
    console_sink_->set_level(to_spdlog_level(level));
}
