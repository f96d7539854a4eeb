/**
 * @file
 * @brief Implementation of the driver
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Driver.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <ios>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "lnhrdac/core/log/log.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/transport/TCPSession.hpp"
#include "lnhrdac/core/utils/string.hpp"
#include "lnhrdac/driver/CommandChannel.hpp"
#include "lnhrdac/driver/DriverConfig.hpp"
#include "lnhrdac/driver/Poller.hpp"

using namespace lnhrdac::driver;
using namespace lnhrdac::protocol;
using namespace lnhrdac::transport;
using namespace lnhrdac::utils;

namespace {
    /** Format a wave memory sample command, address in hex and voltage with microvolt resolution */
    std::string wave_sample_command(char memory, std::size_t address, double voltage) {
        std::ostringstream command {};
        command << "wav-" << memory << " " << std::uppercase << std::hex << address << " " << std::dec << std::fixed
                << std::setprecision(6) << voltage;
        return command.str();
    }
} // namespace

HeldConnection::HeldConnection(Driver& driver) : driver_(&driver) {
    driver_->channel_->acquire();
}

HeldConnection::HeldConnection(HeldConnection&& other) noexcept : driver_(std::exchange(other.driver_, nullptr)) {}

HeldConnection::~HeldConnection() {
    release();
}

void HeldConnection::release() {
    if(driver_ != nullptr) {
        driver_->channel_->release();
        driver_ = nullptr;
    }
}

Response HeldConnection::sendCommand(std::string_view text) {
    if(driver_ == nullptr) {
        throw InvalidCommandError(text, "held connection was already released");
    }
    return driver_->sendCommand(text, Mode::HELD_CONNECTION);
}

std::string HeldConnection::sendQuery(std::string_view text) {
    if(driver_ == nullptr) {
        throw InvalidCommandError(text, "held connection was already released");
    }
    return driver_->sendQuery(text, Mode::HELD_CONNECTION);
}

Driver::Driver(DriverConfig config, SessionFactory session_factory)
    : config_(std::move(config)), classifier_(std::make_unique<ResponseClassifier>(config_.error_tokens)),
      logger_("DRIVER") {
    if(!session_factory) {
        session_factory = TCPSession::factory(config_.host, config_.port, config_.timings.timeout);
    }
    channel_ = std::make_unique<CommandChannel>(std::move(session_factory), config_.timings, *classifier_);
}

Driver::~Driver() = default;

Command Driver::make_command(std::string_view text, Mode mode, bool query) {
    Command command {text, mode};
    if(query && !command.isQuery()) {
        throw InvalidCommandError(text, "queries must contain a question mark");
    }
    if(!query && command.isQuery()) {
        throw InvalidCommandError(text, "commands must not contain a question mark, use a query instead");
    }
    return command;
}

std::string Driver::connect() {
    LOG(logger_, INFO) << "Connecting to " << config_.name << " at " << config_.host << ":" << config_.port;
    auto status = sendQuery("all s?");
    LOG(logger_, STATUS) << "Connected to " << config_.name << ", channel status: " << escape_line(status);
    return status;
}

Response Driver::sendCommand(std::string_view text, Mode mode) {
    return channel_->execute(make_command(text, mode, false));
}

std::string Driver::sendQuery(std::string_view text, Mode mode) {
    const auto response = channel_->execute(make_command(text, mode, true));
    return to_string(response.getValue());
}

std::size_t Driver::expectQueryAnswer(std::string_view text,
                                      std::string_view expected,
                                      std::optional<std::chrono::milliseconds> poll_interval,
                                      std::optional<std::chrono::milliseconds> max_wait,
                                      Mode mode) {
    Poller poller {*channel_};
    return poller.waitFor({
        .query = make_command(text, mode, true),
        .expected = to_string(trim(expected)),
        .poll_interval = poll_interval.value_or(config_.poll_interval),
        .max_wait = max_wait,
    });
}

bool Driver::checkQueryAnswer(std::string_view text, std::string_view expected, Mode mode) {
    const auto answer = sendQuery(text, mode);
    const auto matches = answer == trim(expected);
    LOG_IF(logger_, DEBUG, !matches) << "Query \"" << text << "\" returned \"" << answer << "\" instead of \"" << expected
                                     << "\"";
    return matches;
}

HeldConnection Driver::hold() {
    return HeldConnection(*this);
}

std::size_t Driver::uploadWaveMemory(char memory, std::span<const double> samples, std::size_t start_address) {
    memory = static_cast<char>(std::tolower(static_cast<unsigned char>(memory)));
    if(memory < 'a' || memory > 'd') {
        throw InvalidCommandError(std::string("wav-") + memory, "wave memory must be one of a, b, c or d");
    }
    if(start_address > WAVE_MEMORY_SIZE || samples.size() > WAVE_MEMORY_SIZE - start_address) {
        throw InvalidCommandError(std::string("wav-") + memory,
                                  "samples exceed the wave memory size of " + to_string(WAVE_MEMORY_SIZE));
    }

    // Validate all samples before sending the first one
    for(std::size_t idx = 0; idx < samples.size(); ++idx) {
        if(!std::isfinite(samples[idx]) || std::abs(samples[idx]) > MAX_VOLTAGE) {
            throw InvalidCommandError(wave_sample_command(memory, start_address + idx, samples[idx]),
                                      "voltage out of range");
        }
    }

    LOG(logger_, INFO) << "Uploading " << samples.size() << " samples to wave memory " << memory;

    auto held = hold();
    std::size_t uploaded = 0;
    for(const auto voltage : samples) {
        const auto text = wave_sample_command(memory, start_address + uploaded, voltage);
        held.sendCommand(text);
        ++uploaded;
    }
    held.release();

    LOG(logger_, INFO) << "Uploaded " << uploaded << " samples to wave memory " << memory;
    return uploaded;
}
