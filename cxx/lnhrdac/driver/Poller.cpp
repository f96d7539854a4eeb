/**
 * @file
 * @brief Implementation of the poller
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Poller.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

#include "lnhrdac/core/log/log.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/transport/exceptions.hpp"
#include "lnhrdac/core/utils/chrono.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::driver;
using namespace lnhrdac::protocol;
using namespace lnhrdac::transport;
using namespace lnhrdac::utils;

Poller::Poller(CommandChannel& channel) : channel_(&channel), logger_("POLLER") {}

std::size_t Poller::waitFor(const PollSpec& spec) {
    if(!spec.query.isQuery()) {
        throw InvalidCommandError(spec.query.getPayload(), "polling requires a query");
    }
    if(started_) {
        throw InvalidCommandError(spec.query.getPayload(), "poller was already used");
    }
    started_ = true;

    LOG(logger_, DEBUG) << "Waiting for \"" << spec.query.getPayload() << "\" to return \"" << spec.expected << "\""
                        << (spec.max_wait.has_value() ? " within " + to_string(spec.max_wait.value()) : "");

    const auto start = std::chrono::steady_clock::now();
    std::size_t attempts = 0;

    while(true) {
        ++attempts;
        std::string value {};
        try {
            const auto response = channel_->execute(spec.query);
            value = to_string(response.getValue());
        } catch(...) {
            state_ = State::FAILED;
            throw;
        }

        if(value == spec.expected) {
            state_ = State::SUCCEEDED;
            LOG(logger_, DEBUG) << "Received \"" << value << "\" after " << attempts << " attempts";
            return attempts;
        }
        LOG(logger_, TRACE) << "Attempt " << attempts << " returned \"" << value << "\"";

        auto sleep_time = spec.poll_interval;
        if(spec.max_wait.has_value()) {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            if(elapsed >= spec.max_wait.value()) {
                state_ = State::TIMED_OUT;
                throw TimeoutError("waiting for \"" + to_string(spec.query.getPayload()) + "\" to return \"" +
                                       spec.expected + "\", last answer \"" + value + "\",",
                                   spec.max_wait.value());
            }
            sleep_time = std::min(sleep_time, spec.max_wait.value() - elapsed);
        }
        sleep_for(sleep_time);
    }
}
