/**
 * @file
 * @brief Implementation of the command channel
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "CommandChannel.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "lnhrdac/core/log/log.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/protocol/LineCodec.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/transport/exceptions.hpp"
#include "lnhrdac/core/transport/Session.hpp"
#include "lnhrdac/core/utils/chrono.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::driver;
using namespace lnhrdac::protocol;
using namespace lnhrdac::transport;
using namespace lnhrdac::utils;

namespace {
    /** Closes a session when going out of scope */
    class SessionCloser {
    public:
        explicit SessionCloser(Session& session) : session_(session) {}
        ~SessionCloser() { session_.close(); }

        SessionCloser(const SessionCloser& other) = delete;
        SessionCloser& operator=(const SessionCloser& other) = delete;
        SessionCloser(SessionCloser&& other) = delete;
        SessionCloser& operator=(SessionCloser&& other) = delete;

    private:
        Session& session_;
    };
} // namespace

CommandChannel::CommandChannel(SessionFactory session_factory, ChannelTimings timings, ResponseClassifier& classifier)
    : session_factory_(std::move(session_factory)), timings_(timings), classifier_(&classifier), logger_("CHANNEL") {}

CommandChannel::~CommandChannel() {
    const std::lock_guard lock {mutex_};
    close_held();
}

Response CommandChannel::execute(const Command& command) {
    const std::lock_guard lock {mutex_};

    if(command.getMode() == Mode::HELD_CONNECTION) {
        return exchange_held(command);
    }
    return exchange_one_shot(command);
}

void CommandChannel::acquire() {
    const std::lock_guard lock {mutex_};
    open_held();
    ++hold_count_;
}

void CommandChannel::release() {
    const std::lock_guard lock {mutex_};
    if(hold_count_ > 0) {
        --hold_count_;
    }
    // Nested holds keep the session open until the outermost one is released
    if(hold_count_ == 0) {
        close_held();
    }
}

bool CommandChannel::isHeld() const {
    const std::lock_guard lock {mutex_};
    return held_session_ != nullptr && held_session_->isOpen();
}

void CommandChannel::open_held() {
    if(held_session_ != nullptr && held_session_->isOpen()) {
        return;
    }
    auto session = session_factory_();
    session->open();
    LOG(logger_, DEBUG) << "Holding session to " << session->getEndpoint();
    held_session_ = std::move(session);
}

void CommandChannel::close_held() {
    if(held_session_ == nullptr) {
        return;
    }
    held_session_->close();
    LOG(logger_, DEBUG) << "Released session to " << held_session_->getEndpoint();
    held_session_.reset();
}

Response CommandChannel::exchange_held(const Command& command) {
    open_held();
    try {
        return exchange(*held_session_, command);
    } catch(const ConnectionError& error) {
        LOG(logger_, WARNING) << "Dropping held session: " << error.what();
        close_held();
        throw;
    } catch(const ProtocolError& error) {
        LOG(logger_, WARNING) << "Dropping held session: " << error.what();
        close_held();
        throw;
    } catch(const TimeoutError& error) {
        // A late answer would be paired with the next command
        LOG(logger_, WARNING) << "Dropping held session: " << error.what();
        close_held();
        throw;
    }
}

Response CommandChannel::exchange_one_shot(const Command& command) {
    auto session = session_factory_();
    session->open();

    auto response = [&]() {
        const SessionCloser closer {*session};
        return exchange(*session, command);
    }();

    sleep_for(timings_.disconnect_delay);
    return response;
}

Response CommandChannel::exchange(Session& session, const Command& command) {
    LOG(logger_, TRACE) << "Executing \"" << command.getPayload() << "\" on " << session.getEndpoint();

    session.write(LineCodec::encode(command.getPayload()));
    const auto raw = session.readLine(LineCodec::terminatorFor(command), timings_.timeout);
    const auto line = LineCodec::decode(raw);
    auto response = classifier_->classify(line, command);

    settle(command);

    if(response.isError()) {
        LOG(logger_, DEBUG) << "Command \"" << command.getPayload() << "\" rejected with code " << response.getCode();
        throw CommandRejectedError(command.getPayload(), to_string(response.getCode()), response.getRaw());
    }

    if(!command.isQuery() && !response.isAcknowledged()) {
        LOG(logger_, WARNING) << "Unexpected answer to \"" << command.getPayload() << "\": \""
                              << escape_line(response.getRaw()) << "\"";
    }

    return response;
}

void CommandChannel::settle(const Command& command) const {
    if(!command.isControl()) {
        return;
    }
    sleep_for(timings_.control_delay);
    if(command.isMemoryWrite()) {
        sleep_for(timings_.memory_write_delay);
    }
}
