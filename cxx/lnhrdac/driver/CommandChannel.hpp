/**
 * @file
 * @brief Command channel serializing exchanges with the device
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Logger.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/transport/Session.hpp"
#include "lnhrdac/driver/DriverConfig.hpp"

namespace lnhrdac::driver {

    /**
     * @brief Command channel
     *
     * Executes request/response exchanges with the device, one at a time. One-shot commands open a fresh session which
     * is closed after the answer was read. Held commands reuse a session which stays open until it is released.
     */
    class CommandChannel {
    public:
        /**
         * @param session_factory Factory creating sessions to the device
         * @param timings Timeout and settle delays
         * @param classifier Classifier applied to every answer
         */
        LNHRDAC_API CommandChannel(transport::SessionFactory session_factory,
                                   ChannelTimings timings,
                                   protocol::ResponseClassifier& classifier);

        /** Closes the held session */
        LNHRDAC_API ~CommandChannel();

        // No copy/move constructor/assignment
        CommandChannel(const CommandChannel& other) = delete;
        CommandChannel& operator=(const CommandChannel& other) = delete;
        CommandChannel(CommandChannel&& other) = delete;
        CommandChannel& operator=(CommandChannel&& other) = delete;

        /**
         * @brief Execute a command
         *
         * Sends the command, reads exactly one answer and classifies it. The session is chosen by the mode of the
         * command.
         *
         * @param command Command to execute
         * @return Classified answer, either an acknowledgement or a value
         * @throws CommandRejectedError If the device answered with an error
         * @throws ConnectionError If the session cannot be opened or was lost
         * @throws TimeoutError If no answer was received within the timeout
         * @throws ProtocolError If the answer cannot be decoded
         */
        LNHRDAC_API protocol::Response execute(const protocol::Command& command);

        /**
         * @brief Open the held session and increment the hold count
         *
         * Holds nest: the session stays open until every `acquire()` has been matched by a `release()`. A session
         * dropped after a connection, protocol or timeout error is reopened by the next held command.
         *
         * @throws ConnectionError If the session cannot be opened
         */
        LNHRDAC_API void acquire();

        /**
         * @brief Decrement the hold count and close the held session once it reaches zero
         */
        LNHRDAC_API void release();

        /**
         * @brief Whether a session is currently held open
         */
        LNHRDAC_API bool isHeld() const;

    private:
        /** Execute a command on an open session */
        protocol::Response exchange(transport::Session& session, const protocol::Command& command);

        /** Execute a command on the held session, dropping it on fatal errors */
        protocol::Response exchange_held(const protocol::Command& command);

        /** Execute a command on a fresh session */
        protocol::Response exchange_one_shot(const protocol::Command& command);

        /** Wait for the device to process a command */
        void settle(const protocol::Command& command) const;

        /** Open the held session, requires the mutex to be locked */
        void open_held();

        /** Close the held session, requires the mutex to be locked */
        void close_held();

    private:
        transport::SessionFactory session_factory_;
        ChannelTimings timings_;
        protocol::ResponseClassifier* classifier_;

        std::unique_ptr<transport::Session> held_session_;
        std::size_t hold_count_ {0};
        mutable std::mutex mutex_;

        log::Logger logger_;
    };

} // namespace lnhrdac::driver
