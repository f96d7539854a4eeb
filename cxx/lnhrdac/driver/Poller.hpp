/**
 * @file
 * @brief Poller waiting for a query to return an expected answer
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Logger.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/driver/CommandChannel.hpp"

namespace lnhrdac::driver {

    /**
     * @brief Parameters of a poll
     */
    struct PollSpec {
        /** Query issued on every attempt */
        protocol::Command query;
        /** Expected answer, compared exactly */
        std::string expected;
        /** Interval between two attempts */
        std::chrono::milliseconds poll_interval {100};
        /** Maximum time to wait, unset to wait indefinitely */
        std::optional<std::chrono::milliseconds> max_wait {};
    };

    /**
     * @brief Poller
     *
     * Repeats a query until the device answers with the expected value. A poller instance performs a single poll, once
     * it reached a terminal state it cannot be reused.
     */
    class Poller {
    public:
        enum class State : std::uint8_t {
            /** Created or waiting for the expected answer */
            POLLING,
            /** Expected answer received */
            SUCCEEDED,
            /** Query rejected by the device or transport failure */
            FAILED,
            /** Maximum wait time exceeded */
            TIMED_OUT,
        };

    public:
        /**
         * @param channel Channel used to issue the query
         */
        LNHRDAC_API explicit Poller(CommandChannel& channel);

        /**
         * @brief Poll until the expected answer is received
         *
         * @param spec Parameters of the poll
         * @return Number of exchanges with the device, including the successful one
         * @throws InvalidCommandError If the polled command is not a query or the poller was already used
         * @throws TimeoutError If the maximum wait time is exceeded
         * @throws CommandRejectedError If the device rejected the query
         * @throws ConnectionError If the session cannot be opened or was lost
         */
        LNHRDAC_API std::size_t waitFor(const PollSpec& spec);

        /** Current state of the poller */
        State getState() const { return state_; }

    private:
        CommandChannel* channel_;
        State state_ {State::POLLING};
        bool started_ {false};

        log::Logger logger_;
    };

} // namespace lnhrdac::driver
