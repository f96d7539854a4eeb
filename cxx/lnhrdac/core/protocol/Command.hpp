/**
 * @file
 * @brief Device command
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "lnhrdac/build.hpp"

namespace lnhrdac::protocol {

    /** Connection lifetime used to transmit a command */
    enum class Mode : std::uint8_t {
        /** Open a session for this command and close it afterwards */
        ONE_SHOT,
        /** Reuse the held session and leave it open afterwards */
        HELD_CONNECTION,
    };

    /** Queries whose answer spans several lines, terminated by CR CR instead of CR LF */
    constexpr std::array<std::string_view, 9> MULTI_LINE_QUERIES {
        "?", "help?", "soft?", "hard?", "idn?", "health?", "ip?", "serial?", "contact?"};

    /**
     * @brief Command sent to the device
     *
     * Immutable once constructed. The payload is validated on construction: it must be non-empty printable ASCII. The
     * kind of command is derived from the payload, a payload containing `?` is a query.
     */
    class Command {
    public:
        enum class Kind : std::uint8_t {
            /** Command answered by an acknowledgement or an error code */
            WRITE,
            /** Command answered by a value */
            QUERY,
        };

    public:
        /**
         * @param payload Command text without line terminator, leading and trailing whitespace is removed
         * @param mode Connection lifetime used to transmit the command
         * @throws InvalidCommandError If the payload is empty or contains non-printable characters
         */
        LNHRDAC_API explicit Command(std::string_view payload, Mode mode = Mode::ONE_SHOT);

        /** Payload of the command */
        std::string_view getPayload() const { return payload_; }

        /** Connection lifetime used to transmit the command */
        Mode getMode() const { return mode_; }

        /** Kind of the command */
        Kind getKind() const { return kind_; }

        /** Whether the command is a query */
        bool isQuery() const { return kind_ == Kind::QUERY; }

        /**
         * @brief Whether the command is a control command
         *
         * Control commands (`c <subsystem> <field> <value>`) require the device to synchronize internally.
         */
        LNHRDAC_API bool isControl() const;

        /**
         * @brief Whether the command writes to non-volatile memory
         */
        LNHRDAC_API bool isMemoryWrite() const;

        /**
         * @brief Whether the answer to this command spans several lines
         */
        LNHRDAC_API bool expectsMultiLineAnswer() const;

        /** Same command transmitted with a different connection lifetime */
        Command withMode(Mode mode) const { return Command(payload_, mode); }

    private:
        std::string payload_;
        Mode mode_;
        Kind kind_;
    };

} // namespace lnhrdac::protocol
