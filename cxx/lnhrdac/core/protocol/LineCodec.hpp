/**
 * @file
 * @brief Line framing of the device protocol
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/protocol/Command.hpp"

namespace lnhrdac::protocol {

    /** Line terminator for commands and single-line answers */
    constexpr std::string_view LINE_TERMINATOR = "\r\n";

    /** Terminator of multi-line answers */
    constexpr std::string_view MULTI_LINE_TERMINATOR = "\r\r";

    /** Telnet "interpret as command" byte */
    constexpr unsigned char TELNET_IAC = 0xFF;

    /**
     * @brief Line codec
     *
     * Frames outgoing commands and incoming answers. The device speaks raw ASCII over its Telnet port, but may interleave
     * Telnet option negotiation (IAC sequences) with the answers, which are removed on decoding.
     */
    class LineCodec {
    public:
        /**
         * @brief Frame a payload as a command line
         *
         * @param payload Printable ASCII payload without terminator
         * @return Bytes to send to the device
         * @throws InvalidCommandError If the payload is empty or contains non-printable characters
         */
        LNHRDAC_API static std::string encode(std::string_view payload);

        /**
         * @brief Decode a line received from the device
         *
         * Removes Telnet negotiation, NUL bytes, the terminator and leading and trailing whitespace. CR, LF and TAB are
         * kept inside the line, since multi-line answers contain them.
         *
         * @param bytes Raw bytes of a line including its terminator
         * @return Decoded line
         * @throws ProtocolError If the line is empty or contains non-ASCII or control characters
         */
        LNHRDAC_API static std::string decode(std::string_view bytes);

        /**
         * @brief Terminator of the answer to a command
         */
        LNHRDAC_API static std::string_view terminatorFor(const Command& command);

        /**
         * @brief Remove Telnet negotiation sequences and NUL bytes
         */
        LNHRDAC_API static std::string stripTelnetControls(std::string_view bytes);
    };

} // namespace lnhrdac::protocol
