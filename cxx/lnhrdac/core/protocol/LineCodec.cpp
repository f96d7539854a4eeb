/**
 * @file
 * @brief Implementation of the line codec
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "LineCodec.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::protocol;
using namespace lnhrdac::utils;

namespace {
    // Telnet commands, see RFC 854
    constexpr unsigned char TELNET_SE = 240;
    constexpr unsigned char TELNET_SB = 250;
    constexpr unsigned char TELNET_WILL = 251;
    constexpr unsigned char TELNET_DONT = 254;

    bool is_printable(char character) {
        const auto byte = static_cast<unsigned char>(character);
        return byte >= 0x20 && byte < 0x7F;
    }
} // namespace

std::string LineCodec::encode(std::string_view payload) {
    if(payload.empty()) {
        throw InvalidCommandError(payload, "payload is empty");
    }
    if(!std::ranges::all_of(payload, is_printable)) {
        throw InvalidCommandError(payload, "payload contains non-printable or non-ASCII characters");
    }

    std::string line {};
    line.reserve(payload.size() + LINE_TERMINATOR.size());
    line += payload;
    line += LINE_TERMINATOR;
    return line;
}

std::string LineCodec::stripTelnetControls(std::string_view bytes) {
    std::string out {};
    out.reserve(bytes.size());

    std::size_t pos = 0;
    while(pos < bytes.size()) {
        const auto byte = static_cast<unsigned char>(bytes[pos]);
        if(byte == '\0') {
            ++pos;
            continue;
        }
        if(byte != TELNET_IAC) {
            out += bytes[pos++];
            continue;
        }

        // Sequence starting with IAC, truncated sequences are dropped
        if(pos + 1 >= bytes.size()) {
            break;
        }
        const auto command = static_cast<unsigned char>(bytes[pos + 1]);
        if(command == TELNET_IAC) {
            // Escaped 0xFF data byte
            out += bytes[pos + 1];
            pos += 2;
        } else if(command >= TELNET_WILL && command <= TELNET_DONT) {
            // Option negotiation: IAC WILL/WONT/DO/DONT <option>
            pos += 3;
        } else if(command == TELNET_SB) {
            // Subnegotiation runs until IAC SE
            pos += 2;
            while(pos + 1 < bytes.size() &&
                  !(static_cast<unsigned char>(bytes[pos]) == TELNET_IAC &&
                    static_cast<unsigned char>(bytes[pos + 1]) == TELNET_SE)) {
                ++pos;
            }
            pos += 2;
        } else {
            // Two-byte command such as NOP or GA
            pos += 2;
        }
    }

    return out;
}

std::string LineCodec::decode(std::string_view bytes) {
    const auto stripped = stripTelnetControls(bytes);
    const auto line = trim(stripped);

    if(line.empty()) {
        throw ProtocolError("received empty line");
    }

    // Only multi-line answers may contain line breaks or tabs inside the line
    const auto valid = std::ranges::all_of(
        line, [](char character) { return is_printable(character) || character == '\r' || character == '\n' || character == '\t'; });
    if(!valid) {
        throw ProtocolError("received line with non-ASCII or control characters: \"" + escape_line(line) + "\"");
    }

    return to_string(line);
}

std::string_view LineCodec::terminatorFor(const Command& command) {
    return command.expectsMultiLineAnswer() ? MULTI_LINE_TERMINATOR : LINE_TERMINATOR;
}
