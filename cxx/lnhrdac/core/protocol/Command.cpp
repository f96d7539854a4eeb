/**
 * @file
 * @brief Implementation of the device command
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Command.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::protocol;
using namespace lnhrdac::utils;

Command::Command(std::string_view payload, Mode mode) : payload_(trim(payload)), mode_(mode), kind_(Kind::WRITE) {
    if(payload_.empty()) {
        throw InvalidCommandError(payload, "payload is empty");
    }
    const auto printable = std::ranges::all_of(payload_, [](char character) {
        const auto byte = static_cast<unsigned char>(character);
        return byte >= 0x20 && byte < 0x7F;
    });
    if(!printable) {
        throw InvalidCommandError(payload, "payload contains non-printable or non-ASCII characters");
    }
    if(payload_.find('?') != std::string::npos) {
        kind_ = Kind::QUERY;
    }
}

bool Command::isControl() const {
    return payload_.front() == 'c' || payload_.front() == 'C';
}

bool Command::isMemoryWrite() const {
    return isControl() && transform(payload_, ::tolower).find("write") != std::string::npos;
}

bool Command::expectsMultiLineAnswer() const {
    const auto normalized = transform(payload_, ::tolower);
    return std::ranges::find(MULTI_LINE_QUERIES, normalized) != MULTI_LINE_QUERIES.end();
}
