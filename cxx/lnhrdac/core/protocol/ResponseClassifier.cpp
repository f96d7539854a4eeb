/**
 * @file
 * @brief Implementation of the response classifier
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ResponseClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::protocol;
using namespace lnhrdac::utils;

namespace {
    bool is_integer(std::string_view string) {
        if(!string.empty() && (string.front() == '-' || string.front() == '+')) {
            string.remove_prefix(1);
        }
        return !string.empty() &&
               std::ranges::all_of(string, [](char character) { return std::isdigit(static_cast<unsigned char>(character)) != 0; });
    }

    bool is_token_boundary(char character) {
        return std::isspace(static_cast<unsigned char>(character)) != 0 || character == ':' || character == '-';
    }
} // namespace

std::vector<std::string> ResponseClassifier::defaultErrorTokens() {
    return {"ERR", "ERROR"};
}

ResponseClassifier::ResponseClassifier() : ResponseClassifier(defaultErrorTokens()) {}

ResponseClassifier::ResponseClassifier(std::vector<std::string> error_tokens) {
    for(auto& token : error_tokens) {
        registerErrorToken(std::move(token));
    }
}

void ResponseClassifier::registerErrorToken(std::string token) {
    const auto trimmed = to_string(trim(token));
    if(trimmed.empty()) {
        return;
    }
    const auto exists = std::ranges::any_of(error_tokens_, [&](const auto& registered) {
        return registered.size() == trimmed.size() && starts_with_icase(registered, trimmed);
    });
    if(!exists) {
        error_tokens_.push_back(trimmed);
    }
}

std::optional<std::string> ResponseClassifier::match_error_token(std::string_view line) const {
    // Longest token first so that "ERROR" is not matched as "ERR" followed by "OR"
    const std::string* best = nullptr;
    for(const auto& token : error_tokens_) {
        if(!starts_with_icase(line, token)) {
            continue;
        }
        if(line.size() > token.size() && !is_token_boundary(line[token.size()])) {
            continue;
        }
        if(best == nullptr || token.size() > best->size()) {
            best = &token;
        }
    }
    if(best == nullptr) {
        return std::nullopt;
    }

    auto rest = line.substr(best->size());
    while(!rest.empty() && is_token_boundary(rest.front())) {
        rest.remove_prefix(1);
    }
    return to_string(trim(rest));
}

Response ResponseClassifier::classify(std::string_view line) const {
    const auto text = trim(line);

    if(text == ACK_TOKEN) {
        return Response::acknowledged(to_string(text));
    }
    if(auto code = match_error_token(text)) {
        return Response::errorCode(to_string(text), std::move(code.value()));
    }
    if(!text.empty() && text.front() == '?') {
        return Response::errorCode(to_string(text), "?");
    }
    return Response::queryValue(to_string(text));
}

Response ResponseClassifier::classify(std::string_view line, const Command& command) const {
    const auto text = trim(line);

    // Multi-line answers (help, identification, health...) are always values
    if(command.expectsMultiLineAnswer()) {
        return Response::queryValue(to_string(text));
    }

    if(auto code = match_error_token(text)) {
        return Response::errorCode(to_string(text), std::move(code.value()));
    }
    if(!text.empty() && text.front() == '?') {
        return Response::errorCode(to_string(text), "?");
    }

    if(command.isQuery()) {
        if(text.find('?') != std::string_view::npos) {
            return Response::errorCode(to_string(text), "?");
        }
        return Response::queryValue(to_string(text));
    }

    if(text == ACK_TOKEN) {
        return Response::acknowledged(to_string(text));
    }
    if(is_integer(text)) {
        return Response::errorCode(to_string(text), to_string(text));
    }
    return Response::queryValue(to_string(text));
}
