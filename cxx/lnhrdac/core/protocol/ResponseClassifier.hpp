/**
 * @file
 * @brief Classification of device answers
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/Response.hpp"

namespace lnhrdac::protocol {

    /** Token with which the device acknowledges a command */
    constexpr std::string_view ACK_TOKEN = "0";

    /**
     * @brief Response classifier
     *
     * Maps a decoded line to a `Response`. The device acknowledges commands with `0` and reports errors either with a
     * registered error token followed by an optional code (e.g. `ERR 3`), with a line starting with `?`, or with a
     * non-zero error number. Classification never fails: anything not recognized is a query value.
     */
    class ResponseClassifier {
    public:
        /** Error tokens registered by default */
        LNHRDAC_API static std::vector<std::string> defaultErrorTokens();

    public:
        /**
         * @brief Construct a classifier with the default error tokens
         */
        LNHRDAC_API ResponseClassifier();

        /**
         * @brief Construct a classifier with a custom list of error tokens
         *
         * @param error_tokens Error tokens, matched case-insensitively
         */
        LNHRDAC_API explicit ResponseClassifier(std::vector<std::string> error_tokens);

        /**
         * @brief Classify a line without knowledge of the command it answers
         *
         * @param line Decoded line
         * @return Classified response
         */
        LNHRDAC_API Response classify(std::string_view line) const;

        /**
         * @brief Classify a line as answer to a given command
         *
         * For queries the acknowledgement token is a legitimate value, and single-line answers containing `?` are errors.
         * For write commands a bare non-zero number is an error code.
         *
         * @param line Decoded line
         * @param command Command the line answers
         * @return Classified response
         */
        LNHRDAC_API Response classify(std::string_view line, const Command& command) const;

        /**
         * @brief Register an additional error token
         *
         * Empty tokens and tokens that are already registered are ignored.
         */
        LNHRDAC_API void registerErrorToken(std::string token);

        /** Registered error tokens */
        const std::vector<std::string>& getErrorTokens() const { return error_tokens_; }

    private:
        /** Match a registered error token at the start of the line and return the code following it */
        std::optional<std::string> match_error_token(std::string_view line) const;

    private:
        std::vector<std::string> error_tokens_;
    };

} // namespace lnhrdac::protocol
