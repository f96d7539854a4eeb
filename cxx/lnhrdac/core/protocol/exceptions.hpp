/**
 * @file
 * @brief Collection of all protocol exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/utils/exceptions.hpp"
#include "lnhrdac/core/utils/string.hpp"

namespace lnhrdac::protocol {

    /**
     * @ingroup Exceptions
     * @brief Response line could not be decoded
     *
     * Indicates a framing desynchronization: the alignment of requests and responses on the session can no longer be
     * trusted, which makes this as severe as a connection error.
     */
    class LNHRDAC_API ProtocolError : public utils::RuntimeError {
    public:
        explicit ProtocolError(std::string_view reason) {
            error_message_ = "Protocol error: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Device rejected a command
     *
     * The device answered with an error token. The session is still usable.
     */
    class LNHRDAC_API CommandRejectedError : public utils::RuntimeError {
    public:
        /**
         * @param command Payload of the rejected command
         * @param code Error code reported by the device
         * @param answer Raw answer of the device
         */
        CommandRejectedError(std::string_view command, std::string code, std::string_view answer)
            : code_(std::move(code)) {
            error_message_ = "Command \"";
            error_message_ += command;
            error_message_ += "\" rejected by device with code ";
            error_message_ += code_;
            error_message_ += ", device answered \"";
            error_message_ += utils::escape_line(answer);
            error_message_ += "\"";
        }

        /** Error code reported by the device */
        std::string_view getCode() const { return code_; }

    private:
        std::string code_;
    };

    /**
     * @ingroup Exceptions
     * @brief Command does not fulfill the payload contract
     *
     * Thrown for empty payloads, payloads with non-printable characters, and for using a query with an operation that
     * expects a write command or vice versa.
     */
    class LNHRDAC_API InvalidCommandError : public utils::LogicError {
    public:
        InvalidCommandError(std::string_view command, std::string_view reason) {
            error_message_ = "Invalid command \"";
            error_message_ += utils::escape_line(command);
            error_message_ += "\": ";
            error_message_ += reason;
        }
    };

} // namespace lnhrdac::protocol
