/**
 * @file
 * @brief Collection of all transport exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/utils/exceptions.hpp"
#include "lnhrdac/core/utils/string.hpp"

namespace lnhrdac::transport {

    /**
     * @ingroup Exceptions
     * @brief Connection to the device could not be established or was lost
     *
     * Fatal to the session it occurred on. The driver never reconnects automatically.
     */
    class LNHRDAC_API ConnectionError : public utils::RuntimeError {
    public:
        /**
         * @param endpoint URI of the device
         * @param reason Description of the failure
         */
        ConnectionError(std::string_view endpoint, std::string_view reason) {
            error_message_ = "Connection to ";
            error_message_ += endpoint;
            error_message_ += " failed: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Operation did not complete within its timeout
     *
     * Recoverable, the caller may retry the logical operation.
     */
    class LNHRDAC_API TimeoutError : public utils::RuntimeError {
    public:
        /**
         * @param what Operation that timed out
         * @param timeout Timeout that was exceeded
         */
        TimeoutError(std::string_view what, std::chrono::milliseconds timeout) {
            error_message_ = "Timeout while ";
            error_message_ += what;
            error_message_ += " after ";
            error_message_ += utils::to_string(timeout);
        }
    };

} // namespace lnhrdac::transport
