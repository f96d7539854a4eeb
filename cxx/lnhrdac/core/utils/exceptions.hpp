/**
 * @file
 * @brief Base exceptions
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <exception>
#include <string>
#include <utility>

#include "lnhrdac/build.hpp"

namespace lnhrdac::utils {

    /**
     * @defgroup Exceptions Exception classes
     * @brief Collection of all the exceptions used in the driver
     */

    /**
     * @ingroup Exceptions
     * @brief Base class for all exceptions thrown by the driver
     *
     * Derived classes assemble their message in `error_message_` in their constructor.
     */
    class LNHRDAC_API Exception : public std::exception {
    public:
        /**
         * @brief Creates an exception with a specific error message
         * @param what_arg Text describing the error
         */
        explicit Exception(std::string what_arg) : error_message_(std::move(what_arg)) {}

        /**
         * @brief Return the error message
         * @return Text describing the error
         */
        const char* what() const noexcept override { return error_message_.c_str(); }

    protected:
        /**
         * @brief Internal constructor for exceptions setting the error message indirectly
         */
        Exception() = default;

        // NOLINTNEXTLINE(cppcoreguidelines-non-private-member-variables-in-classes)
        std::string error_message_;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors related to problems occurring at runtime
     *
     * Problems that could also have been detected at compile time by specialized software should use LogicError.
     */
    class LNHRDAC_API RuntimeError : public Exception {
    public:
        explicit RuntimeError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        RuntimeError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors related to logical problems in the calling code
     */
    class LNHRDAC_API LogicError : public Exception {
    public:
        explicit LogicError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        LogicError() = default;
    };

} // namespace lnhrdac::utils
