/**
 * @file
 * @brief Abstract session to the device
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace lnhrdac::transport {

    /**
     * @brief Byte-stream session to the device
     *
     * A session carries one request/response exchange at a time. It is not thread-safe, exchanges are serialized by the
     * `CommandChannel` owning the session.
     */
    class Session {
    public:
        Session() = default;
        virtual ~Session() = default;

        // No copy/move constructor/assignment
        Session(const Session& other) = delete;
        Session& operator=(const Session& other) = delete;
        Session(Session&& other) = delete;
        Session& operator=(Session&& other) = delete;

        /**
         * @brief Open the session
         *
         * @throws ConnectionError If the device cannot be reached
         * @throws TimeoutError If the connection is not established within the timeout
         */
        virtual void open() = 0;

        /**
         * @brief Close the session, does nothing if the session is not open
         */
        virtual void close() = 0;

        /**
         * @brief Whether the session is open
         */
        virtual bool isOpen() const = 0;

        /**
         * @brief Write bytes to the device
         *
         * @throws ConnectionError If the session is not open or the write fails
         * @throws TimeoutError If the write does not complete within the timeout
         */
        virtual void write(std::string_view bytes) = 0;

        /**
         * @brief Read until a terminator is received
         *
         * @param terminator Byte sequence terminating the line
         * @param timeout Maximum time to wait for the terminator
         * @return Bytes up to and including the terminator
         * @throws ConnectionError If the session is not open or the device closed the connection
         * @throws TimeoutError If the terminator is not received within the timeout
         */
        virtual std::string readLine(std::string_view terminator, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief URI of the device, used in log messages and errors
         */
        virtual std::string getEndpoint() const = 0;
    };

    /** Factory creating a new, not yet opened session */
    using SessionFactory = std::function<std::unique_ptr<Session>()>;

} // namespace lnhrdac::transport
