/**
 * @file
 * @brief TCP session to the device
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Logger.hpp"
#include "lnhrdac/core/transport/Session.hpp"
#include "lnhrdac/core/utils/networking.hpp"

namespace lnhrdac::transport {

    /**
     * @brief TCP session
     *
     * Blocking session on top of asio. Every operation runs the io context for at most the configured timeout, and
     * cancels the pending operation if it did not complete.
     */
    class TCPSession : public Session {
    public:
        /**
         * @param host Hostname or IP address of the device
         * @param port Port of the device
         * @param timeout Timeout for connecting and writing
         */
        LNHRDAC_API TCPSession(std::string host, utils::Port port, std::chrono::milliseconds timeout);

        /** Closes the session */
        LNHRDAC_API ~TCPSession() override;

        // No copy/move constructor/assignment
        TCPSession(const TCPSession& other) = delete;
        TCPSession& operator=(const TCPSession& other) = delete;
        TCPSession(TCPSession&& other) = delete;
        TCPSession& operator=(TCPSession&& other) = delete;

        LNHRDAC_API void open() override;
        LNHRDAC_API void close() override;
        LNHRDAC_API bool isOpen() const override;
        LNHRDAC_API void write(std::string_view bytes) override;
        LNHRDAC_API std::string readLine(std::string_view terminator, std::chrono::milliseconds timeout) override;
        LNHRDAC_API std::string getEndpoint() const override;

        /**
         * @brief Create a factory for TCP sessions to a given device
         */
        LNHRDAC_API static SessionFactory factory(std::string host, utils::Port port, std::chrono::milliseconds timeout);

    private:
        /**
         * @brief Run the io context until the pending operation completes or the timeout expires
         *
         * @return True if the operation completed, false if it was cancelled
         */
        bool run_with_timeout(std::chrono::milliseconds timeout);

        /** Close the socket after a failure and throw a connection error */
        [[noreturn]] void fail(std::string_view reason);

    private:
        std::string host_;
        utils::Port port_;
        std::chrono::milliseconds timeout_;

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        asio::streambuf buffer_;

        log::Logger logger_;
    };

} // namespace lnhrdac::transport
