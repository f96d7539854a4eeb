/**
 * @file
 * @brief Implementation of the TCP session
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "TCPSession.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/use_future.hpp>
#include <asio/write.hpp>

#include "lnhrdac/core/log/log.hpp"
#include "lnhrdac/core/transport/exceptions.hpp"
#include "lnhrdac/core/utils/networking.hpp"
#include "lnhrdac/core/utils/string.hpp"

using namespace lnhrdac::transport;
using namespace lnhrdac::utils;

TCPSession::TCPSession(std::string host, Port port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout), socket_(io_context_), logger_("TRANSPORT") {}

TCPSession::~TCPSession() {
    close();
}

SessionFactory TCPSession::factory(std::string host, Port port, std::chrono::milliseconds timeout) {
    return [host = std::move(host), port, timeout]() -> std::unique_ptr<Session> {
        return std::make_unique<TCPSession>(host, port, timeout);
    };
}

std::string TCPSession::getEndpoint() const {
    return endpoint_to_uri("tcp", host_, port_);
}

bool TCPSession::isOpen() const {
    return socket_.is_open();
}

bool TCPSession::run_with_timeout(std::chrono::milliseconds timeout) {
    // Run IO context for timeout
    io_context_.restart();
    io_context_.run_for(timeout);

    // If IO context not stopped, then the operation did not complete
    if(!io_context_.stopped()) {
        // Cancel async operations and let the cancelled handlers complete
        socket_.cancel();
        io_context_.restart();
        io_context_.run();
        return false;
    }
    return true;
}

void TCPSession::fail(std::string_view reason) {
    close();
    throw ConnectionError(getEndpoint(), reason);
}

void TCPSession::open() {
    if(isOpen()) {
        return;
    }

    LOG(logger_, DEBUG) << "Connecting to " << getEndpoint();

    // Resolve host, which fails for unknown hostnames
    asio::ip::tcp::resolver resolver {io_context_};
    std::error_code ec {};
    const auto endpoints = resolver.resolve(host_, to_string(port_), ec);
    if(ec) {
        throw ConnectionError(getEndpoint(), "could not resolve host: " + ec.message());
    }

    auto endpoint_future = asio::async_connect(socket_, endpoints, asio::use_future);
    if(!run_with_timeout(timeout_)) {
        close();
        throw TimeoutError("connecting to " + getEndpoint(), timeout_);
    }

    try {
        const auto endpoint = endpoint_future.get();
        LOG(logger_, DEBUG) << "Connected to " << endpoint_to_uri(endpoint);
    } catch(const std::system_error& error) {
        fail(error.code().message());
    }
}

void TCPSession::close() {
    if(!socket_.is_open()) {
        return;
    }

    // Errors on shutdown are irrelevant since the socket is discarded
    std::error_code ec {};
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    buffer_.consume(buffer_.size());

    LOG(logger_, DEBUG) << "Closed connection to " << getEndpoint();
}

void TCPSession::write(std::string_view bytes) {
    if(!isOpen()) {
        throw ConnectionError(getEndpoint(), "session is not open");
    }

    LOG(logger_, TRACE) << "Sending \"" << escape_line(bytes) << "\"";

    auto length_future = asio::async_write(socket_, asio::buffer(bytes.data(), bytes.size()), asio::use_future);
    if(!run_with_timeout(timeout_)) {
        throw TimeoutError("sending to " + getEndpoint(), timeout_);
    }

    try {
        length_future.get();
    } catch(const std::system_error& error) {
        fail("write failed: " + error.code().message());
    }
}

std::string TCPSession::readLine(std::string_view terminator, std::chrono::milliseconds timeout) {
    if(!isOpen()) {
        throw ConnectionError(getEndpoint(), "session is not open");
    }

    auto length_future = asio::async_read_until(socket_, buffer_, to_string(terminator), asio::use_future);
    if(!run_with_timeout(timeout)) {
        // Partial data stays buffered for the next read
        throw TimeoutError("waiting for answer from " + getEndpoint(), timeout);
    }

    std::size_t length = 0;
    try {
        length = length_future.get();
    } catch(const std::system_error& error) {
        if(error.code() == asio::error::eof) {
            fail("connection closed by device");
        }
        fail("read failed: " + error.code().message());
    }

    const auto begin = asio::buffers_begin(buffer_.data());
    std::string line {begin, begin + static_cast<std::ptrdiff_t>(length)};
    buffer_.consume(length);

    LOG(logger_, TRACE) << "Received \"" << escape_line(line) << "\"";
    return line;
}
