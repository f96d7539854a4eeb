/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include "lnhrdac/core/utils/networking.hpp"

// TCP server on an ephemeral port answering lines like the device
class MockDevice {
public:
    struct Reply {
        // Bytes sent back, including the terminator
        std::string bytes;
        // Close the connection instead of answering
        bool close {false};
    };

    using Handler = std::function<Reply(std::string_view line)>;

    static Reply answer(std::string_view line) { return {std::string(line) + "\r\n", false}; }
    static Reply silent() { return {{}, false}; }
    static Reply hang_up() { return {{}, true}; }

    explicit MockDevice(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {
        do_accept();
        thread_ = std::jthread([this]() { io_context_.run(); });
    }

    ~MockDevice() { io_context_.stop(); }

    MockDevice(const MockDevice& other) = delete;
    MockDevice& operator=(const MockDevice& other) = delete;
    MockDevice(MockDevice&& other) = delete;
    MockDevice& operator=(MockDevice&& other) = delete;

    lnhrdac::utils::Port getPort() const { return acceptor_.local_endpoint().port(); }

    std::size_t getConnections() const { return connections_.load(); }

    std::vector<std::string> getReceived() const {
        const std::lock_guard lock {mutex_};
        return received_;
    }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(MockDevice& device, asio::ip::tcp::socket socket) : device_(device), socket_(std::move(socket)) {}

        void read() {
            asio::async_read_until(
                socket_, buffer_, "\r\n", [self = shared_from_this()](const std::error_code& ec, std::size_t length) {
                    if(ec) {
                        return;
                    }
                    const auto begin = asio::buffers_begin(self->buffer_.data());
                    std::string line {begin, begin + static_cast<std::ptrdiff_t>(length - 2)};
                    self->buffer_.consume(length);
                    self->handle(line);
                });
        }

    private:
        void handle(const std::string& line) {
            {
                const std::lock_guard lock {device_.mutex_};
                device_.received_.push_back(line);
            }
            reply_ = device_.handler_(line);
            if(reply_.close) {
                std::error_code ec {};
                socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
                socket_.close(ec);
                return;
            }
            if(reply_.bytes.empty()) {
                read();
                return;
            }
            asio::async_write(socket_, asio::buffer(reply_.bytes), [self = shared_from_this()](const std::error_code& ec, std::size_t) {
                if(!ec) {
                    self->read();
                }
            });
        }

    private:
        MockDevice& device_;
        asio::ip::tcp::socket socket_;
        asio::streambuf buffer_;
        Reply reply_;
    };

    void do_accept() {
        acceptor_.async_accept([this](const std::error_code& ec, asio::ip::tcp::socket socket) {
            if(ec) {
                return;
            }
            ++connections_;
            std::make_shared<Connection>(*this, std::move(socket))->read();
            do_accept();
        });
    }

private:
    Handler handler_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::atomic_size_t connections_ {0};
    mutable std::mutex mutex_;
    std::vector<std::string> received_;
    std::jthread thread_;
};
