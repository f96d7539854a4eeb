/**
 * @file
 * @brief Helpers for network endpoints
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <asio/ip/tcp.hpp>

#include "lnhrdac/core/utils/string.hpp"

namespace lnhrdac::utils {

    /**
     * @brief Port number for a network connection
     *
     * The device listens on the Telnet port by default.
     */
    using Port = std::uint16_t;

    /** Default Telnet port */
    constexpr Port TELNET_PORT = 23;

    /**
     * @brief Converts a host and port to a URI with given protocol
     */
    inline std::string endpoint_to_uri(std::string_view protocol, std::string_view host, Port port) {
        return to_string(protocol) + "://" + to_string(host) + ":" + to_string(port);
    }

    /**
     * @brief Converts an asio TCP endpoint to a URI
     */
    inline std::string endpoint_to_uri(const asio::ip::tcp::endpoint& endpoint) {
        return endpoint_to_uri("tcp", endpoint.address().to_string(), endpoint.port());
    }

} // namespace lnhrdac::utils
