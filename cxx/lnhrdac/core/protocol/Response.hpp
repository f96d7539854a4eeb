/**
 * @file
 * @brief Classified device response
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace lnhrdac::protocol {

    /**
     * @brief Response of the device to a command
     *
     * Derived from the decoded line by the `ResponseClassifier` and never mutated afterwards.
     */
    class Response {
    public:
        enum class Kind : std::uint8_t {
            /** Command was accepted */
            ACKNOWLEDGED,
            /** Device reported an error, see `getCode()` */
            ERROR_CODE,
            /** Answer to a query or unrecognized line, see `getValue()` */
            QUERY_VALUE,
        };

    public:
        static Response acknowledged(std::string raw) { return {std::move(raw), Kind::ACKNOWLEDGED, {}}; }
        static Response errorCode(std::string raw, std::string code) { return {std::move(raw), Kind::ERROR_CODE, std::move(code)}; }
        static Response queryValue(std::string raw) { return {std::move(raw), Kind::QUERY_VALUE, {}}; }

        /** Decoded line as received from the device */
        std::string_view getRaw() const { return raw_; }

        /** Kind of the response */
        Kind getKind() const { return kind_; }

        /** Error code reported by the device, empty unless the kind is `ERROR_CODE` */
        std::string_view getCode() const { return code_; }

        /** Value text, which for this protocol is the full decoded line */
        std::string_view getValue() const { return raw_; }

        bool isAcknowledged() const { return kind_ == Kind::ACKNOWLEDGED; }
        bool isError() const { return kind_ == Kind::ERROR_CODE; }
        bool isQueryValue() const { return kind_ == Kind::QUERY_VALUE; }

        bool operator==(const Response& other) const = default;

    private:
        Response(std::string raw, Kind kind, std::string code) : raw_(std::move(raw)), kind_(kind), code_(std::move(code)) {}

    private:
        std::string raw_;
        Kind kind_;
        std::string code_;
    };

} // namespace lnhrdac::protocol
