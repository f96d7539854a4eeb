/**
 * @file
 * @brief Driver for the LNHR DAC
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/log/Logger.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/transport/Session.hpp"
#include "lnhrdac/driver/CommandChannel.hpp"
#include "lnhrdac/driver/DriverConfig.hpp"

namespace lnhrdac::driver {

    /** Number of samples in a wave memory of the device */
    constexpr std::size_t WAVE_MEMORY_SIZE = 34000;

    /** Maximum absolute output voltage of the device */
    constexpr double MAX_VOLTAGE = 10.0;

    class Driver;

    /**
     * @brief Scoped held connection
     *
     * Holds the session of a driver open while the object is alive. Commands sent through this object are transmitted
     * over the held session. Holds nest, the session closes when the last one is released.
     *
     * @warning The object refers to the driver that created it and must be released or destroyed before that driver
     */
    class HeldConnection {
    public:
        /** Releases the held session */
        LNHRDAC_API ~HeldConnection();

        // No copy constructor/assignment
        HeldConnection(const HeldConnection& other) = delete;
        HeldConnection& operator=(const HeldConnection& other) = delete;

        // Move leaves the moved-from object released
        LNHRDAC_API HeldConnection(HeldConnection&& other) noexcept;
        HeldConnection& operator=(HeldConnection&& other) = delete;

        /** See `Driver::sendCommand` */
        LNHRDAC_API protocol::Response sendCommand(std::string_view text);

        /** See `Driver::sendQuery` */
        LNHRDAC_API std::string sendQuery(std::string_view text);

        /**
         * @brief Release the held session before the object goes out of scope
         */
        LNHRDAC_API void release();

        /** Whether the session is still held by this object */
        bool isActive() const { return driver_ != nullptr; }

    private:
        friend class Driver;
        explicit HeldConnection(Driver& driver);

    private:
        Driver* driver_;
    };

    /**
     * @brief Driver for the LNHR DAC
     *
     * Entry point for applications. Commands and queries are opaque strings from the device manual, the driver only
     * takes care of transmitting them, matching answers and reporting errors.
     *
     * @code
     * auto driver = Driver(config);
     * driver.sendCommand("1 on");
     * driver.sendCommand("c awg-a start");
     * driver.expectQueryAnswer("c awg-a?", "0", 100ms, 10s);
     * @endcode
     */
    class Driver {
    public:
        /**
         * @param config Configuration of the driver
         * @param session_factory Factory for sessions to the device, defaults to TCP sessions to the configured host
         */
        LNHRDAC_API explicit Driver(DriverConfig config, transport::SessionFactory session_factory = {});

        // No copy/move constructor/assignment
        Driver(const Driver& other) = delete;
        Driver& operator=(const Driver& other) = delete;
        Driver(Driver&& other) = delete;
        Driver& operator=(Driver&& other) = delete;

        LNHRDAC_API ~Driver();

        /**
         * @brief Check that the device is reachable and log the status of its channels
         *
         * @return Status of all channels as reported by the device
         */
        LNHRDAC_API std::string connect();

        /**
         * @brief Send a command
         *
         * @param text Command payload, must not be a query
         * @param mode Connection lifetime
         * @return Answer of the device, an acknowledgement or an unexpected line
         * @throws InvalidCommandError If the payload is invalid or a query
         * @throws CommandRejectedError If the device rejected the command
         */
        LNHRDAC_API protocol::Response sendCommand(std::string_view text, protocol::Mode mode = protocol::Mode::ONE_SHOT);

        /**
         * @brief Send a query
         *
         * @param text Query payload, must contain `?`
         * @param mode Connection lifetime
         * @return Value returned by the device
         * @throws InvalidCommandError If the payload is invalid or not a query
         * @throws CommandRejectedError If the device rejected the query
         */
        LNHRDAC_API std::string sendQuery(std::string_view text, protocol::Mode mode = protocol::Mode::ONE_SHOT);

        /**
         * @brief Poll a query until it returns the expected answer
         *
         * @param text Query payload
         * @param expected Expected answer
         * @param poll_interval Interval between polls, defaults to the configured interval
         * @param max_wait Maximum time to wait, unset to wait indefinitely
         * @param mode Connection lifetime
         * @return Number of exchanges with the device
         * @throws TimeoutError If the maximum wait time is exceeded
         */
        LNHRDAC_API std::size_t expectQueryAnswer(std::string_view text,
                                                  std::string_view expected,
                                                  std::optional<std::chrono::milliseconds> poll_interval = {},
                                                  std::optional<std::chrono::milliseconds> max_wait = {},
                                                  protocol::Mode mode = protocol::Mode::ONE_SHOT);

        /**
         * @brief Query once and compare the answer
         *
         * @return True if the device returned the expected answer
         */
        LNHRDAC_API bool checkQueryAnswer(std::string_view text,
                                          std::string_view expected,
                                          protocol::Mode mode = protocol::Mode::ONE_SHOT);

        /**
         * @brief Hold the session open until the returned object is destroyed
         *
         * The returned object must not outlive this driver.
         *
         * @throws ConnectionError If the session cannot be opened
         */
        LNHRDAC_API HeldConnection hold();

        /**
         * @brief Upload samples to a wave memory
         *
         * Sends one `wav-<memory> <address> <voltage>` command per sample over a held connection. The upload stops at
         * the first rejected sample.
         *
         * @param memory Wave memory, `a` to `d`
         * @param samples Voltages in V
         * @param start_address Address of the first sample
         * @return Number of uploaded samples
         * @throws InvalidCommandError If the memory does not exist, a sample is out of range or the samples do not fit
         * @throws CommandRejectedError If the device rejected a sample
         */
        LNHRDAC_API std::size_t uploadWaveMemory(char memory, std::span<const double> samples, std::size_t start_address = 0);

        /**
         * @brief Classifier applied to all answers, e.g. to register additional error tokens
         */
        protocol::ResponseClassifier& getClassifier() { return *classifier_; }

        /** Configuration of the driver */
        const DriverConfig& getConfig() const { return config_; }

    private:
        friend class HeldConnection;

        /** Build a command and check its kind */
        static protocol::Command make_command(std::string_view text, protocol::Mode mode, bool query);

    private:
        DriverConfig config_;
        std::unique_ptr<protocol::ResponseClassifier> classifier_;
        std::unique_ptr<CommandChannel> channel_;

        log::Logger logger_;
    };

} // namespace lnhrdac::driver
