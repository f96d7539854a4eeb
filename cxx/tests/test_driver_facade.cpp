/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <cmath>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/transport/exceptions.hpp"
#include "lnhrdac/driver/Driver.hpp"
#include "lnhrdac/driver/DriverConfig.hpp"

#include "device_mock.hpp"
#include "session_mock.hpp"

using namespace Catch::Matchers;
using namespace lnhrdac::driver;
using namespace lnhrdac::protocol;
using namespace lnhrdac::transport;
using namespace std::chrono_literals;

namespace {
    DriverConfig fast_config() {
        DriverConfig config {};
        config.host = "127.0.0.1";
        config.timings = fast_timings();
        config.poll_interval = 1ms;
        return config;
    }
} // namespace

TEST_CASE("Connect queries channel status", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("ON;OFF;OFF;OFF");
    REQUIRE(driver.connect() == "ON;OFF;OFF;OFF");
    REQUIRE(script.getWritten() == std::vector<std::string> {"all s?\r\n"});
}

TEST_CASE("Send command and query", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("0");
    REQUIRE(driver.sendCommand("1 on").isAcknowledged());

    script.answer("+2.500000");
    REQUIRE(driver.sendQuery("1 v?") == "+2.500000");
    REQUIRE(script.getOpens() == 2);
    REQUIRE(script.getCloses() == 2);
}

TEST_CASE("Command kind is checked", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    REQUIRE_THROWS_AS(driver.sendCommand("1 v?"), InvalidCommandError);
    REQUIRE_THROWS_AS(driver.sendQuery("1 on"), InvalidCommandError);
    REQUIRE_THROWS_AS(driver.expectQueryAnswer("1 on", "0"), InvalidCommandError);
    REQUIRE_THROWS_AS(driver.sendCommand(""), InvalidCommandError);
    REQUIRE(script.getSessions() == 0);
}

TEST_CASE("Rejected command carries device code", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    auto held = driver.hold();
    script.answer("ERR 3");
    try {
        held.sendCommand("1 foo");
        FAIL("no exception thrown");
    } catch(const CommandRejectedError& error) {
        REQUIRE(error.getCode() == "3");
    }

    script.answer("0");
    REQUIRE(held.sendCommand("1 on").isAcknowledged());
    REQUIRE(script.getOpens() == 1);
}

TEST_CASE("Expect query answer", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("1", 3);
    script.answer("0");
    REQUIRE(driver.expectQueryAnswer("c awg-a?", "0") == 4);
    REQUIRE(script.getExchanges() == 4);

    script.answer("1", 1000);
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(driver.expectQueryAnswer("c awg-a?", "0", 10ms, 50ms), TimeoutError);
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
}

TEST_CASE("Expect query answer over held connection", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("1", 9);
    script.answer("0");
    const auto held = driver.hold();
    REQUIRE(driver.expectQueryAnswer("c wmem-a?", "0", 1ms, {}, Mode::HELD_CONNECTION) == 10);
    REQUIRE(script.getOpens() == 1);
    REQUIRE(script.getCloses() == 0);
}

TEST_CASE("Check query answer", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("ON");
    REQUIRE(driver.checkQueryAnswer("1 s?", "ON"));
    script.answer("OFF");
    REQUIRE_FALSE(driver.checkQueryAnswer("1 s?", "ON"));
    REQUIRE(script.getExchanges() == 2);
}

TEST_CASE("Held connection is scoped", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    {
        auto held = driver.hold();
        REQUIRE(held.isActive());
        script.answer("0", 3);
        held.sendCommand("1 on");
        held.sendCommand("2 on");
        driver.sendCommand("3 on", Mode::HELD_CONNECTION);
        REQUIRE(script.getOpens() == 1);
    }
    REQUIRE(script.getCloses() == 1);

    // Explicit release, moved-from guard does not release again
    auto first = driver.hold();
    auto second = std::move(first);
    REQUIRE_FALSE(first.isActive());
    second.release();
    REQUIRE_FALSE(second.isActive());
    REQUIRE(script.getCloses() == 2);
    REQUIRE_THROWS_AS(second.sendCommand("1 on"), InvalidCommandError);
}

TEST_CASE("Held connection released on exception", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("?");
    try {
        auto held = driver.hold();
        held.sendCommand("1 foo");
    } catch(const CommandRejectedError&) {
        // Expected
    }
    REQUIRE(script.getOpens() == 1);
    REQUIRE(script.getCloses() == 1);
}

TEST_CASE("Upload inside held connection keeps it open", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    const std::vector<double> samples(10, 0.25);
    script.answer("0", samples.size() + 2);
    {
        auto held = driver.hold();
        REQUIRE(driver.uploadWaveMemory('a', samples) == 10);
        REQUIRE(held.isActive());
        REQUIRE(script.getOpens() == 1);
        REQUIRE(script.getCloses() == 0);

        held.sendCommand("c wmem-a write");
        driver.sendCommand("c awg-a start", Mode::HELD_CONNECTION);
        REQUIRE(script.getOpens() == 1);
        REQUIRE(script.getCloses() == 0);
    }
    REQUIRE(script.getCloses() == 1);
    REQUIRE(script.getExchanges() == 12);
}

TEST_CASE("Upload wave memory", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    std::vector<double> samples {};
    for(int n = 0; n < 1000; ++n) {
        samples.push_back(std::sin(n * 0.01));
    }
    script.answer("0", samples.size());

    REQUIRE(driver.uploadWaveMemory('A', samples) == 1000);
    REQUIRE(script.getOpens() == 1);
    REQUIRE(script.getCloses() == 1);

    const auto written = script.getWritten();
    REQUIRE(written.size() == 1000);
    REQUIRE(written.front() == "wav-a 0 0.000000\r\n");
    REQUIRE(written[10] == "wav-a A 0.099833\r\n");
    REQUIRE(written.back() == "wav-a 3E7 -0.535603\r\n");
}

TEST_CASE("Upload wave memory at offset", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    const std::vector<double> samples {-10.0, 10.0};
    script.answer("0", 2);
    REQUIRE(driver.uploadWaveMemory('b', samples, WAVE_MEMORY_SIZE - 2) == 2);
    REQUIRE(script.getWritten() == std::vector<std::string> {"wav-b 84CE -10.000000\r\n", "wav-b 84CF 10.000000\r\n"});
}

TEST_CASE("Upload wave memory aborts on first rejection", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    const std::vector<double> samples(10, 1.0);
    script.answer("0", 3);
    script.answer("ERR 7");
    script.answer("0", 6);

    REQUIRE_THROWS_AS(driver.uploadWaveMemory('a', samples), CommandRejectedError);
    REQUIRE(script.getExchanges() == 4);
    REQUIRE(script.getCloses() == 1);
}

TEST_CASE("Invalid wave memory upload", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    const std::vector<double> samples {0.0, 1.0};
    REQUIRE_THROWS_AS(driver.uploadWaveMemory('e', samples), InvalidCommandError);
    REQUIRE_THROWS_AS(driver.uploadWaveMemory('a', samples, WAVE_MEMORY_SIZE - 1), InvalidCommandError);
    REQUIRE_THROWS_AS(driver.uploadWaveMemory('a', std::vector<double>(WAVE_MEMORY_SIZE + 1, 0.0)), InvalidCommandError);
    REQUIRE_THROWS_WITH(driver.uploadWaveMemory('a', std::vector<double> {0.0, 10.5}), ContainsSubstring("out of range"));
    REQUIRE_THROWS_AS(driver.uploadWaveMemory('a', std::vector<double> {std::numeric_limits<double>::quiet_NaN()}),
                      InvalidCommandError);
    REQUIRE(script.getSessions() == 0);
}

TEST_CASE("Additional error token", "[driver][driver::facade]") {
    MockScript script {};
    Driver driver {fast_config(), script.factory()};

    script.answer("FAIL 2");
    REQUIRE(driver.sendCommand("1 on").isQueryValue());

    driver.getClassifier().registerErrorToken("FAIL");
    script.answer("FAIL 2");
    REQUIRE_THROWS_AS(driver.sendCommand("1 on"), CommandRejectedError);
}

TEST_CASE("Driver over TCP", "[driver][driver::facade]") {
    std::mutex state_mutex {};
    std::string channel_state {"OFF"};

    const MockDevice device {[&](std::string_view line) {
        const std::lock_guard lock {state_mutex};
        if(line == "all s?") {
            return MockDevice::answer(channel_state + ";OFF");
        }
        if(line == "1 on") {
            channel_state = "ON";
            return MockDevice::answer("0");
        }
        if(line == "1 s?") {
            return MockDevice::answer(channel_state);
        }
        if(line.starts_with("wav-a ")) {
            return MockDevice::answer("0");
        }
        if(line == "1 drop") {
            return MockDevice::hang_up();
        }
        return MockDevice::answer("ERR 1");
    }};

    auto config = fast_config();
    config.port = device.getPort();
    config.timings.timeout = 1s;
    Driver driver {config};

    REQUIRE(driver.connect() == "OFF;OFF");
    REQUIRE(driver.sendCommand("1 on").isAcknowledged());
    REQUIRE(driver.expectQueryAnswer("1 s?", "ON", 1ms, 1s) == 1);
    REQUIRE_THROWS_AS(driver.sendCommand("1 foo"), CommandRejectedError);
    REQUIRE(device.getConnections() == 4);

    const std::vector<double> samples(1000, 0.5);
    REQUIRE(driver.uploadWaveMemory('a', samples) == 1000);
    REQUIRE(device.getConnections() == 5);

    // Dropped connection is a connection error, not a timeout
    REQUIRE_THROWS_AS(driver.sendCommand("1 drop"), ConnectionError);
}

TEST_CASE("Late answer is not paired with the next command", "[driver][driver::facade]") {
    const MockDevice device {[](std::string_view line) {
        if(line == "c wmem-a write") {
            // Answer after the driver gave up waiting
            std::this_thread::sleep_for(300ms);
            return MockDevice::answer("LATE");
        }
        if(line == "1 s?") {
            return MockDevice::answer("ON");
        }
        return MockDevice::answer("ERR 1");
    }};

    auto config = fast_config();
    config.port = device.getPort();
    config.timings.timeout = 200ms;
    Driver driver {config};

    auto held = driver.hold();
    REQUIRE_THROWS_AS(held.sendCommand("c wmem-a write"), TimeoutError);

    // Timed out session was dropped, the query gets its own answer on a new connection
    REQUIRE(held.sendQuery("1 s?") == "ON");
    REQUIRE(device.getConnections() == 2);
}
