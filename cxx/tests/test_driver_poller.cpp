/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>

#include <catch2/catch_test_macros.hpp>

#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"
#include "lnhrdac/core/transport/exceptions.hpp"
#include "lnhrdac/driver/CommandChannel.hpp"
#include "lnhrdac/driver/Poller.hpp"

#include "session_mock.hpp"

using namespace lnhrdac::driver;
using namespace lnhrdac::protocol;
using namespace lnhrdac::transport;
using namespace std::chrono_literals;

TEST_CASE("Poll succeeds after mismatches", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("1", 4);
    script.answer("0");

    Poller poller {channel};
    REQUIRE(poller.getState() == Poller::State::POLLING);
    const auto attempts = poller.waitFor({.query = Command("c awg-a?"), .expected = "0", .poll_interval = 1ms});
    REQUIRE(attempts == 5);
    REQUIRE(script.getExchanges() == 5);
    REQUIRE(poller.getState() == Poller::State::SUCCEEDED);
}

TEST_CASE("Poll succeeds immediately", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("ON");
    Poller poller {channel};
    REQUIRE(poller.waitFor({.query = Command("1 s?"), .expected = "ON", .max_wait = 0ms}) == 1);
}

TEST_CASE("Poll times out", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("1", 1000);

    Poller poller {channel};
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(
        poller.waitFor({.query = Command("c awg-a?"), .expected = "0", .poll_interval = 20ms, .max_wait = 100ms}),
        TimeoutError);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed >= 100ms);
    REQUIRE(elapsed < 1s);
    REQUIRE(poller.getState() == Poller::State::TIMED_OUT);

    // Sleep is clipped to the deadline, so only a handful of polls were issued
    REQUIRE(script.getExchanges() <= 7);
}

TEST_CASE("Poll aborts on device error", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("1");
    script.answer("ERR 5");

    Poller poller {channel};
    REQUIRE_THROWS_AS(poller.waitFor({.query = Command("c awg-a?"), .expected = "0", .poll_interval = 1ms}),
                      CommandRejectedError);
    REQUIRE(poller.getState() == Poller::State::FAILED);
    REQUIRE(script.getExchanges() == 2);
}

TEST_CASE("Dropped connection while polling", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("1");
    script.disconnect();

    Poller poller {channel};
    REQUIRE_THROWS_AS(poller.waitFor({.query = Command("c awg-a?", Mode::HELD_CONNECTION),
                                      .expected = "0",
                                      .poll_interval = 1ms,
                                      .max_wait = 1s}),
                      ConnectionError);
    REQUIRE(poller.getState() == Poller::State::FAILED);
    REQUIRE_FALSE(channel.isHeld());
}

TEST_CASE("Poll requires a query", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    Poller poller {channel};
    REQUIRE_THROWS_AS(poller.waitFor({.query = Command("1 on"), .expected = "0"}), InvalidCommandError);
    REQUIRE(script.getExchanges() == 0);
}

TEST_CASE("Poller is not reusable", "[driver][driver::poller]") {
    MockScript script {};
    ResponseClassifier classifier {};
    CommandChannel channel {script.factory(), fast_timings(), classifier};

    script.answer("0", 2);
    Poller poller {channel};
    poller.waitFor({.query = Command("c awg-a?"), .expected = "0"});
    REQUIRE_THROWS_AS(poller.waitFor({.query = Command("c awg-a?"), .expected = "0"}), InvalidCommandError);
    REQUIRE(poller.getState() == Poller::State::SUCCEEDED);
}
