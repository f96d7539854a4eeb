/**
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/protocol/exceptions.hpp"
#include "lnhrdac/core/protocol/LineCodec.hpp"
#include "lnhrdac/core/protocol/Response.hpp"
#include "lnhrdac/core/protocol/ResponseClassifier.hpp"

using namespace Catch::Matchers;
using namespace lnhrdac::protocol;
using namespace std::string_literals;

TEST_CASE("Command kind", "[core][core::protocol]") {
    const Command write {"1 on"};
    REQUIRE_FALSE(write.isQuery());
    REQUIRE(write.getMode() == Mode::ONE_SHOT);

    const Command query {"1 v?", Mode::HELD_CONNECTION};
    REQUIRE(query.isQuery());
    REQUIRE(query.getMode() == Mode::HELD_CONNECTION);
    REQUIRE(query.withMode(Mode::ONE_SHOT).getMode() == Mode::ONE_SHOT);
}

TEST_CASE("Command payload is trimmed", "[core][core::protocol]") {
    const Command command {"  all s?\t"};
    REQUIRE(command.getPayload() == "all s?");
}

TEST_CASE("Invalid command payload", "[core][core::protocol]") {
    REQUIRE_THROWS_AS(Command(""), InvalidCommandError);
    REQUIRE_THROWS_AS(Command("   "), InvalidCommandError);
    REQUIRE_THROWS_AS(Command("1 on\r\n2 off"), InvalidCommandError);
    REQUIRE_THROWS_WITH(Command("1 \xB5V"), ContainsSubstring("non-printable"));
}

TEST_CASE("Control and memory write commands", "[core][core::protocol]") {
    REQUIRE(Command("c awg-a start").isControl());
    REQUIRE(Command("C WAV-A SAVE").isControl());
    REQUIRE_FALSE(Command("1 on").isControl());
    REQUIRE(Command("c wmem-a write").isMemoryWrite());
    REQUIRE_FALSE(Command("c wmem-a clear").isMemoryWrite());
    REQUIRE_FALSE(Command("wav-a 0 1.0").isMemoryWrite());
}

TEST_CASE("Multi-line queries", "[core][core::protocol]") {
    REQUIRE(Command("?").expectsMultiLineAnswer());
    REQUIRE(Command("HELP?").expectsMultiLineAnswer());
    REQUIRE(Command("health?").expectsMultiLineAnswer());
    REQUIRE_FALSE(Command("all s?").expectsMultiLineAnswer());
    REQUIRE(LineCodec::terminatorFor(Command("idn?")) == "\r\r");
    REQUIRE(LineCodec::terminatorFor(Command("1 v?")) == "\r\n");
}

TEST_CASE("Encode line", "[core][core::protocol]") {
    REQUIRE(LineCodec::encode("1 on") == "1 on\r\n");
    REQUIRE_THROWS_AS(LineCodec::encode(""), InvalidCommandError);
    REQUIRE_THROWS_AS(LineCodec::encode("1 on\n"), InvalidCommandError);
}

TEST_CASE("Decode line", "[core][core::protocol]") {
    REQUIRE(LineCodec::decode("0\r\n") == "0");
    REQUIRE(LineCodec::decode("  +1.23456\r\n") == "+1.23456");
    REQUIRE(LineCodec::decode(LineCodec::encode("1 v?")) == "1 v?");
    REQUIRE_THROWS_AS(LineCodec::decode("\r\n"), ProtocolError);
    REQUIRE_THROWS_AS(LineCodec::decode("0\x01\r\n"s), ProtocolError);
}

TEST_CASE("Decode multi-line answer", "[core][core::protocol]") {
    const auto line = LineCodec::decode("Ch1 ON\r\nCh2 OFF\r\n\r\r");
    REQUIRE(line == "Ch1 ON\r\nCh2 OFF");
}

TEST_CASE("Strip Telnet negotiation", "[core][core::protocol]") {
    // IAC DO ECHO, IAC WILL SUPPRESS-GO-AHEAD
    const auto negotiation = "\xFF\xFD\x01\xFF\xFB\x03"s;
    REQUIRE(LineCodec::decode(negotiation + "0\r\n") == "0");

    // Subnegotiation and NUL bytes
    const auto subnegotiation = "\xFF\xFA\x18\x01\xFF\xF0"s;
    REQUIRE(LineCodec::stripTelnetControls(subnegotiation + "1\0 on"s) == "1 on");

    // Escaped 0xFF data byte
    REQUIRE(LineCodec::stripTelnetControls("\xFF\xFF"s) == "\xFF"s);
}

TEST_CASE("Classify acknowledgement", "[core][core::protocol]") {
    const ResponseClassifier classifier {};
    REQUIRE(classifier.classify("0").isAcknowledged());
    REQUIRE(classifier.classify("0", Command("1 on")).isAcknowledged());

    // Zero is a value in answer to a query
    const auto value = classifier.classify("0", Command("c awg-a?"));
    REQUIRE(value.isQueryValue());
    REQUIRE(value.getValue() == "0");
}

TEST_CASE("Classify error token", "[core][core::protocol]") {
    const ResponseClassifier classifier {};

    const auto err = classifier.classify("ERR 3");
    REQUIRE(err.isError());
    REQUIRE(err.getCode() == "3");
    REQUIRE(err.getRaw() == "ERR 3");

    REQUIRE(classifier.classify("error: overload").getCode() == "overload");
    REQUIRE(classifier.classify("ERR-12").getCode() == "12");
    REQUIRE(classifier.classify("ERROR").isError());
    REQUIRE(classifier.classify("ERROR").getCode().empty());

    // Token must be followed by a separator
    REQUIRE(classifier.classify("ERRATIC").isQueryValue());
    REQUIRE(classifier.classify("ERR 3", Command("1 v?")).isError());
}

TEST_CASE("Classify rejection marker", "[core][core::protocol]") {
    const ResponseClassifier classifier {};
    REQUIRE(classifier.classify("?").isError());
    REQUIRE(classifier.classify("? unknown command", Command("1 foo")).isError());
    REQUIRE(classifier.classify("1 foo?", Command("1 foo?")).isError());
}

TEST_CASE("Classify numeric error code", "[core][core::protocol]") {
    const ResponseClassifier classifier {};

    const auto response = classifier.classify("5", Command("1 on"));
    REQUIRE(response.isError());
    REQUIRE(response.getCode() == "5");

    // Numbers are values in answer to queries
    REQUIRE(classifier.classify("5", Command("1 v?")).isQueryValue());
}

TEST_CASE("Classify multi-line answer", "[core][core::protocol]") {
    const ResponseClassifier classifier {};
    const auto response = classifier.classify("Commands:\r\n? help", Command("help?"));
    REQUIRE(response.isQueryValue());
}

TEST_CASE("Classify unknown line", "[core][core::protocol]") {
    const ResponseClassifier classifier {};
    REQUIRE(classifier.classify("+1.00000").isQueryValue());
    REQUIRE(classifier.classify("ON", Command("1 on")).isQueryValue());
    REQUIRE(classifier.classify("").isQueryValue());
    REQUIRE(classifier.classify("\xFF\xFE garbage").isQueryValue());
}

TEST_CASE("Register error token", "[core][core::protocol]") {
    ResponseClassifier classifier {};
    REQUIRE(classifier.classify("FAIL 7").isQueryValue());

    classifier.registerErrorToken("FAIL");
    classifier.registerErrorToken("fail");
    classifier.registerErrorToken("  ");
    REQUIRE(classifier.getErrorTokens().size() == 3);

    const auto response = classifier.classify("fail 7");
    REQUIRE(response.isError());
    REQUIRE(response.getCode() == "7");
}

TEST_CASE("Custom error vocabulary", "[core][core::protocol]") {
    const ResponseClassifier classifier {std::vector<std::string> {"NAK"}};
    REQUIRE(classifier.classify("NAK 1").isError());
    REQUIRE(classifier.classify("ERR 3").isQueryValue());
}
