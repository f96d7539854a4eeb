/**
 * @file
 * @brief Console to send commands and queries to an LNHR DAC
 *
 * @copyright Copyright (c) 2024 DESY and the Constellation authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <argparse/argparse.hpp>
#include <magic_enum.hpp>

#include "lnhrdac/build.hpp"
#include "lnhrdac/core/config/ConfigParser.hpp"
#include "lnhrdac/core/config/Configuration.hpp"
#include "lnhrdac/core/log/log.hpp"
#include "lnhrdac/core/log/Logger.hpp"
#include "lnhrdac/core/log/SinkManager.hpp"
#include "lnhrdac/core/protocol/Command.hpp"
#include "lnhrdac/core/utils/exceptions.hpp"
#include "lnhrdac/core/utils/networking.hpp"
#include "lnhrdac/core/utils/string.hpp"
#include "lnhrdac/driver/Driver.hpp"
#include "lnhrdac/driver/DriverConfig.hpp"

using namespace lnhrdac;
using namespace lnhrdac::config;
using namespace lnhrdac::driver;
using namespace lnhrdac::log;
using namespace lnhrdac::protocol;
using namespace lnhrdac::utils;

// NOLINTNEXTLINE(*-avoid-c-arrays)
void parse_args(int argc, char* argv[], argparse::ArgumentParser& parser) {

    // Device host (-H)
    parser.add_argument("-H", "--host").help("hostname or IP address of the device");

    // Device port (-p)
    parser.add_argument("-p", "--port").help("port of the device").scan<'u', std::uint16_t>();

    // Configuration file (-c)
    parser.add_argument("-c", "--config").help("TOML configuration file");

    // Device table in the configuration file (-d)
    parser.add_argument("-d", "--device").help("name of the device table in the configuration file");

    // Console log level (-l)
    parser.add_argument("-l", "--level").help("console log level").default_value("INFO");

    // Held connection (--hold)
    parser.add_argument("--hold")
        .help("send all commands over a single held connection")
        .default_value(false)
        .implicit_value(true);

    // Commands to run
    parser.add_argument("commands").help("commands and queries to send, in order").remaining();

    // Note: this might throw
    parser.parse_args(argc, argv);
}

// Build the driver configuration from the configuration file and the command line
Configuration get_configuration(const argparse::ArgumentParser& parser) {
    Configuration config {};

    if(const auto config_file = parser.present("config")) {
        const ConfigParser config_parser {std::filesystem::path(config_file.value())};
        if(const auto device = parser.present("device")) {
            config = config_parser.getConfiguration(device.value());
        } else {
            config = config_parser.getHeaderConfiguration();
        }
    }

    // Command line overrides configuration file
    if(const auto host = parser.present("host")) {
        config.set("host", host.value());
    }
    if(const auto port = parser.present<std::uint16_t>("port")) {
        config.set("port", port.value());
    }

    return config;
}

void run_command(Driver& driver, HeldConnection* held, std::string_view text) {
    const Command command {text};
    if(command.isQuery()) {
        const auto answer = held != nullptr ? held->sendQuery(text) : driver.sendQuery(text);
        std::cout << answer << "\n";
    } else {
        const auto response = held != nullptr ? held->sendCommand(text) : driver.sendCommand(text);
        if(!response.isAcknowledged()) {
            std::cout << response.getRaw() << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    // Get the default logger
    auto& logger = Logger::getDefault();

    // CLI parsing
    argparse::ArgumentParser parser {"dac_console", LNHRDAC_VERSION};
    try {
        parse_args(argc, argv, parser);
    } catch(const std::exception& error) {
        LOG(logger, CRITICAL) << "Argument parsing failed: " << error.what();
        LOG(logger, CRITICAL) << "Run \"dac_console --help\" for help";
        return 1;
    }

    // Set log level
    const auto level_arg = parser.get("level");
    const auto default_level = magic_enum::enum_cast<Level>(transform(level_arg, ::toupper));
    if(!default_level.has_value()) {
        LOG(logger, CRITICAL) << "Log level \"" << level_arg << "\" is not valid"
                              << ", possible values are: " << list_enum_names<Level>();
        return 1;
    }
    SinkManager::getInstance().setGlobalConsoleLevel(default_level.value());

    try {
        const auto driver_config = DriverConfig::fromConfiguration(get_configuration(parser));
        Driver driver {driver_config};
        driver.connect();

        const auto commands = parser.present<std::vector<std::string>>("commands").value_or(std::vector<std::string>());
        if(parser.get<bool>("hold")) {
            auto held = driver.hold();
            for(const auto& text : commands) {
                run_command(driver, &held, text);
            }
        } else {
            for(const auto& text : commands) {
                run_command(driver, nullptr, text);
            }
        }
    } catch(const Exception& error) {
        LOG(logger, CRITICAL) << error.what();
        return 1;
    }

    return 0;
}
