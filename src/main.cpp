#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/config.hpp"
#include "beamdrop/core/cli.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/core/command_registry.hpp"
#include "beamdrop/core/client_commands.hpp"
#include "beamdrop/crypto/random.hpp"

int main(int argc, char* argv[]) {
    beamdrop::core::CommandLineParser parser("beamdrop");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = beamdrop::core::Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config", "beamdrop.conf");
    if (beamdrop::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file);
    }

    if (auto error = beamdrop::core::apply_config_overrides(parser, config)) {
        std::cerr << "Error: " << *error << "\n";
        return 1;
    }

    auto log_level = parser.has_option("verbose")
        ? beamdrop::core::LogLevel::Debug
        : beamdrop::core::parse_log_level(config.get_string("log.level", "info"));
    beamdrop::core::Logger::initialize(config.get_string("log.file", "beamdrop.log"), log_level);

    if (!beamdrop::crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return 1;
    }

    LOG_INFO("BeamDrop starting up");

    beamdrop::core::CommandRegistry command_registry;
    command_registry.register_command("peers", std::make_unique<beamdrop::core::PeersCommandHandler>());
    command_registry.register_command("send", std::make_unique<beamdrop::core::SendCommandHandler>());
    command_registry.register_command("receive", std::make_unique<beamdrop::core::ReceiveCommandHandler>());
    command_registry.register_command("relay", std::make_unique<beamdrop::core::RelayCommandHandler>());

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    beamdrop::core::Logger::shutdown();
    return result.exit_code;
}
