#include "beamdrop/core/command_handler.hpp"
#include "beamdrop/core/config.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/signaling/relay_server.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace beamdrop::core {

namespace {
    std::optional<std::uint16_t> parse_port(const std::string& text) {
        try {
            std::size_t consumed = 0;
            auto value = std::stoul(text, &consumed);
            if (consumed != text.size() || value > std::numeric_limits<std::uint16_t>::max()) {
                return std::nullopt;
            }
            return static_cast<std::uint16_t>(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
}

std::optional<RelayAddress> parse_relay_address(const std::string& address, std::uint16_t default_port) {
    if (address.empty()) {
        return std::nullopt;
    }

    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        return RelayAddress{address, default_port};
    }

    auto host = address.substr(0, colon);
    auto port = parse_port(address.substr(colon + 1));
    if (host.empty() || !port) {
        return std::nullopt;
    }
    return RelayAddress{host, *port};
}

CommandResult RelayCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = Config::instance();

    auto port_text = args.size() > 1 ? args[1] : config.get_string("relay.port", "8001");
    auto port = parse_port(port_text);
    if (!port) {
        return CommandResult::error("Invalid port: " + port_text);
    }

    boost::asio::io_context io_context;
    signaling::RelayServer server(io_context, *port);

    if (!server.start()) {
        return CommandResult::error("Failed to start relay on port " + port_text);
    }

    std::cout << "Signaling relay listening on ws://0.0.0.0:" << server.local_port()
              << signaling::RELAY_PATH_PREFIX << "{peerId}\n";
    std::cout << "Press Ctrl+C to stop\n";

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (ec) return;
        LOG_INFO("Received signal {}, shutting down relay", signal_number);
        server.stop();
        io_context.stop();
    });

    try {
        io_context.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Relay event loop failed: {}", e.what());
        return CommandResult::error(std::string("Relay stopped: ") + e.what());
    }

    return CommandResult::ok("Relay stopped");
}

}
