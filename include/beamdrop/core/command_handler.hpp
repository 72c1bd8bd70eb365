#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Runs the WebSocket signaling relay until interrupted.
class RelayCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the signaling relay"; }
    std::string get_usage() const override { return "relay [port]"; }
};

struct RelayAddress {
    std::string host;
    std::uint16_t port;
};

// Parses "host:port" or "host"; the port falls back to `default_port`.
std::optional<RelayAddress> parse_relay_address(const std::string& address, std::uint16_t default_port);

}
