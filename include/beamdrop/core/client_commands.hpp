#pragma once

#include "beamdrop/core/command_handler.hpp"

namespace beamdrop::core {

// Commands that join the relay as a participant and need the WebRTC transport.

class PeersCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List peers online at the relay"; }
    std::string get_usage() const override { return "peers"; }
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file directly to an online peer"; }
    std::string get_usage() const override { return "send <peer-id> <file>"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stay online and save incoming files"; }
    std::string get_usage() const override { return "receive"; }
};

}
