#pragma once

#include "beamdrop/network/transport.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace beamdrop::signaling {

enum class SignalType {
    ONLINE_USERS,
    OFFER,
    ANSWER,
    ICE_CANDIDATE,
    UPDATE_INFO,
    UNKNOWN
};

const char* to_string(SignalType type);
SignalType signal_type_from_string(const std::string& name);

// Relay text frame: {type, sender?, target?, payload}. update_info carries
// displayName/emoji at the top level instead of a payload.
struct SignalEnvelope {
    SignalType type = SignalType::UNKNOWN;
    std::string type_name;
    std::string sender;
    std::string target;
    nlohmann::json payload;

    std::string serialize() const;

    // Throws core::TransferError(PROTOCOL_ERROR) on malformed frames.
    static SignalEnvelope parse(const std::string& frame);

    static SignalEnvelope offer(const std::string& target, const network::SessionDescription& desc);
    static SignalEnvelope answer(const std::string& target, const network::SessionDescription& desc);
    static SignalEnvelope ice_candidate(const std::string& target, const network::IceCandidate& candidate);
    static SignalEnvelope update_info(const std::string& display_name, const std::string& emoji);
    static SignalEnvelope online_users(nlohmann::json users);
};

}
