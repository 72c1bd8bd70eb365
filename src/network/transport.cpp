#include "beamdrop/network/transport.hpp"

namespace beamdrop::network {

const char* to_string(PeerState state) {
    switch (state) {
        case PeerState::NEW: return "new";
        case PeerState::CONNECTING: return "connecting";
        case PeerState::CONNECTED: return "connected";
        case PeerState::DISCONNECTED: return "disconnected";
        case PeerState::FAILED: return "failed";
        case PeerState::CLOSED: return "closed";
    }
    return "unknown";
}

const char* to_string(ChannelState state) {
    switch (state) {
        case ChannelState::CONNECTING: return "connecting";
        case ChannelState::OPEN: return "open";
        case ChannelState::CLOSING: return "closing";
        case ChannelState::CLOSED: return "closed";
    }
    return "unknown";
}

const char* to_string(NegotiationRole role) {
    return role == NegotiationRole::INITIATOR ? "initiator" : "responder";
}

void to_json(nlohmann::json& j, const SessionDescription& desc) {
    j = nlohmann::json{{"type", desc.type}, {"sdp", desc.sdp}};
}

void from_json(const nlohmann::json& j, SessionDescription& desc) {
    j.at("type").get_to(desc.type);
    j.at("sdp").get_to(desc.sdp);
}

void to_json(nlohmann::json& j, const IceCandidate& candidate) {
    j = nlohmann::json{{"candidate", candidate.candidate}, {"sdpMid", candidate.mid}};
}

void from_json(const nlohmann::json& j, IceCandidate& candidate) {
    j.at("candidate").get_to(candidate.candidate);
    auto mid = j.find("sdpMid");
    candidate.mid = (mid != j.end() && mid->is_string()) ? mid->get<std::string>() : std::string();
}

}
