#include "beamdrop/signaling/signal_envelope.hpp"
#include "beamdrop/core/error.hpp"

namespace beamdrop::signaling {

namespace {
    SignalEnvelope make(SignalType type, std::string target, nlohmann::json payload) {
        SignalEnvelope envelope;
        envelope.type = type;
        envelope.type_name = to_string(type);
        envelope.target = std::move(target);
        envelope.payload = std::move(payload);
        return envelope;
    }

    std::string string_field(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
    }
}

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::ONLINE_USERS: return "online_users";
        case SignalType::OFFER: return "offer";
        case SignalType::ANSWER: return "answer";
        case SignalType::ICE_CANDIDATE: return "ice-candidate";
        case SignalType::UPDATE_INFO: return "update_info";
        case SignalType::UNKNOWN: break;
    }
    return "unknown";
}

SignalType signal_type_from_string(const std::string& name) {
    if (name == "online_users") return SignalType::ONLINE_USERS;
    if (name == "offer") return SignalType::OFFER;
    if (name == "answer") return SignalType::ANSWER;
    if (name == "ice-candidate") return SignalType::ICE_CANDIDATE;
    if (name == "update_info") return SignalType::UPDATE_INFO;
    return SignalType::UNKNOWN;
}

std::string SignalEnvelope::serialize() const {
    nlohmann::json j;
    j["type"] = type == SignalType::UNKNOWN ? type_name : std::string(to_string(type));

    if (!sender.empty()) j["sender"] = sender;
    if (!target.empty()) j["target"] = target;

    if (type == SignalType::UPDATE_INFO) {
        j["displayName"] = payload.value("displayName", std::string());
        j["emoji"] = payload.value("emoji", std::string());
    } else if (!payload.is_null()) {
        j["payload"] = payload;
    }

    return j.dump();
}

SignalEnvelope SignalEnvelope::parse(const std::string& frame) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::TransferError(core::ErrorCode::PROTOCOL_ERROR,
                                  std::string("Malformed signaling frame: ") + e.what());
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw core::TransferError(core::ErrorCode::PROTOCOL_ERROR, "Signaling frame without a type");
    }

    SignalEnvelope envelope;
    envelope.type_name = j["type"].get<std::string>();
    envelope.type = signal_type_from_string(envelope.type_name);
    envelope.sender = string_field(j, "sender");
    envelope.target = string_field(j, "target");

    if (j.contains("payload")) {
        envelope.payload = j["payload"];
    } else if (envelope.type == SignalType::ONLINE_USERS && j.contains("users")) {
        envelope.payload = j["users"];
    } else if (envelope.type == SignalType::UPDATE_INFO) {
        auto display_name = string_field(j, "displayName");
        if (display_name.empty()) {
            display_name = string_field(j, "username");
        }
        envelope.payload = {{"displayName", display_name}, {"emoji", string_field(j, "emoji")}};
    }

    return envelope;
}

SignalEnvelope SignalEnvelope::offer(const std::string& target, const network::SessionDescription& desc) {
    return make(SignalType::OFFER, target, desc);
}

SignalEnvelope SignalEnvelope::answer(const std::string& target, const network::SessionDescription& desc) {
    return make(SignalType::ANSWER, target, desc);
}

SignalEnvelope SignalEnvelope::ice_candidate(const std::string& target, const network::IceCandidate& candidate) {
    return make(SignalType::ICE_CANDIDATE, target, candidate);
}

SignalEnvelope SignalEnvelope::update_info(const std::string& display_name, const std::string& emoji) {
    return make(SignalType::UPDATE_INFO, "", {{"displayName", display_name}, {"emoji", emoji}});
}

SignalEnvelope SignalEnvelope::online_users(nlohmann::json users) {
    return make(SignalType::ONLINE_USERS, "", std::move(users));
}

}
