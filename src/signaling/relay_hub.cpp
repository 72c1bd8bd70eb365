#include "beamdrop/signaling/relay_hub.hpp"
#include "beamdrop/signaling/signal_envelope.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <algorithm>

namespace beamdrop::signaling {

std::uint64_t RelayHub::join(const std::string& peer_id, FrameSink sink) {
    auto connection_id = next_connection_id_++;

    auto it = participants_.find(peer_id);
    if (it != participants_.end()) {
        LOG_INFO("Peer {} reconnected, replacing connection {}", peer_id, it->second.connection_id);
        it->second.connection_id = connection_id;
        it->second.sink = std::move(sink);
    } else {
        Participant participant{
            peer_id,
            "Anonymous",
            "",
            std::chrono::system_clock::now(),
            connection_id,
            std::move(sink)
        };
        participants_.emplace(peer_id, std::move(participant));
        LOG_INFO("Peer {} joined the relay ({} online)", peer_id, participants_.size());
    }

    broadcast_roster();
    return connection_id;
}

void RelayHub::leave(const std::string& peer_id, std::uint64_t connection_id) {
    auto it = participants_.find(peer_id);
    if (it == participants_.end() || it->second.connection_id != connection_id) {
        return;
    }

    participants_.erase(it);
    LOG_INFO("Peer {} left the relay ({} online)", peer_id, participants_.size());
    broadcast_roster();
}

void RelayHub::handle_frame(const std::string& peer_id, const std::string& frame) {
    auto self = participants_.find(peer_id);
    if (self == participants_.end()) {
        LOG_WARN("Frame from unknown participant {}", peer_id);
        return;
    }

    SignalEnvelope envelope;
    try {
        envelope = SignalEnvelope::parse(frame);
    } catch (const core::TransferError& e) {
        LOG_WARN("Dropping frame from {}: {}", peer_id, e.what());
        return;
    }

    switch (envelope.type) {
        case SignalType::UPDATE_INFO: {
            self->second.display_name = envelope.payload.value("displayName", self->second.display_name);
            self->second.emoji = envelope.payload.value("emoji", self->second.emoji);
            LOG_DEBUG("Peer {} is now '{}' {}", peer_id, self->second.display_name, self->second.emoji);
            broadcast_roster();
            break;
        }
        case SignalType::OFFER:
        case SignalType::ANSWER:
        case SignalType::ICE_CANDIDATE: {
            auto target = participants_.find(envelope.target);
            if (target == participants_.end()) {
                LOG_WARN("Dropping {} from {} for offline peer '{}'",
                         to_string(envelope.type), peer_id, envelope.target);
                return;
            }

            envelope.sender = peer_id;
            envelope.target.clear();
            deliver(target->second, envelope.serialize());
            break;
        }
        default:
            LOG_DEBUG("Ignoring '{}' frame from {}", envelope.type_name, peer_id);
            break;
    }
}

nlohmann::json RelayHub::roster_json() const {
    auto users = nlohmann::json::array();
    for (const auto* participant : ordered_participants()) {
        users.push_back({
            {"id", participant->peer_id},
            {"displayName", participant->display_name},
            {"emoji", participant->emoji},
            {"connectedAt", core::utils::TimeUtils::to_iso_string(participant->connected_at)}
        });
    }
    return users;
}

std::vector<std::string> RelayHub::online_peer_ids() const {
    std::vector<std::string> ids;
    for (const auto* participant : ordered_participants()) {
        ids.push_back(participant->peer_id);
    }
    return ids;
}

void RelayHub::broadcast_roster() {
    auto frame = SignalEnvelope::online_users(roster_json()).serialize();

    std::vector<FrameSink> sinks;
    sinks.reserve(participants_.size());
    for (auto& [id, participant] : participants_) {
        sinks.push_back(participant.sink);
    }

    for (auto& sink : sinks) {
        try {
            sink(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to deliver roster: {}", e.what());
        }
    }
}

void RelayHub::deliver(Participant& participant, const std::string& frame) {
    auto sink = participant.sink;
    auto peer_id = participant.peer_id;
    try {
        sink(frame);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deliver frame to {}: {}", peer_id, e.what());
    }
}

std::vector<const RelayHub::Participant*> RelayHub::ordered_participants() const {
    std::vector<const Participant*> ordered;
    ordered.reserve(participants_.size());
    for (const auto& [id, participant] : participants_) {
        ordered.push_back(&participant);
    }

    std::sort(ordered.begin(), ordered.end(), [](const Participant* a, const Participant* b) {
        if (a->connected_at != b->connected_at) return a->connected_at < b->connected_at;
        return a->peer_id < b->peer_id;
    });
    return ordered;
}

}
