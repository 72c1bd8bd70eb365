#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace beamdrop::signaling {

// Relay bookkeeping independent of the socket layer: who is online, and
// where each participant's frames go.
class RelayHub {
public:
    using FrameSink = std::function<void(const std::string&)>;

    struct Participant {
        std::string peer_id;
        std::string display_name;
        std::string emoji;
        std::chrono::system_clock::time_point connected_at;
        std::uint64_t connection_id;
        FrameSink sink;
    };

    // A second join for a connected identity replaces the first connection.
    std::uint64_t join(const std::string& peer_id, FrameSink sink);

    // Ignored when connection_id belongs to a connection that was replaced.
    void leave(const std::string& peer_id, std::uint64_t connection_id);

    void handle_frame(const std::string& peer_id, const std::string& frame);

    nlohmann::json roster_json() const;
    std::vector<std::string> online_peer_ids() const;
    std::size_t participant_count() const { return participants_.size(); }
    bool is_online(const std::string& peer_id) const { return participants_.count(peer_id) > 0; }

private:
    void broadcast_roster();
    void deliver(Participant& participant, const std::string& frame);
    std::vector<const Participant*> ordered_participants() const;

    std::unordered_map<std::string, Participant> participants_;
    std::uint64_t next_connection_id_ = 1;
};

}
