#pragma once

#include "beamdrop/core/observer.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::signaling {

struct OnlineUser {
    std::string peer_id;
    std::string display_name;
    std::string emoji;
    std::chrono::system_clock::time_point connected_at;

    // Accepts `id` or `peerId`, and `displayName` or `username`.
    static std::optional<OnlineUser> from_json(const nlohmann::json& j);
};

// Remote participants as last broadcast by the relay, local identity excluded.
class OnlineRoster {
public:
    explicit OnlineRoster(std::string local_id);

    void replace(std::vector<OnlineUser> users);
    void handle_broadcast(const nlohmann::json& users);

    const std::vector<OnlineUser>& users() const { return users_; }
    std::optional<OnlineUser> find(const std::string& peer_id) const;
    bool contains(const std::string& peer_id) const;
    std::size_t size() const { return users_.size(); }
    const std::string& local_id() const { return local_id_; }

    core::ObserverList<std::vector<OnlineUser>>& on_change() { return on_change_; }

private:
    std::string local_id_;
    std::vector<OnlineUser> users_;
    core::ObserverList<std::vector<OnlineUser>> on_change_;
};

}
