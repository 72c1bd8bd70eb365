#include "beamdrop/signaling/online_roster.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <algorithm>

namespace beamdrop::signaling {

namespace {
    std::string string_field(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
    }

    std::string first_string(const nlohmann::json& j, const char* key, const char* fallback_key) {
        auto value = string_field(j, key);
        return value.empty() ? string_field(j, fallback_key) : value;
    }
}

std::optional<OnlineUser> OnlineUser::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    OnlineUser user;
    user.peer_id = first_string(j, "id", "peerId");
    if (user.peer_id.empty()) {
        return std::nullopt;
    }

    user.display_name = first_string(j, "displayName", "username");
    user.emoji = string_field(j, "emoji");

    auto connected_at = core::utils::TimeUtils::from_iso_string(string_field(j, "connectedAt"));
    user.connected_at = connected_at.value_or(std::chrono::system_clock::time_point{});
    return user;
}

OnlineRoster::OnlineRoster(std::string local_id)
    : local_id_(std::move(local_id)) {
}

void OnlineRoster::replace(std::vector<OnlineUser> users) {
    users.erase(std::remove_if(users.begin(), users.end(),
                               [this](const OnlineUser& user) { return user.peer_id == local_id_; }),
                users.end());
    users_ = std::move(users);

    LOG_DEBUG("Online roster updated: {} remote peer(s)", users_.size());
    on_change_.notify(users_);
}

void OnlineRoster::handle_broadcast(const nlohmann::json& users) {
    if (!users.is_array()) {
        LOG_WARN("Ignoring online_users broadcast without a user list");
        return;
    }

    std::vector<OnlineUser> parsed;
    parsed.reserve(users.size());
    for (const auto& entry : users) {
        if (auto user = OnlineUser::from_json(entry)) {
            parsed.push_back(std::move(*user));
        } else {
            LOG_WARN("Skipping malformed roster entry: {}", entry.dump());
        }
    }

    replace(std::move(parsed));
}

std::optional<OnlineUser> OnlineRoster::find(const std::string& peer_id) const {
    auto it = std::find_if(users_.begin(), users_.end(),
                           [&](const OnlineUser& user) { return user.peer_id == peer_id; });
    if (it == users_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool OnlineRoster::contains(const std::string& peer_id) const {
    return find(peer_id).has_value();
}

}
