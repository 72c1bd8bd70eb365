#include "beamdrop/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace beamdrop::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# BeamDrop Configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    auto value = get(key);
    if (!value) return items;

    std::stringstream ss(*value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void Config::set_defaults() {
    values_["relay.host"] = "127.0.0.1";
    values_["relay.port"] = "8001";
    values_["relay.reconnect.max_attempts"] = "5";
    values_["relay.reconnect.base_delay_ms"] = "2000";
    values_["ice.stun_servers"] = "stun:stun.l.google.com:19302,stun:stun1.l.google.com:19302";
    values_["transfer.chunk_size"] = "16384";
    values_["transfer.chunk_delay_ms"] = "10";
    values_["transfer.completion_policy"] = "last_index";
    values_["transfer.download_dir"] = "./downloads";
    values_["user.display_name"] = "Anonymous";
    values_["user.emoji"] = "🙂";
    values_["log.level"] = "info";
    values_["log.file"] = "beamdrop.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

}
