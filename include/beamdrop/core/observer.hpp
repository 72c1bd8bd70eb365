#pragma once

#include "beamdrop/core/logger.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <vector>

namespace beamdrop::core {

using SubscriptionHandle = std::size_t;

// Multi-subscriber event hook. Handles start at 1; 0 is never issued.
// Notification iterates over a snapshot, so callbacks may subscribe or
// unsubscribe while an event is being delivered.
template<typename... Args>
class ObserverList {
public:
    using Callback = std::function<void(Args...)>;

    SubscriptionHandle subscribe(Callback callback) {
        if (!callback) return 0;
        auto handle = next_handle_++;
        callbacks_.emplace(handle, std::move(callback));
        return handle;
    }

    bool unsubscribe(SubscriptionHandle handle) {
        return callbacks_.erase(handle) > 0;
    }

    void clear() { callbacks_.clear(); }
    std::size_t size() const { return callbacks_.size(); }
    bool empty() const { return callbacks_.empty(); }

    void notify(const Args&... args) const {
        std::vector<Callback> snapshot;
        snapshot.reserve(callbacks_.size());
        for (const auto& [handle, callback] : callbacks_) {
            snapshot.push_back(callback);
        }

        for (auto& callback : snapshot) {
            try {
                callback(args...);
            } catch (const std::exception& e) {
                LOG_ERROR("Observer callback threw: {}", e.what());
            }
        }
    }

private:
    std::map<SubscriptionHandle, Callback> callbacks_;
    SubscriptionHandle next_handle_ = 1;
};

}
