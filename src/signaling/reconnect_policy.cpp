#include "beamdrop/signaling/reconnect_policy.hpp"
#include <algorithm>

namespace beamdrop::signaling {

ReconnectPolicy::ReconnectPolicy()
    : ReconnectPolicy(DEFAULT_MAX_ATTEMPTS, linear_backoff(DEFAULT_BASE_DELAY)) {
}

ReconnectPolicy::ReconnectPolicy(std::uint32_t max_attempts, BackoffFunction backoff)
    : max_attempts_(max_attempts)
    , backoff_(backoff ? std::move(backoff) : linear_backoff(DEFAULT_BASE_DELAY))
    , attempts_(0) {
}

std::optional<std::chrono::milliseconds> ReconnectPolicy::next_delay() {
    if (exhausted()) {
        return std::nullopt;
    }

    ++attempts_;
    return backoff_(attempts_);
}

ReconnectPolicy::BackoffFunction ReconnectPolicy::linear_backoff(std::chrono::milliseconds base) {
    return [base](std::uint32_t attempt) {
        return base * attempt;
    };
}

ReconnectPolicy::BackoffFunction ReconnectPolicy::exponential_backoff(std::chrono::milliseconds base,
                                                                      std::chrono::milliseconds cap) {
    return [base, cap](std::uint32_t attempt) {
        auto delay = base;
        for (std::uint32_t i = 1; i < attempt && delay < cap; ++i) {
            delay *= 2;
        }
        return std::min(delay, cap);
    };
}

}
