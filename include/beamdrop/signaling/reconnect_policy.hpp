#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace beamdrop::signaling {

// Bounded retry schedule for the relay connection. Attempts are numbered
// from 1; next_delay() returns nullopt once max_attempts have been handed out.
class ReconnectPolicy {
public:
    using BackoffFunction = std::function<std::chrono::milliseconds(std::uint32_t attempt)>;

    static constexpr std::uint32_t DEFAULT_MAX_ATTEMPTS = 5;
    static constexpr std::chrono::milliseconds DEFAULT_BASE_DELAY{2000};

    ReconnectPolicy();
    ReconnectPolicy(std::uint32_t max_attempts, BackoffFunction backoff);

    std::optional<std::chrono::milliseconds> next_delay();
    void reset() { attempts_ = 0; }

    std::uint32_t attempts() const { return attempts_; }
    std::uint32_t max_attempts() const { return max_attempts_; }
    bool exhausted() const { return attempts_ >= max_attempts_; }

    // base * attempt
    static BackoffFunction linear_backoff(std::chrono::milliseconds base);
    // base * 2^(attempt-1), capped
    static BackoffFunction exponential_backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap);

private:
    std::uint32_t max_attempts_;
    BackoffFunction backoff_;
    std::uint32_t attempts_;
};

}
