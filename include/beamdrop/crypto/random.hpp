#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace beamdrop::crypto {

class SecureRandom {
public:
    static bool initialize();

    static void generate_bytes(std::span<std::uint8_t> output);
    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    // Lowercase base-36 token, used for file ids.
    static std::string generate_token(std::size_t length = 9);

    // Random (version 4) UUID string, used for local peer ids.
    static std::string generate_peer_id();

private:
    static void ensure_initialized();

    static bool initialized_;
};

}
