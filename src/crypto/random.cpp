#include "beamdrop/crypto/random.hpp"
#include "beamdrop/core/logger.hpp"
#include <array>
#include <cstdio>
#include <stdexcept>
#include <sodium.h>

namespace beamdrop::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

void SecureRandom::ensure_initialized() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
}

void SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    ensure_initialized();
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
}

std::uint32_t SecureRandom::generate_uint32() {
    ensure_initialized();
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    ensure_initialized();
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_token(std::size_t length) {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    ensure_initialized();
    std::string token;
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        token.push_back(alphabet[randombytes_uniform(36)]);
    }
    return token;
}

std::string SecureRandom::generate_peer_id() {
    std::array<std::uint8_t, 16> bytes{};
    generate_bytes(bytes);

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buffer);
}

}
