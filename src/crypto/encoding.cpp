#include "beamdrop/crypto/encoding.hpp"
#include <sodium.h>

namespace beamdrop::crypto {

std::string base64_encode(std::span<const std::uint8_t> data) {
    const std::size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);

    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded_len, data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    // encoded_len counts the terminating NUL.
    encoded.resize(encoded_len - 1);
    return encoded;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded) {
    std::vector<std::uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    std::size_t decoded_len = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }

    decoded.resize(decoded_len);
    return decoded;
}

}
