#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beamdrop::crypto {

// Standard padded base64, the transport-safe form chunk bytes take on the wire.
std::string base64_encode(std::span<const std::uint8_t> data);

// std::nullopt on invalid characters or padding.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded);

}
