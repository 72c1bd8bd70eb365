#pragma once

#include <nlohmann/json.hpp>
#include <concepts>
#include <cstdint>
#include <string>
#include <variant>

namespace beamdrop::network {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 16384; // 16 KiB
constexpr const char* TRANSFER_CHANNEL_LABEL = "fileTransfer";

template<typename T>
concept WireFrame = requires(const T t, const nlohmann::json& j) {
    { t.serialize() } -> std::convertible_to<std::string>;
    { T::deserialize(j) } -> std::same_as<T>;
};

// Sent once, before any chunk of the file.
struct FileMetadataMessage {
    static constexpr const char* TYPE = "file-metadata";

    std::string file_id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::uint32_t total_chunks = 0;

    std::string serialize() const;
    static FileMetadataMessage deserialize(const nlohmann::json& j);
};

// One per chunk; `data` holds the chunk bytes in base64.
struct FileChunkMessage {
    static constexpr const char* TYPE = "file-chunk";

    std::string file_id;
    std::uint32_t index = 0;
    std::string data;
    std::uint32_t total_chunks = 0;

    std::string serialize() const;
    static FileChunkMessage deserialize(const nlohmann::json& j);
};

using WireMessage = std::variant<FileMetadataMessage, FileChunkMessage>;

// Throws core::TransferError(PROTOCOL_ERROR) for frames that are not valid
// JSON, carry an unknown type, or miss required fields.
WireMessage parse_wire_message(const std::string& frame);

// ceil(size / chunk_size), except that an empty file still travels as one
// empty chunk so the receiver has a final index to complete on.
std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size);

}

static_assert(beamdrop::network::WireFrame<beamdrop::network::FileMetadataMessage>);
static_assert(beamdrop::network::WireFrame<beamdrop::network::FileChunkMessage>);
