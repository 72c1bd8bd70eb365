#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/core/error.hpp"
#include <limits>
#include <stdexcept>

namespace beamdrop::network {

namespace {
    using core::ErrorCode;
    using core::TransferError;

    template<typename T>
    T read_unsigned(const nlohmann::json& j, const char* key) {
        const auto& value = j.at(key);
        if (!value.is_number_unsigned()) {
            throw TransferError(ErrorCode::PROTOCOL_ERROR,
                                std::string("Field '") + key + "' must be a non-negative integer");
        }
        auto raw = value.get<std::uint64_t>();
        if (raw > std::numeric_limits<T>::max()) {
            throw TransferError(ErrorCode::PROTOCOL_ERROR,
                                std::string("Field '") + key + "' out of range");
        }
        return static_cast<T>(raw);
    }
}

std::string FileMetadataMessage::serialize() const {
    nlohmann::json j{
        {"type", TYPE},
        {"fileId", file_id},
        {"name", name},
        {"size", size},
        {"mimeType", mime_type},
        {"totalChunks", total_chunks}
    };
    return j.dump();
}

FileMetadataMessage FileMetadataMessage::deserialize(const nlohmann::json& j) {
    FileMetadataMessage msg;
    j.at("fileId").get_to(msg.file_id);
    j.at("name").get_to(msg.name);
    msg.size = read_unsigned<std::uint64_t>(j, "size");
    msg.mime_type = j.contains("mimeType") && j["mimeType"].is_string()
        ? j["mimeType"].get<std::string>()
        : std::string();
    msg.total_chunks = read_unsigned<std::uint32_t>(j, "totalChunks");
    return msg;
}

std::string FileChunkMessage::serialize() const {
    nlohmann::json j{
        {"type", TYPE},
        {"fileId", file_id},
        {"index", index},
        {"data", data},
        {"totalChunks", total_chunks}
    };
    return j.dump();
}

FileChunkMessage FileChunkMessage::deserialize(const nlohmann::json& j) {
    FileChunkMessage msg;
    j.at("fileId").get_to(msg.file_id);
    msg.index = read_unsigned<std::uint32_t>(j, "index");
    j.at("data").get_to(msg.data);
    msg.total_chunks = read_unsigned<std::uint32_t>(j, "totalChunks");
    return msg;
}

WireMessage parse_wire_message(const std::string& frame) {
    try {
        auto j = nlohmann::json::parse(frame);
        if (!j.is_object()) {
            throw TransferError(ErrorCode::PROTOCOL_ERROR, "Frame is not a JSON object");
        }

        auto type = j.at("type").get<std::string>();
        if (type == FileChunkMessage::TYPE) {
            return FileChunkMessage::deserialize(j);
        }
        if (type == FileMetadataMessage::TYPE) {
            return FileMetadataMessage::deserialize(j);
        }
        throw TransferError(ErrorCode::PROTOCOL_ERROR, "Unknown message type: " + type);
    } catch (const nlohmann::json::exception& e) {
        throw TransferError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed frame: ") + e.what());
    }
}

std::uint32_t chunk_count(std::uint64_t size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (size == 0) {
        return 1;
    }
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

}
