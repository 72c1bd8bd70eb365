#pragma once

#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/transfer/byte_source.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::transfer {

enum class CompletionPolicy {
    LAST_INDEX,     // reassemble when index totalChunks-1 arrives, gaps or not
    ALL_CHUNKS      // reassemble only when every index has arrived
};

const char* to_string(CompletionPolicy policy);
std::optional<CompletionPolicy> parse_completion_policy(const std::string& name);

struct ReceivedFile {
    std::string file_id;
    std::string name;
    std::string mime_type;
    std::vector<std::uint8_t> data;
    std::uint32_t missing_chunks = 0;

    std::uint64_t size() const { return data.size(); }
    bool is_complete() const { return missing_chunks == 0; }
};

class OutboundTransferSession {
public:
    OutboundTransferSession(std::string file_id,
                            std::string peer_id,
                            std::shared_ptr<ByteSource> source,
                            std::size_t chunk_size);

    network::FileMetadataMessage metadata_message() const;

    // Reads, encodes and advances past the next slice. Throws
    // core::TransferError(FILE_READ_ERROR) when the source fails.
    network::FileChunkMessage next_chunk();
    bool has_next_chunk() const { return next_chunk_index_ < total_chunks_; }

    const std::string& file_id() const { return file_id_; }
    const std::string& peer_id() const { return peer_id_; }
    const std::string& file_name() const { return source_->name(); }
    std::uint64_t total_size() const { return total_size_; }
    std::size_t chunk_size() const { return chunk_size_; }
    std::uint32_t total_chunks() const { return total_chunks_; }
    std::uint32_t next_chunk_index() const { return next_chunk_index_; }
    std::uint64_t bytes_sent() const { return bytes_sent_; }
    std::chrono::steady_clock::time_point start_time() const { return start_time_; }

private:
    std::string file_id_;
    std::string peer_id_;
    std::shared_ptr<ByteSource> source_;
    std::uint64_t total_size_;
    std::size_t chunk_size_;
    std::uint32_t total_chunks_;
    std::uint32_t next_chunk_index_;
    std::uint64_t bytes_sent_;
    std::chrono::steady_clock::time_point start_time_;
};

class InboundTransferSession {
public:
    InboundTransferSession(const network::FileMetadataMessage& metadata, std::string peer_id);

    // False for a duplicate index. Throws core::TransferError(PROTOCOL_ERROR)
    // when the index is outside [0, totalChunks).
    bool store_chunk(std::uint32_t index, std::vector<std::uint8_t> data);

    bool has_chunk(std::uint32_t index) const;
    bool should_assemble(CompletionPolicy policy, std::uint32_t stored_index) const;

    // Concatenates the chunks present, in index order.
    ReceivedFile assemble() const;

    const std::string& file_id() const { return file_id_; }
    const std::string& peer_id() const { return peer_id_; }
    const std::string& name() const { return name_; }
    const std::string& mime_type() const { return mime_type_; }
    std::uint64_t total_size() const { return total_size_; }
    std::uint32_t total_chunks() const { return total_chunks_; }
    std::uint64_t received_bytes() const { return received_bytes_; }
    std::uint32_t received_count() const { return received_count_; }
    std::uint32_t missing_count() const { return total_chunks_ - received_count_; }
    std::chrono::steady_clock::time_point start_time() const { return start_time_; }

private:
    std::string file_id_;
    std::string peer_id_;
    std::string name_;
    std::string mime_type_;
    std::uint64_t total_size_;
    std::uint32_t total_chunks_;
    std::vector<std::optional<std::vector<std::uint8_t>>> chunks_;
    std::uint64_t received_bytes_;
    std::uint32_t received_count_;
    std::chrono::steady_clock::time_point start_time_;
};

}
