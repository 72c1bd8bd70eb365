#include "beamdrop/transfer/transfer_session.hpp"
#include "beamdrop/crypto/encoding.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/utils.hpp"
#include <stdexcept>

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

const char* to_string(CompletionPolicy policy) {
    switch (policy) {
        case CompletionPolicy::LAST_INDEX: return "last_index";
        case CompletionPolicy::ALL_CHUNKS: return "all_chunks";
    }
    return "unknown";
}

std::optional<CompletionPolicy> parse_completion_policy(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(name));
    if (lower == "last_index") return CompletionPolicy::LAST_INDEX;
    if (lower == "all_chunks") return CompletionPolicy::ALL_CHUNKS;
    return std::nullopt;
}

OutboundTransferSession::OutboundTransferSession(std::string file_id,
                                                 std::string peer_id,
                                                 std::shared_ptr<ByteSource> source,
                                                 std::size_t chunk_size)
    : file_id_(std::move(file_id))
    , peer_id_(std::move(peer_id))
    , source_(std::move(source))
    , total_size_(0)
    , chunk_size_(chunk_size)
    , total_chunks_(0)
    , next_chunk_index_(0)
    , bytes_sent_(0)
    , start_time_(std::chrono::steady_clock::now()) {
    if (!source_) {
        throw std::invalid_argument("Outbound transfer without a byte source");
    }
    total_size_ = source_->size();
    total_chunks_ = network::chunk_count(total_size_, chunk_size_);
}

network::FileMetadataMessage OutboundTransferSession::metadata_message() const {
    network::FileMetadataMessage message;
    message.file_id = file_id_;
    message.name = source_->name();
    message.size = total_size_;
    message.mime_type = source_->mime_type();
    message.total_chunks = total_chunks_;
    return message;
}

network::FileChunkMessage OutboundTransferSession::next_chunk() {
    if (!has_next_chunk()) {
        throw TransferError(ErrorCode::INVALID_STATE, "No chunks left in " + file_id_);
    }

    auto offset = static_cast<std::uint64_t>(next_chunk_index_) * chunk_size_;
    auto bytes = source_->read(offset, chunk_size_);

    network::FileChunkMessage message;
    message.file_id = file_id_;
    message.index = next_chunk_index_;
    message.data = crypto::base64_encode(bytes);
    message.total_chunks = total_chunks_;

    ++next_chunk_index_;
    bytes_sent_ += bytes.size();
    return message;
}

InboundTransferSession::InboundTransferSession(const network::FileMetadataMessage& metadata, std::string peer_id)
    : file_id_(metadata.file_id)
    , peer_id_(std::move(peer_id))
    , name_(metadata.name)
    , mime_type_(metadata.mime_type)
    , total_size_(metadata.size)
    , total_chunks_(metadata.total_chunks)
    , chunks_(metadata.total_chunks)
    , received_bytes_(0)
    , received_count_(0)
    , start_time_(std::chrono::steady_clock::now()) {
}

bool InboundTransferSession::store_chunk(std::uint32_t index, std::vector<std::uint8_t> data) {
    if (index >= total_chunks_) {
        throw TransferError(ErrorCode::PROTOCOL_ERROR,
                            "Chunk index " + std::to_string(index) + " outside [0, " +
                            std::to_string(total_chunks_) + ")");
    }

    if (chunks_[index]) {
        return false;
    }

    received_bytes_ += data.size();
    ++received_count_;
    chunks_[index] = std::move(data);
    return true;
}

bool InboundTransferSession::has_chunk(std::uint32_t index) const {
    return index < total_chunks_ && chunks_[index].has_value();
}

bool InboundTransferSession::should_assemble(CompletionPolicy policy, std::uint32_t stored_index) const {
    switch (policy) {
        case CompletionPolicy::LAST_INDEX:
            return total_chunks_ > 0 && stored_index == total_chunks_ - 1;
        case CompletionPolicy::ALL_CHUNKS:
            return received_count_ == total_chunks_;
    }
    return false;
}

ReceivedFile InboundTransferSession::assemble() const {
    ReceivedFile file;
    file.file_id = file_id_;
    file.name = name_;
    file.mime_type = mime_type_;
    file.data.reserve(static_cast<std::size_t>(received_bytes_));

    for (const auto& chunk : chunks_) {
        if (!chunk) {
            ++file.missing_chunks;
            continue;
        }
        file.data.insert(file.data.end(), chunk->begin(), chunk->end());
    }
    return file;
}

}
