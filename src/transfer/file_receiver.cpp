#include "beamdrop/transfer/file_receiver.hpp"
#include "beamdrop/crypto/encoding.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <algorithm>
#include <type_traits>
#include <variant>

namespace beamdrop::transfer {

using core::ErrorCode;
using core::Result;
using core::TransferError;

FileReceiver::FileReceiver(ReceiverOptions options)
    : options_(options) {
}

void FileReceiver::handle_message(const std::string& peer_id, const std::string& frame) {
    network::WireMessage message;
    try {
        message = network::parse_wire_message(frame);
    } catch (const TransferError& e) {
        LOG_WARN("Dropping frame from {}: {}", peer_id, e.what());
        return;
    }

    std::visit([&](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, network::FileMetadataMessage>) {
            handle_metadata(peer_id, msg);
        } else {
            handle_chunk(peer_id, msg);
        }
    }, message);
}

void FileReceiver::handle_metadata(const std::string& peer_id, const network::FileMetadataMessage& metadata) {
    if (metadata.total_chunks == 0) {
        LOG_WARN("Rejecting '{}' from {}: no chunks announced", metadata.name, peer_id);
        failure_observers_.notify(TransferFailure{
            peer_id, metadata.file_id, metadata.name,
            Result(ErrorCode::PROTOCOL_ERROR, "file-metadata announces zero chunks")});
        return;
    }

    // Every chunk but an empty file's single one carries at least a byte.
    if (metadata.total_chunks > std::max<std::uint64_t>(1, metadata.size)) {
        LOG_WARN("Rejecting '{}' from {}: {} chunks announced for {} bytes", metadata.name, peer_id,
                 metadata.total_chunks, metadata.size);
        failure_observers_.notify(TransferFailure{
            peer_id, metadata.file_id, metadata.name,
            Result(ErrorCode::PROTOCOL_ERROR, "file-metadata announces more chunks than bytes")});
        return;
    }

    if (sessions_.count(metadata.file_id)) {
        LOG_WARN("Replacing inbound session {} with new metadata from {}", metadata.file_id, peer_id);
    }

    auto session = std::make_unique<InboundTransferSession>(metadata, peer_id);
    LOG_INFO("Receiving '{}' ({}, {} chunks) from {}", metadata.name,
             core::utils::StringUtils::format_bytes(metadata.size), metadata.total_chunks, peer_id);

    auto update = make_progress(TransferDirection::RECEIVING, peer_id, metadata.file_id, metadata.name,
                                0, metadata.size, session->start_time());
    update.progress_percent = 0;

    sessions_[metadata.file_id] = std::move(session);
    progress_observers_.notify(update);
}

void FileReceiver::handle_chunk(const std::string& peer_id, const network::FileChunkMessage& chunk) {
    auto it = sessions_.find(chunk.file_id);
    if (it == sessions_.end()) {
        LOG_WARN("Dropping chunk {} for unknown file {} from {}", chunk.index, chunk.file_id, peer_id);
        return;
    }

    auto& session = *it->second;
    if (session.peer_id() != peer_id) {
        LOG_WARN("Dropping chunk for {} from {}: session belongs to {}", chunk.file_id, peer_id, session.peer_id());
        return;
    }

    if (chunk.total_chunks != session.total_chunks()) {
        fail_session(chunk.file_id, Result(ErrorCode::PROTOCOL_ERROR,
            "Chunk announces " + std::to_string(chunk.total_chunks) + " chunks, metadata announced " +
            std::to_string(session.total_chunks())));
        return;
    }

    auto data = crypto::base64_decode(chunk.data);
    if (!data) {
        fail_session(chunk.file_id, Result(ErrorCode::DECODE_ERROR,
            "Chunk " + std::to_string(chunk.index) + " is not valid base64"));
        return;
    }

    bool stored = false;
    try {
        stored = session.store_chunk(chunk.index, std::move(*data));
    } catch (const TransferError& e) {
        fail_session(chunk.file_id, e.to_result());
        return;
    }

    if (!stored) {
        LOG_DEBUG("Ignoring duplicate chunk {} of {}", chunk.index, chunk.file_id);
        return;
    }

    LOG_TRACE("Stored chunk {}/{} of {}", chunk.index + 1, session.total_chunks(), chunk.file_id);

    progress_observers_.notify(make_progress(TransferDirection::RECEIVING, peer_id, session.file_id(),
                                             session.name(), session.received_bytes(), session.total_size(),
                                             session.start_time()));

    if (session.should_assemble(options_.completion_policy, chunk.index)) {
        complete_session(chunk.file_id);
    }
}

void FileReceiver::abandon_peer(const std::string& peer_id) {
    std::size_t dropped = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second->peer_id() == peer_id) {
            LOG_WARN("Abandoning '{}' from {} after {}/{} chunks", it->second->name(), peer_id,
                     it->second->received_count(), it->second->total_chunks());
            it = sessions_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    if (dropped > 0) {
        LOG_INFO("Discarded {} inbound transfer(s) from {}", dropped, peer_id);
    }
}

const InboundTransferSession* FileReceiver::find_session(const std::string& file_id) const {
    auto it = sessions_.find(file_id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

void FileReceiver::fail_session(const std::string& file_id, Result error) {
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return;
    }

    auto session = std::move(it->second);
    sessions_.erase(it);

    LOG_ERROR("Inbound transfer of '{}' from {} failed: {} ({})", session->name(), session->peer_id(),
              core::to_string(error.error), error.message);

    failure_observers_.notify(TransferFailure{session->peer_id(), session->file_id(), session->name(), error});
}

void FileReceiver::complete_session(const std::string& file_id) {
    auto it = sessions_.find(file_id);
    if (it == sessions_.end()) {
        return;
    }

    auto session = std::move(it->second);
    sessions_.erase(it);

    auto file = session->assemble();
    if (file.missing_chunks > 0) {
        LOG_WARN("Reassembled '{}' from {} with {} of {} chunks missing", file.name, session->peer_id(),
                 file.missing_chunks, session->total_chunks());
    } else {
        LOG_INFO("Received '{}' ({}) from {}", file.name,
                 core::utils::StringUtils::format_bytes(file.size()), session->peer_id());
    }

    file_observers_.notify(session->peer_id(), file);
}

}
