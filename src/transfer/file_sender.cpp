#include "beamdrop/transfer/file_sender.hpp"
#include "beamdrop/crypto/random.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <stdexcept>
#include <vector>

namespace beamdrop::transfer {

using core::ErrorCode;
using core::Result;
using core::TransferError;

FileSender::FileSender(boost::asio::io_context& io_context, SenderOptions options)
    : io_context_(io_context)
    , options_(options)
    , next_send_id_(1)
    , alive_(std::make_shared<bool>(true)) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

FileSender::~FileSender() {
    alive_.reset();
    abort_all("Sender destroyed");
}

std::future<Result> FileSender::send(const std::string& peer_id,
                                     std::shared_ptr<network::DataChannel> channel,
                                     std::shared_ptr<ByteSource> source,
                                     ProgressCallback on_progress) {
    if (!channel || !channel->is_open()) {
        throw TransferError(ErrorCode::CHANNEL_NOT_READY, "No open data channel to " + peer_id);
    }

    if (is_sending(peer_id)) {
        throw TransferError(ErrorCode::TRANSFER_BUSY, "A transfer to " + peer_id + " is already in progress");
    }

    if (!source) {
        throw std::invalid_argument("send() requires a byte source");
    }

    auto file_id = crypto::SecureRandom::generate_token();
    auto active = std::make_unique<ActiveSend>(
        next_send_id_++,
        OutboundTransferSession(file_id, peer_id, std::move(source), options_.chunk_size),
        std::move(channel),
        std::move(on_progress),
        std::promise<Result>(),
        boost::asio::steady_timer(io_context_));

    auto future = active->promise.get_future();
    auto id = active->id;
    auto& session = active->session;

    LOG_INFO("Sending '{}' ({}, {} chunks) to {} as {}", session.file_name(),
             core::utils::StringUtils::format_bytes(session.total_size()),
             session.total_chunks(), peer_id, file_id);

    auto metadata = session.metadata_message().serialize();
    auto* channel_ptr = active->channel.get();
    active_[peer_id] = std::move(active);

    if (!channel_ptr->send(metadata)) {
        finish(peer_id, Result(ErrorCode::TRANSFER_ABORTED, "Failed to send file metadata"));
        return future;
    }

    std::weak_ptr<bool> token = alive_;
    boost::asio::post(io_context_, [this, token, peer_id, id]() {
        if (token.expired()) return;
        send_next_chunk(peer_id, id);
    });

    return future;
}

void FileSender::abort(const std::string& peer_id, const std::string& reason) {
    if (!is_sending(peer_id)) {
        return;
    }

    LOG_WARN("Aborting transfer to {}: {}", peer_id, reason);
    finish(peer_id, Result(ErrorCode::TRANSFER_ABORTED, reason));
}

void FileSender::abort_all(const std::string& reason) {
    std::vector<std::string> peers;
    peers.reserve(active_.size());
    for (const auto& [peer_id, send] : active_) {
        peers.push_back(peer_id);
    }

    for (const auto& peer_id : peers) {
        abort(peer_id, reason);
    }
}

void FileSender::send_next_chunk(const std::string& peer_id, std::uint64_t id) {
    auto* active = find_current(peer_id, id);
    if (!active) {
        return;
    }

    auto& session = active->session;
    if (!active->channel->is_open()) {
        finish(peer_id, Result(ErrorCode::TRANSFER_ABORTED, "Data channel closed during transfer"));
        return;
    }

    network::FileChunkMessage chunk;
    try {
        chunk = session.next_chunk();
    } catch (const TransferError& e) {
        LOG_ERROR("Reading '{}' failed: {}", session.file_name(), e.what());
        finish(peer_id, e.to_result());
        return;
    }

    if (!active->channel->send(chunk.serialize())) {
        finish(peer_id, Result(ErrorCode::TRANSFER_ABORTED,
                               "Failed to send chunk " + std::to_string(chunk.index)));
        return;
    }

    LOG_TRACE("Sent chunk {}/{} of {} to {}", chunk.index + 1, session.total_chunks(), session.file_id(), peer_id);

    if (active->on_progress) {
        auto update = make_progress(TransferDirection::SENDING, peer_id, session.file_id(), session.file_name(),
                                    session.bytes_sent(), session.total_size(), session.start_time());
        try {
            active->on_progress(update);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress callback threw: {}", e.what());
        }

        // The callback may have aborted this transfer.
        active = find_current(peer_id, id);
        if (!active) {
            return;
        }
    }

    if (!active->session.has_next_chunk()) {
        finish(peer_id, Result());
        return;
    }

    schedule_next_chunk(*active);
}

void FileSender::schedule_next_chunk(ActiveSend& send) {
    auto peer_id = send.session.peer_id();
    auto id = send.id;
    std::weak_ptr<bool> token = alive_;

    send.timer.expires_after(options_.chunk_delay);
    send.timer.async_wait([this, token, peer_id, id](const boost::system::error_code& ec) {
        if (ec || token.expired()) return;
        send_next_chunk(peer_id, id);
    });
}

void FileSender::finish(const std::string& peer_id, Result result) {
    auto it = active_.find(peer_id);
    if (it == active_.end()) {
        return;
    }

    auto active = std::move(it->second);
    active_.erase(it);
    active->timer.cancel();

    if (result) {
        auto elapsed = std::chrono::steady_clock::now() - active->session.start_time();
        LOG_INFO("Sent '{}' to {} in {}", active->session.file_name(), peer_id,
                 core::utils::StringUtils::format_duration(
                     std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)));
    } else {
        LOG_WARN("Transfer of '{}' to {} ended: {} ({})", active->session.file_name(), peer_id,
                 core::to_string(result.error), result.message);
    }

    active->promise.set_value(std::move(result));
}

FileSender::ActiveSend* FileSender::find_current(const std::string& peer_id, std::uint64_t id) {
    auto it = active_.find(peer_id);
    if (it == active_.end() || it->second->id != id) {
        return nullptr;
    }
    return it->second.get();
}

}
