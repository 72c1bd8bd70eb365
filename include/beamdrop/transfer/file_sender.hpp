#pragma once

#include "beamdrop/core/error.hpp"
#include "beamdrop/network/transport.hpp"
#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/transfer/byte_source.hpp"
#include "beamdrop/transfer/progress.hpp"
#include "beamdrop/transfer/transfer_session.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>

namespace beamdrop::transfer {

struct SenderOptions {
    std::size_t chunk_size = network::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds chunk_delay{10};
};

// Streams one file per peer over its data channel: a file-metadata frame,
// then file-chunk frames paced by a fixed delay. There is no acknowledgement;
// the transfer is done once the last chunk is handed to the channel.
class FileSender {
public:
    using ProgressCallback = std::function<void(const ProgressUpdate&)>;

    explicit FileSender(boost::asio::io_context& io_context, SenderOptions options = SenderOptions());
    ~FileSender();

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    // Throws core::TransferError with CHANNEL_NOT_READY or TRANSFER_BUSY.
    std::future<core::Result> send(const std::string& peer_id,
                                   std::shared_ptr<network::DataChannel> channel,
                                   std::shared_ptr<ByteSource> source,
                                   ProgressCallback on_progress = nullptr);

    // Resolves the peer's transfer with TRANSFER_ABORTED.
    void abort(const std::string& peer_id, const std::string& reason = "Data channel closed");
    void abort_all(const std::string& reason = "Session disconnected");

    bool is_sending(const std::string& peer_id) const { return active_.count(peer_id) > 0; }
    std::size_t active_count() const { return active_.size(); }
    const SenderOptions& options() const { return options_; }

private:
    struct ActiveSend {
        std::uint64_t id;
        OutboundTransferSession session;
        std::shared_ptr<network::DataChannel> channel;
        ProgressCallback on_progress;
        std::promise<core::Result> promise;
        boost::asio::steady_timer timer;
    };

    void send_next_chunk(const std::string& peer_id, std::uint64_t id);
    void schedule_next_chunk(ActiveSend& send);
    void finish(const std::string& peer_id, core::Result result);
    ActiveSend* find_current(const std::string& peer_id, std::uint64_t id);

    boost::asio::io_context& io_context_;
    SenderOptions options_;
    std::unordered_map<std::string, std::unique_ptr<ActiveSend>> active_;
    std::uint64_t next_send_id_;
    std::shared_ptr<bool> alive_;
};

}
