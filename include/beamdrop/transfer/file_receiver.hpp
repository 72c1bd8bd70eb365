#pragma once

#include "beamdrop/core/error.hpp"
#include "beamdrop/core/observer.hpp"
#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/transfer/progress.hpp"
#include "beamdrop/transfer/transfer_session.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace beamdrop::transfer {

struct ReceiverOptions {
    CompletionPolicy completion_policy = CompletionPolicy::LAST_INDEX;
};

struct TransferFailure {
    std::string peer_id;
    std::string file_id;
    std::string file_name;
    core::Result error;
};

// Reassembles files from file-metadata / file-chunk frames. One session per
// fileId; chunks may arrive in any order.
class FileReceiver {
public:
    using FileObservers = core::ObserverList<std::string, ReceivedFile>;
    using ProgressObservers = core::ObserverList<ProgressUpdate>;
    using FailureObservers = core::ObserverList<TransferFailure>;

    explicit FileReceiver(ReceiverOptions options = ReceiverOptions());

    // Entry point for every text frame that arrives on a peer's data channel.
    void handle_message(const std::string& peer_id, const std::string& frame);

    void handle_metadata(const std::string& peer_id, const network::FileMetadataMessage& metadata);
    void handle_chunk(const std::string& peer_id, const network::FileChunkMessage& chunk);

    // Drops every session from the peer without notifying anyone.
    void abandon_peer(const std::string& peer_id);
    void clear() { sessions_.clear(); }

    std::size_t session_count() const { return sessions_.size(); }
    const InboundTransferSession* find_session(const std::string& file_id) const;
    const ReceiverOptions& options() const { return options_; }

    FileObservers& on_file_received() { return file_observers_; }
    ProgressObservers& on_progress() { return progress_observers_; }
    FailureObservers& on_transfer_failed() { return failure_observers_; }

private:
    void fail_session(const std::string& file_id, core::Result error);
    void complete_session(const std::string& file_id);

    ReceiverOptions options_;
    std::unordered_map<std::string, std::unique_ptr<InboundTransferSession>> sessions_;

    FileObservers file_observers_;
    ProgressObservers progress_observers_;
    FailureObservers failure_observers_;
};

}
