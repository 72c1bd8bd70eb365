#pragma once

#include "beamdrop/core/config.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/observer.hpp"
#include "beamdrop/network/peer_connection_manager.hpp"
#include "beamdrop/signaling/online_roster.hpp"
#include "beamdrop/signaling/signaling_channel.hpp"
#include "beamdrop/transfer/file_receiver.hpp"
#include "beamdrop/transfer/file_sender.hpp"
#include <boost/asio.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace beamdrop::core {

struct SessionOptions {
    std::string local_id;
    std::string display_name = "Anonymous";
    std::string emoji;
    transfer::SenderOptions sender;
    transfer::ReceiverOptions receiver;

    static SessionOptions from_config(const Config& config, const std::string& local_id);
};

// Everything one local participant needs: relay traffic, peer connections,
// the sender and receiver, and the roster, wired together on one io_context.
class PeerSession {
public:
    using FileReceivedCallback = std::function<void(const std::string&, const transfer::ReceivedFile&)>;
    using ProgressCallback = std::function<void(const transfer::ProgressUpdate&)>;
    using RosterCallback = std::function<void(const std::vector<signaling::OnlineUser>&)>;
    using PeerStateCallback = std::function<void(const std::string&, network::PeerState)>;
    using ChannelOpenCallback = std::function<void(const std::string&)>;
    using FailureCallback = std::function<void(const transfer::TransferFailure&)>;

    PeerSession(boost::asio::io_context& io_context,
                SessionOptions options,
                signaling::SignalingChannel& signaling,
                network::TransportFactory& transports);
    ~PeerSession();

    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;

    void initiate(const std::string& peer_id);

    // Throws TransferError(CHANNEL_NOT_READY | TRANSFER_BUSY). Progress goes to
    // `on_progress` and to every on_progress_update subscriber.
    std::future<Result> send_file(const std::string& peer_id,
                                  std::shared_ptr<transfer::ByteSource> source,
                                  ProgressCallback on_progress = nullptr);

    bool update_info(const std::string& display_name, const std::string& emoji);
    void disconnect();

    SubscriptionHandle on_file_received(FileReceivedCallback callback);
    SubscriptionHandle on_progress_update(ProgressCallback callback);
    SubscriptionHandle on_online_users_change(RosterCallback callback);
    SubscriptionHandle on_peer_state_change(PeerStateCallback callback);
    SubscriptionHandle on_channel_open(ChannelOpenCallback callback);
    SubscriptionHandle on_transfer_failed(FailureCallback callback);
    bool unsubscribe(SubscriptionHandle handle);

    bool is_channel_open(const std::string& peer_id) const { return connections_.is_channel_open(peer_id); }
    bool is_disconnected() const { return disconnected_; }
    const std::string& local_id() const { return options_.local_id; }
    const SessionOptions& options() const { return options_; }

    const signaling::OnlineRoster& roster() const { return roster_; }
    network::PeerConnectionManager& connections() { return connections_; }
    transfer::FileSender& sender() { return sender_; }
    transfer::FileReceiver& receiver() { return receiver_; }

private:
    void handle_envelope(const signaling::SignalEnvelope& envelope);
    void handle_relay_state(bool open);
    void handle_channel_closed(const std::string& peer_id);

    // Wraps a per-list handle so every subscription shares one handle space.
    template<typename List, typename Callback>
    SubscriptionHandle add_subscription(List& list, Callback callback) {
        auto inner = list.subscribe(std::move(callback));
        if (inner == 0) {
            return 0;
        }
        auto handle = next_handle_++;
        unsubscribers_[handle] = [&list, inner]() { return list.unsubscribe(inner); };
        return handle;
    }

    boost::asio::io_context& io_context_;
    SessionOptions options_;
    signaling::SignalingChannel& signaling_;
    bool disconnected_;

    signaling::OnlineRoster roster_;
    transfer::FileReceiver receiver_;
    transfer::FileSender sender_;
    network::PeerConnectionManager connections_;

    ObserverList<std::string, transfer::ReceivedFile> file_observers_;
    ObserverList<transfer::ProgressUpdate> progress_observers_;
    ObserverList<std::vector<signaling::OnlineUser>> roster_observers_;
    ObserverList<std::string, network::PeerState> state_observers_;
    ObserverList<std::string> channel_open_observers_;
    ObserverList<transfer::TransferFailure> failure_observers_;

    std::map<SubscriptionHandle, std::function<bool()>> unsubscribers_;
    SubscriptionHandle next_handle_;
};

}
