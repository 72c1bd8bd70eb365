#pragma once

#include "beamdrop/core/observer.hpp"
#include "beamdrop/network/transport.hpp"
#include "beamdrop/signaling/signaling_channel.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace beamdrop::network {

// Owns one transport per remote peer and drives offer/answer/ICE exchange
// through the signaling relay. All work happens on the io_context thread.
class PeerConnectionManager {
public:
    using StateObservers = core::ObserverList<std::string, PeerState>;
    using ChannelOpenObservers = core::ObserverList<std::string, std::shared_ptr<DataChannel>>;
    using ChannelMessageObservers = core::ObserverList<std::string, std::string>;
    using ChannelClosedObservers = core::ObserverList<std::string>;

    PeerConnectionManager(boost::asio::io_context& io_context,
                          std::string local_id,
                          signaling::SignalingChannel& signaling,
                          TransportFactory& factory);
    ~PeerConnectionManager();

    PeerConnectionManager(const PeerConnectionManager&) = delete;
    PeerConnectionManager& operator=(const PeerConnectionManager&) = delete;

    // Replaces any existing connection to the peer.
    void initiate(const std::string& peer_id);
    void handle_offer(const std::string& peer_id, const SessionDescription& description);
    void handle_answer(const std::string& peer_id, const SessionDescription& description);
    void handle_ice_candidate(const std::string& peer_id, const IceCandidate& candidate);

    // Routes offer, answer and ice-candidate envelopes; ignores the rest.
    void handle_signal(const signaling::SignalEnvelope& envelope);

    void close_peer(const std::string& peer_id);
    void close_all();

    bool has_connection(const std::string& peer_id) const;
    std::optional<PeerState> get_state(const std::string& peer_id) const;
    std::optional<NegotiationRole> get_role(const std::string& peer_id) const;
    std::shared_ptr<DataChannel> get_channel(const std::string& peer_id) const;
    bool is_channel_open(const std::string& peer_id) const;
    std::size_t connection_count() const { return connections_.size(); }
    std::vector<std::string> connected_peers() const;
    const std::string& local_id() const { return local_id_; }

    StateObservers& on_state_change() { return state_observers_; }
    ChannelOpenObservers& on_channel_open() { return channel_open_observers_; }
    ChannelMessageObservers& on_channel_message() { return channel_message_observers_; }
    ChannelClosedObservers& on_channel_closed() { return channel_closed_observers_; }

private:
    struct PeerConnection {
        std::string peer_id;
        std::uint64_t id;
        NegotiationRole role;
        PeerState state;
        std::unique_ptr<PeerTransport> transport;
        std::shared_ptr<DataChannel> channel;
        bool channel_open;
    };

    PeerConnection& create_connection(const std::string& peer_id, NegotiationRole role);
    void attach_channel(PeerConnection& connection, std::shared_ptr<DataChannel> channel);

    void on_local_description(const std::string& peer_id, std::uint64_t id, const SessionDescription& desc);
    void on_local_candidate(const std::string& peer_id, std::uint64_t id, const IceCandidate& candidate);
    void on_transport_state(const std::string& peer_id, std::uint64_t id, PeerState state);
    void on_remote_channel(const std::string& peer_id, std::uint64_t id, std::shared_ptr<DataChannel> channel);
    void on_channel_open(const std::string& peer_id, std::uint64_t id, const std::shared_ptr<DataChannel>& channel);
    void on_channel_closed(const std::string& peer_id, std::uint64_t id, const std::shared_ptr<DataChannel>& channel);

    void fail_connection(PeerConnection& connection, const std::string& reason);
    void schedule_destroy(const std::string& peer_id, std::uint64_t id);
    void destroy_connection(const std::string& peer_id);

    // Null when the connection for peer_id is gone or has been replaced.
    PeerConnection* find_current(const std::string& peer_id, std::uint64_t id);
    PeerConnection* find(const std::string& peer_id);
    const PeerConnection* find(const std::string& peer_id) const;

    boost::asio::io_context& io_context_;
    std::string local_id_;
    signaling::SignalingChannel& signaling_;
    TransportFactory& factory_;
    std::unordered_map<std::string, std::unique_ptr<PeerConnection>> connections_;
    std::uint64_t next_connection_id_;
    std::shared_ptr<bool> alive_;

    StateObservers state_observers_;
    ChannelOpenObservers channel_open_observers_;
    ChannelMessageObservers channel_message_observers_;
    ChannelClosedObservers channel_closed_observers_;
};

}
