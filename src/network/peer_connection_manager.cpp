#include "beamdrop/network/peer_connection_manager.hpp"
#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"

namespace beamdrop::network {

using signaling::SignalEnvelope;
using signaling::SignalType;

PeerConnectionManager::PeerConnectionManager(boost::asio::io_context& io_context,
                                             std::string local_id,
                                             signaling::SignalingChannel& signaling,
                                             TransportFactory& factory)
    : io_context_(io_context)
    , local_id_(std::move(local_id))
    , signaling_(signaling)
    , factory_(factory)
    , next_connection_id_(1)
    , alive_(std::make_shared<bool>(true)) {
}

PeerConnectionManager::~PeerConnectionManager() {
    alive_.reset();
    state_observers_.clear();
    channel_open_observers_.clear();
    channel_message_observers_.clear();
    channel_closed_observers_.clear();
    close_all();
}

void PeerConnectionManager::initiate(const std::string& peer_id) {
    if (peer_id == local_id_) {
        throw core::TransferError(core::ErrorCode::INVALID_STATE, "Cannot connect to self");
    }

    LOG_INFO("Initiating connection to {}", peer_id);
    auto& connection = create_connection(peer_id, NegotiationRole::INITIATOR);

    try {
        auto channel = connection.transport->create_data_channel(TRANSFER_CHANNEL_LABEL);
        attach_channel(connection, std::move(channel));
        connection.transport->set_local_description();
    } catch (const std::exception& e) {
        fail_connection(connection, std::string("failed to create offer: ") + e.what());
    }
}

void PeerConnectionManager::handle_offer(const std::string& peer_id, const SessionDescription& description) {
    LOG_INFO("Received offer from {}", peer_id);
    auto& connection = create_connection(peer_id, NegotiationRole::RESPONDER);

    try {
        connection.transport->set_remote_description(description);
        connection.transport->set_local_description();
    } catch (const std::exception& e) {
        fail_connection(connection, std::string("failed to answer offer: ") + e.what());
    }
}

void PeerConnectionManager::handle_answer(const std::string& peer_id, const SessionDescription& description) {
    auto* connection = find(peer_id);
    if (!connection) {
        LOG_WARN("{}: answer from {} with no pending connection",
                 core::to_string(core::ErrorCode::STALE_SIGNAL), peer_id);
        return;
    }

    if (connection->role != NegotiationRole::INITIATOR) {
        LOG_WARN("{}: unexpected answer from {} while responding",
                 core::to_string(core::ErrorCode::STALE_SIGNAL), peer_id);
        return;
    }

    LOG_DEBUG("Applying answer from {}", peer_id);
    try {
        connection->transport->set_remote_description(description);
    } catch (const std::exception& e) {
        fail_connection(*connection, std::string("failed to apply answer: ") + e.what());
    }
}

void PeerConnectionManager::handle_ice_candidate(const std::string& peer_id, const IceCandidate& candidate) {
    auto* connection = find(peer_id);
    if (!connection) {
        LOG_WARN("{}: ICE candidate from {} with no connection",
                 core::to_string(core::ErrorCode::STALE_SIGNAL), peer_id);
        return;
    }

    try {
        connection->transport->add_remote_candidate(candidate);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to add ICE candidate from {}: {}", peer_id, e.what());
    }
}

void PeerConnectionManager::handle_signal(const SignalEnvelope& envelope) {
    if (envelope.type != SignalType::OFFER && envelope.type != SignalType::ANSWER &&
        envelope.type != SignalType::ICE_CANDIDATE) {
        return;
    }

    if (envelope.sender.empty()) {
        LOG_WARN("Dropping {} without a sender", signaling::to_string(envelope.type));
        return;
    }

    try {
        switch (envelope.type) {
            case SignalType::OFFER:
                handle_offer(envelope.sender, envelope.payload.get<SessionDescription>());
                break;
            case SignalType::ANSWER:
                handle_answer(envelope.sender, envelope.payload.get<SessionDescription>());
                break;
            case SignalType::ICE_CANDIDATE:
                handle_ice_candidate(envelope.sender, envelope.payload.get<IceCandidate>());
                break;
            default:
                break;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("{}: bad {} payload from {}: {}", core::to_string(core::ErrorCode::PROTOCOL_ERROR),
                 signaling::to_string(envelope.type), envelope.sender, e.what());
    }
}

void PeerConnectionManager::close_peer(const std::string& peer_id) {
    if (!find(peer_id)) {
        return;
    }

    LOG_INFO("Closing connection to {}", peer_id);
    destroy_connection(peer_id);
    state_observers_.notify(peer_id, PeerState::CLOSED);
}

void PeerConnectionManager::close_all() {
    auto peers = connected_peers();
    for (const auto& peer_id : peers) {
        close_peer(peer_id);
    }
}

bool PeerConnectionManager::has_connection(const std::string& peer_id) const {
    return find(peer_id) != nullptr;
}

std::optional<PeerState> PeerConnectionManager::get_state(const std::string& peer_id) const {
    auto* connection = find(peer_id);
    if (!connection) return std::nullopt;
    return connection->state;
}

std::optional<NegotiationRole> PeerConnectionManager::get_role(const std::string& peer_id) const {
    auto* connection = find(peer_id);
    if (!connection) return std::nullopt;
    return connection->role;
}

std::shared_ptr<DataChannel> PeerConnectionManager::get_channel(const std::string& peer_id) const {
    auto* connection = find(peer_id);
    return connection ? connection->channel : nullptr;
}

bool PeerConnectionManager::is_channel_open(const std::string& peer_id) const {
    auto channel = get_channel(peer_id);
    return channel && channel->is_open();
}

std::vector<std::string> PeerConnectionManager::connected_peers() const {
    std::vector<std::string> peers;
    peers.reserve(connections_.size());
    for (const auto& [peer_id, connection] : connections_) {
        peers.push_back(peer_id);
    }
    return peers;
}

PeerConnectionManager::PeerConnection& PeerConnectionManager::create_connection(const std::string& peer_id,
                                                                               NegotiationRole role) {
    if (find(peer_id)) {
        LOG_INFO("Replacing existing connection to {}", peer_id);
        destroy_connection(peer_id);
    }

    auto connection = std::make_unique<PeerConnection>();
    connection->peer_id = peer_id;
    connection->id = next_connection_id_++;
    connection->role = role;
    connection->state = PeerState::NEW;
    connection->transport = factory_.create(role);
    connection->channel_open = false;

    if (!connection->transport) {
        throw core::TransferError(core::ErrorCode::NEGOTIATION_FAILURE, "Transport factory returned no transport");
    }

    auto id = connection->id;
    auto& transport = *connection->transport;

    transport.set_local_description_handler([this, peer_id, id](const SessionDescription& desc) {
        on_local_description(peer_id, id, desc);
    });
    transport.set_local_candidate_handler([this, peer_id, id](const IceCandidate& candidate) {
        on_local_candidate(peer_id, id, candidate);
    });
    transport.set_state_handler([this, peer_id, id](PeerState state) {
        on_transport_state(peer_id, id, state);
    });
    transport.set_data_channel_handler([this, peer_id, id](std::shared_ptr<DataChannel> channel) {
        on_remote_channel(peer_id, id, std::move(channel));
    });

    LOG_DEBUG("Created {} connection #{} for {}", to_string(role), id, peer_id);

    auto& ref = *connection;
    connections_[peer_id] = std::move(connection);
    return ref;
}

void PeerConnectionManager::attach_channel(PeerConnection& connection, std::shared_ptr<DataChannel> channel) {
    if (!channel) {
        return;
    }

    auto peer_id = connection.peer_id;
    auto id = connection.id;
    std::weak_ptr<DataChannel> weak_channel = channel;

    channel->set_open_handler([this, peer_id, id, weak_channel]() {
        if (auto ch = weak_channel.lock()) {
            on_channel_open(peer_id, id, ch);
        }
    });
    channel->set_message_handler([this, peer_id, id](const std::string& message) {
        if (find_current(peer_id, id)) {
            channel_message_observers_.notify(peer_id, message);
        }
    });
    channel->set_closed_handler([this, peer_id, id, weak_channel]() {
        on_channel_closed(peer_id, id, weak_channel.lock());
    });
    channel->set_error_handler([peer_id](const std::string& error) {
        LOG_ERROR("Data channel error with {}: {}", peer_id, error);
    });

    connection.channel = std::move(channel);

    // A channel announced by the remote side may already be open.
    if (connection.channel->is_open()) {
        on_channel_open(peer_id, id, connection.channel);
    }
}

void PeerConnectionManager::on_local_description(const std::string& peer_id, std::uint64_t id,
                                                 const SessionDescription& desc) {
    if (!find_current(peer_id, id)) {
        return;
    }

    LOG_DEBUG("Sending {} to {}", desc.type, peer_id);
    auto envelope = desc.type == "answer"
        ? SignalEnvelope::answer(peer_id, desc)
        : SignalEnvelope::offer(peer_id, desc);
    signaling_.send(envelope);
}

void PeerConnectionManager::on_local_candidate(const std::string& peer_id, std::uint64_t id,
                                               const IceCandidate& candidate) {
    if (!find_current(peer_id, id)) {
        return;
    }

    LOG_TRACE("Sending ICE candidate to {}: {}", peer_id, candidate.candidate);
    signaling_.send(SignalEnvelope::ice_candidate(peer_id, candidate));
}

void PeerConnectionManager::on_transport_state(const std::string& peer_id, std::uint64_t id, PeerState state) {
    auto* connection = find_current(peer_id, id);
    if (!connection || connection->state == state) {
        return;
    }

    LOG_INFO("Connection to {}: {} -> {}", peer_id, to_string(connection->state), to_string(state));
    connection->state = state;

    if (state == PeerState::FAILED || state == PeerState::DISCONNECTED) {
        LOG_WARN("{}: connection to {} is {}", core::to_string(core::ErrorCode::NEGOTIATION_FAILURE),
                 peer_id, to_string(state));
    }

    state_observers_.notify(peer_id, state);

    if (state == PeerState::FAILED || state == PeerState::CLOSED) {
        schedule_destroy(peer_id, id);
    }
}

void PeerConnectionManager::on_remote_channel(const std::string& peer_id, std::uint64_t id,
                                              std::shared_ptr<DataChannel> channel) {
    auto* connection = find_current(peer_id, id);
    if (!connection || !channel) {
        return;
    }

    if (channel->label() != TRANSFER_CHANNEL_LABEL) {
        LOG_WARN("Ignoring data channel '{}' from {}", channel->label(), peer_id);
        channel->close();
        return;
    }

    if (connection->channel) {
        LOG_WARN("Ignoring second transfer channel from {}", peer_id);
        channel->close();
        return;
    }

    LOG_DEBUG("Accepted data channel '{}' from {}", channel->label(), peer_id);
    attach_channel(*connection, std::move(channel));
}

void PeerConnectionManager::on_channel_open(const std::string& peer_id, std::uint64_t id,
                                            const std::shared_ptr<DataChannel>& channel) {
    auto* connection = find_current(peer_id, id);
    if (!connection || connection->channel != channel || connection->channel_open) {
        return;
    }

    connection->channel_open = true;
    LOG_INFO("Data channel to {} is open", peer_id);
    channel_open_observers_.notify(peer_id, channel);
}

void PeerConnectionManager::on_channel_closed(const std::string& peer_id, std::uint64_t id,
                                              const std::shared_ptr<DataChannel>& channel) {
    auto* connection = find_current(peer_id, id);
    if (!connection || (channel && connection->channel != channel)) {
        return;
    }

    bool was_open = connection->channel_open;
    connection->channel_open = false;
    LOG_INFO("Data channel to {} closed", peer_id);

    if (was_open) {
        channel_closed_observers_.notify(peer_id);
    }
}

void PeerConnectionManager::fail_connection(PeerConnection& connection, const std::string& reason) {
    LOG_ERROR("{}: connection to {} {}", core::to_string(core::ErrorCode::NEGOTIATION_FAILURE),
              connection.peer_id, reason);
    on_transport_state(connection.peer_id, connection.id, PeerState::FAILED);
}

void PeerConnectionManager::schedule_destroy(const std::string& peer_id, std::uint64_t id) {
    std::weak_ptr<bool> token = alive_;
    boost::asio::post(io_context_, [this, token, peer_id, id]() {
        if (token.expired() || !find_current(peer_id, id)) {
            return;
        }
        destroy_connection(peer_id);
    });
}

void PeerConnectionManager::destroy_connection(const std::string& peer_id) {
    auto it = connections_.find(peer_id);
    if (it == connections_.end()) {
        return;
    }

    auto connection = std::move(it->second);
    connections_.erase(it);

    bool was_open = connection->channel_open;
    if (connection->channel) {
        connection->channel->set_open_handler(nullptr);
        connection->channel->set_message_handler(nullptr);
        connection->channel->set_closed_handler(nullptr);
        connection->channel->set_error_handler(nullptr);
        connection->channel->close();
    }

    connection->transport->set_local_description_handler(nullptr);
    connection->transport->set_local_candidate_handler(nullptr);
    connection->transport->set_state_handler(nullptr);
    connection->transport->set_data_channel_handler(nullptr);
    connection->transport->close();

    LOG_DEBUG("Destroyed connection #{} for {}", connection->id, peer_id);

    if (was_open) {
        channel_closed_observers_.notify(peer_id);
    }
}

PeerConnectionManager::PeerConnection* PeerConnectionManager::find_current(const std::string& peer_id,
                                                                          std::uint64_t id) {
    auto* connection = find(peer_id);
    return (connection && connection->id == id) ? connection : nullptr;
}

PeerConnectionManager::PeerConnection* PeerConnectionManager::find(const std::string& peer_id) {
    auto it = connections_.find(peer_id);
    return it == connections_.end() ? nullptr : it->second.get();
}

const PeerConnectionManager::PeerConnection* PeerConnectionManager::find(const std::string& peer_id) const {
    auto it = connections_.find(peer_id);
    return it == connections_.end() ? nullptr : it->second.get();
}

}
