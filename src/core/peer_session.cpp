#include "beamdrop/core/peer_session.hpp"
#include "beamdrop/core/logger.hpp"

namespace beamdrop::core {

using signaling::SignalEnvelope;
using signaling::SignalType;

SessionOptions SessionOptions::from_config(const Config& config, const std::string& local_id) {
    SessionOptions options;
    options.local_id = local_id;
    options.display_name = config.get_string("user.display_name", options.display_name);
    options.emoji = config.get_string("user.emoji", options.emoji);

    auto chunk_size = config.get_int("transfer.chunk_size", static_cast<int>(network::DEFAULT_CHUNK_SIZE));
    if (chunk_size > 0) {
        options.sender.chunk_size = static_cast<std::size_t>(chunk_size);
    } else {
        LOG_WARN("Ignoring invalid transfer.chunk_size {}", chunk_size);
    }

    auto delay = config.get_int("transfer.chunk_delay_ms", static_cast<int>(options.sender.chunk_delay.count()));
    if (delay >= 0) {
        options.sender.chunk_delay = std::chrono::milliseconds(delay);
    } else {
        LOG_WARN("Ignoring negative transfer.chunk_delay_ms {}", delay);
    }

    auto policy_name = config.get_string("transfer.completion_policy", "last_index");
    if (auto policy = transfer::parse_completion_policy(policy_name)) {
        options.receiver.completion_policy = *policy;
    } else {
        LOG_WARN("Unknown transfer.completion_policy '{}', using last_index", policy_name);
    }

    return options;
}

PeerSession::PeerSession(boost::asio::io_context& io_context,
                         SessionOptions options,
                         signaling::SignalingChannel& signaling,
                         network::TransportFactory& transports)
    : io_context_(io_context)
    , options_(std::move(options))
    , signaling_(signaling)
    , disconnected_(false)
    , roster_(options_.local_id)
    , receiver_(options_.receiver)
    , sender_(io_context, options_.sender)
    , connections_(io_context, options_.local_id, signaling, transports)
    , next_handle_(1) {

    signaling_.set_envelope_handler([this](const SignalEnvelope& envelope) {
        handle_envelope(envelope);
    });
    signaling_.set_state_handler([this](bool open) {
        handle_relay_state(open);
    });

    connections_.on_state_change().subscribe([this](const std::string& peer_id, network::PeerState state) {
        state_observers_.notify(peer_id, state);
    });
    connections_.on_channel_open().subscribe([this](const std::string& peer_id,
                                                    const std::shared_ptr<network::DataChannel>&) {
        channel_open_observers_.notify(peer_id);
    });
    connections_.on_channel_message().subscribe([this](const std::string& peer_id, const std::string& frame) {
        receiver_.handle_message(peer_id, frame);
    });
    connections_.on_channel_closed().subscribe([this](const std::string& peer_id) {
        handle_channel_closed(peer_id);
    });

    receiver_.on_file_received().subscribe([this](const std::string& peer_id, const transfer::ReceivedFile& file) {
        file_observers_.notify(peer_id, file);
    });
    receiver_.on_progress().subscribe([this](const transfer::ProgressUpdate& update) {
        progress_observers_.notify(update);
    });
    receiver_.on_transfer_failed().subscribe([this](const transfer::TransferFailure& failure) {
        failure_observers_.notify(failure);
    });

    roster_.on_change().subscribe([this](const std::vector<signaling::OnlineUser>& users) {
        roster_observers_.notify(users);
    });

    LOG_DEBUG("Peer session ready for {}", options_.local_id);
}

PeerSession::~PeerSession() {
    signaling_.set_envelope_handler(nullptr);
    signaling_.set_state_handler(nullptr);

    file_observers_.clear();
    progress_observers_.clear();
    roster_observers_.clear();
    state_observers_.clear();
    channel_open_observers_.clear();
    failure_observers_.clear();

    sender_.abort_all("Session destroyed");
    connections_.close_all();
}

void PeerSession::initiate(const std::string& peer_id) {
    if (disconnected_) {
        throw TransferError(ErrorCode::INVALID_STATE, "Session is disconnected");
    }
    connections_.initiate(peer_id);
}

std::future<Result> PeerSession::send_file(const std::string& peer_id,
                                           std::shared_ptr<transfer::ByteSource> source,
                                           ProgressCallback on_progress) {
    if (disconnected_) {
        throw TransferError(ErrorCode::CHANNEL_NOT_READY, "Session is disconnected");
    }

    auto callback = [this, on_progress = std::move(on_progress)](const transfer::ProgressUpdate& update) {
        if (on_progress) {
            on_progress(update);
        }
        progress_observers_.notify(update);
    };

    return sender_.send(peer_id, connections_.get_channel(peer_id), std::move(source), std::move(callback));
}

bool PeerSession::update_info(const std::string& display_name, const std::string& emoji) {
    options_.display_name = display_name;
    options_.emoji = emoji;
    return signaling_.send(SignalEnvelope::update_info(display_name, emoji));
}

void PeerSession::disconnect() {
    if (disconnected_) {
        return;
    }
    disconnected_ = true;

    LOG_INFO("Disconnecting session {}", options_.local_id);
    sender_.abort_all();
    receiver_.clear();
    connections_.close_all();
    signaling_.close();
}

SubscriptionHandle PeerSession::on_file_received(FileReceivedCallback callback) {
    return add_subscription(file_observers_, std::move(callback));
}

SubscriptionHandle PeerSession::on_progress_update(ProgressCallback callback) {
    return add_subscription(progress_observers_, std::move(callback));
}

SubscriptionHandle PeerSession::on_online_users_change(RosterCallback callback) {
    return add_subscription(roster_observers_, std::move(callback));
}

SubscriptionHandle PeerSession::on_peer_state_change(PeerStateCallback callback) {
    return add_subscription(state_observers_, std::move(callback));
}

SubscriptionHandle PeerSession::on_channel_open(ChannelOpenCallback callback) {
    return add_subscription(channel_open_observers_, std::move(callback));
}

SubscriptionHandle PeerSession::on_transfer_failed(FailureCallback callback) {
    return add_subscription(failure_observers_, std::move(callback));
}

bool PeerSession::unsubscribe(SubscriptionHandle handle) {
    auto it = unsubscribers_.find(handle);
    if (it == unsubscribers_.end()) {
        return false;
    }
    auto removed = it->second();
    unsubscribers_.erase(it);
    return removed;
}

void PeerSession::handle_envelope(const SignalEnvelope& envelope) {
    switch (envelope.type) {
        case SignalType::ONLINE_USERS:
            roster_.handle_broadcast(envelope.payload);
            break;
        case SignalType::OFFER:
        case SignalType::ANSWER:
        case SignalType::ICE_CANDIDATE:
            if (disconnected_) {
                LOG_DEBUG("Ignoring {} from {} after disconnect", signaling::to_string(envelope.type), envelope.sender);
                return;
            }
            connections_.handle_signal(envelope);
            break;
        default:
            LOG_DEBUG("Ignoring relay message '{}'", envelope.type_name);
            break;
    }
}

void PeerSession::handle_relay_state(bool open) {
    if (!open) {
        LOG_WARN("Lost connection to the signaling relay");
        return;
    }

    LOG_INFO("Signaling relay connected, announcing as '{}'", options_.display_name);
    signaling_.send(SignalEnvelope::update_info(options_.display_name, options_.emoji));
}

void PeerSession::handle_channel_closed(const std::string& peer_id) {
    sender_.abort(peer_id);
    receiver_.abandon_peer(peer_id);
}

}
