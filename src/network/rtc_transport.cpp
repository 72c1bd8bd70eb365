#include "beamdrop/network/rtc_transport.hpp"
#include "beamdrop/core/logger.hpp"
#include <variant>

namespace beamdrop::network {

namespace {
    PeerState from_rtc_state(rtc::PeerConnection::State state) {
        switch (state) {
            case rtc::PeerConnection::State::New: return PeerState::NEW;
            case rtc::PeerConnection::State::Connecting: return PeerState::CONNECTING;
            case rtc::PeerConnection::State::Connected: return PeerState::CONNECTED;
            case rtc::PeerConnection::State::Disconnected: return PeerState::DISCONNECTED;
            case rtc::PeerConnection::State::Failed: return PeerState::FAILED;
            case rtc::PeerConnection::State::Closed: return PeerState::CLOSED;
        }
        return PeerState::FAILED;
    }
}

RtcDataChannel::RtcDataChannel(boost::asio::io_context& io_context, std::shared_ptr<rtc::DataChannel> channel)
    : io_context_(io_context)
    , channel_(std::move(channel))
    , label_(channel_->label())
    , state_(channel_->isOpen() ? ChannelState::OPEN : ChannelState::CONNECTING)
    , alive_(std::make_shared<bool>(true)) {
    bind_callbacks();
}

RtcDataChannel::~RtcDataChannel() {
    // No library callback is running once resetCallbacks() returns.
    channel_->resetCallbacks();
    alive_.reset();
    if (!channel_->isClosed()) {
        channel_->close();
    }
}

bool RtcDataChannel::send(const std::string& message) {
    if (state_ != ChannelState::OPEN) {
        return false;
    }

    try {
        channel_->send(message);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Data channel '{}' send failed: {}", label_, e.what());
        return false;
    }
}

void RtcDataChannel::close() {
    if (state_ == ChannelState::CLOSED || state_ == ChannelState::CLOSING) {
        return;
    }
    state_ = ChannelState::CLOSING;
    channel_->close();
}

void RtcDataChannel::bind_callbacks() {
    std::weak_ptr<bool> token = alive_;
    auto& io = io_context_;

    channel_->onOpen([this, token, &io]() {
        boost::asio::post(io, [this, token]() {
            if (token.expired() || state_ != ChannelState::CONNECTING) return;
            state_ = ChannelState::OPEN;
            handle_open();
        });
    });

    channel_->onMessage([this, token, &io](rtc::message_variant data) {
        if (!std::holds_alternative<std::string>(data)) {
            LOG_WARN("Ignoring binary message on data channel '{}'", label_);
            return;
        }
        boost::asio::post(io, [this, token, text = std::get<std::string>(std::move(data))]() {
            if (token.expired()) return;
            handle_message(text);
        });
    });

    channel_->onClosed([this, token, &io]() {
        boost::asio::post(io, [this, token]() {
            if (token.expired() || state_ == ChannelState::CLOSED) return;
            state_ = ChannelState::CLOSED;
            handle_closed();
        });
    });

    channel_->onError([this, token, &io](std::string error) {
        boost::asio::post(io, [this, token, error = std::move(error)]() {
            if (token.expired()) return;
            handle_error(error);
        });
    });
}

RtcPeerTransport::RtcPeerTransport(boost::asio::io_context& io_context, const rtc::Configuration& config)
    : io_context_(io_context)
    , connection_(std::make_shared<rtc::PeerConnection>(config))
    , state_(PeerState::NEW)
    , closed_(false)
    , alive_(std::make_shared<bool>(true)) {
    bind_callbacks();
}

RtcPeerTransport::~RtcPeerTransport() {
    connection_->resetCallbacks();
    alive_.reset();
    if (!closed_) {
        connection_->close();
    }
}

std::shared_ptr<DataChannel> RtcPeerTransport::create_data_channel(const std::string& label) {
    auto channel = connection_->createDataChannel(label);
    return std::make_shared<RtcDataChannel>(io_context_, std::move(channel));
}

void RtcPeerTransport::set_local_description() {
    connection_->setLocalDescription();
}

void RtcPeerTransport::set_remote_description(const SessionDescription& description) {
    connection_->setRemoteDescription(rtc::Description(description.sdp, description.type));
}

void RtcPeerTransport::add_remote_candidate(const IceCandidate& candidate) {
    connection_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.mid));
}

void RtcPeerTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    connection_->close();
}

void RtcPeerTransport::bind_callbacks() {
    connection_->onLocalDescription([this](rtc::Description description) {
        SessionDescription desc{description.typeString(), std::string(description)};
        post([this, desc]() { handle_local_description(desc); });
    });

    connection_->onLocalCandidate([this](rtc::Candidate candidate) {
        IceCandidate local{candidate.candidate(), candidate.mid()};
        post([this, local]() { handle_local_candidate(local); });
    });

    connection_->onStateChange([this](rtc::PeerConnection::State rtc_state) {
        auto state = from_rtc_state(rtc_state);
        post([this, state]() {
            state_ = state;
            handle_state_change(state);
        });
    });

    connection_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
        post([this, channel]() {
            handle_data_channel(std::make_shared<RtcDataChannel>(io_context_, channel));
        });
    });
}

RtcTransportFactory::RtcTransportFactory(boost::asio::io_context& io_context, TransportConfig config)
    : io_context_(io_context)
    , config_(std::move(config)) {
}

std::unique_ptr<PeerTransport> RtcTransportFactory::create(NegotiationRole role) {
    rtc::Configuration config;
    config.disableAutoNegotiation = true;
    for (const auto& server : config_.ice_servers) {
        config.iceServers.emplace_back(server);
    }

    LOG_DEBUG("Creating {} transport with {} ICE server(s)", to_string(role), config_.ice_servers.size());
    return std::make_unique<RtcPeerTransport>(io_context_, config);
}

void RtcTransportFactory::enable_library_logging() {
    rtc::InitLogger(rtc::LogLevel::Warning, [](rtc::LogLevel level, std::string message) {
        switch (level) {
            case rtc::LogLevel::Fatal:
            case rtc::LogLevel::Error:
                LOG_ERROR("libdatachannel: {}", message);
                break;
            case rtc::LogLevel::Warning:
                LOG_WARN("libdatachannel: {}", message);
                break;
            default:
                LOG_DEBUG("libdatachannel: {}", message);
                break;
        }
    });
}

}
