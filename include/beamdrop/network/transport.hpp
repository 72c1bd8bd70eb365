#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace beamdrop::network {

enum class PeerState {
    NEW,
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    FAILED,
    CLOSED
};

enum class ChannelState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED
};

enum class NegotiationRole {
    INITIATOR,
    RESPONDER
};

const char* to_string(PeerState state);
const char* to_string(ChannelState state);
const char* to_string(NegotiationRole role);

struct SessionDescription {
    std::string type;   // "offer" or "answer"
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string mid;
};

void to_json(nlohmann::json& j, const SessionDescription& desc);
void from_json(const nlohmann::json& j, SessionDescription& desc);
void to_json(nlohmann::json& j, const IceCandidate& candidate);
void from_json(const nlohmann::json& j, IceCandidate& candidate);

// Ordered, reliable text channel between two negotiated peers.
class DataChannel {
public:
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(const std::string&)>;
    using ClosedHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~DataChannel() = default;

    virtual const std::string& label() const = 0;
    virtual ChannelState state() const = 0;
    virtual bool send(const std::string& message) = 0;
    virtual void close() = 0;

    bool is_open() const { return state() == ChannelState::OPEN; }

    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_closed_handler(ClosedHandler handler) { closed_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }

protected:
    void handle_open() { if (open_handler_) open_handler_(); }
    void handle_message(const std::string& message) { if (message_handler_) message_handler_(message); }
    void handle_closed() { if (closed_handler_) closed_handler_(); }
    void handle_error(const std::string& error) { if (error_handler_) error_handler_(error); }

private:
    OpenHandler open_handler_;
    MessageHandler message_handler_;
    ClosedHandler closed_handler_;
    ErrorHandler error_handler_;
};

// One negotiated peer-to-peer transport. Descriptions and candidates it
// produces must be carried to the remote side over signaling.
class PeerTransport {
public:
    using DescriptionHandler = std::function<void(const SessionDescription&)>;
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using StateHandler = std::function<void(PeerState)>;
    using ChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;

    virtual ~PeerTransport() = default;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label) = 0;

    // Produces an offer, or an answer once a remote offer has been applied.
    virtual void set_local_description() = 0;
    virtual void set_remote_description(const SessionDescription& description) = 0;
    virtual void add_remote_candidate(const IceCandidate& candidate) = 0;
    virtual void close() = 0;
    virtual PeerState state() const = 0;

    void set_local_description_handler(DescriptionHandler handler) { description_handler_ = std::move(handler); }
    void set_local_candidate_handler(CandidateHandler handler) { candidate_handler_ = std::move(handler); }
    void set_state_handler(StateHandler handler) { state_handler_ = std::move(handler); }
    void set_data_channel_handler(ChannelHandler handler) { channel_handler_ = std::move(handler); }

protected:
    void handle_local_description(const SessionDescription& desc) { if (description_handler_) description_handler_(desc); }
    void handle_local_candidate(const IceCandidate& candidate) { if (candidate_handler_) candidate_handler_(candidate); }
    void handle_state_change(PeerState state) { if (state_handler_) state_handler_(state); }
    void handle_data_channel(std::shared_ptr<DataChannel> channel) { if (channel_handler_) channel_handler_(std::move(channel)); }

private:
    DescriptionHandler description_handler_;
    CandidateHandler candidate_handler_;
    StateHandler state_handler_;
    ChannelHandler channel_handler_;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;
    virtual std::unique_ptr<PeerTransport> create(NegotiationRole role) = 0;
};

struct TransportConfig {
    std::vector<std::string> ice_servers;
};

}
