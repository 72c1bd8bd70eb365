#pragma once

#include "beamdrop/signaling/signal_envelope.hpp"
#include <functional>
#include <string>

namespace beamdrop::signaling {

// Client end of the signaling relay, keyed by the local identity.
class SignalingChannel {
public:
    using EnvelopeHandler = std::function<void(const SignalEnvelope&)>;
    using StateHandler = std::function<void(bool open)>;

    virtual ~SignalingChannel() = default;

    virtual bool is_open() const = 0;
    virtual void close() = 0;

    // Drops and logs the envelope when the relay is not open.
    bool send(const SignalEnvelope& envelope);

    void set_envelope_handler(EnvelopeHandler handler) { envelope_handler_ = std::move(handler); }
    void set_state_handler(StateHandler handler) { state_handler_ = std::move(handler); }

protected:
    virtual void send_frame(std::string frame) = 0;

    // Parses an inbound frame and hands it to the envelope handler.
    void dispatch_frame(const std::string& frame);
    void notify_state(bool open) { if (state_handler_) state_handler_(open); }

private:
    EnvelopeHandler envelope_handler_;
    StateHandler state_handler_;
};

}
