#include "beamdrop/signaling/signaling_channel.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"

namespace beamdrop::signaling {

bool SignalingChannel::send(const SignalEnvelope& envelope) {
    if (!is_open()) {
        LOG_WARN("Signaling relay not open, dropping {} for '{}'",
                 to_string(envelope.type), envelope.target);
        return false;
    }

    send_frame(envelope.serialize());
    return true;
}

void SignalingChannel::dispatch_frame(const std::string& frame) {
    SignalEnvelope envelope;
    try {
        envelope = SignalEnvelope::parse(frame);
    } catch (const core::TransferError& e) {
        LOG_WARN("Dropping signaling frame: {}", e.what());
        return;
    }

    if (envelope.type == SignalType::UNKNOWN) {
        LOG_DEBUG("Ignoring signaling message of type '{}'", envelope.type_name);
        return;
    }

    if (envelope_handler_) {
        envelope_handler_(envelope);
    }
}

}
