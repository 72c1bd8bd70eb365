#include "beamdrop/core/error.hpp"

namespace beamdrop::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::SIGNALING_UNAVAILABLE: return "signaling unavailable";
        case ErrorCode::CHANNEL_NOT_READY: return "channel not ready";
        case ErrorCode::TRANSFER_BUSY: return "transfer busy";
        case ErrorCode::NEGOTIATION_FAILURE: return "negotiation failure";
        case ErrorCode::STALE_SIGNAL: return "stale signal";
        case ErrorCode::DECODE_ERROR: return "decode error";
        case ErrorCode::PROTOCOL_ERROR: return "protocol error";
        case ErrorCode::TRANSFER_ABORTED: return "transfer aborted";
        case ErrorCode::FILE_READ_ERROR: return "file read error";
        case ErrorCode::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

}
