#pragma once

#include <stdexcept>
#include <string>

namespace beamdrop::core {

enum class ErrorCode {
    SUCCESS = 0,
    SIGNALING_UNAVAILABLE,
    CHANNEL_NOT_READY,
    TRANSFER_BUSY,
    NEGOTIATION_FAILURE,
    STALE_SIGNAL,
    DECODE_ERROR,
    PROTOCOL_ERROR,
    TRANSFER_ABORTED,
    FILE_READ_ERROR,
    INVALID_STATE
};

const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

// Raised synchronously to callers; asynchronous failures travel as Result.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    Result to_result() const { return Result(code_, what()); }

private:
    ErrorCode code_;
};

}
