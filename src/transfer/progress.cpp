#include "beamdrop/transfer/progress.hpp"
#include <algorithm>

namespace beamdrop::transfer {

const char* to_string(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::SENDING: return "SENDING";
        case TransferDirection::RECEIVING: return "RECEIVING";
    }
    return "UNKNOWN";
}

std::uint32_t progress_percent(std::uint64_t transferred, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    transferred = std::min(transferred, total);
    return static_cast<std::uint32_t>((transferred * 100) / total);
}

std::uint64_t average_speed(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) {
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (elapsed_ms <= 0) {
        elapsed_ms = 1;
    }
    return (bytes * 1000) / static_cast<std::uint64_t>(elapsed_ms);
}

std::chrono::milliseconds estimate_remaining(std::uint64_t remaining_bytes, std::uint64_t speed_bps) {
    if (speed_bps == 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds((remaining_bytes * 1000) / speed_bps);
}

ProgressUpdate make_progress(TransferDirection direction,
                             const std::string& peer_id,
                             const std::string& file_id,
                             const std::string& file_name,
                             std::uint64_t bytes_transferred,
                             std::uint64_t total_bytes,
                             std::chrono::steady_clock::time_point start_time) {
    ProgressUpdate update;
    update.direction = direction;
    update.peer_id = peer_id;
    update.file_id = file_id;
    update.file_name = file_name;
    update.bytes_transferred = bytes_transferred;
    update.total_bytes = total_bytes;
    update.progress_percent = progress_percent(bytes_transferred, total_bytes);
    update.speed_bps = average_speed(bytes_transferred, std::chrono::steady_clock::now() - start_time);

    auto remaining = total_bytes > bytes_transferred ? total_bytes - bytes_transferred : 0;
    update.time_remaining = estimate_remaining(remaining, update.speed_bps);
    return update;
}

}
