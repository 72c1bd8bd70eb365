#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace beamdrop::transfer {

enum class TransferDirection {
    SENDING,
    RECEIVING
};

const char* to_string(TransferDirection direction);

struct ProgressUpdate {
    TransferDirection direction = TransferDirection::SENDING;
    std::string peer_id;
    std::string file_id;
    std::string file_name;
    std::uint32_t progress_percent = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t speed_bps = 0;                    // bytes per second since start
    std::chrono::milliseconds time_remaining{0};    // 0 when unknown
};

// floor(transferred * 100 / total); an empty file counts as complete.
std::uint32_t progress_percent(std::uint64_t transferred, std::uint64_t total);

std::uint64_t average_speed(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed);
std::chrono::milliseconds estimate_remaining(std::uint64_t remaining_bytes, std::uint64_t speed_bps);

ProgressUpdate make_progress(TransferDirection direction,
                             const std::string& peer_id,
                             const std::string& file_id,
                             const std::string& file_name,
                             std::uint64_t bytes_transferred,
                             std::uint64_t total_bytes,
                             std::chrono::steady_clock::time_point start_time);

}
