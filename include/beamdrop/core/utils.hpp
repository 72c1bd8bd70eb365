#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace beamdrop::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static bool write_binary_file(const std::filesystem::path& path, std::span<const std::uint8_t> data);

    // Returns `dir / name`, or `dir / "stem (n)ext"` when that file already exists.
    static std::filesystem::path unique_path(const std::filesystem::path& dir, const std::string& name);

    static std::string guess_mime_type(const std::filesystem::path& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::optional<std::chrono::system_clock::time_point> from_iso_string(const std::string& str);
};

}
