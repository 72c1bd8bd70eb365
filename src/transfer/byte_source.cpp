#include "beamdrop/transfer/byte_source.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <algorithm>

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

std::shared_ptr<FileByteSource> FileByteSource::open(const std::filesystem::path& path) {
    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        throw TransferError(ErrorCode::FILE_READ_ERROR, "Cannot read file: " + path.string());
    }

    auto source = std::shared_ptr<FileByteSource>(new FileByteSource(path, *size));
    if (!source->stream_) {
        throw TransferError(ErrorCode::FILE_READ_ERROR, "Cannot open file: " + path.string());
    }

    LOG_DEBUG("Opened {} ({} bytes, {})", path.string(), source->size_, source->mime_type_);
    return source;
}

FileByteSource::FileByteSource(std::filesystem::path path, std::uint64_t size)
    : path_(std::move(path))
    , name_(path_.filename().string())
    , mime_type_(core::utils::FileUtils::guess_mime_type(path_))
    , size_(size)
    , stream_(path_, std::ios::binary) {
}

std::vector<std::uint8_t> FileByteSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > size_) {
        throw TransferError(ErrorCode::FILE_READ_ERROR, "Read past end of " + path_.string());
    }

    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
    std::vector<std::uint8_t> buffer(count);
    if (count == 0) {
        return buffer;
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));

    if (static_cast<std::size_t>(stream_.gcount()) != count) {
        throw TransferError(ErrorCode::FILE_READ_ERROR,
                            "Short read from " + path_.string() + " at offset " + std::to_string(offset));
    }
    return buffer;
}

MemoryByteSource::MemoryByteSource(std::string name, std::string mime_type, std::vector<std::uint8_t> data)
    : name_(std::move(name))
    , mime_type_(std::move(mime_type))
    , data_(std::move(data)) {
}

std::vector<std::uint8_t> MemoryByteSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > data_.size()) {
        throw TransferError(ErrorCode::FILE_READ_ERROR, "Read past end of " + name_);
    }

    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    auto count = std::min<std::uint64_t>(length, data_.size() - offset);
    return std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count));
}

}
