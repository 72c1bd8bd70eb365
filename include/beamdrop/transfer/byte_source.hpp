#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace beamdrop::transfer {

// Random-access read interface for an outgoing file.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::uint64_t size() const = 0;
    virtual const std::string& name() const = 0;
    virtual const std::string& mime_type() const = 0;

    // Reads up to `length` bytes at `offset`. Throws core::TransferError(FILE_READ_ERROR).
    virtual std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) = 0;
};

class FileByteSource : public ByteSource {
public:
    // Throws core::TransferError(FILE_READ_ERROR) if the file cannot be opened.
    static std::shared_ptr<FileByteSource> open(const std::filesystem::path& path);

    std::uint64_t size() const override { return size_; }
    const std::string& name() const override { return name_; }
    const std::string& mime_type() const override { return mime_type_; }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) override;

    const std::filesystem::path& path() const { return path_; }

private:
    FileByteSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::string mime_type_;
    std::uint64_t size_;
    std::ifstream stream_;
};

class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource(std::string name, std::string mime_type, std::vector<std::uint8_t> data);

    std::uint64_t size() const override { return data_.size(); }
    const std::string& name() const override { return name_; }
    const std::string& mime_type() const override { return mime_type_; }
    std::vector<std::uint8_t> read(std::uint64_t offset, std::size_t length) override;

private:
    std::string name_;
    std::string mime_type_;
    std::vector<std::uint8_t> data_;
};

}
