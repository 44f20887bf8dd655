#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

namespace aether::filestream {

using Bytes = std::vector<std::uint8_t>;

Bytes ReadFileBytes(const std::filesystem::path& path);
void WriteFileBytes(const std::filesystem::path& path, const Bytes& data);

// Sequential byte source for the beam sender; sources never alias each other.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::uint64_t Size() const = 0;
    // Returns 0 only at end of data.
    virtual std::size_t Read(std::uint8_t* out, std::size_t max_size) = 0;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(Bytes data) : data_(std::move(data)) {}

    std::uint64_t Size() const override { return data_.size(); }
    std::size_t Read(std::uint8_t* out, std::size_t max_size) override;

private:
    Bytes data_;
    std::size_t position_ = 0;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    std::uint64_t Size() const override { return total_size_; }
    std::size_t Read(std::uint8_t* out, std::size_t max_size) override;

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::uint64_t total_size_ = 0;
    std::uint64_t bytes_read_ = 0;
};

}  // namespace aether::filestream
