#include "aether/file_stream.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace aether::filestream {

Bytes ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFileBytes(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream output(path, std::ios::binary);
    if (!output) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!output) {
            throw std::runtime_error("Failed to write output file: " + path.string());
        }
    }
}

std::size_t MemorySource::Read(std::uint8_t* out, std::size_t max_size) {
    std::size_t take = std::min(max_size, data_.size() - position_);
    if (take > 0) {
        std::memcpy(out, data_.data() + position_, take);
        position_ += take;
    }
    return take;
}

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path), input_(path, std::ios::binary) {
    if (!input_) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    input_.seekg(0, std::ios::end);
    std::streamoff size = input_.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to read file size: " + path.string());
    }
    total_size_ = static_cast<std::uint64_t>(size);
    input_.seekg(0, std::ios::beg);
}

std::size_t FileSource::Read(std::uint8_t* out, std::size_t max_size) {
    if (bytes_read_ >= total_size_ || max_size == 0) {
        return 0;
    }
    input_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(max_size));
    std::size_t got = static_cast<std::size_t>(input_.gcount());
    if (got == 0) {
        throw std::runtime_error("Failed to read file: " + path_.string());
    }
    bytes_read_ += got;
    return got;
}

}  // namespace aether::filestream
