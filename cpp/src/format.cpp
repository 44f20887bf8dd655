#include "aether/format.hpp"

#include <limits>
#include <stdexcept>

namespace aether::format {

void PutU32Be(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void PutU64Be(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

std::uint32_t ReadU32Be(const Bytes& data, std::size_t offset) {
    if (offset > data.size() || data.size() - offset < 4) {
        throw std::runtime_error("Malformed length-prefixed blob (missing length)");
    }
    return (static_cast<std::uint32_t>(data[offset]) << 24)
           | (static_cast<std::uint32_t>(data[offset + 1]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 8)
           | static_cast<std::uint32_t>(data[offset + 3]);
}

std::uint64_t ReadU64Be(const Bytes& data, std::size_t offset) {
    if (offset > data.size() || data.size() - offset < 8) {
        throw std::runtime_error("Malformed blob (missing 64-bit field)");
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(data[offset + i]);
    }
    return value;
}

Bytes PackLengthPrefixed(const std::vector<Bytes>& parts) {
    std::size_t total = 4 * parts.size();
    for (const auto& part : parts) {
        if (part.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw std::runtime_error("Length-prefixed part too large");
        }
        total += part.size();
    }
    Bytes out;
    out.reserve(total);
    for (const auto& part : parts) {
        PutU32Be(out, static_cast<std::uint32_t>(part.size()));
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<Bytes> UnpackLengthPrefixed(const Bytes& data, std::size_t count) {
    std::vector<Bytes> parts;
    parts.reserve(count);
    std::size_t offset = 0;
    for (std::size_t i = 0; i < count; ++i) {
        std::uint32_t len = ReadU32Be(data, offset);
        offset += 4;
        if (len > data.size() - offset) {
            throw std::runtime_error("Malformed length-prefixed blob (truncated part)");
        }
        parts.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                           data.begin() + static_cast<std::ptrdiff_t>(offset + len));
        offset += len;
    }
    if (offset != data.size()) {
        throw std::runtime_error("Malformed length-prefixed blob (extra bytes)");
    }
    return parts;
}

}  // namespace aether::format
