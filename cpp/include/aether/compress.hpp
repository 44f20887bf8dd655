#pragma once

#include <cstdint>
#include <vector>

namespace aether::compress {

using Bytes = std::vector<std::uint8_t>;

enum class Codec {
    Gzip,
    Xz
};

bool XzAvailable();

// Empty input still yields a well-formed (non-empty) container.
Bytes Compress(const Bytes& data, Codec codec = Codec::Gzip);

// Detects gzip or xz by magic. Throws CorruptStream on anything else,
// truncated input, checksum failure or trailing garbage.
Bytes Decompress(const Bytes& data);

}  // namespace aether::compress
