#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace aether::format {

using Bytes = std::vector<std::uint8_t>;

void PutU32Be(Bytes& out, std::uint32_t value);
void PutU64Be(Bytes& out, std::uint64_t value);
std::uint32_t ReadU32Be(const Bytes& data, std::size_t offset);
std::uint64_t ReadU64Be(const Bytes& data, std::size_t offset);

// [u32 len][bytes] per part. Unpack requires exactly `count` parts and no
// trailing bytes; throws std::runtime_error otherwise.
Bytes PackLengthPrefixed(const std::vector<Bytes>& parts);
std::vector<Bytes> UnpackLengthPrefixed(const Bytes& data, std::size_t count);

}  // namespace aether::format
