#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aether::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
std::string Encode(std::string_view text);

// Standard alphabet; padding optional, whitespace ignored. On any character
// outside the alphabet or misplaced padding, *ok is false and the result empty.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

}  // namespace aether::base64
