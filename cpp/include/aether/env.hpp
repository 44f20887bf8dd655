#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace aether::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Parses an unsigned override; empty, zero or unparsable values yield `fallback`,
// oversized values saturate at `max_value`.
std::uint64_t GetUint(std::string_view name, std::uint64_t fallback, std::uint64_t max_value);

}  // namespace aether::env
