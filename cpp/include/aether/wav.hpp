#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace aether::wav {

struct PcmAudio {
    std::uint32_t sample_rate = 44100;
    // Mono, nominally in [-1, 1].
    std::vector<float> samples;
};

// 16-bit PCM mono RIFF/WAVE. Samples are clamped before quantisation.
std::vector<std::uint8_t> Encode(const PcmAudio& audio);
// Accepts 8/16-bit PCM and 32-bit float, any channel count (downmixed to mono).
// Throws std::runtime_error on anything else.
PcmAudio Decode(const std::vector<std::uint8_t>& data);

void WriteFile(const std::filesystem::path& path, const PcmAudio& audio);
PcmAudio ReadFile(const std::filesystem::path& path);

}  // namespace aether::wav
