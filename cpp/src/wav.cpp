#include "aether/wav.hpp"

#include "aether/file_stream.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace aether::wav {

namespace {

using Bytes = std::vector<std::uint8_t>;

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

void PutU16Le(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void PutU32Le(Bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void PutTag(Bytes& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

std::uint16_t ReadU16Le(const Bytes& data, std::size_t offset) {
    return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
}

std::uint32_t ReadU32Le(const Bytes& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset]) | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

bool TagIs(const Bytes& data, std::size_t offset, const char* tag) {
    return std::memcmp(data.data() + offset, tag, 4) == 0;
}

float SampleAt(const Bytes& data, std::size_t offset, std::uint16_t format, std::uint16_t bits) {
    if (format == kFormatFloat) {
        std::uint32_t raw = ReadU32Le(data, offset);
        float value = 0.0f;
        std::memcpy(&value, &raw, sizeof(value));
        return value;
    }
    if (bits == 8) {
        return (static_cast<float>(data[offset]) - 128.0f) / 128.0f;
    }
    auto raw = static_cast<std::int16_t>(ReadU16Le(data, offset));
    return static_cast<float>(raw) / 32768.0f;
}

}  // namespace

Bytes Encode(const PcmAudio& audio) {
    if (audio.sample_rate == 0) {
        throw std::invalid_argument("WAV sample rate must be positive");
    }
    std::uint64_t data_size = static_cast<std::uint64_t>(audio.samples.size()) * 2;
    if (data_size > std::numeric_limits<std::uint32_t>::max() - 36) {
        throw std::runtime_error("Audio too long for a WAV file");
    }
    Bytes out;
    out.reserve(44 + static_cast<std::size_t>(data_size));
    PutTag(out, "RIFF");
    PutU32Le(out, static_cast<std::uint32_t>(36 + data_size));
    PutTag(out, "WAVE");
    PutTag(out, "fmt ");
    PutU32Le(out, 16);
    PutU16Le(out, kFormatPcm);
    PutU16Le(out, 1);
    PutU32Le(out, audio.sample_rate);
    PutU32Le(out, audio.sample_rate * 2);
    PutU16Le(out, 2);
    PutU16Le(out, 16);
    PutTag(out, "data");
    PutU32Le(out, static_cast<std::uint32_t>(data_size));
    for (float sample : audio.samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        auto value = static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
        PutU16Le(out, static_cast<std::uint16_t>(value));
    }
    return out;
}

PcmAudio Decode(const Bytes& data) {
    if (data.size() < 12 || !TagIs(data, 0, "RIFF") || !TagIs(data, 8, "WAVE")) {
        throw std::runtime_error("Not a RIFF/WAVE file");
    }
    std::uint16_t format = 0;
    std::uint16_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::uint16_t bits = 0;
    bool have_fmt = false;
    std::size_t offset = 12;
    while (offset + 8 <= data.size()) {
        std::uint32_t chunk_size = ReadU32Le(data, offset + 4);
        std::size_t body = offset + 8;
        if (chunk_size > data.size() - body) {
            throw std::runtime_error("Truncated WAV chunk");
        }
        if (TagIs(data, offset, "fmt ")) {
            if (chunk_size < 16) {
                throw std::runtime_error("Malformed WAV fmt chunk");
            }
            format = ReadU16Le(data, body);
            channels = ReadU16Le(data, body + 2);
            sample_rate = ReadU32Le(data, body + 4);
            bits = ReadU16Le(data, body + 14);
            if (format == kFormatExtensible && chunk_size >= 26) {
                format = ReadU16Le(data, body + 24);
            }
            have_fmt = true;
        } else if (TagIs(data, offset, "data")) {
            if (!have_fmt) {
                throw std::runtime_error("WAV data chunk precedes fmt chunk");
            }
            bool supported = (format == kFormatPcm && (bits == 8 || bits == 16))
                             || (format == kFormatFloat && bits == 32);
            if (!supported || channels == 0 || sample_rate == 0) {
                throw std::runtime_error("Unsupported WAV encoding");
            }
            std::size_t frame_bytes = static_cast<std::size_t>(channels) * (bits / 8);
            std::size_t frames = chunk_size / frame_bytes;
            PcmAudio audio;
            audio.sample_rate = sample_rate;
            audio.samples.resize(frames);
            for (std::size_t i = 0; i < frames; ++i) {
                float sum = 0.0f;
                for (std::uint16_t ch = 0; ch < channels; ++ch) {
                    sum += SampleAt(data, body + i * frame_bytes + ch * (bits / 8u), format, bits);
                }
                audio.samples[i] = sum / static_cast<float>(channels);
            }
            return audio;
        }
        offset = body + chunk_size + (chunk_size & 1u);
    }
    throw std::runtime_error("WAV file has no data chunk");
}

void WriteFile(const std::filesystem::path& path, const PcmAudio& audio) {
    filestream::WriteFileBytes(path, Encode(audio));
}

PcmAudio ReadFile(const std::filesystem::path& path) {
    return Decode(filestream::ReadFileBytes(path));
}

}  // namespace aether::wav
