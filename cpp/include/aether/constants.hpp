#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include "aether/env.hpp"

namespace aether::constants {

// Key derivation: PBKDF2-HMAC-SHA-256. Sender and receiver must agree on the
// iteration count or every decrypt fails authentication.
inline constexpr std::size_t kKdfIterations = 100000;
inline constexpr std::size_t kKdfSaltLen = 16;
inline constexpr std::size_t kAeadKeyLen = 32;
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;

inline std::size_t KdfIterations() {
    return static_cast<std::size_t>(
        aether::env::GetUint("AETHER_TEST_KDF_ITERS", kKdfIterations, std::numeric_limits<std::int32_t>::max()));
}

inline constexpr double kDefaultImageQuality = 0.7;
inline constexpr int kGzipLevel = 6;
inline constexpr std::uint32_t kXzPreset = 6;

// Beam path. 16 KiB stays under common peer-channel message limits.
inline constexpr std::size_t kBeamChunkSize = 16u * 1024u;
inline constexpr std::size_t kBeamYieldEvery = 50;
inline constexpr std::size_t kMaxFrameBody = 64u * 1024u * 1024u;

inline std::size_t BeamChunkSize() {
    return static_cast<std::size_t>(aether::env::GetUint("AETHER_CHUNK_SIZE", kBeamChunkSize, kMaxFrameBody / 2));
}

inline std::size_t BeamYieldEvery() {
    return static_cast<std::size_t>(aether::env::GetUint("AETHER_YIELD_EVERY", kBeamYieldEvery, 1u << 20));
}

inline constexpr std::string_view kFrameMagic = "AEF1";
inline constexpr std::uint8_t kFrameKindMeta = 0x01;
inline constexpr std::uint8_t kFrameKindChunk = 0x02;

// Locator wire format.
inline constexpr char kLocatorDelim = '|';
inline constexpr std::string_view kInlineScheme = "AETHER";
inline constexpr std::string_view kSecureScheme = "SECURE";
inline constexpr std::string_view kBeamScheme = "BEAM";

// Acoustic signal.
inline constexpr double kMarkHz = 2000.0;
inline constexpr double kSpaceHz = 1200.0;
inline constexpr double kBaudRate = 20.0;
inline constexpr double kLeadInSeconds = 0.1;
inline constexpr double kCompletionSlackSeconds = 0.5;
inline constexpr double kToneAmplitude = 0.5;
inline constexpr double kSampleRate = 44100.0;
inline constexpr std::size_t kFftSize = 2048;
inline constexpr double kSmoothing = 0.5;
inline constexpr double kMinDecibels = -100.0;
inline constexpr double kMaxDecibels = -30.0;
inline constexpr int kBinRange = 2;
inline constexpr int kNoiseGate = 50;
inline constexpr double kFrameRate = 60.0;
inline constexpr std::string_view kPreambleBits = "10101010";
inline constexpr std::string_view kTrailerBits = "0000";

inline constexpr double kDefaultGeoRadiusMeters = 5000.0;

}  // namespace aether::constants
