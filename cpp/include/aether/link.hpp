#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aether/cipher.hpp"
#include "aether/compress.hpp"
#include "aether/constants.hpp"
#include "aether/header.hpp"
#include "aether/locator.hpp"
#include "aether/transport.hpp"
#include "aether/vibes.hpp"

namespace aether::link {

using Bytes = std::vector<std::uint8_t>;

struct InputFile {
    std::string name;
    std::string mime;
    Bytes data;
};

std::string GuessMime(std::string_view filename);
InputFile LoadInputFile(const std::filesystem::path& path);

struct LinkOptions {
    // Encrypts the compressed payload when set.
    std::optional<std::string> password;
    bool lossy_images = false;
    double quality = constants::kDefaultImageQuality;
    compress::Codec codec = compress::Codec::Gzip;
    std::optional<std::string> vibe;
    std::optional<std::int64_t> expiry_ms;
    std::optional<header::GeoFence> geo;
    cipher::Options cipher;
};

// Milliseconds since the Unix epoch, `minutes` from now.
std::int64_t ExpiryFromNow(int minutes);

// compress (after optional image transcode) -> optional encrypt -> header.
// Throws std::invalid_argument for an unknown vibe or an empty password.
std::string BuildInlineLink(const InputFile& file,
                            const LinkOptions& options,
                            const vibes::VibeTable& vibes = vibes::DefaultVibes());

// Never reads file bytes; the payload follows over the peer channel.
std::string BuildBeamLink(std::string_view peer, std::string_view filename, std::uint64_t size);
std::string BuildBeamLink(std::string_view peer, const InputFile& file);

// base#locator.
std::string ShareUrl(std::string_view base, std::string_view locator);
// Text after the first '#', or the whole text when there is none.
std::string_view ExtractLocator(std::string_view text);

struct DecodedLink {
    locator::LocatorKind kind = locator::LocatorKind::None;
    header::FileHeader header;
    // Encrypted payload still waiting for a password.
    bool locked = false;
    Bytes sealed;
    // Reconstructed bytes once unlocked; empty for beam links.
    Bytes payload;
    // Session handle for the beam path.
    std::optional<locator::BeamLocator> beam;
};

// Accepts a bare locator or a full share URL. Unencrypted payloads are
// decompressed immediately; encrypted ones come back locked.
DecodedLink ParseLink(std::string_view text);
DecodedLink ParseLink(std::string_view text, const std::string& password, const cipher::Options& options = {});
void Unlock(DecodedLink& link, const std::string& password, const cipher::Options& options = {});

struct BeamPayload {
    transport::MetaFrame meta;
    Bytes data;
};

// Beam files travel uncompressed; with a password the whole file is sealed
// and the meta frame carries salt and iv.
BeamPayload PrepareBeam(const InputFile& file,
                        const std::optional<std::string>& password,
                        const cipher::Options& options = {});
// Decrypts a reassembled beam payload when its meta frame says so.
Bytes OpenBeamPayload(const transport::MetaFrame& meta,
                      Bytes payload,
                      const std::optional<std::string>& password,
                      const cipher::Options& options = {});

enum class FailureKind {
    DecodeFailure,
    WrongPassword,
    ConnectionLost,
    Unsupported
};

FailureKind Classify(const std::exception& error);
const char* UserMessage(FailureKind kind);

}  // namespace aether::link
