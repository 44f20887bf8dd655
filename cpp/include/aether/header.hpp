#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aether/constants.hpp"

namespace aether::header {

using Bytes = std::vector<std::uint8_t>;

struct GeoFence {
    double lat = 0.0;
    double lng = 0.0;
    double radius_m = constants::kDefaultGeoRadiusMeters;

    bool operator==(const GeoFence& other) const {
        return lat == other.lat && lng == other.lng && radius_m == other.radius_m;
    }
    bool operator!=(const GeoFence& other) const { return !(*this == other); }
};

// Metadata carried ahead of the payload. `encrypted` holds iff salt and iv are
// both present with their fixed lengths.
struct FileHeader {
    std::string filename;
    std::optional<std::string> mime;
    bool encrypted = false;
    std::optional<std::string> vibe;
    std::optional<std::int64_t> expiry_ms;
    std::optional<GeoFence> geo;
    std::optional<std::uint64_t> size;
    Bytes salt;
    Bytes iv;

    bool operator==(const FileHeader& other) const {
        return filename == other.filename && mime == other.mime && encrypted == other.encrypted
               && vibe == other.vibe && expiry_ms == other.expiry_ms && geo == other.geo
               && size == other.size && salt == other.salt && iv == other.iv;
    }
    bool operator!=(const FileHeader& other) const { return !(*this == other); }
};

// Throws MalformedHeader when the filename is empty or the encrypted/salt/iv
// invariant does not hold.
void Validate(const FileHeader& header);

std::string ToJson(const FileHeader& header);
FileHeader FromJson(std::string_view json);

// base64(UTF-8 JSON). Deterministic: equal headers encode to equal text.
std::string Encode(const FileHeader& header);
FileHeader Decode(std::string_view text);

}  // namespace aether::header
