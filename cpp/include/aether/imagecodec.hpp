#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace aether::imagecodec {

using Bytes = std::vector<std::uint8_t>;

bool IsImageMime(std::string_view mime);

// Re-encodes a raster image as JPEG at `quality` in (0, 1]. Returns the input
// unchanged when the hint names a non-image type, the bytes do not decode as an
// image, or the re-encoded form is not smaller. Throws std::invalid_argument
// only for an out-of-range quality.
Bytes TranscodeImage(const Bytes& data, double quality, std::string_view mime_hint = {});

}  // namespace aether::imagecodec
