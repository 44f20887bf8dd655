#include "aether/imagecodec.hpp"

#include "aether/log.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace aether::imagecodec {

namespace {

struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    Bytes pixels;
};

bool DecodeImage(const Bytes& blob, ImageBuffer& out) {
    if (blob.empty() || blob.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    int width = 0;
    int height = 0;
    int channels_in_file = 0;
    if (!stbi_info_from_memory(blob.data(), static_cast<int>(blob.size()), &width, &height, &channels_in_file)) {
        return false;
    }
    // JPEG has no alpha channel; gray stays gray, everything else becomes RGB.
    int target_channels = channels_in_file == 1 ? 1 : 3;
    int loaded_channels = 0;
    unsigned char* data = stbi_load_from_memory(blob.data(), static_cast<int>(blob.size()),
                                                &width, &height, &loaded_channels, target_channels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        aether::log::Debug(std::string("Image decode failed: ") + (reason ? reason : "unknown error"));
        return false;
    }
    std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                        * static_cast<std::size_t>(target_channels);
    out.width = width;
    out.height = height;
    out.channels = target_channels;
    out.pixels.assign(data, data + total);
    stbi_image_free(data);
    return true;
}

void AppendToBytes(void* context, void* data, int size) {
    auto* out = static_cast<Bytes*>(context);
    const auto* begin = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), begin, begin + size);
}

}  // namespace

bool IsImageMime(std::string_view mime) {
    return mime.substr(0, 6) == "image/";
}

Bytes TranscodeImage(const Bytes& data, double quality, std::string_view mime_hint) {
    if (!(quality > 0.0 && quality <= 1.0)) {
        throw std::invalid_argument("Image quality must be in (0, 1]");
    }
    if (!mime_hint.empty() && !IsImageMime(mime_hint)) {
        return data;
    }
    ImageBuffer image;
    if (!DecodeImage(data, image)) {
        aether::log::Debug("Not a decodable raster image; keeping original bytes");
        return data;
    }
    int jpeg_quality = std::clamp(static_cast<int>(std::lround(quality * 100.0)), 1, 100);
    Bytes encoded;
    encoded.reserve(data.size());
    int ok = stbi_write_jpg_to_func(&AppendToBytes, &encoded, image.width, image.height, image.channels,
                                    image.pixels.data(), jpeg_quality);
    if (!ok || encoded.empty()) {
        aether::log::Debug("JPEG re-encode failed; keeping original bytes");
        return data;
    }
    if (encoded.size() >= data.size()) {
        aether::log::Debug("Re-encoded image is not smaller; keeping original bytes");
        return data;
    }
    return encoded;
}

}  // namespace aether::imagecodec
