#include "aether/compress.hpp"

#include "aether/constants.hpp"
#include "aether/errors.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

#include <zlib.h>

#if AETHER_HAS_LZMA
#include <lzma.h>
#endif

namespace aether::compress {

namespace {

constexpr std::size_t kBufferSize = 1u << 16;
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::uint8_t kGzipMagic[] = {0x1F, 0x8B};
constexpr std::uint8_t kXzMagic[] = {0xFD, '7', 'z', 'X', 'Z', 0x00};

template <std::size_t N>
bool HasMagic(const Bytes& data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::equal(std::begin(magic), std::end(magic), data.begin());
}

Bytes GzipCompress(const Bytes& data) {
    z_stream strm{};
    if (deflateInit2(&strm, constants::kGzipLevel, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("gzip deflateInit failed");
    }
    Bytes out;
    out.reserve(deflateBound(&strm, static_cast<uLong>(data.size())));
    std::array<std::uint8_t, kBufferSize> buffer{};

    std::size_t offset = 0;
    int ret = Z_OK;
    do {
        std::size_t take = std::min<std::size_t>(data.size() - offset, std::numeric_limits<uInt>::max());
        strm.next_in = const_cast<Bytef*>(data.data() + offset);
        strm.avail_in = static_cast<uInt>(take);
        offset += take;
        int flush = offset == data.size() ? Z_FINISH : Z_NO_FLUSH;
        do {
            strm.next_out = buffer.data();
            strm.avail_out = static_cast<uInt>(buffer.size());
            ret = deflate(&strm, flush);
            if (ret == Z_STREAM_ERROR) {
                deflateEnd(&strm);
                throw std::runtime_error("gzip deflate failed");
            }
            out.insert(out.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
        } while (strm.avail_out == 0);
    } while (ret != Z_STREAM_END);
    deflateEnd(&strm);
    return out;
}

Bytes GzipDecompress(const Bytes& data) {
    z_stream strm{};
    if (inflateInit2(&strm, kGzipWindowBits) != Z_OK) {
        throw std::runtime_error("gzip inflateInit failed");
    }
    Bytes out;
    out.reserve(data.size() * 3);
    std::array<std::uint8_t, kBufferSize> buffer{};

    std::size_t offset = 0;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (strm.avail_in == 0) {
            if (offset == data.size()) {
                inflateEnd(&strm);
                throw CorruptStream("gzip stream is truncated");
            }
            std::size_t take = std::min<std::size_t>(data.size() - offset, std::numeric_limits<uInt>::max());
            strm.next_in = const_cast<Bytef*>(data.data() + offset);
            strm.avail_in = static_cast<uInt>(take);
            offset += take;
        }
        strm.next_out = buffer.data();
        strm.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            std::string reason = strm.msg ? strm.msg : "invalid data";
            inflateEnd(&strm);
            throw CorruptStream("gzip stream is corrupt: " + reason);
        }
        out.insert(out.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
    }
    bool trailing = strm.avail_in != 0 || offset != data.size();
    inflateEnd(&strm);
    if (trailing) {
        throw CorruptStream("gzip stream has trailing bytes");
    }
    return out;
}

#if AETHER_HAS_LZMA
Bytes XzCode(lzma_stream& strm, const Bytes& data, bool decoding) {
    Bytes out;
    std::array<std::uint8_t, kBufferSize> buffer{};
    strm.next_in = data.data();
    strm.avail_in = data.size();
    lzma_ret ret = LZMA_OK;
    while (ret != LZMA_STREAM_END) {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            if (decoding && ret == LZMA_BUF_ERROR) {
                throw CorruptStream("xz stream is truncated");
            }
            if (decoding) {
                throw CorruptStream("xz stream is corrupt (lzma error " + std::to_string(static_cast<int>(ret)) + ")");
            }
            throw std::runtime_error("xz compression failed");
        }
        out.insert(out.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
    }
    bool trailing = strm.avail_in != 0;
    lzma_end(&strm);
    if (trailing) {
        throw CorruptStream("xz stream has trailing bytes");
    }
    return out;
}
#endif

Bytes XzCompress(const Bytes& data) {
#if AETHER_HAS_LZMA
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_easy_encoder(&strm, constants::kXzPreset, LZMA_CHECK_CRC64) != LZMA_OK) {
        throw std::runtime_error("xz encoder init failed");
    }
    return XzCode(strm, data, false);
#else
    (void)data;
    throw std::runtime_error("XZ support unavailable (liblzma missing)");
#endif
}

Bytes XzDecompress(const Bytes& data) {
#if AETHER_HAS_LZMA
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        throw std::runtime_error("xz decoder init failed");
    }
    return XzCode(strm, data, true);
#else
    (void)data;
    throw CorruptStream("xz payload cannot be decoded (liblzma missing)");
#endif
}

}  // namespace

bool XzAvailable() {
#if AETHER_HAS_LZMA
    return true;
#else
    return false;
#endif
}

Bytes Compress(const Bytes& data, Codec codec) {
    if (codec == Codec::Xz) {
        return XzCompress(data);
    }
    return GzipCompress(data);
}

Bytes Decompress(const Bytes& data) {
    if (HasMagic(data, kGzipMagic)) {
        return GzipDecompress(data);
    }
    if (HasMagic(data, kXzMagic)) {
        return XzDecompress(data);
    }
    throw CorruptStream("Payload is not a gzip or xz stream");
}

}  // namespace aether::compress
