#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace aether::crypto::detail {

// RAII wrapper so early throws never leak the cipher context.
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

inline UniqueCipherCtx NewCipherCtx() {
    return UniqueCipherCtx(EVP_CIPHER_CTX_new());
}

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::uint8_t* src, std::size_t len) {
    if (len == 0) return;
    dest.insert(dest.end(), src, src + len);
}

}  // namespace aether::crypto::detail
