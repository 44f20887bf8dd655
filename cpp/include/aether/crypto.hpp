#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aether::crypto {

using Bytes = std::vector<std::uint8_t>;

// OpenSSL CSPRNG; the process-wide random source for salts and nonces.
Bytes RandomBytes(std::size_t size);

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// AES-256-GCM with a caller-supplied IV. Output is ciphertext || 16-byte tag,
// the layout WebCrypto produces, so payloads interoperate with browser senders.
Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad);
Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob, const Bytes& aad);

}  // namespace aether::crypto
