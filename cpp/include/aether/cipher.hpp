#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "aether/constants.hpp"

namespace aether::cipher {

using Bytes = std::vector<std::uint8_t>;

struct Options {
    // 0 selects constants::KdfIterations().
    std::size_t kdf_iterations = 0;
};

struct Sealed {
    Bytes salt;
    Bytes iv;
    Bytes ciphertext;
};

// PBKDF2-HMAC-SHA-256 -> 32-byte AES key. Deterministic per (password, salt).
Bytes DeriveKey(const std::string& password, const Bytes& salt, const Options& options = {});

// Fresh 16-byte salt and 12-byte nonce per call. Throws std::invalid_argument
// for an empty password.
Sealed Encrypt(const Bytes& plaintext, const std::string& password, const Options& options = {});

// Any failure (wrong password, flipped bit, truncated blob, bad salt or iv)
// surfaces as the same AuthenticationError.
Bytes Decrypt(const Bytes& ciphertext,
              const std::string& password,
              const Bytes& salt,
              const Bytes& iv,
              const Options& options = {});

}  // namespace aether::cipher
