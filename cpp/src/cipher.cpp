#include "aether/cipher.hpp"

#include "aether/crypto.hpp"
#include "aether/errors.hpp"

#include <stdexcept>

namespace aether::cipher {

namespace {

std::size_t ResolveIterations(const Options& options) {
    return options.kdf_iterations > 0 ? options.kdf_iterations : constants::KdfIterations();
}

}  // namespace

Bytes DeriveKey(const std::string& password, const Bytes& salt, const Options& options) {
    return aether::crypto::Pbkdf2HmacSha256(password, salt, ResolveIterations(options), constants::kAeadKeyLen);
}

Sealed Encrypt(const Bytes& plaintext, const std::string& password, const Options& options) {
    if (password.empty()) {
        throw std::invalid_argument("Password required");
    }
    Sealed sealed;
    sealed.salt = aether::crypto::RandomBytes(constants::kKdfSaltLen);
    sealed.iv = aether::crypto::RandomBytes(constants::kAeadNonceLen);
    Bytes key = DeriveKey(password, sealed.salt, options);
    sealed.ciphertext = aether::crypto::AesGcmEncryptWithIv(key, sealed.iv, plaintext, {});
    return sealed;
}

Bytes Decrypt(const Bytes& ciphertext,
              const std::string& password,
              const Bytes& salt,
              const Bytes& iv,
              const Options& options) {
    if (salt.size() != constants::kKdfSaltLen || iv.size() != constants::kAeadNonceLen
        || ciphertext.size() < constants::kAeadTagLen) {
        throw AuthenticationError();
    }
    Bytes key = DeriveKey(password, salt, options);
    try {
        return aether::crypto::AesGcmDecryptWithIv(key, iv, ciphertext, {});
    } catch (const std::runtime_error&) {
        throw AuthenticationError();
    }
}

}  // namespace aether::cipher
