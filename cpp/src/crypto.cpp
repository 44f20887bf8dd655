#include "aether/crypto.hpp"

#include "aether/constants.hpp"
#include "aether/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace aether::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedLength(std::size_t size, const char* what) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large");
    }
    return static_cast<int>(size);
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedLength(out.size(), "random request")) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), CheckedLength(password.size(), "password"), salt.data(),
                             CheckedLength(salt.size(), "salt"), CheckedLength(iterations, "iteration count"),
                             EVP_sha256(), CheckedLength(out.size(), "key"), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    Bytes ciphertext(plaintext.size());
    Bytes tag(constants::kAeadTagLen);

    detail::UniqueCipherCtx ctx = detail::NewCipherCtx();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedLength(iv.size(), "iv"), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLength(aad.size(), "aad")) == 1,
               "AES-GCM aad failed");
    }
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &out_len, plaintext.data(),
                                 CheckedLength(plaintext.size(), "plaintext")) == 1,
               "AES-GCM encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total_len, &out_len) == 1,
           "AES-GCM final failed");
    total_len += out_len;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM get tag failed");

    ciphertext.resize(static_cast<std::size_t>(total_len));
    detail::AppendBytes(ciphertext, tag.data(), tag.size());
    return ciphertext;
}

Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob, const Bytes& aad) {
    if (key.size() != constants::kAeadKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    if (blob.size() < constants::kAeadTagLen) {
        throw std::runtime_error("AES-GCM blob too short");
    }
    Bytes ciphertext(blob.begin(), blob.end() - constants::kAeadTagLen);
    Bytes tag(blob.end() - constants::kAeadTagLen, blob.end());

    Bytes plaintext(ciphertext.size());
    detail::UniqueCipherCtx ctx = detail::NewCipherCtx();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedLength(iv.size(), "iv"), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedLength(aad.size(), "aad")) == 1,
               "AES-GCM aad failed");
    }
    if (!ciphertext.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext.data(),
                                 CheckedLength(ciphertext.size(), "ciphertext")) == 1,
               "AES-GCM decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
           "AES-GCM set tag failed");
    Ensure(EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) == 1,
           "AES-GCM auth failed");
    total_len += out_len;

    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

}  // namespace aether::crypto
