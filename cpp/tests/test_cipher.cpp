#include "aether/cipher.hpp"
#include "aether/errors.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

using aether::cipher::Bytes;

// Low iteration count keeps the exhaustive bit-flip test fast.
aether::cipher::Options FastKdf() {
    aether::cipher::Options options;
    options.kdf_iterations = 1000;
    return options;
}

Bytes TextBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string Hex(const Bytes& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    for (auto byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

TEST(CryptoStage, DeriveKeyMatchesPbkdf2Sha256Vector) {
    aether::cipher::Options options;
    options.kdf_iterations = 1;
    Bytes key = aether::cipher::DeriveKey("passwd", TextBytes("salt"), options);
    EXPECT_EQ(Hex(key), "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc");
}

TEST(CryptoStage, DeriveKeyIsDeterministic) {
    Bytes salt(16, 0x42);
    Bytes a = aether::cipher::DeriveKey("hunter2", salt, FastKdf());
    Bytes b = aether::cipher::DeriveKey("hunter2", salt, FastKdf());
    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, aether::cipher::DeriveKey("hunter3", salt, FastKdf()));
}

TEST(CryptoStage, RoundTripsIncludingEmptyPlaintext) {
    for (const std::string& text : {std::string(), std::string("x"), std::string(70000, 'q')}) {
        auto sealed = aether::cipher::Encrypt(TextBytes(text), "correct horse", FastKdf());
        EXPECT_EQ(sealed.salt.size(), 16u);
        EXPECT_EQ(sealed.iv.size(), 12u);
        EXPECT_EQ(sealed.ciphertext.size(), text.size() + 16);
        EXPECT_EQ(aether::cipher::Decrypt(sealed.ciphertext, "correct horse", sealed.salt, sealed.iv, FastKdf()),
                  TextBytes(text));
    }
}

TEST(CryptoStage, RoundTripsWithDefaultIterations) {
    Bytes data = TextBytes("default iteration count");
    auto sealed = aether::cipher::Encrypt(data, "pw");
    EXPECT_EQ(aether::cipher::Decrypt(sealed.ciphertext, "pw", sealed.salt, sealed.iv), data);
}

TEST(CryptoStage, FreshSaltAndNoncePerCall) {
    Bytes data = TextBytes("same input");
    auto first = aether::cipher::Encrypt(data, "pw", FastKdf());
    auto second = aether::cipher::Encrypt(data, "pw", FastKdf());
    EXPECT_NE(first.salt, second.salt);
    EXPECT_NE(first.iv, second.iv);
    EXPECT_NE(first.ciphertext, second.ciphertext);
}

TEST(CryptoStage, AnySingleBitFlipFailsAuthentication) {
    Bytes data = TextBytes("tamper me");
    auto sealed = aether::cipher::Encrypt(data, "pw", FastKdf());
    for (std::size_t bit = 0; bit < sealed.ciphertext.size() * 8; ++bit) {
        Bytes tampered = sealed.ciphertext;
        tampered[bit / 8] ^= static_cast<std::uint8_t>(1u << (bit % 8));
        EXPECT_THROW(aether::cipher::Decrypt(tampered, "pw", sealed.salt, sealed.iv, FastKdf()),
                     aether::AuthenticationError)
            << "bit " << bit;
    }
}

TEST(CryptoStage, WrongPasswordFailsAuthentication) {
    auto sealed = aether::cipher::Encrypt(TextBytes("secret"), "right", FastKdf());
    EXPECT_THROW(aether::cipher::Decrypt(sealed.ciphertext, "wrong", sealed.salt, sealed.iv, FastKdf()),
                 aether::AuthenticationError);
    EXPECT_THROW(aether::cipher::Decrypt(sealed.ciphertext, "", sealed.salt, sealed.iv, FastKdf()),
                 aether::AuthenticationError);
}

TEST(CryptoStage, MismatchedIterationCountFailsAuthentication) {
    auto sealed = aether::cipher::Encrypt(TextBytes("secret"), "pw", FastKdf());
    aether::cipher::Options other;
    other.kdf_iterations = 1001;
    EXPECT_THROW(aether::cipher::Decrypt(sealed.ciphertext, "pw", sealed.salt, sealed.iv, other),
                 aether::AuthenticationError);
}

TEST(CryptoStage, MalformedParametersLookLikeAuthenticationFailure) {
    auto sealed = aether::cipher::Encrypt(TextBytes("secret"), "pw", FastKdf());
    Bytes short_salt(sealed.salt.begin(), sealed.salt.begin() + 8);
    Bytes short_iv(sealed.iv.begin(), sealed.iv.begin() + 8);
    Bytes truncated(sealed.ciphertext.begin(), sealed.ciphertext.begin() + 10);
    EXPECT_THROW(aether::cipher::Decrypt(sealed.ciphertext, "pw", short_salt, sealed.iv, FastKdf()),
                 aether::AuthenticationError);
    EXPECT_THROW(aether::cipher::Decrypt(sealed.ciphertext, "pw", sealed.salt, short_iv, FastKdf()),
                 aether::AuthenticationError);
    EXPECT_THROW(aether::cipher::Decrypt(truncated, "pw", sealed.salt, sealed.iv, FastKdf()),
                 aether::AuthenticationError);
}

TEST(CryptoStage, FailureMessageIsUniform) {
    auto sealed = aether::cipher::Encrypt(TextBytes("secret"), "pw", FastKdf());
    std::string wrong_password;
    std::string tampered_message;
    try {
        aether::cipher::Decrypt(sealed.ciphertext, "nope", sealed.salt, sealed.iv, FastKdf());
    } catch (const aether::AuthenticationError& exc) {
        wrong_password = exc.what();
    }
    Bytes tampered = sealed.ciphertext;
    tampered[0] ^= 0x01;
    try {
        aether::cipher::Decrypt(tampered, "pw", sealed.salt, sealed.iv, FastKdf());
    } catch (const aether::AuthenticationError& exc) {
        tampered_message = exc.what();
    }
    EXPECT_FALSE(wrong_password.empty());
    EXPECT_EQ(wrong_password, tampered_message);
}

TEST(CryptoStage, EmptyPasswordIsRejectedOnEncrypt) {
    EXPECT_THROW(aether::cipher::Encrypt(TextBytes("x"), "", FastKdf()), std::invalid_argument);
}

}  // namespace
