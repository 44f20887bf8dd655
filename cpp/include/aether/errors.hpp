#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace aether {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Header text is not valid base64/JSON, or lacks the mandatory filename.
class MalformedHeader : public Error {
public:
    using Error::Error;
};

// Compressed bytes could not be inflated.
class CorruptStream : public Error {
public:
    using Error::Error;
};

// Wrong password and tampered ciphertext are deliberately indistinguishable.
class AuthenticationError : public Error {
public:
    AuthenticationError() : Error("Authentication failed") {}
};

class TransferAborted : public Error {
public:
    TransferAborted(std::uint64_t received, std::uint64_t expected)
        : Error("Transfer aborted after " + std::to_string(received) + " of " + std::to_string(expected) + " bytes"),
          received_(received),
          expected_(expected) {}

    std::uint64_t bytes_received() const noexcept { return received_; }
    std::uint64_t bytes_expected() const noexcept { return expected_; }

private:
    std::uint64_t received_ = 0;
    std::uint64_t expected_ = 0;
};

class UnsupportedLocator : public Error {
public:
    using Error::Error;
};

}  // namespace aether
