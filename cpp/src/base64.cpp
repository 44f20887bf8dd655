#include "aether/base64.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace aether::base64 {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

// Symbol value per input byte, kInvalid outside the alphabet.
const std::array<std::uint8_t, 256>& SymbolValues() {
    static const std::array<std::uint8_t, 256> values = [] {
        std::array<std::uint8_t, 256> table{};
        table.fill(kInvalid);
        for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
            table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
        }
        return table;
    }();
    return values;
}

// Bit accumulator, the mirror image of Decode: bytes go in eight bits at a
// time and symbols come out six at a time.
std::string EncodeBytes(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    std::uint32_t acc = 0;
    int pending = 0;
    for (std::size_t i = 0; i < size; ++i) {
        acc = ((acc << 8) | data[i]) & 0xFFFF;
        pending += 8;
        while (pending >= 6) {
            pending -= 6;
            out.push_back(kAlphabet[(acc >> pending) & 0x3F]);
        }
    }
    if (pending > 0) {
        out.push_back(kAlphabet[(acc << (6 - pending)) & 0x3F]);
    }
    out.append((4 - out.size() % 4) % 4, '=');
    return out;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    return EncodeBytes(data.data(), data.size());
}

std::string Encode(std::string_view text) {
    return EncodeBytes(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3);

    int val = 0;
    int valb = -8;
    std::size_t symbols = 0;
    std::size_t padding = 0;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        std::uint8_t decoded = SymbolValues()[c];
        if (decoded == kInvalid || padding > 0) {
            success = false;
            break;
        }
        ++symbols;
        val = ((val << 6) + decoded) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // A lone trailing symbol carries fewer than 8 bits.
    if (success && (symbols % 4 == 1 || padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0))) {
        success = false;
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace aether::base64
