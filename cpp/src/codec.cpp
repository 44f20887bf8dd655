#include "aether/codec.hpp"

#include <array>
#include <cstdint>

namespace aether::codec {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

std::array<bool, 256> BuildUnreservedTable() {
    std::array<bool, 256> table{};
    table.fill(false);
    for (int c = 'A'; c <= 'Z'; ++c) {
        table[static_cast<unsigned char>(c)] = true;
    }
    for (int c = 'a'; c <= 'z'; ++c) {
        table[static_cast<unsigned char>(c)] = true;
    }
    for (int c = '0'; c <= '9'; ++c) {
        table[static_cast<unsigned char>(c)] = true;
    }
    for (char c : std::string_view("-_.!~*'()")) {
        table[static_cast<unsigned char>(c)] = true;
    }
    return table;
}

const std::array<bool, 256> kUnreserved = BuildUnreservedTable();

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string PercentEncode(std::string_view input) {
    std::string out;
    out.reserve(input.size() * 3);
    for (char ch : input) {
        unsigned char byte = static_cast<unsigned char>(ch);
        if (kUnreserved[byte]) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHexDigits[byte >> 4]);
            out.push_back(kHexDigits[byte & 0x0F]);
        }
    }
    return out;
}

std::string PercentDecode(std::string_view input, bool* ok) {
    bool success = true;
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            out.push_back(input[i]);
            continue;
        }
        if (i + 2 >= input.size()) {
            success = false;
            break;
        }
        int hi = HexValue(input[i + 1]);
        int lo = HexValue(input[i + 2]);
        if (hi < 0 || lo < 0) {
            success = false;
            break;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    if (success && !IsValidUtf8(out)) {
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

bool IsValidUtf8(std::string_view input) {
    std::size_t i = 0;
    while (i < input.size()) {
        std::uint8_t lead = static_cast<std::uint8_t>(input[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= input.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            std::uint8_t cont = static_cast<std::uint8_t>(input[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        static constexpr std::uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace aether::codec
