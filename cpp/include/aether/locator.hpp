#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "aether/header.hpp"

namespace aether::locator {

using Bytes = std::vector<std::uint8_t>;

// AETHER|<base64 JSON header>|<base64 payload>
struct InlineLocator {
    header::FileHeader header;
    Bytes payload;
};

// SECURE|<url-encoded filename>|<base64 salt>|<base64 iv>|<base64 payload>
struct LegacySecureLocator {
    std::string filename;
    Bytes salt;
    Bytes iv;
    Bytes payload;
};

// <url-encoded filename>|<base64 payload>
struct LegacyPlainLocator {
    std::string filename;
    Bytes payload;
};

// BEAM|<peer address>|<url-encoded filename>|<size>
struct BeamLocator {
    std::string peer;
    std::string filename;
    std::uint64_t size_hint = 0;
};

using Locator = std::variant<InlineLocator, LegacySecureLocator, LegacyPlainLocator, BeamLocator>;

enum class LocatorKind {
    None,
    Inline,
    LegacySecure,
    LegacyPlain,
    Beam
};

const char* KindName(LocatorKind kind);

// Purely syntactic; never inspects field contents.
LocatorKind Classify(std::string_view text);

std::vector<std::string_view> SplitFields(std::string_view text);

// Throws UnsupportedLocator when Classify gives None, MalformedHeader for a
// wrong field count or an undecodable header field, CorruptStream for a
// payload that is not base64.
Locator Parse(std::string_view text);

LocatorKind KindOf(const Locator& locator);
std::string Format(const Locator& locator);

}  // namespace aether::locator
