#include "aether/locator.hpp"

#include "aether/base64.hpp"
#include "aether/codec.hpp"
#include "aether/constants.hpp"
#include "aether/errors.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace aether::locator {

namespace {

bool StartsWithScheme(std::string_view text, std::string_view scheme) {
    return text.size() > scheme.size() && text.compare(0, scheme.size(), scheme) == 0
           && text[scheme.size()] == constants::kLocatorDelim;
}

void ExpectFields(const std::vector<std::string_view>& fields, std::size_t count, const char* kind) {
    if (fields.size() != count) {
        throw MalformedHeader(std::string(kind) + " locator expects " + std::to_string(count) + " fields, got "
                              + std::to_string(fields.size()));
    }
}

std::string DecodeFilename(std::string_view field) {
    bool ok = false;
    std::string name = codec::PercentDecode(field, &ok);
    if (!ok || name.empty()) {
        throw MalformedHeader("Locator filename is not valid percent-encoded UTF-8");
    }
    return name;
}

Bytes DecodeField(std::string_view field, const char* what, bool payload) {
    bool ok = false;
    Bytes out = base64::Decode(field, &ok);
    if (!ok) {
        std::string message = std::string("Locator ") + what + " is not valid base64";
        if (payload) {
            throw CorruptStream(message);
        }
        throw MalformedHeader(message);
    }
    return out;
}

std::uint64_t ParseSize(std::string_view field) {
    if (field.empty() || field.size() > 20) {
        throw MalformedHeader("Beam locator size is not a number");
    }
    std::uint64_t value = 0;
    for (char ch : field) {
        if (ch < '0' || ch > '9') {
            throw MalformedHeader("Beam locator size is not a number");
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw MalformedHeader("Beam locator size out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

void CheckPeer(const std::string& peer) {
    if (peer.empty() || peer.find(constants::kLocatorDelim) != std::string::npos
        || peer.find('#') != std::string::npos) {
        throw std::invalid_argument("Peer address must be non-empty and free of '|' and '#'");
    }
}

}  // namespace

const char* KindName(LocatorKind kind) {
    switch (kind) {
        case LocatorKind::Inline:
            return "inline";
        case LocatorKind::LegacySecure:
            return "legacy-secure";
        case LocatorKind::LegacyPlain:
            return "legacy-plain";
        case LocatorKind::Beam:
            return "beam";
        case LocatorKind::None:
            break;
    }
    return "none";
}

LocatorKind Classify(std::string_view text) {
    if (StartsWithScheme(text, constants::kBeamScheme)) {
        return LocatorKind::Beam;
    }
    if (StartsWithScheme(text, constants::kInlineScheme)) {
        return LocatorKind::Inline;
    }
    std::size_t delim = text.find(constants::kLocatorDelim);
    if (delim == std::string_view::npos) {
        return LocatorKind::None;
    }
    if (text.substr(0, delim) == constants::kSecureScheme) {
        return LocatorKind::LegacySecure;
    }
    return LocatorKind::LegacyPlain;
}

std::vector<std::string_view> SplitFields(std::string_view text) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    for (;;) {
        std::size_t delim = text.find(constants::kLocatorDelim, start);
        if (delim == std::string_view::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, delim - start));
        start = delim + 1;
    }
    return fields;
}

Locator Parse(std::string_view text) {
    LocatorKind kind = Classify(text);
    std::vector<std::string_view> fields = SplitFields(text);
    switch (kind) {
        case LocatorKind::Inline: {
            ExpectFields(fields, 3, "Inline");
            InlineLocator out;
            out.header = header::Decode(fields[1]);
            out.payload = DecodeField(fields[2], "payload", true);
            return out;
        }
        case LocatorKind::LegacySecure: {
            ExpectFields(fields, 5, "Secure");
            LegacySecureLocator out;
            out.filename = DecodeFilename(fields[1]);
            out.salt = DecodeField(fields[2], "salt", false);
            out.iv = DecodeField(fields[3], "iv", false);
            if (out.salt.size() != constants::kKdfSaltLen || out.iv.size() != constants::kAeadNonceLen) {
                throw MalformedHeader("Secure locator has malformed salt or iv");
            }
            out.payload = DecodeField(fields[4], "payload", true);
            return out;
        }
        case LocatorKind::LegacyPlain: {
            ExpectFields(fields, 2, "Plain");
            LegacyPlainLocator out;
            out.filename = DecodeFilename(fields[0]);
            out.payload = DecodeField(fields[1], "payload", true);
            return out;
        }
        case LocatorKind::Beam: {
            ExpectFields(fields, 4, "Beam");
            BeamLocator out;
            out.peer = std::string(fields[1]);
            if (out.peer.empty()) {
                throw MalformedHeader("Beam locator has no peer address");
            }
            out.filename = DecodeFilename(fields[2]);
            out.size_hint = ParseSize(fields[3]);
            return out;
        }
        case LocatorKind::None:
            break;
    }
    throw UnsupportedLocator("Text is not a locator");
}

LocatorKind KindOf(const Locator& locator) {
    switch (locator.index()) {
        case 0:
            return LocatorKind::Inline;
        case 1:
            return LocatorKind::LegacySecure;
        case 2:
            return LocatorKind::LegacyPlain;
        default:
            return LocatorKind::Beam;
    }
}

std::string Format(const Locator& locator) {
    const std::string delim(1, constants::kLocatorDelim);
    if (const auto* inline_locator = std::get_if<InlineLocator>(&locator)) {
        return std::string(constants::kInlineScheme) + delim + header::Encode(inline_locator->header) + delim
               + base64::Encode(inline_locator->payload);
    }
    if (const auto* secure = std::get_if<LegacySecureLocator>(&locator)) {
        if (secure->filename.empty()) {
            throw std::invalid_argument("Locator filename must not be empty");
        }
        return std::string(constants::kSecureScheme) + delim + codec::PercentEncode(secure->filename) + delim
               + base64::Encode(secure->salt) + delim + base64::Encode(secure->iv) + delim
               + base64::Encode(secure->payload);
    }
    if (const auto* plain = std::get_if<LegacyPlainLocator>(&locator)) {
        if (plain->filename.empty()) {
            throw std::invalid_argument("Locator filename must not be empty");
        }
        return codec::PercentEncode(plain->filename) + delim + base64::Encode(plain->payload);
    }
    const auto& beam = std::get<BeamLocator>(locator);
    CheckPeer(beam.peer);
    if (beam.filename.empty()) {
        throw std::invalid_argument("Locator filename must not be empty");
    }
    return std::string(constants::kBeamScheme) + delim + beam.peer + delim + codec::PercentEncode(beam.filename)
           + delim + std::to_string(beam.size_hint);
}

}  // namespace aether::locator
