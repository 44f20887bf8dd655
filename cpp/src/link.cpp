#include "aether/link.hpp"

#include "aether/errors.hpp"
#include "aether/file_stream.hpp"
#include "aether/imagecodec.hpp"
#include "aether/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace aether::link {

namespace {

struct MimeEntry {
    const char* extension;
    const char* mime;
};

constexpr MimeEntry kMimeTable[] = {
    {"png", "image/png"},        {"jpg", "image/jpeg"},       {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},        {"bmp", "image/bmp"},        {"webp", "image/webp"},
    {"tga", "image/x-tga"},      {"psd", "image/vnd.adobe.photoshop"},
    {"svg", "image/svg+xml"},    {"txt", "text/plain"},       {"md", "text/markdown"},
    {"csv", "text/csv"},         {"html", "text/html"},       {"htm", "text/html"},
    {"json", "application/json"}, {"pdf", "application/pdf"}, {"zip", "application/zip"},
    {"gz", "application/gzip"},  {"mp3", "audio/mpeg"},       {"wav", "audio/wav"},
    {"mp4", "video/mp4"},        {"webm", "video/webm"},
};

constexpr const char* kDefaultMime = "application/octet-stream";

header::FileHeader LegacyHeader(std::string filename) {
    header::FileHeader out;
    out.filename = std::move(filename);
    return out;
}

}  // namespace

std::string GuessMime(std::string_view filename) {
    std::size_t dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= filename.size()) {
        return kDefaultMime;
    }
    std::string ext(filename.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    for (const auto& entry : kMimeTable) {
        if (ext == entry.extension) {
            return entry.mime;
        }
    }
    return kDefaultMime;
}

InputFile LoadInputFile(const std::filesystem::path& path) {
    InputFile file;
    file.name = path.filename().string();
    if (file.name.empty()) {
        throw std::invalid_argument("Input path has no filename: " + path.string());
    }
    file.mime = GuessMime(file.name);
    file.data = filestream::ReadFileBytes(path);
    return file;
}

std::int64_t ExpiryFromNow(int minutes) {
    if (minutes <= 0) {
        throw std::invalid_argument("Expiry must be a positive number of minutes");
    }
    using namespace std::chrono;
    auto now = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return static_cast<std::int64_t>(now) + static_cast<std::int64_t>(minutes) * 60 * 1000;
}

std::string BuildInlineLink(const InputFile& file, const LinkOptions& options, const vibes::VibeTable& vibes) {
    if (file.name.empty()) {
        throw std::invalid_argument("Input file needs a name");
    }
    header::FileHeader head;
    head.filename = file.name;
    if (options.vibe && *options.vibe != vibes::kDefaultVibe) {
        if (!vibes.Contains(*options.vibe)) {
            throw std::invalid_argument("Unknown vibe: " + *options.vibe);
        }
        head.vibe = options.vibe;
    }
    head.expiry_ms = options.expiry_ms;
    head.geo = options.geo;

    Bytes body = file.data;
    std::string mime = file.mime;
    if (options.lossy_images && imagecodec::IsImageMime(mime)) {
        Bytes transcoded = imagecodec::TranscodeImage(body, options.quality, mime);
        if (transcoded != body) {
            log::Debug("Image re-encoded: " + std::to_string(body.size()) + " -> "
                       + std::to_string(transcoded.size()) + " bytes");
            body = std::move(transcoded);
            mime = "image/jpeg";
        }
    }
    if (!mime.empty()) {
        head.mime = mime;
    }
    head.size = body.size();

    locator::InlineLocator out;
    Bytes compressed = compress::Compress(body, options.codec);
    if (options.password) {
        cipher::Sealed sealed = cipher::Encrypt(compressed, *options.password, options.cipher);
        head.encrypted = true;
        head.salt = std::move(sealed.salt);
        head.iv = std::move(sealed.iv);
        out.payload = std::move(sealed.ciphertext);
    } else {
        out.payload = std::move(compressed);
    }
    out.header = std::move(head);
    return locator::Format(out);
}

std::string BuildBeamLink(std::string_view peer, std::string_view filename, std::uint64_t size) {
    locator::BeamLocator beam;
    beam.peer = std::string(peer);
    beam.filename = std::string(filename);
    beam.size_hint = size;
    return locator::Format(beam);
}

std::string BuildBeamLink(std::string_view peer, const InputFile& file) {
    return BuildBeamLink(peer, file.name, file.data.size());
}

std::string ShareUrl(std::string_view base, std::string_view locator) {
    std::string_view trimmed = base.substr(0, base.find('#'));
    std::string url(trimmed);
    url.push_back('#');
    url.append(locator);
    return url;
}

std::string_view ExtractLocator(std::string_view text) {
    std::size_t hash = text.find('#');
    if (hash == std::string_view::npos) {
        return text;
    }
    return text.substr(hash + 1);
}

DecodedLink ParseLink(std::string_view text) {
    locator::Locator parsed = locator::Parse(ExtractLocator(text));
    DecodedLink out;
    out.kind = locator::KindOf(parsed);
    switch (out.kind) {
        case locator::LocatorKind::Inline: {
            auto& inline_locator = std::get<locator::InlineLocator>(parsed);
            out.header = std::move(inline_locator.header);
            if (out.header.encrypted) {
                out.locked = true;
                out.sealed = std::move(inline_locator.payload);
            } else {
                out.payload = compress::Decompress(inline_locator.payload);
            }
            break;
        }
        case locator::LocatorKind::LegacySecure: {
            auto& secure = std::get<locator::LegacySecureLocator>(parsed);
            out.header = LegacyHeader(std::move(secure.filename));
            out.header.encrypted = true;
            out.header.salt = std::move(secure.salt);
            out.header.iv = std::move(secure.iv);
            out.locked = true;
            out.sealed = std::move(secure.payload);
            break;
        }
        case locator::LocatorKind::LegacyPlain: {
            auto& plain = std::get<locator::LegacyPlainLocator>(parsed);
            out.header = LegacyHeader(std::move(plain.filename));
            out.payload = compress::Decompress(plain.payload);
            break;
        }
        case locator::LocatorKind::Beam: {
            auto& beam = std::get<locator::BeamLocator>(parsed);
            out.header = LegacyHeader(beam.filename);
            out.header.size = beam.size_hint;
            out.beam = std::move(beam);
            break;
        }
        case locator::LocatorKind::None:
            throw UnsupportedLocator("Text is not a locator");
    }
    return out;
}

DecodedLink ParseLink(std::string_view text, const std::string& password, const cipher::Options& options) {
    DecodedLink out = ParseLink(text);
    if (out.locked) {
        Unlock(out, password, options);
    }
    return out;
}

void Unlock(DecodedLink& link, const std::string& password, const cipher::Options& options) {
    if (!link.locked) {
        return;
    }
    Bytes compressed = cipher::Decrypt(link.sealed, password, link.header.salt, link.header.iv, options);
    link.payload = compress::Decompress(compressed);
    link.sealed.clear();
    link.locked = false;
}

BeamPayload PrepareBeam(const InputFile& file, const std::optional<std::string>& password, const cipher::Options& options) {
    if (file.name.empty()) {
        throw std::invalid_argument("Input file needs a name");
    }
    BeamPayload out;
    out.meta.filename = file.name;
    out.meta.mime = file.mime;
    if (password) {
        cipher::Sealed sealed = cipher::Encrypt(file.data, *password, options);
        out.meta.encrypted = true;
        out.meta.salt = std::move(sealed.salt);
        out.meta.iv = std::move(sealed.iv);
        out.data = std::move(sealed.ciphertext);
    } else {
        out.data = file.data;
    }
    return out;
}

Bytes OpenBeamPayload(const transport::MetaFrame& meta,
                      Bytes payload,
                      const std::optional<std::string>& password,
                      const cipher::Options& options) {
    if (!meta.encrypted) {
        return payload;
    }
    if (!password || password->empty()) {
        throw std::invalid_argument("This beam transfer is encrypted; a password is required");
    }
    return cipher::Decrypt(payload, *password, meta.salt, meta.iv, options);
}

FailureKind Classify(const std::exception& error) {
    if (dynamic_cast<const AuthenticationError*>(&error)) {
        return FailureKind::WrongPassword;
    }
    if (dynamic_cast<const TransferAborted*>(&error)) {
        return FailureKind::ConnectionLost;
    }
    if (dynamic_cast<const UnsupportedLocator*>(&error)) {
        return FailureKind::Unsupported;
    }
    return FailureKind::DecodeFailure;
}

const char* UserMessage(FailureKind kind) {
    switch (kind) {
        case FailureKind::WrongPassword:
            return "Decryption failed. Wrong password?";
        case FailureKind::ConnectionLost:
            return "Connection lost before the transfer finished.";
        case FailureKind::Unsupported:
            return "Not an Aether link.";
        case FailureKind::DecodeFailure:
            break;
    }
    return "Error parsing link: invalid format.";
}

}  // namespace aether::link
