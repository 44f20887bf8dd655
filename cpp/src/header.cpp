#include "aether/header.hpp"

#include "aether/base64.hpp"
#include "aether/errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <utility>
#include <vector>

namespace aether::header {

namespace {

// The header is one flat object; only "geo" nests, one level deep. Nested
// members are flattened to "geo.lat" and friends.
struct Scalar {
    enum class Kind {
        Null,
        Bool,
        Number,
        String,
        Object,
        Other
    };

    Kind kind = Kind::Null;
    bool boolean = false;
    std::string text;
};

using Fields = std::vector<std::pair<std::string, Scalar>>;

const Scalar* Find(const Fields& fields, std::string_view name) {
    // Last duplicate wins, as with JSON.parse.
    const Scalar* found = nullptr;
    for (const auto& field : fields) {
        if (field.first == name) {
            found = &field.second;
        }
    }
    return found;
}

class HeaderReader {
public:
    explicit HeaderReader(std::string_view input) : input_(input) {}

    Fields Read() {
        SkipWhitespace();
        if (Peek() != '{') {
            throw MalformedHeader("Header JSON must be an object");
        }
        Fields fields;
        ReadObject("", fields, false);
        SkipWhitespace();
        if (pos_ != input_.size()) {
            Fail("trailing characters");
        }
        return fields;
    }

private:
    [[noreturn]] void Fail(const std::string& what) const {
        throw MalformedHeader("Malformed header JSON: " + what + " at offset " + std::to_string(pos_));
    }

    void SkipWhitespace() {
        while (pos_ < input_.size()) {
            char ch = input_[pos_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
                break;
            }
            ++pos_;
        }
    }

    char Peek() const { return pos_ < input_.size() ? input_[pos_] : '\0'; }

    void Expect(char ch) {
        if (Peek() != ch) {
            Fail(std::string("expected '") + ch + "'");
        }
        ++pos_;
    }

    bool ConsumeLiteral(std::string_view literal) {
        if (input_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    void ReadObject(const std::string& prefix, Fields& out, bool nested) {
        Expect('{');
        SkipWhitespace();
        if (Peek() == '}') {
            ++pos_;
            return;
        }
        while (true) {
            SkipWhitespace();
            if (Peek() != '"') {
                Fail("expected member name");
            }
            std::string name = prefix + ReadString();
            SkipWhitespace();
            Expect(':');
            SkipWhitespace();
            char ch = Peek();
            if (ch == '{' && !nested) {
                out.emplace_back(name, Scalar{Scalar::Kind::Object, false, {}});
                ReadObject(name + ".", out, true);
            } else if (ch == '{' || ch == '[') {
                SkipComposite();
                out.emplace_back(std::move(name), Scalar{Scalar::Kind::Other, false, {}});
            } else {
                out.emplace_back(std::move(name), ReadScalar());
            }
            SkipWhitespace();
            if (Peek() == ',') {
                ++pos_;
                continue;
            }
            Expect('}');
            return;
        }
    }

    // Steps over an array or a deeper object; no field reads them.
    void SkipComposite() {
        int depth = 0;
        while (pos_ < input_.size()) {
            char ch = input_[pos_];
            if (ch == '"') {
                ReadString();
                continue;
            }
            ++pos_;
            if (ch == '{' || ch == '[') {
                ++depth;
            } else if (ch == '}' || ch == ']') {
                if (--depth == 0) {
                    return;
                }
            }
        }
        Fail("unterminated value");
    }

    Scalar ReadScalar() {
        Scalar value;
        char ch = Peek();
        if (ch == '"') {
            value.kind = Scalar::Kind::String;
            value.text = ReadString();
        } else if (ConsumeLiteral("true")) {
            value.kind = Scalar::Kind::Bool;
            value.boolean = true;
        } else if (ConsumeLiteral("false")) {
            value.kind = Scalar::Kind::Bool;
        } else if (ConsumeLiteral("null")) {
            value.kind = Scalar::Kind::Null;
        } else if (ch == '-' || (ch >= '0' && ch <= '9')) {
            std::size_t start = pos_;
            while (pos_ < input_.size() && std::string_view("+-.eE0123456789").find(input_[pos_]) != std::string_view::npos) {
                ++pos_;
            }
            value.kind = Scalar::Kind::Number;
            value.text = std::string(input_.substr(start, pos_ - start));
        } else {
            Fail("unexpected character");
        }
        return value;
    }

    std::uint32_t ReadHex4() {
        if (pos_ + 4 > input_.size()) {
            Fail("truncated unicode escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = input_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                Fail("invalid unicode escape");
            }
        }
        return value;
    }

    // Writers leave non-ASCII text raw, so \u escapes only cover the BMP.
    std::string ReadString() {
        Expect('"');
        std::string out;
        while (true) {
            if (pos_ >= input_.size()) {
                Fail("unterminated string");
            }
            unsigned char ch = static_cast<unsigned char>(input_[pos_++]);
            if (ch == '"') {
                return out;
            }
            if (ch < 0x20) {
                Fail("control character in string");
            }
            if (ch != '\\') {
                out.push_back(static_cast<char>(ch));
                continue;
            }
            char esc = Peek();
            ++pos_;
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t cp = ReadHex4();
                    if (cp >= 0xD800 && cp <= 0xDFFF) {
                        Fail("surrogate escape");
                    }
                    if (cp < 0x80) {
                        out.push_back(static_cast<char>(cp));
                    } else if (cp < 0x800) {
                        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                    } else {
                        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                    }
                    break;
                }
                default:
                    Fail("unknown escape");
            }
        }
    }

    std::string_view input_;
    std::size_t pos_ = 0;
};

void AppendEscaped(std::string& out, std::string_view input) {
    static constexpr char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (char ch : input) {
        unsigned char byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[byte >> 4]);
                    out.push_back(kHex[byte & 0x0F]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back('"');
}

std::string FormatDouble(double value) {
    if (!std::isfinite(value)) {
        throw MalformedHeader("Header numbers must be finite");
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return buffer;
}

double NumberAsDouble(const Scalar& value, const char* field) {
    if (value.kind != Scalar::Kind::Number) {
        throw MalformedHeader(std::string("Header field '") + field + "' must be a number");
    }
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(value.text.c_str(), &end);
    if (errno == ERANGE || end != value.text.c_str() + value.text.size() || !std::isfinite(parsed)) {
        throw MalformedHeader(std::string("Header field '") + field + "' is out of range");
    }
    return parsed;
}

std::int64_t NumberAsInt(const Scalar& value, const char* field) {
    double parsed = NumberAsDouble(value, field);
    if (parsed != std::floor(parsed) || std::fabs(parsed) > 9007199254740991.0) {
        throw MalformedHeader(std::string("Header field '") + field + "' must be an integer");
    }
    return static_cast<std::int64_t>(parsed);
}

std::optional<std::string> OptionalString(const Fields& fields, const char* field) {
    const Scalar* value = Find(fields, field);
    if (!value || value->kind == Scalar::Kind::Null) {
        return std::nullopt;
    }
    if (value->kind != Scalar::Kind::String) {
        throw MalformedHeader(std::string("Header field '") + field + "' must be a string");
    }
    return value->text;
}

Bytes OptionalBase64(const Fields& fields, const char* field) {
    std::optional<std::string> text = OptionalString(fields, field);
    if (!text) {
        return {};
    }
    bool ok = false;
    Bytes decoded = aether::base64::Decode(*text, &ok);
    if (!ok) {
        throw MalformedHeader(std::string("Header field '") + field + "' is not valid base64");
    }
    return decoded;
}

}  // namespace

void Validate(const FileHeader& header) {
    if (header.filename.empty()) {
        throw MalformedHeader("Header is missing a filename");
    }
    bool has_salt = header.salt.size() == constants::kKdfSaltLen;
    bool has_iv = header.iv.size() == constants::kAeadNonceLen;
    if (header.encrypted && !(has_salt && has_iv)) {
        throw MalformedHeader("Encrypted header requires a 16-byte salt and a 12-byte iv");
    }
    if (!header.encrypted && (!header.salt.empty() || !header.iv.empty())) {
        throw MalformedHeader("Unencrypted header must not carry crypto parameters");
    }
}

std::string ToJson(const FileHeader& header) {
    Validate(header);
    std::string json;
    json.reserve(128 + header.filename.size());
    json += "{\"filename\":";
    AppendEscaped(json, header.filename);
    if (header.mime) {
        json += ",\"mime\":";
        AppendEscaped(json, *header.mime);
    }
    if (header.vibe) {
        json += ",\"vibe\":";
        AppendEscaped(json, *header.vibe);
    }
    json += ",\"encrypted\":";
    json += header.encrypted ? "true" : "false";
    if (header.expiry_ms) {
        json += ",\"expiry\":" + std::to_string(*header.expiry_ms);
    }
    if (header.geo) {
        json += ",\"geo\":{\"lat\":" + FormatDouble(header.geo->lat);
        json += ",\"lng\":" + FormatDouble(header.geo->lng);
        json += ",\"radius\":" + FormatDouble(header.geo->radius_m) + "}";
    }
    if (header.size) {
        json += ",\"size\":" + std::to_string(*header.size);
    }
    if (header.encrypted) {
        json += ",\"salt\":\"" + aether::base64::Encode(header.salt) + "\"";
        json += ",\"iv\":\"" + aether::base64::Encode(header.iv) + "\"";
    }
    json.push_back('}');
    return json;
}

FileHeader FromJson(std::string_view json) {
    Fields fields = HeaderReader(json).Read();

    FileHeader header;
    std::optional<std::string> filename = OptionalString(fields, "filename");
    if (!filename || filename->empty()) {
        throw MalformedHeader("Header is missing a filename");
    }
    header.filename = std::move(*filename);
    header.mime = OptionalString(fields, "mime");
    header.vibe = OptionalString(fields, "vibe");

    if (const Scalar* encrypted = Find(fields, "encrypted")) {
        if (encrypted->kind == Scalar::Kind::Bool) {
            header.encrypted = encrypted->boolean;
        } else if (encrypted->kind != Scalar::Kind::Null) {
            throw MalformedHeader("Header field 'encrypted' must be a boolean");
        }
    }
    if (const Scalar* expiry = Find(fields, "expiry")) {
        if (expiry->kind != Scalar::Kind::Null) {
            header.expiry_ms = NumberAsInt(*expiry, "expiry");
        }
    }
    if (const Scalar* geo = Find(fields, "geo")) {
        if (geo->kind == Scalar::Kind::Object) {
            const Scalar* lat = Find(fields, "geo.lat");
            const Scalar* lng = Find(fields, "geo.lng");
            if (!lat || !lng) {
                throw MalformedHeader("Header field 'geo' requires lat and lng");
            }
            GeoFence fence;
            fence.lat = NumberAsDouble(*lat, "geo.lat");
            fence.lng = NumberAsDouble(*lng, "geo.lng");
            if (const Scalar* radius = Find(fields, "geo.radius")) {
                fence.radius_m = NumberAsDouble(*radius, "geo.radius");
            }
            header.geo = fence;
        } else if (geo->kind != Scalar::Kind::Null) {
            throw MalformedHeader("Header field 'geo' must be an object");
        }
    }
    if (const Scalar* size = Find(fields, "size")) {
        if (size->kind != Scalar::Kind::Null) {
            std::int64_t parsed = NumberAsInt(*size, "size");
            if (parsed < 0) {
                throw MalformedHeader("Header field 'size' must not be negative");
            }
            header.size = static_cast<std::uint64_t>(parsed);
        }
    }
    header.salt = OptionalBase64(fields, "salt");
    header.iv = OptionalBase64(fields, "iv");
    if (!header.encrypted) {
        // Older senders emit salt/iv only when encrypting; ignore stray values.
        header.salt.clear();
        header.iv.clear();
    }
    Validate(header);
    return header;
}

std::string Encode(const FileHeader& header) {
    return aether::base64::Encode(ToJson(header));
}

FileHeader Decode(std::string_view text) {
    bool ok = false;
    std::vector<std::uint8_t> decoded = aether::base64::Decode(text, &ok);
    if (!ok || decoded.empty()) {
        throw MalformedHeader("Header text is not valid base64");
    }
    std::string json(decoded.begin(), decoded.end());
    return FromJson(json);
}

}  // namespace aether::header
