#include "aether/aether.hpp"

#include "aether/env.hpp"
#include "aether/file_stream.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace aether {

namespace {

void StripTrailingNewline(std::string& text) {
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
    }
}

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    std::size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    std::size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

InspectResult InspectLink(const std::string& text) {
    link::DecodedLink decoded = link::ParseLink(text);
    InspectResult result;
    result.kind = locator::KindName(decoded.kind);
    result.header = decoded.header;
    result.locked = decoded.locked;
    result.payload_len = decoded.locked ? decoded.sealed.size() : decoded.payload.size();
    if (decoded.beam) {
        result.peer = decoded.beam->peer;
    }
    return result;
}

std::string ResolvePassword(const std::string& input) {
    if (input.empty()) {
        return input;
    }
    std::filesystem::path candidate(input);
    if (input.rfind("~/", 0) == 0) {
        std::string home = env::Get("HOME");
        if (!home.empty()) {
            candidate = std::filesystem::path(home) / input.substr(2);
        }
    }
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec) && std::filesystem::is_regular_file(candidate, ec)) {
        auto data = filestream::ReadFileBytes(candidate);
        std::string password(data.begin(), data.end());
        StripTrailingNewline(password);
        return password;
    }
    return input;
}

std::string ResolveLocatorArgument(const std::string& input) {
    if (input == "-") {
        std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        return Trim(text);
    }
    if (input.size() > 1 && input[0] == '@') {
        auto data = filestream::ReadFileBytes(input.substr(1));
        return Trim(std::string(data.begin(), data.end()));
    }
    return input;
}

}  // namespace aether
