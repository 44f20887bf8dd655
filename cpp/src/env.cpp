#include "aether/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace aether::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUint(std::string_view name, std::uint64_t fallback, std::uint64_t max_value) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(raw, &consumed);
        if (consumed != raw.size() || parsed == 0) {
            return fallback;
        }
        return std::min<std::uint64_t>(parsed, max_value);
    } catch (const std::out_of_range&) {
        return max_value;
    } catch (const std::invalid_argument&) {
        return fallback;
    }
}

}  // namespace aether::env
