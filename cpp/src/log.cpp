#include "aether/log.hpp"

#include "aether/cli_colors.hpp"
#include "aether/env.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace aether::log {

namespace {

bool g_level_set = false;
Level g_level = Level::Info;
std::ostream* g_sink = nullptr;

const char* Prefix(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            break;
    }
    return "";
}

const char* PrefixColor(Level level) {
    switch (level) {
        case Level::Debug:
            return cli::color::BRIGHT_BLACK;
        case Level::Info:
            return cli::color::CYAN;
        case Level::Warn:
            return cli::color::BOLD_YELLOW;
        default:
            return cli::color::BOLD_RED;
    }
}

}  // namespace

Level ParseLevel(std::string_view name, Level fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "error") {
        return Level::Error;
    }
    if (lower == "off" || lower == "none") {
        return Level::Off;
    }
    return fallback;
}

Level CurrentLevel() {
    if (!g_level_set) {
        g_level = ParseLevel(aether::env::Get("AETHER_LOG_LEVEL"), Level::Info);
        g_level_set = true;
    }
    return g_level;
}

void SetLevel(Level level) {
    g_level = level;
    g_level_set = true;
}

void SetSink(std::ostream* sink) {
    g_sink = sink;
}

void Write(Level level, const std::string& message) {
    if (level == Level::Off || level < CurrentLevel()) {
        return;
    }
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << cli::Colorize(Prefix(level), PrefixColor(level), out) << ": " << message << "\n";
}

}  // namespace aether::log
