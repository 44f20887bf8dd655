#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace aether::log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Defaults to AETHER_LOG_LEVEL, else Info.
Level CurrentLevel();
void SetLevel(Level level);
Level ParseLevel(std::string_view name, Level fallback);

// nullptr restores std::cerr.
void SetSink(std::ostream* sink);

void Write(Level level, const std::string& message);

inline void Debug(const std::string& message) { Write(Level::Debug, message); }
inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace aether::log
