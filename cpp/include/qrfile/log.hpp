#pragma once

#include <string>

namespace qrfile::log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// Current threshold. Initialised from QRFILE_LOG_LEVEL on first use.
Level GetLevel();
void SetLevel(Level level);

// Parses debug|info|warn|error|off (case-insensitive); falls back to Info.
Level ParseLevel(const std::string& text);

// Colors are used only when stderr is a TTY and NO_COLOR is unset.
bool ColorsEnabled();
void SetColorsEnabled(bool enabled);

// Each call writes exactly one line to stderr; safe to call from worker threads.
void Write(Level level, const std::string& message);

inline void Debug(const std::string& message) { Write(Level::Debug, message); }
inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace qrfile::log
