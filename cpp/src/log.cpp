#include "qrfile/log.hpp"

#include "qrfile/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <mutex>

#include <unistd.h>

namespace qrfile::log {

namespace {

std::mutex g_write_mutex;
std::once_flag g_init_flag;
Level g_level = Level::Info;
bool g_colors_enabled = false;

void InitFromEnvironment() {
    std::call_once(g_init_flag, []() {
        std::string raw = env::Get("QRFILE_LOG_LEVEL");
        if (!raw.empty()) {
            g_level = ParseLevel(raw);
        }
        g_colors_enabled = env::Get("NO_COLOR").empty() && isatty(fileno(stderr)) != 0;
    });
}

const char* Prefix(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG: ";
        case Level::Info:
            return "INFO: ";
        case Level::Warn:
            return "WARN: ";
        case Level::Error:
            return "ERROR: ";
        case Level::Off:
            break;
    }
    return "";
}

const char* Color(Level level) {
    switch (level) {
        case Level::Debug:
            return color::BRIGHT_BLACK;
        case Level::Info:
            return color::CYAN;
        case Level::Warn:
            return color::YELLOW;
        case Level::Error:
            return color::RED;
        case Level::Off:
            break;
    }
    return color::RESET;
}

}  // namespace

Level GetLevel() {
    InitFromEnvironment();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    return g_level;
}

void SetLevel(Level level) {
    InitFromEnvironment();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_level = level;
}

Level ParseLevel(const std::string& text) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "debug") {
        return Level::Debug;
    }
    if (value == "warn" || value == "warning") {
        return Level::Warn;
    }
    if (value == "error") {
        return Level::Error;
    }
    if (value == "off" || value == "none" || value == "quiet") {
        return Level::Off;
    }
    return Level::Info;
}

bool ColorsEnabled() {
    InitFromEnvironment();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    InitFromEnvironment();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_colors_enabled = enabled;
}

void Write(Level level, const std::string& message) {
    if (level == Level::Off) {
        return;
    }
    InitFromEnvironment();
    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_level)) {
        return;
    }
    if (g_colors_enabled) {
        std::cerr << Color(level) << Prefix(level) << color::RESET << message << "\n";
    } else {
        std::cerr << Prefix(level) << message << "\n";
    }
}

}  // namespace qrfile::log
