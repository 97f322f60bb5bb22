#include "qrfile/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace qrfile::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    return value ? std::string(value) : std::string();
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

std::optional<std::size_t> ParseSize(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(std::string(text)));
        if (parsed == 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::size_t> GetSize(std::string_view name) {
    return ParseSize(Get(name));
}

}  // namespace qrfile::env
