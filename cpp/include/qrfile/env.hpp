#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace qrfile::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Positive decimal integer, digits only; nullopt for zero, signs, blanks or overflow.
std::optional<std::size_t> ParseSize(std::string_view text);

// ParseSize of the variable; nullopt when unset.
std::optional<std::size_t> GetSize(std::string_view name);

}  // namespace qrfile::env
