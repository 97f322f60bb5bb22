#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace qrfile::hex {

// Lowercase, two characters per byte.
std::string Encode(const std::vector<std::uint8_t>& data);

// Accepts upper or lower case. On odd length or a non-hex character the result is
// empty and *ok is false.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

bool IsHex(std::string_view input);

}  // namespace qrfile::hex
