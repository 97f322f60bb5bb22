#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qrfile::digest {

// Lowercase hex SHA-256 of the buffer.
std::string Sha256Hex(const std::vector<std::uint8_t>& data);

}  // namespace qrfile::digest
