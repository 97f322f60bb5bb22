#pragma once

#include "qrfile/record.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace qrfile::chunker {

// Number of records needed for a hex payload of the given length. An empty payload
// still takes one record so that total_index stays defined.
std::uint64_t ChunkCount(std::size_t payload_size);

// Splits hex text into capacity-sized records. Throws HexDecodeError on non-hex
// input and PayloadTooLarge if a slice would not fit a record.
ChunkSet ChunkPayload(std::string_view hex_payload);

ChunkSet ChunkBytes(const std::vector<std::uint8_t>& data);

}  // namespace qrfile::chunker
