#pragma once

#include "qrfile/record.hpp"

#include <cstdint>
#include <vector>

namespace qrfile::validator {

// Sorts by index and checks that the set is exactly 0..total_index with every
// chunk but the last full. Throws NoElementsExtracted, InconsistentTotal,
// IncompleteSet, DuplicateElement, IndexOutOfRange or PayloadLengthMismatch.
ChunkSet Validate(ChunkSet chunks);

// Concatenates the hex-decoded payloads of a validated set. Throws HexDecodeError
// carrying the offending chunk index.
std::vector<std::uint8_t> Materialize(const ChunkSet& sorted);

}  // namespace qrfile::validator
