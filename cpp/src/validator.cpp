#include "qrfile/validator.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"
#include "qrfile/hex.hpp"
#include "qrfile/log.hpp"

#include <algorithm>
#include <string>

namespace qrfile::validator {

ChunkSet Validate(ChunkSet chunks) {
    if (chunks.empty()) {
        throw Error(ErrorKind::NoElementsExtracted, "No elements extracted.");
    }
    const std::uint64_t total_index = chunks.front().total_index;
    for (const auto& chunk : chunks) {
        if (chunk.total_index != total_index) {
            throw Error(ErrorKind::InconsistentTotal, chunk.index,
                        "Chunks disagree on the last index: " + std::to_string(total_index)
                            + " vs " + std::to_string(chunk.total_index));
        }
    }
    // Compare as total_index >= size so that total_index + 1 cannot overflow.
    if (total_index >= chunks.size()) {
        throw Error(ErrorKind::IncompleteSet,
                    "Incomplete set extracted: " + std::to_string(chunks.size()) + " of "
                        + std::to_string(total_index) + "+1 elements.");
    }

    std::stable_sort(chunks.begin(), chunks.end(),
                     [](const Chunk& a, const Chunk& b) { return a.index < b.index; });
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        if (chunks[i].index == chunks[i + 1].index) {
            throw Error(ErrorKind::DuplicateElement, chunks[i].index,
                        "Duplicate element detected: " + std::to_string(chunks[i].index));
        }
    }
    for (std::uint64_t i = 0; i <= total_index; ++i) {
        if (chunks[i].index != i) {
            throw Error(ErrorKind::IncompleteSet, i,
                        "Incomplete set extracted: element " + std::to_string(i) + " missing.");
        }
    }
    if (chunks.size() > total_index + 1) {
        const Chunk& extra = chunks[total_index + 1];
        throw Error(ErrorKind::IndexOutOfRange, extra.index,
                    "Element index " + std::to_string(extra.index)
                        + " beyond last index " + std::to_string(total_index));
    }
    // Only the last chunk may be short.
    for (std::uint64_t i = 0; i < total_index; ++i) {
        if (chunks[i].payload_length != constants::kDataSize
            || chunks[i].payload.size() != constants::kDataSize) {
            throw Error(ErrorKind::PayloadLengthMismatch, i,
                        "Element " + std::to_string(i) + " carries "
                            + std::to_string(chunks[i].payload_length) + " payload characters, expected "
                            + std::to_string(constants::kDataSize));
        }
    }
    return chunks;
}

std::vector<std::uint8_t> Materialize(const ChunkSet& sorted) {
    std::vector<std::uint8_t> out;
    std::size_t hex_chars = 0;
    for (const auto& chunk : sorted) {
        hex_chars += chunk.payload.size();
    }
    out.reserve(hex_chars / 2);
    for (const auto& chunk : sorted) {
        log::Debug("Storing data for " + record::FormatRecordSummary(chunk));
        bool ok = false;
        std::vector<std::uint8_t> buffer = hex::Decode(chunk.payload, &ok);
        if (!ok) {
            throw Error(ErrorKind::HexDecodeError, chunk.index,
                        "Invalid hex payload in element " + std::to_string(chunk.index));
        }
        out.insert(out.end(), buffer.begin(), buffer.end());
    }
    return out;
}

}  // namespace qrfile::validator
