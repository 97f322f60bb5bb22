#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace qrfile {

// One self-describing slice of a file. The payload is held unpadded; padding exists
// only in the text record.
struct Chunk {
    std::uint64_t index = 0;
    std::uint64_t total_index = 0;
    std::uint64_t payload_length = 0;
    std::string payload;

    bool operator==(const Chunk& other) const {
        return index == other.index && total_index == other.total_index
               && payload_length == other.payload_length && payload == other.payload;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }
};

using ChunkSet = std::vector<Chunk>;

namespace record {

// index(20) | total_index(20) | payload_length(20) | payload(1548), integers
// right-justified with spaces, payload right-justified (left-padded) with spaces.
std::string EncodeRecord(const Chunk& chunk);

// Throws SizeMismatch, MalformedInteger or PayloadLengthMismatch.
Chunk DecodeRecord(std::string_view text);

// "index/total_index len=N |0123456789...|" for log lines.
std::string FormatRecordSummary(const Chunk& chunk);

}  // namespace record

}  // namespace qrfile
