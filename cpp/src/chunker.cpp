#include "qrfile/chunker.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"
#include "qrfile/hex.hpp"
#include "qrfile/log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace qrfile::chunker {

using constants::kDataSize;

std::uint64_t ChunkCount(std::size_t payload_size) {
    if (payload_size == 0) {
        return 1;
    }
    return (payload_size + kDataSize - 1) / kDataSize;
}

ChunkSet ChunkPayload(std::string_view hex_payload) {
    if (hex_payload.size() % 2 != 0 || !hex::IsHex(hex_payload)) {
        throw Error(ErrorKind::HexDecodeError, "Chunk payload is not a hex string");
    }
    const std::uint64_t count = ChunkCount(hex_payload.size());
    ChunkSet chunks;
    chunks.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        std::size_t offset = static_cast<std::size_t>(i) * kDataSize;
        std::size_t len = std::min(kDataSize, hex_payload.size() - offset);
        if (len > kDataSize) {
            throw Error(ErrorKind::PayloadTooLarge, i, "Payload size exceeds maximum data size");
        }
        Chunk chunk;
        chunk.index = i;
        chunk.total_index = count - 1;
        chunk.payload_length = len;
        chunk.payload.assign(hex_payload.substr(offset, len));
        log::Debug("Creating element: " + std::to_string(i) + " " + std::to_string(count));
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

ChunkSet ChunkBytes(const std::vector<std::uint8_t>& data) {
    return ChunkPayload(hex::Encode(data));
}

}  // namespace qrfile::chunker
