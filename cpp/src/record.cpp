#include "qrfile/record.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"

#include <limits>
#include <string>

namespace qrfile::record {

namespace {

using constants::kDataSize;
using constants::kPaddingChar;
using constants::kUintFieldWidth;

void AppendField(std::string& out, std::uint64_t value) {
    std::string digits = std::to_string(value);
    out.append(kUintFieldWidth - digits.size(), kPaddingChar);
    out.append(digits);
}

// A field is padding followed by at least one digit; anything that would not be
// reproduced byte for byte by AppendField is rejected.
std::uint64_t ParseField(std::string_view field, const char* name) {
    std::size_t pos = 0;
    while (pos < field.size() && field[pos] == kPaddingChar) {
        ++pos;
    }
    std::string_view digits = field.substr(pos);
    if (digits.empty()) {
        throw Error(ErrorKind::MalformedInteger, std::string("Empty ") + name + " field");
    }
    if (digits.size() > 1 && digits.front() == '0') {
        throw Error(ErrorKind::MalformedInteger,
                    std::string("Leading zero in ") + name + " field: '" + std::string(digits) + "'");
    }
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char ch : digits) {
        if (ch < '0' || ch > '9') {
            throw Error(ErrorKind::MalformedInteger,
                        std::string("Invalid ") + name + " field: '" + std::string(field) + "'");
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (kMax - digit) / 10) {
            throw Error(ErrorKind::MalformedInteger,
                        std::string("Overflow in ") + name + " field: '" + std::string(digits) + "'");
        }
        value = value * 10 + digit;
    }
    return value;
}

}  // namespace

std::string EncodeRecord(const Chunk& chunk) {
    if (chunk.payload.size() > kDataSize) {
        throw Error(ErrorKind::PayloadTooLarge, chunk.index,
                    "Payload size " + std::to_string(chunk.payload.size())
                        + " exceeds maximum data size " + std::to_string(kDataSize));
    }
    if (chunk.payload_length != chunk.payload.size()) {
        throw Error(ErrorKind::PayloadLengthMismatch, chunk.index,
                    "Payload length field " + std::to_string(chunk.payload_length)
                        + " does not match payload size " + std::to_string(chunk.payload.size()));
    }
    std::string out;
    out.reserve(constants::kQrSize);
    AppendField(out, chunk.index);
    AppendField(out, chunk.total_index);
    AppendField(out, chunk.payload_length);
    out.append(kDataSize - chunk.payload.size(), kPaddingChar);
    out.append(chunk.payload);
    return out;
}

Chunk DecodeRecord(std::string_view text) {
    if (text.size() != constants::kQrSize) {
        throw Error(ErrorKind::SizeMismatch,
                    "Size mismatch. Expected " + std::to_string(constants::kQrSize)
                        + ", got " + std::to_string(text.size()) + "!");
    }
    Chunk chunk;
    chunk.index = ParseField(text.substr(constants::kIndexPos, kUintFieldWidth), "index");
    chunk.total_index = ParseField(text.substr(constants::kTotalIndexPos, kUintFieldWidth), "total index");
    chunk.payload_length = ParseField(text.substr(constants::kPayloadLengthPos, kUintFieldWidth),
                                      "payload length");
    if (chunk.payload_length > kDataSize) {
        throw Error(ErrorKind::MalformedInteger, chunk.index,
                    "Payload length " + std::to_string(chunk.payload_length)
                        + " exceeds maximum data size " + std::to_string(kDataSize));
    }

    std::string_view field = text.substr(constants::kPayloadPos);
    std::size_t pad = kDataSize - static_cast<std::size_t>(chunk.payload_length);
    for (std::size_t i = 0; i < pad; ++i) {
        if (field[i] != kPaddingChar) {
            throw Error(ErrorKind::PayloadLengthMismatch, chunk.index,
                        "Payload longer than its length field " + std::to_string(chunk.payload_length));
        }
    }
    if (chunk.payload_length > 0 && field[pad] == kPaddingChar) {
        throw Error(ErrorKind::PayloadLengthMismatch, chunk.index,
                    "Payload shorter than its length field " + std::to_string(chunk.payload_length));
    }
    chunk.payload.assign(field.substr(pad));
    return chunk;
}

std::string FormatRecordSummary(const Chunk& chunk) {
    std::string preview = chunk.payload.substr(0, constants::kLogPreviewChars);
    return std::to_string(chunk.index) + "/" + std::to_string(chunk.total_index)
           + " len=" + std::to_string(chunk.payload_length) + " |" + preview + "...|";
}

}  // namespace qrfile::record
