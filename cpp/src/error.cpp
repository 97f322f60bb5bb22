#include "qrfile/error.hpp"

#include <sstream>
#include <utility>

namespace qrfile {

namespace {

std::string JoinFailures(const std::vector<ChunkFailure>& failures) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& failure : failures) {
        if (!first) {
            oss << "; ";
        }
        first = false;
        oss << "chunk " << failure.index << ": " << failure.message;
    }
    return oss.str();
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SizeMismatch:
            return "SizeMismatch";
        case ErrorKind::MalformedInteger:
            return "MalformedInteger";
        case ErrorKind::PayloadLengthMismatch:
            return "PayloadLengthMismatch";
        case ErrorKind::HexDecodeError:
            return "HexDecodeError";
        case ErrorKind::IncompleteSet:
            return "IncompleteSet";
        case ErrorKind::DuplicateElement:
            return "DuplicateElement";
        case ErrorKind::InconsistentTotal:
            return "InconsistentTotal";
        case ErrorKind::IndexOutOfRange:
            return "IndexOutOfRange";
        case ErrorKind::NoElementsExtracted:
            return "NoElementsExtracted";
        case ErrorKind::PayloadTooLarge:
            return "PayloadTooLarge";
        case ErrorKind::Io:
            return "Io";
        case ErrorKind::Codec:
            return "Codec";
        case ErrorKind::Aggregate:
            return "Aggregate";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

Error::Error(ErrorKind kind, std::uint64_t chunk_index, const std::string& message)
    : std::runtime_error(message), kind_(kind), chunk_index_(chunk_index) {}

AggregateError::AggregateError(std::vector<ChunkFailure> failures)
    : Error(ErrorKind::Aggregate, JoinFailures(failures)), failures_(std::move(failures)) {}

}  // namespace qrfile
