#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace qrfile {

enum class ErrorKind {
    // format
    SizeMismatch,
    MalformedInteger,
    PayloadLengthMismatch,
    HexDecodeError,
    // completeness
    IncompleteSet,
    DuplicateElement,
    InconsistentTotal,
    IndexOutOfRange,
    NoElementsExtracted,
    // capacity
    PayloadTooLarge,
    // io and external tools
    Io,
    Codec,
    Aggregate,
};

const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);
    Error(ErrorKind kind, std::uint64_t chunk_index, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<std::uint64_t>& chunk_index() const noexcept { return chunk_index_; }

private:
    ErrorKind kind_;
    std::optional<std::uint64_t> chunk_index_;
};

struct ChunkFailure {
    std::uint64_t index = 0;
    std::string message;
};

// One exception for every chunk that failed during a bulk run.
class AggregateError : public Error {
public:
    explicit AggregateError(std::vector<ChunkFailure> failures);

    const std::vector<ChunkFailure>& failures() const noexcept { return failures_; }

private:
    std::vector<ChunkFailure> failures_;
};

}  // namespace qrfile
