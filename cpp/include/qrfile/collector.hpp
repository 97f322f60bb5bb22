#pragma once

#include "qrfile/error.hpp"
#include "qrfile/qr.hpp"
#include "qrfile/record.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace qrfile::collector {

struct CollectOptions {
    // 0 resolves from QRFILE_WORKERS / hardware concurrency.
    std::size_t workers = 0;
};

struct ArtifactFailure {
    std::filesystem::path path;
    ErrorKind kind = ErrorKind::Codec;
    std::string message;
};

struct CollectReport {
    // Unsorted; arrival order is not meaningful.
    ChunkSet chunks;
    // Directory entries that are not chunk artifacts.
    std::vector<std::filesystem::path> skipped;
    // Chunk artifacts that could not be turned into a chunk.
    std::vector<ArtifactFailure> failures;
};

bool IsArtifactName(const std::string& filename, const std::string& prefix);

// Decodes every "<prefix>*.png" regular file in input_dir. Unreadable artifacts
// are logged and reported, not thrown. Throws NoElementsExtracted when nothing
// decoded, and Io when the directory cannot be listed.
CollectReport CollectAll(const std::filesystem::path& input_dir,
                         const std::string& prefix,
                         qr::ImageDecoder& decoder,
                         const CollectOptions& options = {});

// Same, over an explicit list of images with no name filter.
CollectReport CollectFiles(const std::vector<std::filesystem::path>& files,
                           qr::ImageDecoder& decoder,
                           const CollectOptions& options = {});

}  // namespace qrfile::collector
