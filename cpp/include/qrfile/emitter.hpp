#pragma once

#include "qrfile/qr.hpp"
#include "qrfile/record.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace qrfile::emitter {

struct EmitOptions {
    qr::EcLevel level = qr::DefaultLevel();
    // 0 resolves from QRFILE_WORKERS / hardware concurrency.
    std::size_t workers = 0;
};

struct EmitReport {
    // Indexed like the input chunk set.
    std::vector<std::filesystem::path> artifacts;
};

// "<prefix><index>.png"
std::string ArtifactName(const std::string& prefix, std::uint64_t index);

// Encodes every chunk to output_dir/<prefix><index>.png. Every chunk is attempted;
// failures are thrown together as one AggregateError once all tasks have finished.
// Files written by failed tasks are left in place.
EmitReport EmitAll(const ChunkSet& chunks,
                   const std::filesystem::path& output_dir,
                   const std::string& prefix,
                   qr::ImageEncoder& encoder,
                   const EmitOptions& options = {});

}  // namespace qrfile::emitter
