#include "qrfile/emitter.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"
#include "qrfile/file_io.hpp"
#include "qrfile/log.hpp"
#include "qrfile/parallel.hpp"

#include <algorithm>
#include <optional>
#include <system_error>
#include <utility>

namespace qrfile::emitter {

std::string ArtifactName(const std::string& prefix, std::uint64_t index) {
    return prefix + std::to_string(index) + std::string(constants::kArtifactExtension);
}

EmitReport EmitAll(const ChunkSet& chunks,
                   const std::filesystem::path& output_dir,
                   const std::string& prefix,
                   qr::ImageEncoder& encoder,
                   const EmitOptions& options) {
    qr::RequireRecordCapacity(options.level);

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "Failed to create image directory " + output_dir.string()
                                       + ": " + ec.message());
    }

    EmitReport report;
    report.artifacts.resize(chunks.size());
    // One slot per task; a task writes only its own.
    std::vector<std::optional<std::string>> errors(chunks.size());

    const std::size_t workers = parallel::ResolveWorkers(options.workers, chunks.size());
    log::Debug("Emitting " + std::to_string(chunks.size()) + " images on "
               + std::to_string(workers) + " workers");

    parallel::ParallelFor(chunks.size(), workers, [&](std::size_t i) {
        const Chunk& chunk = chunks[i];
        auto path = output_dir / ArtifactName(prefix, chunk.index);
        try {
            log::Debug("Creating png for: " + record::FormatRecordSummary(chunk));
            std::string text = record::EncodeRecord(chunk);
            Bytes image = encoder.Encode(text, options.level);
            WriteFileBytes(path, image);
            report.artifacts[i] = path;
        } catch (const std::exception& exc) {
            errors[i] = path.filename().string() + ": " + exc.what();
            log::Warn("Chunk " + std::to_string(chunk.index) + " not written: " + exc.what());
        } catch (...) {
            errors[i] = path.filename().string() + ": unknown error";
            log::Warn("Chunk " + std::to_string(chunk.index) + " not written: unknown error");
        }
    });

    std::vector<ChunkFailure> failures;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (errors[i]) {
            failures.push_back({chunks[i].index, *errors[i]});
        }
    }
    if (!failures.empty()) {
        std::stable_sort(failures.begin(), failures.end(),
                         [](const ChunkFailure& a, const ChunkFailure& b) { return a.index < b.index; });
        log::Error(std::to_string(failures.size()) + " of " + std::to_string(chunks.size())
                   + " images failed");
        throw AggregateError(std::move(failures));
    }
    return report;
}

}  // namespace qrfile::emitter
