#include "qrfile/collector.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/file_io.hpp"
#include "qrfile/log.hpp"
#include "qrfile/parallel.hpp"

#include <algorithm>
#include <optional>
#include <system_error>
#include <utility>

namespace qrfile::collector {

namespace {

struct TaskResult {
    std::optional<Chunk> chunk;
    std::optional<ArtifactFailure> failure;
};

TaskResult DecodeArtifact(const std::filesystem::path& path, qr::ImageDecoder& decoder) {
    TaskResult result;
    log::Debug("Handling file " + path.filename().string());
    try {
        Bytes image = ReadFileBytes(path);
        std::string text = decoder.Decode(image);
        Chunk chunk = record::DecodeRecord(text);
        log::Debug("Element created: " + record::FormatRecordSummary(chunk));
        result.chunk = std::move(chunk);
    } catch (const Error& exc) {
        log::Warn("No element created from " + path.string() + ": " + exc.what());
        result.failure = ArtifactFailure{path, exc.kind(), exc.what()};
    } catch (const std::exception& exc) {
        log::Warn("No element created from " + path.string() + ": " + exc.what());
        result.failure = ArtifactFailure{path, ErrorKind::Io, exc.what()};
    } catch (...) {
        log::Warn("No element created from " + path.string() + ": unknown error");
        result.failure = ArtifactFailure{path, ErrorKind::Codec, "unknown error"};
    }
    return result;
}

CollectReport Run(const std::vector<std::filesystem::path>& tasks,
                  std::vector<std::filesystem::path> skipped,
                  qr::ImageDecoder& decoder,
                  const CollectOptions& options) {
    std::vector<TaskResult> results(tasks.size());
    const std::size_t workers = parallel::ResolveWorkers(options.workers, tasks.size());
    parallel::ParallelFor(tasks.size(), workers, [&](std::size_t i) {
        results[i] = DecodeArtifact(tasks[i], decoder);
    });

    CollectReport report;
    report.skipped = std::move(skipped);
    for (auto& result : results) {
        if (result.chunk) {
            report.chunks.push_back(std::move(*result.chunk));
        } else if (result.failure) {
            report.failures.push_back(std::move(*result.failure));
        }
    }
    log::Info("Extracted " + std::to_string(report.chunks.size()) + " elements ("
              + std::to_string(report.failures.size()) + " unreadable, "
              + std::to_string(report.skipped.size()) + " skipped)");
    if (report.chunks.empty()) {
        throw Error(ErrorKind::NoElementsExtracted, "No elements extracted.");
    }
    return report;
}

}  // namespace

bool IsArtifactName(const std::string& filename, const std::string& prefix) {
    const std::string ext(constants::kArtifactExtension);
    if (filename.size() < prefix.size() + ext.size()) {
        return false;
    }
    return filename.compare(0, prefix.size(), prefix) == 0
           && filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
}

CollectReport CollectAll(const std::filesystem::path& input_dir,
                         const std::string& prefix,
                         qr::ImageDecoder& decoder,
                         const CollectOptions& options) {
    std::vector<std::filesystem::path> tasks;
    std::vector<std::filesystem::path> skipped;
    std::error_code ec;
    std::filesystem::directory_iterator it(input_dir, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "Failed to list " + input_dir.string() + ": " + ec.message());
    }
    std::filesystem::directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && IsArtifactName(name, prefix)) {
            tasks.push_back(entry.path());
        } else {
            log::Debug("Not handling file " + name);
            skipped.push_back(entry.path());
        }
        it.increment(ec);
        if (ec) {
            throw Error(ErrorKind::Io, "Failed to list " + input_dir.string() + ": " + ec.message());
        }
    }
    std::sort(tasks.begin(), tasks.end());
    return Run(tasks, std::move(skipped), decoder, options);
}

CollectReport CollectFiles(const std::vector<std::filesystem::path>& files,
                           qr::ImageDecoder& decoder,
                           const CollectOptions& options) {
    return Run(files, {}, decoder, options);
}

}  // namespace qrfile::collector
