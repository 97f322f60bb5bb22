#include "qrfile/qrfile.hpp"

#include "qrfile/chunker.hpp"
#include "qrfile/digest.hpp"
#include "qrfile/log.hpp"
#include "qrfile/validator.hpp"

#include <utility>

namespace qrfile {

namespace {

FileBuffer Reassemble(collector::CollectReport report, const std::filesystem::path& output) {
    ChunkSet sorted = validator::Validate(std::move(report.chunks));
    log::Info("Successfully read " + std::to_string(sorted.size()) + " images, now storing data...");
    FileBuffer file;
    file.name = output.string();
    file.data = validator::Materialize(sorted);
    WriteFile(file);
    log::Info("Done! Wrote " + std::to_string(file.data.size()) + " bytes to " + file.name
              + " (sha256 " + digest::Sha256Hex(file.data) + ")");
    return file;
}

}  // namespace

emitter::EmitReport EncodeFileToImages(const std::filesystem::path& input,
                                       const std::filesystem::path& image_dir,
                                       const std::string& prefix,
                                       qr::ImageEncoder& encoder,
                                       const emitter::EmitOptions& options) {
    log::Info("Creating QR codes for file " + input.string() + " into folder " + image_dir.string()
              + " using image prefix " + prefix);
    FileBuffer file = ReadFile(input);
    log::Info("Read " + std::to_string(file.data.size()) + " bytes (sha256 "
              + digest::Sha256Hex(file.data) + ")");
    ChunkSet chunks = chunker::ChunkBytes(file.data);
    log::Info("Converted file to " + std::to_string(chunks.size()) + " QR codes");
    emitter::EmitReport report = emitter::EmitAll(chunks, image_dir, prefix, encoder, options);
    log::Info("Wrote " + std::to_string(report.artifacts.size()) + " png files in " + image_dir.string());
    return report;
}

FileBuffer RestoreFileFromImages(const std::filesystem::path& image_dir,
                                 const std::string& prefix,
                                 const std::filesystem::path& output,
                                 qr::ImageDecoder& decoder,
                                 const collector::CollectOptions& options) {
    log::Info("Extracting data from " + image_dir.string() + " (prefix " + prefix + "), writing to "
              + output.string());
    return Reassemble(collector::CollectAll(image_dir, prefix, decoder, options), output);
}

FileBuffer RestoreFileFromImageList(const std::vector<std::filesystem::path>& images,
                                    const std::filesystem::path& output,
                                    qr::ImageDecoder& decoder,
                                    const collector::CollectOptions& options) {
    log::Info("Extracting data from " + std::to_string(images.size()) + " images, writing to "
              + output.string());
    return Reassemble(collector::CollectFiles(images, decoder, options), output);
}

Chunk InspectArtifact(const std::filesystem::path& image, qr::ImageDecoder& decoder) {
    return record::DecodeRecord(decoder.Decode(ReadFileBytes(image)));
}

}  // namespace qrfile
