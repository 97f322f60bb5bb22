#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "qrfile/collector.hpp"
#include "qrfile/constants.hpp"
#include "qrfile/emitter.hpp"
#include "qrfile/error.hpp"
#include "qrfile/file_io.hpp"
#include "qrfile/qr.hpp"
#include "qrfile/record.hpp"

namespace qrfile {

// Reads `input` and writes one QR image per chunk into image_dir.
emitter::EmitReport EncodeFileToImages(const std::filesystem::path& input,
                                       const std::filesystem::path& image_dir,
                                       const std::string& prefix,
                                       qr::ImageEncoder& encoder,
                                       const emitter::EmitOptions& options = {});

// Collects <prefix>*.png from image_dir, validates the set and writes the restored
// file to `output`. Nothing is written unless the set is complete and decodes.
FileBuffer RestoreFileFromImages(const std::filesystem::path& image_dir,
                                 const std::string& prefix,
                                 const std::filesystem::path& output,
                                 qr::ImageDecoder& decoder,
                                 const collector::CollectOptions& options = {});

FileBuffer RestoreFileFromImageList(const std::vector<std::filesystem::path>& images,
                                    const std::filesystem::path& output,
                                    qr::ImageDecoder& decoder,
                                    const collector::CollectOptions& options = {});

// Decodes the header and payload of a single artifact.
Chunk InspectArtifact(const std::filesystem::path& image, qr::ImageDecoder& decoder);

}  // namespace qrfile
