#pragma once

#include "qrfile/file_io.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace qrfile::qr {

// QR error correction level, lowest to highest redundancy.
enum class EcLevel {
    L,
    M,
    Q,
    H,
};

char LevelLetter(EcLevel level);
// Accepts L, M, Q, H in either case.
std::optional<EcLevel> ParseLevel(const std::string& text);
// QRFILE_QR_LEVEL, or L when unset, invalid or too small for a record.
EcLevel DefaultLevel();

// Bytes a version 40 symbol holds at the level.
std::size_t ByteCapacity(EcLevel level);
bool HoldsRecord(EcLevel level);
// Throws Error(ErrorKind::PayloadTooLarge) when a record does not fit the level.
void RequireRecordCapacity(EcLevel level);

// Implementations are called from several worker threads at once.
class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;
    // Returns the encoded image file contents. Throws Error(ErrorKind::Codec).
    virtual Bytes Encode(const std::string& text, EcLevel level) = 0;
};

class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    // Returns the text of the single code in the image. Throws Error(ErrorKind::Codec).
    virtual std::string Decode(const Bytes& image) = 0;
};

struct ToolOptions {
    std::string binary;
    // Seconds; 0 disables. Wraps the call in timeout(1).
    std::size_t timeout_seconds = 0;
};

// Defaults resolved from QRFILE_QRENCODE_BIN / QRFILE_ZBARIMG_BIN and
// QRFILE_CODEC_TIMEOUT.
ToolOptions QrencodeOptionsFromEnvironment();
ToolOptions ZbarimgOptionsFromEnvironment();

// PNG output of the qrencode command-line tool.
class QrencodeEncoder : public ImageEncoder {
public:
    QrencodeEncoder();
    explicit QrencodeEncoder(ToolOptions options);

    Bytes Encode(const std::string& text, EcLevel level) override;

private:
    ToolOptions options_;
};

// zbarimg (zbar suite) restricted to QR symbols.
class ZbarDecoder : public ImageDecoder {
public:
    ZbarDecoder();
    explicit ZbarDecoder(ToolOptions options);

    std::string Decode(const Bytes& image) override;

private:
    ToolOptions options_;
};

}  // namespace qrfile::qr
