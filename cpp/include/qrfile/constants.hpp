#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace qrfile::constants {

// Width of one text record handed to the QR encoder. Must stay even: every
// payload byte takes two hex characters.
inline constexpr std::size_t kQrSize = 1608;

// A space-padded uint64 never needs more than 20 decimal digits.
inline constexpr std::size_t kUintFieldWidth = 20;
inline constexpr std::size_t kHeaderFieldCount = 3;
inline constexpr std::size_t kHeaderSize = kUintFieldWidth * kHeaderFieldCount;
inline constexpr std::size_t kDataSize = kQrSize - kHeaderSize;

inline constexpr std::size_t kIndexPos = 0;
inline constexpr std::size_t kTotalIndexPos = kIndexPos + kUintFieldWidth;
inline constexpr std::size_t kPayloadLengthPos = kTotalIndexPos + kUintFieldWidth;
inline constexpr std::size_t kPayloadPos = kPayloadLengthPos + kUintFieldWidth;

inline constexpr char kPaddingChar = ' ';

static_assert(kQrSize % 2 == 0, "record width must hold whole hex bytes");
static_assert(kDataSize % 2 == 0, "payload capacity must hold whole hex bytes");
static_assert(kPayloadPos == kHeaderSize, "header layout out of sync");

// Byte-mode capacity of a version 40 symbol per error correction level.
inline constexpr std::size_t kQrCapacityL = 2953;
inline constexpr std::size_t kQrCapacityM = 2331;
inline constexpr std::size_t kQrCapacityQ = 1663;
inline constexpr std::size_t kQrCapacityH = 1273;
static_assert(kQrSize <= kQrCapacityL, "record exceeds QR capacity at the default level");

inline constexpr std::string_view kArtifactExtension = ".png";
inline constexpr std::string_view kDefaultImagePrefix = "img_";
inline constexpr std::string_view kDefaultImageDir = "./img_dir";
inline constexpr std::string_view kDefaultOutputDir = "./output_dir";
inline constexpr std::string_view kDefaultOutputName = "result";

inline constexpr std::string_view kQrencodeBin = "qrencode";
inline constexpr std::string_view kZbarimgBin = "zbarimg";
inline constexpr std::string_view kZbarQrPrefix = "QR-Code:";

inline constexpr std::string_view kTempDirPrefix = "qrfile_";
inline constexpr std::string_view kEngineVersion = "1.2.0";

// Characters of payload shown in log summaries.
inline constexpr std::size_t kLogPreviewChars = 10;

}  // namespace qrfile::constants
