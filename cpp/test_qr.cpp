#include <gtest/gtest.h>

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"
#include "qrfile/file_io.hpp"
#include "qrfile/qr.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using qrfile::Bytes;
using qrfile::Error;
using qrfile::ErrorKind;
using qrfile::TempDir;
using qrfile::qr::EcLevel;
using qrfile::qr::ToolOptions;

namespace {

// Writes an executable /bin/sh script that stands in for an external tool.
fs::path WriteScript(const TempDir& dir, const std::string& name, const std::string& body) {
    fs::path path = dir.path() / name;
    std::string text = "#!/bin/sh\n" + body + "\n";
    qrfile::WriteFileBytes(path, Bytes(text.begin(), text.end()));
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

ToolOptions Tool(const fs::path& binary, std::size_t timeout_seconds = 0) {
    ToolOptions options;
    options.binary = binary.string();
    options.timeout_seconds = timeout_seconds;
    return options;
}

Error DecodeFailure(qrfile::qr::ZbarDecoder& decoder, const Bytes& image) {
    try {
        decoder.Decode(image);
    } catch (const Error& exc) {
        return exc;
    }
    ADD_FAILURE() << "decode succeeded unexpectedly";
    return Error(ErrorKind::Aggregate, "");
}

}  // namespace

TEST(ZbarDecoderTest, StripsPrefixAndTrailingNewline) {
    TempDir dir;
    // The image path is the fifth argument after the scan flags.
    auto tool = WriteScript(dir, "zbarimg", "printf 'QR-Code:'; cat \"$5\"; printf '\\n'");
    qrfile::qr::ZbarDecoder decoder(Tool(tool));
    EXPECT_EQ(decoder.Decode(Bytes{'a', 'b', 'c'}), "abc");
}

TEST(ZbarDecoderTest, AcceptsOutputWithoutPrefix) {
    TempDir dir;
    auto tool = WriteScript(dir, "zbarimg", "printf 'plain text\\r\\n'");
    qrfile::qr::ZbarDecoder decoder(Tool(tool));
    EXPECT_EQ(decoder.Decode(Bytes{'x'}), "plain text");
}

TEST(ZbarDecoderTest, EmptyOutputIsCodecError) {
    TempDir dir;
    auto tool = WriteScript(dir, "zbarimg", "exit 0");
    qrfile::qr::ZbarDecoder decoder(Tool(tool));
    EXPECT_EQ(DecodeFailure(decoder, Bytes{'x'}).kind(), ErrorKind::Codec);
}

TEST(ZbarDecoderTest, NonZeroExitIsCodecError) {
    TempDir dir;
    auto tool = WriteScript(dir, "zbarimg", "echo 'QR-Code:abc'; exit 4");
    qrfile::qr::ZbarDecoder decoder(Tool(tool));
    Error exc = DecodeFailure(decoder, Bytes{'x'});
    EXPECT_EQ(exc.kind(), ErrorKind::Codec);
    EXPECT_NE(std::string(exc.what()).find("exit code 4"), std::string::npos) << exc.what();
}

TEST(ZbarDecoderTest, MissingBinaryIsCodecError) {
    TempDir dir;
    qrfile::qr::ZbarDecoder decoder(Tool(dir.path() / "no-such-tool"));
    EXPECT_EQ(DecodeFailure(decoder, Bytes{'x'}).kind(), ErrorKind::Codec);
}

TEST(ZbarDecoderTest, HungToolTimesOut) {
    if (std::system("command -v timeout >/dev/null 2>&1") != 0) {
        GTEST_SKIP() << "timeout not installed";
    }
    TempDir dir;
    auto tool = WriteScript(dir, "zbarimg", "exec sleep 5");
    qrfile::qr::ZbarDecoder decoder(Tool(tool, 1));
    Error exc = DecodeFailure(decoder, Bytes{'x'});
    EXPECT_EQ(exc.kind(), ErrorKind::Codec);
    EXPECT_NE(std::string(exc.what()).find("timed out"), std::string::npos) << exc.what();
}

TEST(QrencodeEncoderTest, PassesLevelAndQuotedText) {
    TempDir dir;
    auto tool = WriteScript(dir, "qrencode", "printf '%s|' \"$@\"");
    qrfile::qr::QrencodeEncoder encoder(Tool(tool));
    Bytes out = encoder.Encode("it's 1", EcLevel::M);
    EXPECT_EQ(std::string(out.begin(), out.end()), "-l|M|-t|PNG|-8|-o|-|it's 1|");
}

TEST(QrencodeEncoderTest, EmptyOutputIsCodecError) {
    TempDir dir;
    auto tool = WriteScript(dir, "qrencode", "exit 0");
    qrfile::qr::QrencodeEncoder encoder(Tool(tool));
    try {
        encoder.Encode("text", EcLevel::L);
        FAIL() << "expected Codec";
    } catch (const Error& exc) {
        EXPECT_EQ(exc.kind(), ErrorKind::Codec);
    }
}

TEST(ToolOptionsTest, ReadsEnvironmentOverrides) {
    ASSERT_EQ(setenv("QRFILE_QRENCODE_BIN", "/opt/bin/qrencode", 1), 0);
    ASSERT_EQ(setenv("QRFILE_CODEC_TIMEOUT", "7", 1), 0);
    ToolOptions options = qrfile::qr::QrencodeOptionsFromEnvironment();
    EXPECT_EQ(options.binary, "/opt/bin/qrencode");
    EXPECT_EQ(options.timeout_seconds, 7u);

    ASSERT_EQ(setenv("QRFILE_CODEC_TIMEOUT", "-1", 1), 0);
    EXPECT_EQ(qrfile::qr::QrencodeOptionsFromEnvironment().timeout_seconds, 0u);

    ASSERT_EQ(unsetenv("QRFILE_QRENCODE_BIN"), 0);
    ASSERT_EQ(unsetenv("QRFILE_CODEC_TIMEOUT"), 0);
    options = qrfile::qr::ZbarimgOptionsFromEnvironment();
    EXPECT_EQ(options.binary, "zbarimg");
    EXPECT_EQ(options.timeout_seconds, 0u);
}

TEST(LevelTest, ParsesLettersInEitherCase) {
    EXPECT_EQ(qrfile::qr::ParseLevel("l"), EcLevel::L);
    EXPECT_EQ(qrfile::qr::ParseLevel("Q"), EcLevel::Q);
    EXPECT_FALSE(qrfile::qr::ParseLevel("X").has_value());
    EXPECT_FALSE(qrfile::qr::ParseLevel("LM").has_value());
    EXPECT_FALSE(qrfile::qr::ParseLevel("").has_value());
}

TEST(LevelTest, OnlyLevelsThatHoldARecordAreAccepted) {
    EXPECT_EQ(qrfile::qr::ByteCapacity(EcLevel::L), 2953u);
    EXPECT_EQ(qrfile::qr::ByteCapacity(EcLevel::H), 1273u);
    EXPECT_TRUE(qrfile::qr::HoldsRecord(EcLevel::L));
    EXPECT_TRUE(qrfile::qr::HoldsRecord(EcLevel::M));
    EXPECT_TRUE(qrfile::qr::HoldsRecord(EcLevel::Q));
    EXPECT_FALSE(qrfile::qr::HoldsRecord(EcLevel::H));

    EXPECT_NO_THROW(qrfile::qr::RequireRecordCapacity(EcLevel::Q));
    try {
        qrfile::qr::RequireRecordCapacity(EcLevel::H);
        FAIL() << "expected PayloadTooLarge";
    } catch (const Error& exc) {
        EXPECT_EQ(exc.kind(), ErrorKind::PayloadTooLarge);
    }
}

TEST(LevelTest, DefaultLevelFallsBackWhenRecordDoesNotFit) {
    ASSERT_EQ(setenv("QRFILE_QR_LEVEL", "q", 1), 0);
    EXPECT_EQ(qrfile::qr::DefaultLevel(), EcLevel::Q);
    ASSERT_EQ(setenv("QRFILE_QR_LEVEL", "H", 1), 0);
    EXPECT_EQ(qrfile::qr::DefaultLevel(), EcLevel::L);
    ASSERT_EQ(unsetenv("QRFILE_QR_LEVEL"), 0);
    EXPECT_EQ(qrfile::qr::DefaultLevel(), EcLevel::L);
}
