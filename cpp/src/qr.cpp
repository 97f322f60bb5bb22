#include "qrfile/qr.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/env.hpp"
#include "qrfile/error.hpp"
#include "qrfile/file_io.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

#include <sys/wait.h>

namespace qrfile::qr {

namespace {

std::string QuoteShellArg(const std::string& value) {
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out += "'";
    return out;
}

std::string BuildCommand(const ToolOptions& options, const std::vector<std::string>& args) {
    std::ostringstream oss;
    if (options.timeout_seconds > 0) {
        oss << "timeout " << options.timeout_seconds << ' ';
    }
    oss << QuoteShellArg(options.binary);
    for (const auto& arg : args) {
        oss << ' ' << QuoteShellArg(arg);
    }
    oss << " 2>/dev/null";
    return oss.str();
}

// Runs the command and returns its stdout. Throws Codec on a spawn failure or a
// non-zero exit status.
Bytes RunCommandCapture(const std::string& cmd, const std::string& tool) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw Error(ErrorKind::Codec, "Failed to run " + tool);
    }
    Bytes output;
    std::array<std::uint8_t, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.insert(output.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    int rc = pclose(pipe);
    if (rc == -1) {
        throw Error(ErrorKind::Codec, tool + " did not terminate cleanly");
    }
    if (WIFEXITED(rc) && WEXITSTATUS(rc) == 124) {
        throw Error(ErrorKind::Codec, tool + " timed out");
    }
    if (!WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
        int code = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
        throw Error(ErrorKind::Codec, tool + " failed with exit code " + std::to_string(code));
    }
    return output;
}

ToolOptions OptionsFor(const char* bin_var, std::string_view default_bin) {
    ToolOptions options;
    options.binary = env::Get(bin_var);
    if (options.binary.empty()) {
        options.binary = std::string(default_bin);
    }
    options.timeout_seconds = env::GetSize("QRFILE_CODEC_TIMEOUT").value_or(0);
    return options;
}

class TempFile {
public:
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

char LevelLetter(EcLevel level) {
    switch (level) {
        case EcLevel::L:
            return 'L';
        case EcLevel::M:
            return 'M';
        case EcLevel::Q:
            return 'Q';
        case EcLevel::H:
            return 'H';
    }
    return 'L';
}

std::optional<EcLevel> ParseLevel(const std::string& text) {
    if (text.size() != 1) {
        return std::nullopt;
    }
    switch (std::toupper(static_cast<unsigned char>(text[0]))) {
        case 'L':
            return EcLevel::L;
        case 'M':
            return EcLevel::M;
        case 'Q':
            return EcLevel::Q;
        case 'H':
            return EcLevel::H;
        default:
            return std::nullopt;
    }
}

EcLevel DefaultLevel() {
    auto level = ParseLevel(env::Get("QRFILE_QR_LEVEL"));
    if (!level || !HoldsRecord(*level)) {
        return EcLevel::L;
    }
    return *level;
}

std::size_t ByteCapacity(EcLevel level) {
    switch (level) {
        case EcLevel::L:
            return constants::kQrCapacityL;
        case EcLevel::M:
            return constants::kQrCapacityM;
        case EcLevel::Q:
            return constants::kQrCapacityQ;
        case EcLevel::H:
            return constants::kQrCapacityH;
    }
    return constants::kQrCapacityL;
}

bool HoldsRecord(EcLevel level) {
    return constants::kQrSize <= ByteCapacity(level);
}

void RequireRecordCapacity(EcLevel level) {
    if (!HoldsRecord(level)) {
        throw Error(ErrorKind::PayloadTooLarge,
                    std::string("QR level ") + LevelLetter(level) + " holds "
                        + std::to_string(ByteCapacity(level)) + " bytes, records need "
                        + std::to_string(constants::kQrSize));
    }
}

ToolOptions QrencodeOptionsFromEnvironment() {
    return OptionsFor("QRFILE_QRENCODE_BIN", constants::kQrencodeBin);
}

ToolOptions ZbarimgOptionsFromEnvironment() {
    return OptionsFor("QRFILE_ZBARIMG_BIN", constants::kZbarimgBin);
}

QrencodeEncoder::QrencodeEncoder() : options_(QrencodeOptionsFromEnvironment()) {}

QrencodeEncoder::QrencodeEncoder(ToolOptions options) : options_(std::move(options)) {}

Bytes QrencodeEncoder::Encode(const std::string& text, EcLevel level) {
    std::string cmd = BuildCommand(options_, {
        "-l", std::string(1, LevelLetter(level)),
        "-t", "PNG",
        "-8",
        "-o", "-",
        text
    });
    Bytes png = RunCommandCapture(cmd, options_.binary);
    if (png.empty()) {
        throw Error(ErrorKind::Codec, options_.binary + " produced no image");
    }
    return png;
}

ZbarDecoder::ZbarDecoder() : options_(ZbarimgOptionsFromEnvironment()) {}

ZbarDecoder::ZbarDecoder(ToolOptions options) : options_(std::move(options)) {}

std::string ZbarDecoder::Decode(const Bytes& image) {
    TempFile temp(MakeTempPath(std::string(constants::kArtifactExtension)));
    WriteFileBytes(temp.path(), image);
    std::string cmd = BuildCommand(options_, {
        "--quiet", "--raw",
        "-Sdisable", "-Sqrcode.enable",
        temp.path().string()
    });
    Bytes raw = RunCommandCapture(cmd, options_.binary);
    std::string text(raw.begin(), raw.end());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    const std::string prefix(constants::kZbarQrPrefix);
    if (text.compare(0, prefix.size(), prefix) == 0) {
        text.erase(0, prefix.size());
    }
    if (text.empty()) {
        throw Error(ErrorKind::Codec, "No QR code recognized");
    }
    return text;
}

}  // namespace qrfile::qr
