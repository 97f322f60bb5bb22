#include "qrfile/qrfile.hpp"

#include "qrfile/digest.hpp"
#include "qrfile/env.hpp"
#include "qrfile/log.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  qrfile_cpp encode <file> [--dir <img_dir>] [--prefix <p>] [--level L|M|Q] [--workers <n>]\n";
    std::cout << "  qrfile_cpp decode [<image>...] [--dir <img_dir>] [--prefix <p>] [--out <file>] [--workers <n>]\n";
    std::cout << "  qrfile_cpp inspect <image>\n";
    std::cout << "  qrfile_cpp roundtrip <file> [--level L|M|Q] [--workers <n>]\n";
    std::cout << "  qrfile_cpp version\n";
    std::cout << "Global flags: --quiet, --verbose, --no-color\n";
}

struct Args {
    std::vector<std::string> positional;
    std::string image_dir = std::string(qrfile::constants::kDefaultImageDir);
    std::string prefix = std::string(qrfile::constants::kDefaultImagePrefix);
    std::string output;
    qrfile::qr::EcLevel level = qrfile::qr::DefaultLevel();
    std::size_t workers = 0;
    bool dir_given = false;
};

std::string RequireValue(int argc, char** argv, int idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag);
    }
    return argv[idx + 1];
}

Args ParseArgs(int argc, char** argv, int start_index) {
    Args opts;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--dir" || flag == "-d") {
            opts.image_dir = RequireValue(argc, argv, idx, flag);
            opts.dir_given = true;
            idx += 2;
        } else if (flag == "--prefix") {
            opts.prefix = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--out" || flag == "-o") {
            opts.output = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--level") {
            std::string value = RequireValue(argc, argv, idx, flag);
            auto level = qrfile::qr::ParseLevel(value);
            if (!level) {
                throw std::runtime_error("Invalid QR level: " + value);
            }
            qrfile::qr::RequireRecordCapacity(*level);
            opts.level = *level;
            idx += 2;
        } else if (flag == "--workers") {
            std::string value = RequireValue(argc, argv, idx, flag);
            auto workers = qrfile::env::ParseSize(value);
            if (!workers) {
                throw std::runtime_error("Invalid worker count: " + value);
            }
            opts.workers = *workers;
            idx += 2;
        } else if (flag == "--quiet" || flag == "--verbose" || flag == "--no-color") {
            idx += 1;
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else {
            opts.positional.push_back(flag);
            idx += 1;
        }
    }
    return opts;
}

void ApplyGlobalFlags(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string flag(argv[i]);
        if (flag == "--quiet") {
            qrfile::log::SetLevel(qrfile::log::Level::Error);
        } else if (flag == "--verbose") {
            qrfile::log::SetLevel(qrfile::log::Level::Debug);
        } else if (flag == "--no-color") {
            qrfile::log::SetColorsEnabled(false);
        }
    }
}

int RunRoundtrip(const Args& opts) {
    std::filesystem::path input(opts.positional.front());
    qrfile::TempDir scratch;
    qrfile::qr::QrencodeEncoder encoder;
    qrfile::qr::ZbarDecoder decoder;
    qrfile::emitter::EmitOptions emit_opts;
    emit_opts.level = opts.level;
    emit_opts.workers = opts.workers;
    qrfile::collector::CollectOptions collect_opts;
    collect_opts.workers = opts.workers;

    auto images = scratch.path() / "images";
    qrfile::EncodeFileToImages(input, images, opts.prefix, encoder, emit_opts);
    qrfile::FileBuffer restored = qrfile::RestoreFileFromImages(
        images, opts.prefix, scratch.path() / "restored", decoder, collect_opts);

    std::string expected = qrfile::digest::Sha256Hex(qrfile::ReadFileBytes(input));
    std::string actual = qrfile::digest::Sha256Hex(restored.data);
    std::cout << "source:   " << expected << "\n";
    std::cout << "restored: " << actual << "\n";
    if (expected != actual) {
        std::cout << "Match: false\n";
        return 1;
    }
    std::cout << "Match: true\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        ApplyGlobalFlags(argc, argv);
        if (command == "version") {
            std::cout << "qrfile_cpp " << qrfile::constants::kEngineVersion << "\n";
            return 0;
        }
        if (command == "encode") {
            Args opts = ParseArgs(argc, argv, 2);
            if (opts.positional.size() != 1) {
                PrintUsage();
                return 2;
            }
            qrfile::qr::QrencodeEncoder encoder;
            qrfile::emitter::EmitOptions emit_opts;
            emit_opts.level = opts.level;
            emit_opts.workers = opts.workers;
            auto report = qrfile::EncodeFileToImages(opts.positional.front(), opts.image_dir, opts.prefix,
                                                     encoder, emit_opts);
            for (const auto& path : report.artifacts) {
                std::cout << path.string() << "\n";
            }
            return 0;
        }
        if (command == "decode") {
            Args opts = ParseArgs(argc, argv, 2);
            if (opts.output.empty()) {
                opts.output = (std::filesystem::path(qrfile::constants::kDefaultOutputDir)
                               / std::string(qrfile::constants::kDefaultOutputName)).string();
            }
            qrfile::qr::ZbarDecoder decoder;
            qrfile::collector::CollectOptions collect_opts;
            collect_opts.workers = opts.workers;
            qrfile::FileBuffer restored;
            if (!opts.positional.empty()) {
                if (opts.dir_given) {
                    throw std::runtime_error("Pass either image files or --dir, not both");
                }
                std::vector<std::filesystem::path> images(opts.positional.begin(), opts.positional.end());
                restored = qrfile::RestoreFileFromImageList(images, opts.output, decoder, collect_opts);
            } else {
                restored = qrfile::RestoreFileFromImages(opts.image_dir, opts.prefix, opts.output, decoder,
                                                         collect_opts);
            }
            std::cout << restored.name << "\n";
            return 0;
        }
        if (command == "inspect") {
            Args opts = ParseArgs(argc, argv, 2);
            if (opts.positional.size() != 1) {
                PrintUsage();
                return 2;
            }
            qrfile::qr::ZbarDecoder decoder;
            qrfile::Chunk chunk = qrfile::InspectArtifact(opts.positional.front(), decoder);
            std::cout << "index: " << chunk.index << "\n";
            std::cout << "total_index: " << chunk.total_index << "\n";
            std::cout << "payload_length: " << chunk.payload_length << "\n";
            std::cout << "payload_bytes: " << chunk.payload.size() / 2 << "\n";
            return 0;
        }
        if (command == "roundtrip") {
            Args opts = ParseArgs(argc, argv, 2);
            if (opts.positional.size() != 1) {
                PrintUsage();
                return 2;
            }
            return RunRoundtrip(opts);
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
