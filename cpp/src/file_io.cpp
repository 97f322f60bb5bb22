#include "qrfile/file_io.hpp"

#include "qrfile/constants.hpp"
#include "qrfile/error.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace qrfile {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

}  // namespace

Bytes ReadFileBytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw Error(ErrorKind::Io, "Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw Error(ErrorKind::Io, "Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);
    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw Error(ErrorKind::Io, "Failed to read file: " + path.string());
        }
    }
    return data;
}

void WriteFileBytes(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw Error(ErrorKind::Io, "Failed to open output file: " + path.string());
    }
    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    output.flush();
    if (!output) {
        throw Error(ErrorKind::Io, "Failed to write file: " + path.string());
    }
}

FileBuffer ReadFile(const std::filesystem::path& path) {
    FileBuffer file;
    file.name = path.string();
    file.data = ReadFileBytes(path);
    return file;
}

void WriteFile(const FileBuffer& file) {
    std::filesystem::path path(file.name);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw Error(ErrorKind::Io, "Failed to create directory " + path.parent_path().string()
                                           + ": " + ec.message());
        }
    }
    WriteFileBytes(path, file.data);
}

std::filesystem::path MakeTempPath(std::string_view suffix) {
    const auto now = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const std::string stem = std::string(constants::kTempDirPrefix) + std::to_string(getpid()) + "_"
                             + std::to_string(now) + "_";
    for (std::uint32_t i = 0; i < 32; ++i) {
        auto candidate = std::filesystem::temp_directory_path()
                         / (stem + std::to_string(g_temp_counter.fetch_add(1)) + std::string(suffix));
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    throw Error(ErrorKind::Io, "Failed to allocate temporary path");
}

TempDir::TempDir() {
    path_ = MakeTempPath("");
    std::error_code ec;
    if (!std::filesystem::create_directory(path_, ec) || ec) {
        throw Error(ErrorKind::Io, "Failed to create temporary directory " + path_.string());
    }
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

}  // namespace qrfile
