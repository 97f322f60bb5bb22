#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace qrfile {

using Bytes = std::vector<std::uint8_t>;

struct FileBuffer {
    std::string name;
    Bytes data;
};

// Both throw Error(ErrorKind::Io) on failure.
Bytes ReadFileBytes(const std::filesystem::path& path);
void WriteFileBytes(const std::filesystem::path& path, const Bytes& data);

FileBuffer ReadFile(const std::filesystem::path& path);
// Creates the parent directory when missing.
void WriteFile(const FileBuffer& file);

// A path under the system temp directory that did not exist when checked.
std::filesystem::path MakeTempPath(std::string_view suffix);

// Owns a freshly created directory and removes it, recursively, when destroyed.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace qrfile
