#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

// Creates a unique directory under the system temp dir and removes it on
// destruction.
class TempDir {
   public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(std::string_view name) const {
        return path_ / name;
    }

   private:
    std::filesystem::path path_;
};

// MP4 ("ftyp" mp42/isom) header followed by a deterministic byte pattern.
std::string MakeMp4Data(std::size_t size, unsigned seed = 0);

// JPEG SOI marker followed by a deterministic byte pattern.
std::string MakeJpegData(std::size_t size, unsigned seed = 0);

void WriteFile(const std::filesystem::path& path, std::string_view data);
std::string ReadFile(const std::filesystem::path& path);
