#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <tuple>

#include "FileStream.hpp"

// Identity of a file for the purpose of resuming its upload.
//
// key:  sha256(canonical path, size, first and last 64 KiB of content);
//       any change to one of those makes a stored session stale.
// slot: "<basename>-<12 hex of sha256(canonical path)>"; names the record
//       file, so a file keeps its slot while its content changes.
struct FileIdentity
{
	std::filesystem::path path;
	std::uint64_t size = 0;
	std::string key;
	std::string slot;
};

inline constexpr std::size_t kIdentitySampleSize = 64 * 1024;

std::tuple<bool, FileIdentity, FileStream::Error> MakeFileIdentityFrom(const std::filesystem::path& path) noexcept;
