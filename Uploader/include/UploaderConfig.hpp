#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "MediaValidator.hpp"

inline constexpr const char* kDefaultEndpoint = "https://photoslibrary.googleapis.com/v1";

struct UploaderConfig
{
	std::string endpoint = kDefaultEndpoint;
	std::string access_token;

	std::filesystem::path state_dir;

	std::size_t chunk_size = 10 * 1024 * 1024;
	// Stall deadline per chunk request: it fails once the transfer stays below
	// HttpRequest::kStallBytesPerSecond for this long.
	std::chrono::milliseconds chunk_timeout{ 30'000 };
	std::chrono::milliseconds request_timeout{ 30'000 };

	MediaCategory category = MediaCategory::Video;
	std::uint64_t max_file_size = 0;	// 0: category ceiling
};

// $XDG_CONFIG_HOME/gphoto-uploader/uploads, falling back to
// $HOME/.config/gphoto-uploader/uploads, then ./.gphoto-uploader/uploads.
std::filesystem::path DefaultStateDir();
