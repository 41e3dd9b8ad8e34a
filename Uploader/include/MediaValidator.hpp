#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>

#include "UploadError.hpp"

enum class MediaCategory {
	Video,
	Photo
};

const char* MediaCategoryToString(MediaCategory category) noexcept;

struct MediaInfo
{
	std::uint64_t size = 0;
	std::string content_type;
};

class MediaValidator
{
public:
	static constexpr std::uint64_t kMinSize = 1;
	static constexpr std::uint64_t kMaxVideoSize = 10ULL * 1024 * 1024 * 1024;
	static constexpr std::uint64_t kMaxPhotoSize = 200ULL * 1024 * 1024;
	static constexpr std::size_t kSniffLength = 512;

public:
	// max_size == 0 selects the service ceiling for the category.
	explicit MediaValidator(MediaCategory category, std::uint64_t max_size = 0);

public:
	std::tuple<bool, MediaInfo, UploadError> Validate(const std::filesystem::path& path) const noexcept;

	std::uint64_t GetMaxSize() const noexcept { return max_size_; }

public:
	// MIME type from leading bytes; "application/octet-stream" if unknown.
	static std::string DetectContentType(std::string_view header);
	static std::uint64_t MaxSizeFor(MediaCategory category) noexcept;

private:
	MediaCategory category_;
	std::uint64_t max_size_;
};
