#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "HttpTransport.hpp"
#include "UploadError.hpp"
#include "UploaderConfig.hpp"

#include "media_item.pb.h"

// Exchanges an upload token for a media item (mediaItems:batchCreate).
class MediaItemClient
{
public:
	MediaItemClient(HttpTransport& transport, const UploaderConfig& config,
			std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	std::tuple<bool, MediaItem, UploadError> Create(const std::string& upload_token, const std::string& file_name,
							const CancellationToken& cancel) noexcept;

private:
	HttpTransport& transport_;

	const std::string endpoint_;
	const std::string access_token_;
	const std::chrono::milliseconds timeout_;

	std::shared_ptr<spdlog::logger> logger_;
};
