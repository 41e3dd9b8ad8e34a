#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "HttpTransport.hpp"
#include "SessionStore.hpp"
#include "UploadError.hpp"
#include "UploaderConfig.hpp"

/**
 * UploadClient
 *
 * Uploads a batch of files with up to `jobs` concurrent orchestrators.
 * Each worker owns the transport the factory gives it; all workers share
 * one SessionStore. With register_items set, every token is exchanged for
 * a media item right after its upload.
 */
class UploadClient
{
public:
	using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

	struct Result {
		std::filesystem::path path;
		bool success = false;
		std::string upload_token;
		std::string media_item_id;
		UploadError error;
	};

public:
	UploadClient(const UploaderConfig& config, SessionStore& store, TransportFactory factory,
		     bool register_items, std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	// Results are in the order of `files`.
	std::vector<Result> UploadFiles(const std::vector<std::filesystem::path>& files, std::size_t jobs,
					const CancellationToken& cancel);

private:
	void RunWorker(const std::vector<std::filesystem::path>& files, std::vector<Result>& results,
		       std::size_t& next, std::mutex& next_mutex, const CancellationToken& cancel);

	Result UploadOne(HttpTransport& transport, const std::filesystem::path& path, const CancellationToken& cancel);

private:
	const UploaderConfig config_;
	SessionStore& store_;
	TransportFactory factory_;
	const bool register_items_;

	std::shared_ptr<spdlog::logger> logger_;
};
