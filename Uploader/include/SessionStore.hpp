#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "FileIdentity.hpp"
#include "UploadSession.hpp"

#include "upload_session.pb.h"

/**
 * SessionStore
 *
 * One JSON record per file under a state directory, named after the
 * identity's slot. Records survive process restarts; a record whose
 * identity no longer matches the file on disk is reported as absent.
 *
 * Save() is durable on return (temporary file, fsync, rename). Each
 * operation holds the store's mutex, so one instance may be shared by
 * concurrent uploads of different files.
 */
class SessionStore
{
public:
	struct Error {
		int code;
		std::string message;
	};

	static constexpr const char* kRecordExtension = ".upload";
	static constexpr std::chrono::hours kDefaultMaxAge{ 24 * 7 };

public:
	explicit SessionStore(std::filesystem::path directory,
			      std::shared_ptr<spdlog::logger> logger = nullptr);

	SessionStore(const SessionStore&) = delete;
	SessionStore& operator=(const SessionStore&) = delete;

public:
	std::optional<UploadSession> Load(const FileIdentity& identity) noexcept;
	std::optional<Error> Save(const UploadSession& session) noexcept;

	// Best-effort; failures are logged.
	void Delete(const FileIdentity& identity) noexcept;

	// Removes records last updated more than max_age ago. Returns the
	// number of records removed.
	std::size_t PurgeExpired(std::chrono::hours max_age = kDefaultMaxAge) noexcept;

	std::filesystem::path RecordPath(const FileIdentity& identity) const;

private:
	std::tuple<bool, UploadSessionRecord, Error> ReadRecord(const std::filesystem::path& path) const noexcept;
	std::optional<Error> WriteRecord(const std::filesystem::path& path, const UploadSessionRecord& record) noexcept;

private:
	const std::filesystem::path directory_;
	std::shared_ptr<spdlog::logger> logger_;
	std::mutex mutex_;
};
