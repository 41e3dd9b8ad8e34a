#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "FileIdentity.hpp"
#include "HttpTransport.hpp"
#include "MediaValidator.hpp"
#include "SessionStore.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "UploaderConfig.hpp"

// Opens a new resumable session on the server and persists it with
// confirmed_bytes = 0 before returning.
class SessionInitiator
{
public:
	SessionInitiator(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
			 std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	std::tuple<bool, UploadSession, UploadError> Start(const FileIdentity& identity, const MediaInfo& media,
							   const CancellationToken& cancel) noexcept;

private:
	HttpTransport& transport_;
	SessionStore& store_;

	const std::string endpoint_;
	const std::string access_token_;
	const std::chrono::milliseconds timeout_;

	std::shared_ptr<spdlog::logger> logger_;
};
