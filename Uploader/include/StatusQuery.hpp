#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "HttpTransport.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "UploaderConfig.hpp"

// Asks the server for the state of a session. Succeeds only when the
// server reports the upload final and returns its token; everything else
// is UploadIncomplete.
class StatusQuery
{
public:
	StatusQuery(HttpTransport& transport, const UploaderConfig& config,
		    std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	std::tuple<bool, std::string, UploadError> Query(const UploadSession& session,
							 const CancellationToken& cancel) noexcept;

private:
	HttpTransport& transport_;

	const std::string access_token_;
	const std::chrono::milliseconds timeout_;

	std::shared_ptr<spdlog::logger> logger_;
};
