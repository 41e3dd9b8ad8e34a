#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <tuple>

#include "CancellationToken.hpp"

// HTTP header names compare case-insensitively (HTTP/2 lowercases them).
struct CaseInsensitiveLess
{
	bool operator()(const std::string& lhs, const std::string& rhs) const noexcept;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest
{
	std::string method = "POST";
	std::string url;
	HttpHeaders headers;

	// Not owned; must outlive the Perform() call.
	std::string_view body;

	// Zero means no limit.
	std::chrono::milliseconds timeout{ 0 };

	// Aborts once the transfer moves fewer than kStallBytesPerSecond for
	// this long. Zero means no limit. Reported as DeadlineExceeded.
	std::chrono::milliseconds stall_timeout{ 0 };

	static constexpr long kStallBytesPerSecond = 1024;
};

struct HttpResponse
{
	long status = 0;
	HttpHeaders headers;
	std::string body;

	// Empty string when the header is absent.
	std::string Header(const std::string& name) const;
};

/**
 * HttpTransport
 *
 * Performs one blocking request per call. Implementations report
 * transport-level failures (no HTTP status was received) through Error;
 * any HTTP status, including 4xx/5xx, is a successful Perform().
 */
class HttpTransport
{
public:
	enum class ErrorCode {
		None = 0,
		Network,
		Cancelled,
		DeadlineExceeded
	};

	struct Error {
		ErrorCode code = ErrorCode::None;
		std::string message;
	};

public:
	virtual ~HttpTransport() = default;

public:
	virtual std::tuple<bool, HttpResponse, Error> Perform(const HttpRequest& request,
							       const CancellationToken& cancel) noexcept = 0;
};
