#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include "HttpTransport.hpp"

/**
 * CurlTransport
 *
 * HttpTransport over a reused libcurl easy handle.
 *
 * - Requests never follow redirects: a 308 from a resumable upload
 *   endpoint is a protocol answer, not a redirect.
 * - request.timeout maps to CURLOPT_TIMEOUT_MS and is reported as
 *   ErrorCode::DeadlineExceeded.
 * - The cancellation token is polled from the transfer progress callback,
 *   so an in-flight request aborts within one callback interval.
 *
 * One handle serves one request at a time; concurrent uploads should own
 * separate transports.
 */
class CurlTransport final : public HttpTransport
{
public:
	// Throws std::runtime_error if libcurl cannot allocate a handle.
	CurlTransport();
	~CurlTransport() override;

	CurlTransport(const CurlTransport&) = delete;
	CurlTransport& operator=(const CurlTransport&) = delete;

public:
	std::tuple<bool, HttpResponse, Error> Perform(const HttpRequest& request,
						       const CancellationToken& cancel) noexcept override;

public:
	// Must run once before any thread creates a transport.
	static std::optional<Error> GlobalInit() noexcept;
	static void GlobalCleanup() noexcept;

private:
	void* curl_handle_ = nullptr;  // CURL*
	std::mutex curl_mutex_;
};
