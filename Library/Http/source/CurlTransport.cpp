#include "CurlTransport.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include <curl/curl.h>

#include "fmt/core.h"

namespace {
	// libcurl write callback - accumulates response body
	size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp)
	{
		const size_t total_size = size * nmemb;
		auto* body = static_cast<std::string*>(userp);
		body->append(contents, total_size);
		return total_size;
	}

	// libcurl header callback - captures response headers of the last response
	size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp)
	{
		const size_t total_size = size * nitems;
		auto* headers = static_cast<HttpHeaders*>(userp);

		std::string line(buffer, total_size);
		while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
			line.pop_back();

		if (line.empty())
			return total_size;

		// a new status line starts a new header block (e.g. after "100 Continue")
		if (line.rfind("HTTP/", 0) == 0) {
			headers->clear();
			return total_size;
		}

		const size_t colon_pos = line.find(':');
		if (colon_pos == std::string::npos)
			return total_size;

		std::string key = line.substr(0, colon_pos);
		std::string value = line.substr(colon_pos + 1);

		const size_t first = value.find_first_not_of(" \t");
		value = (first == std::string::npos) ? std::string() : value.substr(first);

		(*headers)[key] = value;

		return total_size;
	}

	int XferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
	{
		const auto* cancel = static_cast<const CancellationToken*>(clientp);
		return cancel->IsCancelled() ? 1 : 0;
	}

	struct SlistDeleter {
		void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
	};

	using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

	HttpTransport::Error MakeCurlError(CURLcode res, const char* errbuf)
	{
		HttpTransport::ErrorCode code;

		switch (res) {
		case CURLE_ABORTED_BY_CALLBACK:
			code = HttpTransport::ErrorCode::Cancelled;
			break;
		case CURLE_OPERATION_TIMEDOUT:
			code = HttpTransport::ErrorCode::DeadlineExceeded;
			break;
		default:
			code = HttpTransport::ErrorCode::Network;
			break;
		}

		const std::string detail = (errbuf && errbuf[0] != '\0') ? errbuf : curl_easy_strerror(res);

		return HttpTransport::Error{ code, fmt::format("curl error {}: {}", static_cast<int>(res), detail) };
	}
}

CurlTransport::CurlTransport()
{
	curl_handle_ = curl_easy_init();
	if (!curl_handle_)
		throw std::runtime_error("Failed to initialize libcurl");
}

CurlTransport::~CurlTransport()
{
	if (curl_handle_)
		curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
}

std::optional<HttpTransport::Error> CurlTransport::GlobalInit() noexcept
{
	const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (res != CURLE_OK)
		return Error{ ErrorCode::Network, fmt::format("curl_global_init failed: {}", curl_easy_strerror(res)) };

	return std::nullopt;
}

void CurlTransport::GlobalCleanup() noexcept
{
	curl_global_cleanup();
}

std::tuple<bool, HttpResponse, HttpTransport::Error>
CurlTransport::Perform(const HttpRequest& request, const CancellationToken& cancel) noexcept
{
	std::lock_guard<std::mutex> lock(curl_mutex_);

	if (cancel.IsCancelled())
		return { false, HttpResponse{}, Error{ ErrorCode::Cancelled, "cancelled before request was sent" } };

	CURL* curl = static_cast<CURL*>(curl_handle_);

	HttpResponse response;
	char errbuf[CURL_ERROR_SIZE] = { 0 };

	curl_easy_reset(curl);
	curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

	curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
	curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancel);

	if (request.timeout.count() > 0)
		curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

	if (request.stall_timeout.count() > 0) {
		// libcurl measures the stall window in whole seconds
		const auto seconds = std::chrono::ceil<std::chrono::seconds>(request.stall_timeout);
		curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, HttpRequest::kStallBytesPerSecond);
		curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(seconds.count()));
	}

	if (request.method == "POST") {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.empty() ? "" : request.body.data());
	} else if (request.method == "GET") {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	} else {
		curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
	}

	SlistPtr header_list;
	auto append_header = [&header_list](const std::string& line) {
		curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
		if (appended) {
			(void)header_list.release();
			header_list.reset(appended);
		}
	};

	for (const auto& [name, value] : request.headers)
		append_header(name + ": " + value);

	// no "Expect: 100-continue" round trip for chunk bodies
	append_header("Expect:");

	// a bare "Name:" line suppresses libcurl's form-urlencoded default
	if (request.method == "POST" && request.headers.find("Content-Type") == request.headers.end())
		append_header(request.body.empty() ? "Content-Type:" : "Content-Type: application/octet-stream");

	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

	const CURLcode res = curl_easy_perform(curl);

	// the list must stay alive until the handle stops referencing it
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);

	if (res != CURLE_OK)
		return { false, HttpResponse{}, MakeCurlError(res, errbuf) };

	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

	return { true, std::move(response), Error{} };
}
