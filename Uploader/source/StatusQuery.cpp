#include "StatusQuery.hpp"

#include "fmt/core.h"

#include "ResumableProtocol.hpp"
#include "UploaderLog.hpp"

StatusQuery::StatusQuery(HttpTransport& transport, const UploaderConfig& config,
                         std::shared_ptr<spdlog::logger> logger)
    : transport_(transport)
    , access_token_(config.access_token)
    , timeout_(config.request_timeout)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::tuple<bool, std::string, UploadError> StatusQuery::Query(const UploadSession& session,
                                                              const CancellationToken& cancel) noexcept
{
    const std::uint64_t offset = session.confirmed_bytes;

    HttpRequest request;
    request.url = session.upload_url;
    request.headers = MakeBaseHeaders(access_token_);
    request.headers[kUploadCommandHeader] = kCommandQuery;
    request.timeout = timeout_;

    auto [ok, response, err] = transport_.Perform(request, cancel);
    if (!ok)
        return { false, "", UploadError::FromTransport(err, UploadError::Kind::UploadIncomplete, offset) };

    const std::string upload_status = response.Header(kUploadStatusHeader);

    logger_->info("[query] event=status path={} code={} upload_status={}",
                  session.identity.path.string(), response.status, upload_status.empty() ? "-" : upload_status);

    const bool status_ok = response.status == kHttpOk || response.status == kHttpResumeIncomplete;
    if (!status_ok || upload_status != kStatusFinal || response.body.empty())
        return { false, "", UploadError{ UploadError::Kind::UploadIncomplete, response.status, offset,
                                         fmt::format("server reports upload status \"{}\"", upload_status) } };

    return { true, std::move(response.body), UploadError{} };
}
