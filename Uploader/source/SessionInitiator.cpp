#include "SessionInitiator.hpp"

#include "fmt/core.h"

#include "ResumableProtocol.hpp"
#include "UploaderLog.hpp"

namespace {
    UploadError MakeStartErr(long status, std::string message)
    {
        return UploadError{ UploadError::Kind::SessionStartFailed, status, 0, std::move(message) };
    }
}

SessionInitiator::SessionInitiator(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
                                   std::shared_ptr<spdlog::logger> logger)
    : transport_(transport)
    , store_(store)
    , endpoint_(config.endpoint)
    , access_token_(config.access_token)
    , timeout_(config.request_timeout)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::tuple<bool, UploadSession, UploadError> SessionInitiator::Start(const FileIdentity& identity, const MediaInfo& media,
                                                                     const CancellationToken& cancel) noexcept
{
    HttpRequest request;
    request.url = JoinEndpoint(endpoint_, "uploads");
    request.headers = MakeBaseHeaders(access_token_);
    request.headers[kUploadProtocolHeader] = kProtocolResumable;
    request.headers[kUploadCommandHeader] = kCommandStart;
    request.headers[kUploadContentTypeHeader] = media.content_type;
    request.headers[kUploadRawSizeHeader] = std::to_string(identity.size);
    request.timeout = timeout_;

    auto [ok, response, err] = transport_.Perform(request, cancel);
    if (!ok)
        return { false, UploadSession{}, UploadError::FromTransport(err, UploadError::Kind::SessionStartFailed, 0) };

    if (response.status != kHttpOk)
        return { false, UploadSession{}, MakeStartErr(response.status,
                                                      fmt::format("unexpected status {}: {}", response.status, response.body)) };

    std::string upload_url = response.Header(kUploadUrlHeader);
    if (upload_url.empty())
        return { false, UploadSession{}, MakeStartErr(response.status, "response carries no upload URL") };

    UploadSession session;
    session.identity = identity;
    session.upload_url = std::move(upload_url);
    session.confirmed_bytes = 0;
    session.total_bytes = identity.size;
    session.content_type = media.content_type;
    session.created_at = std::chrono::system_clock::now();

    if (auto serr = store_.Save(session))
        return { false, UploadSession{}, UploadError{ UploadError::Kind::StateStoreFailed, 0, 0,
                                                      "persist new session: " + serr->message } };

    logger_->info("[session] event=start path={} size={} content_type={}",
                  identity.path.string(), identity.size, media.content_type);

    return { true, std::move(session), UploadError{} };
}
