#include "ChunkTransmitter.hpp"

#include <algorithm>

#include "fmt/core.h"

#include "ResumableProtocol.hpp"
#include "UploaderLog.hpp"

namespace {
    UploadError MakeErr(UploadError::Kind kind, long status, std::uint64_t offset, std::string message)
    {
        return UploadError{ kind, status, offset, std::move(message) };
    }
}

ChunkTransmitter::ChunkTransmitter(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
                                   std::shared_ptr<spdlog::logger> logger)
    : transport_(transport)
    , store_(store)
    , access_token_(config.access_token)
    , chunk_size_(std::max<std::size_t>(config.chunk_size, 1))
    , stall_timeout_(config.chunk_timeout)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::tuple<bool, ChunkResult, UploadError> ChunkTransmitter::SendChunk(const UploadSession& session, std::string_view chunk,
                                                                       const CancellationToken& cancel) noexcept
{
    const std::uint64_t offset = session.confirmed_bytes;

    if (chunk.empty() || offset + chunk.size() > session.total_bytes)
        return { false, ChunkResult{}, MakeErr(UploadError::Kind::ChunkUploadFailed, 0, offset,
                                               fmt::format("chunk of {} bytes does not fit at offset {} of {}",
                                                           chunk.size(), offset, session.total_bytes)) };

    HttpRequest request;
    request.url = session.upload_url;
    request.headers = MakeBaseHeaders(access_token_);
    request.headers[kUploadCommandHeader] = kCommandUpload;
    request.headers[kUploadOffsetHeader] = std::to_string(offset);
    request.headers[kContentRangeHeader] = FormatContentRange(offset, chunk.size(), session.total_bytes);
    request.body = chunk;
    request.stall_timeout = stall_timeout_;

    logger_->debug("[chunk] event=send path={} offset={} length={} total={}",
                   session.identity.path.string(), offset, chunk.size(), session.total_bytes);

    auto [ok, response, err] = transport_.Perform(request, cancel);
    if (!ok)
        return { false, ChunkResult{}, UploadError::FromTransport(err, UploadError::Kind::ChunkUploadFailed, offset) };

    switch (response.status) {
    case kHttpResumeIncomplete: {
        const std::string range = response.Header(kRangeHeader);
        const auto server = ParseConfirmedBytes(range);
        if (!server)
            return { false, ChunkResult{}, MakeErr(UploadError::Kind::ChunkMismatch, response.status, offset,
                                                   fmt::format("unparsable range acknowledgment \"{}\"", range)) };

        if (*server <= offset || *server > session.total_bytes)
            return { false, ChunkResult{}, MakeErr(UploadError::Kind::ChunkMismatch, response.status, offset,
                                                   fmt::format("server confirmed {} bytes, client holds {} of {}",
                                                               *server, offset, session.total_bytes)) };

        return { true, ChunkResult{ false, *server, "" }, UploadError{} };
    }

    case kHttpOk:
    case kHttpCreated:
        if (response.body.empty())
            return { false, ChunkResult{}, MakeErr(UploadError::Kind::ChunkUploadFailed, response.status, offset,
                                                   "final response carries no upload token") };

        return { true, ChunkResult{ true, session.total_bytes, std::move(response.body) }, UploadError{} };

    case kHttpNotFound:
        return { false, ChunkResult{}, MakeErr(UploadError::Kind::SessionExpired, response.status, offset,
                                               "upload session no longer exists") };

    default:
        return { false, ChunkResult{}, MakeErr(UploadError::Kind::ChunkUploadFailed, response.status, offset,
                                               fmt::format("unexpected status {}: {}", response.status, response.body)) };
    }
}

std::tuple<bool, std::optional<std::string>, UploadError> ChunkTransmitter::Transfer(UploadSession& session, FileStream& stream,
                                                                                     const CancellationToken& cancel,
                                                                                     const ConfirmedCallback& on_confirmed) noexcept
{
    while (session.confirmed_bytes < session.total_bytes) {
        const std::uint64_t offset = session.confirmed_bytes;

        if (cancel.IsCancelled())
            return { false, std::nullopt, MakeErr(UploadError::Kind::Cancelled, 0, offset, "upload cancelled") };

        const std::size_t length = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, session.total_bytes - offset));

        auto [read_ok, chunk, read_err] = stream.ReadAt(offset, length);
        if (!read_ok)
            return { false, std::nullopt, MakeErr(UploadError::Kind::ChunkUploadFailed, 0, offset, read_err.message) };

        if (chunk.size() != length)
            return { false, std::nullopt, MakeErr(UploadError::Kind::ChunkUploadFailed, 0, offset,
                                                  fmt::format("short read: {} of {} bytes", chunk.size(), length)) };

        auto [ok, result, err] = SendChunk(session, chunk, cancel);
        if (!ok)
            return { false, std::nullopt, err };

        session.confirmed_bytes = result.confirmed_bytes;

        if (result.final) {
            // The token is already in hand; a stale record only costs a
            // status query on the next run.
            if (auto serr = store_.Save(session))
                logger_->warn("[chunk] event=persist_failed path={} error=\"{}\"",
                              session.identity.path.string(), serr->message);

            if (on_confirmed)
                on_confirmed(session);

            return { true, std::move(result.token), UploadError{} };
        }

        if (auto serr = store_.Save(session))
            return { false, std::nullopt, MakeErr(UploadError::Kind::StateStoreFailed, 0, session.confirmed_bytes,
                                                  "persist confirmed offset: " + serr->message) };

        logger_->debug("[chunk] event=ack path={} confirmed={} total={}",
                       session.identity.path.string(), session.confirmed_bytes, session.total_bytes);

        if (on_confirmed)
            on_confirmed(session);
    }

    return { true, std::nullopt, UploadError{} };
}
