#include "UploadOrchestrator.hpp"

#include "fmt/core.h"

#include "FileIdentity.hpp"
#include "FileStream.hpp"
#include "ResumableProtocol.hpp"
#include "UploaderLog.hpp"

namespace fs = std::filesystem;

namespace {
    // True when the status query proved that this session will never hand
    // out a token: the server forgot it, or it answered "not final" although
    // every byte was confirmed.
    bool IsDeadSession(const UploadError& err, const UploadSession& session) noexcept
    {
        if (err.status == kHttpNotFound)
            return true;

        const bool answered = err.status == kHttpOk || err.status == kHttpResumeIncomplete;
        return answered && session.confirmed_bytes >= session.total_bytes;
    }
}

const char* UploadStateToString(UploadState state) noexcept
{
    switch (state) {
    case UploadState::Idle:             return "idle";
    case UploadState::Validating:       return "validating";
    case UploadState::SessionResolving: return "session_resolving";
    case UploadState::Transferring:     return "transferring";
    case UploadState::Finalizing:       return "finalizing";
    case UploadState::Done:             return "done";
    case UploadState::Failed:           return "failed";
    }

    return "unknown";
}

UploadOrchestrator::UploadOrchestrator(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
                                       std::shared_ptr<spdlog::logger> logger)
    : store_(store)
    , validator_(config.category, config.max_file_size)
    , initiator_(transport, store, config, logger)
    , transmitter_(transport, store, config, logger)
    , query_(transport, config, logger)
    , logger_(logger ? std::move(logger) : GetUploaderLogger())
{
}

std::tuple<bool, std::string, UploadError> UploadOrchestrator::Upload(const fs::path& path,
                                                                      const CancellationToken& cancel) noexcept
{
    state_ = UploadState::Idle;
    Transition(path, UploadState::Validating);

    auto [valid, media, verr] = validator_.Validate(path);
    if (!valid)
        return Fail(path, verr);

    auto [id_ok, identity, id_err] = MakeFileIdentityFrom(path);
    if (!id_ok)
        return Fail(path, UploadError{ UploadError::Kind::InvalidFile, 0, 0, "file identity: " + id_err.message });

    if (identity.size != media.size)
        return Fail(path, UploadError{ UploadError::Kind::InvalidFile, 0, 0, "file changed during validation" });

    Transition(path, UploadState::SessionResolving);

    UploadSession session;
    if (auto stored = store_.Load(identity)) {
        session = std::move(*stored);
        logger_->info("[upload] event=resume path={} confirmed={} total={}",
                      path.string(), session.confirmed_bytes, session.total_bytes);
    } else {
        auto [started, fresh, serr] = initiator_.Start(identity, media, cancel);
        if (!started)
            return Fail(path, serr);

        session = std::move(fresh);
    }

    Notify(session, false);

    Transition(path, UploadState::Transferring);

    FileStream stream(identity.path);
    if (auto err = stream.Open(std::ios::binary | std::ios::in))
        return Fail(path, UploadError{ UploadError::Kind::InvalidFile, 0, session.confirmed_bytes, err->message });

    auto [sent, token, terr] = transmitter_.Transfer(session, stream, cancel,
                                                     [this](const UploadSession& s) { Notify(s, false); });
    if (auto cerr = stream.Close())
        logger_->warn("[upload] event=close path={} message=\"{}\"", path.string(), cerr->message);

    if (!sent) {
        if (terr.kind == UploadError::Kind::SessionExpired || terr.kind == UploadError::Kind::ChunkMismatch)
            store_.Delete(identity);

        return Fail(path, terr);
    }

    std::string upload_token;
    if (token) {
        upload_token = std::move(*token);
    } else {
        logger_->info("[upload] event=query path={} confirmed={} total={}",
                      path.string(), session.confirmed_bytes, session.total_bytes);

        auto [queried, queried_token, qerr] = query_.Query(session, cancel);
        if (!queried) {
            if (IsDeadSession(qerr, session)) {
                logger_->warn("[upload] event=drop_session path={} status={} url={}",
                              path.string(), qerr.status, session.upload_url);
                store_.Delete(identity);
            }

            return Fail(path, qerr);
        }

        upload_token = std::move(queried_token);
    }

    Transition(path, UploadState::Finalizing);

    store_.Delete(identity);
    Notify(session, true);

    Transition(path, UploadState::Done);

    return { true, std::move(upload_token), UploadError{} };
}

void UploadOrchestrator::Transition(const fs::path& path, UploadState next)
{
    logger_->info("[upload] event=state path={} from={} to={}",
                  path.string(), UploadStateToString(state_), UploadStateToString(next));

    state_ = next;
}

void UploadOrchestrator::Notify(const UploadSession& session, bool complete)
{
    logger_->debug("[upload] event=offset path={} confirmed={} total={} complete={}",
                   session.identity.path.string(), session.confirmed_bytes, session.total_bytes, complete);

    if (observer_)
        observer_(UploadProgress{ session.identity.path, session.confirmed_bytes, session.total_bytes, complete });
}

std::tuple<bool, std::string, UploadError> UploadOrchestrator::Fail(const fs::path& path, UploadError error)
{
    Transition(path, UploadState::Failed);

    if (error.IsCancellation())
        logger_->warn("[upload] event=cancelled path={} kind={} offset={}",
                      path.string(), UploadErrorKindToString(error.kind), error.offset);
    else
        logger_->error("[upload] event=failed path={} kind={} status={} offset={} message=\"{}\"",
                       path.string(), UploadErrorKindToString(error.kind), error.status, error.offset, error.message);

    return { false, "", std::move(error) };
}
