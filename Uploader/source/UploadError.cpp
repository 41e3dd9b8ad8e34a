#include "UploadError.hpp"

#include "fmt/core.h"

bool UploadError::IsCancellation() const noexcept
{
    return kind == Kind::Cancelled || kind == Kind::DeadlineExceeded;
}

UploadError UploadError::FromTransport(const HttpTransport::Error& error, Kind fallback, std::uint64_t offset)
{
    Kind kind = fallback;

    switch (error.code) {
    case HttpTransport::ErrorCode::Cancelled:
        kind = Kind::Cancelled;
        break;
    case HttpTransport::ErrorCode::DeadlineExceeded:
        kind = Kind::DeadlineExceeded;
        break;
    case HttpTransport::ErrorCode::None:
    case HttpTransport::ErrorCode::Network:
        break;
    }

    return UploadError{ kind, 0, offset, error.message };
}

const char* UploadErrorKindToString(UploadError::Kind kind) noexcept
{
    switch (kind) {
    case UploadError::Kind::None:               return "None";
    case UploadError::Kind::InvalidFile:        return "InvalidFile";
    case UploadError::Kind::SessionStartFailed: return "SessionStartFailed";
    case UploadError::Kind::SessionExpired:     return "SessionExpired";
    case UploadError::Kind::ChunkMismatch:      return "ChunkMismatch";
    case UploadError::Kind::ChunkUploadFailed:  return "ChunkUploadFailed";
    case UploadError::Kind::UploadIncomplete:   return "UploadIncomplete";
    case UploadError::Kind::StateStoreFailed:   return "StateStoreFailed";
    case UploadError::Kind::RegistrationFailed: return "RegistrationFailed";
    case UploadError::Kind::Cancelled:          return "Cancelled";
    case UploadError::Kind::DeadlineExceeded:   return "DeadlineExceeded";
    }

    return "Unknown";
}

std::string UploadErrorToString(const UploadError& error)
{
    return fmt::format("{} (status={} offset={}): {}",
                       UploadErrorKindToString(error.kind), error.status, error.offset, error.message);
}
