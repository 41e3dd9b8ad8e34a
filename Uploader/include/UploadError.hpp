#pragma once

#include <cstdint>
#include <string>

#include "HttpTransport.hpp"

struct UploadError
{
	enum class Kind {
		None = 0,
		InvalidFile,
		SessionStartFailed,
		SessionExpired,
		ChunkMismatch,
		ChunkUploadFailed,
		UploadIncomplete,
		StateStoreFailed,
		RegistrationFailed,
		Cancelled,
		DeadlineExceeded
	};

	Kind kind = Kind::None;
	long status = 0;		// HTTP status, 0 when no response was received
	std::uint64_t offset = 0;
	std::string message;

	bool IsCancellation() const noexcept;

	// Cancellation and deadline keep their own kinds; any other transport
	// failure becomes `fallback`.
	static UploadError FromTransport(const HttpTransport::Error& error, Kind fallback, std::uint64_t offset);
};

const char* UploadErrorKindToString(UploadError::Kind kind) noexcept;
std::string UploadErrorToString(const UploadError& error);
