#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "FileStream.hpp"
#include "HttpTransport.hpp"
#include "SessionStore.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "UploaderConfig.hpp"

struct ChunkResult
{
	bool final = false;
	std::uint64_t confirmed_bytes = 0;
	std::string token;		// set when final
};

/**
 * ChunkTransmitter
 *
 * SendChunk() posts one slice starting at session.confirmed_bytes and
 * interprets the reply:
 *
 *   308 + "Range: bytes=0-<end>"  -> confirmed_bytes = end + 1
 *   200 / 201 + body              -> final, body is the upload token
 *   404                           -> SessionExpired
 *   anything else                 -> ChunkUploadFailed
 *
 * A 308 that does not advance the offset, overshoots the total, or lacks
 * a parsable Range is a ChunkMismatch.
 *
 * Transfer() drives SendChunk() until the server holds every byte,
 * persisting the session after each acknowledgment. It re-reads from the
 * confirmed offset each round, so an unconfirmed tail is sent again.
 */
class ChunkTransmitter
{
public:
	using ConfirmedCallback = std::function<void(const UploadSession&)>;

public:
	ChunkTransmitter(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
			 std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	std::tuple<bool, ChunkResult, UploadError> SendChunk(const UploadSession& session, std::string_view chunk,
							     const CancellationToken& cancel) noexcept;

	// The optional holds the token when the final chunk returned one; it is
	// empty if the server confirmed every byte without sending a token.
	std::tuple<bool, std::optional<std::string>, UploadError> Transfer(UploadSession& session, FileStream& stream,
									  const CancellationToken& cancel,
									  const ConfirmedCallback& on_confirmed = nullptr) noexcept;

private:
	HttpTransport& transport_;
	SessionStore& store_;

	const std::string access_token_;
	const std::size_t chunk_size_;
	const std::chrono::milliseconds stall_timeout_;

	std::shared_ptr<spdlog::logger> logger_;
};
