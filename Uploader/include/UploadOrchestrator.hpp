#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "CancellationToken.hpp"
#include "ChunkTransmitter.hpp"
#include "HttpTransport.hpp"
#include "MediaValidator.hpp"
#include "SessionInitiator.hpp"
#include "SessionStore.hpp"
#include "StatusQuery.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "UploaderConfig.hpp"

enum class UploadState {
	Idle,
	Validating,
	SessionResolving,
	Transferring,
	Finalizing,
	Done,
	Failed
};

const char* UploadStateToString(UploadState state) noexcept;

struct UploadProgress
{
	std::filesystem::path path;
	std::uint64_t confirmed_bytes = 0;
	std::uint64_t total_bytes = 0;
	bool complete = false;
};

using ProgressObserver = std::function<void(const UploadProgress&)>;

/**
 * UploadOrchestrator
 *
 * Validating -> SessionResolving -> Transferring -> Finalizing -> Done,
 * or Failed from any of them.
 *
 * A persisted session that still matches the file is resumed; otherwise
 * a new one is started. SessionExpired and ChunkMismatch drop the record,
 * every other failure leaves it for the next run.
 *
 * One instance runs one upload at a time. Give each concurrent upload its
 * own orchestrator and transport; the SessionStore may be shared.
 */
class UploadOrchestrator
{
public:
	UploadOrchestrator(HttpTransport& transport, SessionStore& store, const UploaderConfig& config,
			   std::shared_ptr<spdlog::logger> logger = nullptr);

	UploadOrchestrator(const UploadOrchestrator&) = delete;
	UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

public:
	// Returns the upload token.
	std::tuple<bool, std::string, UploadError> Upload(const std::filesystem::path& path,
							  const CancellationToken& cancel) noexcept;

	void SetProgressObserver(ProgressObserver observer) { observer_ = std::move(observer); }
	UploadState GetState() const noexcept { return state_; }

private:
	void Transition(const std::filesystem::path& path, UploadState next);
	void Notify(const UploadSession& session, bool complete);

	std::tuple<bool, std::string, UploadError> Fail(const std::filesystem::path& path, UploadError error);

private:
	SessionStore& store_;

	MediaValidator validator_;
	SessionInitiator initiator_;
	ChunkTransmitter transmitter_;
	StatusQuery query_;

	ProgressObserver observer_;
	UploadState state_ = UploadState::Idle;

	std::shared_ptr<spdlog::logger> logger_;
};
