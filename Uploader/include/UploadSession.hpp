#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "FileIdentity.hpp"

// In-memory view of one resumable upload. confirmed_bytes only moves on a
// server acknowledgment and never exceeds total_bytes.
struct UploadSession
{
	FileIdentity identity;
	std::string upload_url;
	std::uint64_t confirmed_bytes = 0;
	std::uint64_t total_bytes = 0;
	std::string content_type;
	std::chrono::system_clock::time_point created_at;
};
