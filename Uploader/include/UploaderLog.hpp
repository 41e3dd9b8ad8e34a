#pragma once

#include <memory>

#include <spdlog/spdlog.h>

inline constexpr const char* kUploaderLoggerName = "uploader";

// The named logger shared by the upload components; created on first use.
std::shared_ptr<spdlog::logger> GetUploaderLogger();
