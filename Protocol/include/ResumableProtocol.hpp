#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "HttpTransport.hpp"

// Header names and framing of the resumable media upload protocol.

inline constexpr const char* kUploadProtocolHeader    = "X-Goog-Upload-Protocol";
inline constexpr const char* kUploadCommandHeader     = "X-Goog-Upload-Command";
inline constexpr const char* kUploadContentTypeHeader = "X-Goog-Upload-Content-Type";
inline constexpr const char* kUploadRawSizeHeader     = "X-Goog-Upload-Raw-Size";
inline constexpr const char* kUploadUrlHeader         = "X-Goog-Upload-URL";
inline constexpr const char* kUploadOffsetHeader      = "X-Goog-Upload-Offset";
inline constexpr const char* kUploadStatusHeader      = "X-Goog-Upload-Status";
inline constexpr const char* kContentRangeHeader      = "Content-Range";
inline constexpr const char* kRangeHeader             = "Range";

inline constexpr const char* kProtocolResumable = "resumable";
inline constexpr const char* kCommandStart      = "start";
inline constexpr const char* kCommandUpload     = "upload";
inline constexpr const char* kCommandQuery      = "query";
inline constexpr const char* kStatusFinal       = "final";

inline constexpr long kHttpOk                = 200;
inline constexpr long kHttpCreated           = 201;
inline constexpr long kHttpResumeIncomplete  = 308;
inline constexpr long kHttpNotFound          = 404;

// "bytes <offset>-<offset + length - 1>/<total>"; length must be non-zero.
std::string FormatContentRange(std::uint64_t offset, std::uint64_t length, std::uint64_t total);

// Parses a "Range: bytes=0-<last>" acknowledgment and returns the number of
// bytes the server holds (last + 1). nullopt if malformed or if the range
// does not start at byte 0.
std::optional<std::uint64_t> ParseConfirmedBytes(std::string_view range) noexcept;

// Headers every request carries: the bearer token when one is configured.
HttpHeaders MakeBaseHeaders(const std::string& access_token);

std::string JoinEndpoint(const std::string& endpoint, std::string_view path);
