#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Binary file access for media payloads and session records.
// Uploads read the file in random-access slices; records are written whole.
class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);
	~FileStream() = default;

	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;

public:
	bool IsOpen() const noexcept;

	std::optional<Error> Open(std::ios::openmode mode) noexcept;
	std::optional<Error> Close() noexcept;

	std::optional<Error> Write(std::string_view data) noexcept;

	// Fills `data` from the current position; a short count means end of file.
	std::tuple<bool, std::streamsize, Error> Read(std::string& data) noexcept;

	// Positions the read cursor at an absolute offset from the start of the file.
	std::optional<Error> Seek(std::uint64_t offset) noexcept;

	// Reads up to `length` bytes starting at `offset`. The result is shorter
	// than `length` only when the file ends first.
	std::tuple<bool, std::string, Error> ReadAt(std::uint64_t offset, std::size_t length) noexcept;

	std::tuple<bool, std::uint64_t, Error> Size() const noexcept;

private:
	std::tuple<bool, std::streamsize, Error> ReadInto(char* data, std::streamsize size) noexcept;
	Error StreamError(const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	std::fstream stream_;
};
