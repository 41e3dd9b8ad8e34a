#include "FileStream.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <system_error>

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
{
}

bool FileStream::IsOpen() const noexcept
{
    return stream_.is_open();
}

std::optional<FileStream::Error> FileStream::Open(std::ios::openmode mode) noexcept
{
    if (stream_.is_open())
        stream_.close();

    stream_.clear();

    errno = 0;
    stream_.open(path_, mode);
    if (!stream_.is_open() || stream_.fail() || stream_.bad())
        return StreamError("open");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Write(std::string_view data) noexcept
{
    if (!stream_.is_open())
        return Error{-1, "write: stream is not open"};

    if (data.empty())
        return std::nullopt;

    errno = 0;
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));

    if (stream_.bad() || stream_.fail())
        return StreamError("write");

    return std::nullopt;
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(std::string& data) noexcept
{
    if (data.empty())
        return { true, 0, Error{} };

    return ReadInto(data.data(), static_cast<std::streamsize>(data.size()));
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::ReadInto(char* data, std::streamsize size) noexcept
{
    if (!stream_.is_open())
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size < 0)
        return { false, 0, Error{ -1, "read: invalid size"} };

    if (size == 0)
        return { true, 0, Error{} };

    if (!data)
        return { false, 0, Error{ -1, "read: null buffer with non-zero size"} };

    errno = 0;
    stream_.read(data, size);
    const std::streamsize n = stream_.gcount();

    if (stream_.bad())
        return { false, n, StreamError("read") };

    // a short read at end of file sets failbit together with eofbit
    if (stream_.eof()) {
        stream_.clear();
        return { true, n, Error{} };
    }

    if (stream_.fail())
        return { false, n, StreamError("read") };

    return { true, n, Error{} };
}

std::optional<FileStream::Error> FileStream::Seek(std::uint64_t offset) noexcept
{
    if (!stream_.is_open())
        return Error{ -1, "seek: stream is not open" };

    stream_.clear();

    errno = 0;
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (stream_.fail() || stream_.bad())
        return StreamError("seek");

    return std::nullopt;
}

std::tuple<bool, std::string, FileStream::Error> FileStream::ReadAt(std::uint64_t offset, std::size_t length) noexcept
{
    std::string data;

    if (auto err = Seek(offset))
        return { false, std::move(data), *err };

    try {
        data.resize(length);
    }
    catch (const std::exception& e) {
        return { false, std::string{}, Error{ -1, std::string("read: ") + e.what() + ", path=" + path_.string() } };
    }

    auto [ok, n, err] = ReadInto(data.data(), static_cast<std::streamsize>(length));
    if (!ok)
        return { false, std::string{}, err };

    data.resize(static_cast<std::size_t>(n));
    return { true, std::move(data), Error{} };
}

std::tuple<bool, std::uint64_t, FileStream::Error> FileStream::Size() const noexcept
{
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path_, ec);
    if (ec)
        return { false, 0, Error{ ec.value(), "size: " + ec.message() + ", path=" + path_.string() } };

    return { true, static_cast<std::uint64_t>(size), Error{} };
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (!stream_.is_open())
        return std::nullopt;

    errno = 0;
    stream_.close();

    if (stream_.fail() || stream_.bad())
        return StreamError("close");

    return std::nullopt;
}

FileStream::Error FileStream::StreamError(const char* context) const noexcept
{
    const auto state = stream_.rdstate();

    std::ostringstream oss;
    oss << (context ? context : "stream")
        << ": iostate=0x" << std::hex << static_cast<unsigned int>(state);

    if ((state & std::ios::badbit) != 0)  oss << " (badbit)";
    if ((state & std::ios::failbit) != 0) oss << " (failbit)";
    if ((state & std::ios::eofbit) != 0)  oss << " (eofbit)";

    if (errno != 0)
        oss << ", errno=" << std::dec << errno << " (" << std::strerror(errno) << ")";

    oss << ", path=" << path_.string();

    return Error{ static_cast<int>(state), oss.str() };
}
