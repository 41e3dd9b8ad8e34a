#include "MediaValidator.hpp"

#include <array>
#include <cstring>
#include <vector>

#include "fmt/core.h"

#include "FileStream.hpp"

namespace {
    constexpr const char* kOctetStream = "application/octet-stream";

    bool HasPrefix(std::string_view data, std::string_view prefix) noexcept
    {
        return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
    }

    bool HasAt(std::string_view data, std::size_t offset, std::string_view what) noexcept
    {
        return data.size() >= offset + what.size() && data.compare(offset, what.size(), what) == 0;
    }

    std::uint32_t ReadBigEndian32(std::string_view data, std::size_t offset) noexcept
    {
        const auto* p = reinterpret_cast<const unsigned char*>(data.data() + offset);
        return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
             | (static_cast<std::uint32_t>(p[2]) << 8)  |  static_cast<std::uint32_t>(p[3]);
    }

    const char* ClassifyBrand(std::string_view brand) noexcept
    {
        if (brand == "qt  ")
            return "video/quicktime";

        if (brand == "heic" || brand == "heix" || brand == "heim" || brand == "heis")
            return "image/heic";
        if (brand == "mif1" || brand == "msf1")
            return "image/heif";
        if (brand == "avif")
            return "image/avif";

        if (HasPrefix(brand, "3gp") || HasPrefix(brand, "3g2"))
            return "video/3gpp";

        if (HasPrefix(brand, "mp4") || HasPrefix(brand, "iso") || brand == "avc1"
            || HasPrefix(brand, "M4V") || brand == "f4v " || brand == "MSNV" || brand == "dash")
            return "video/mp4";

        return nullptr;
    }

    // ISO base media file: [size:4]["ftyp"][major:4][minor:4][compatible:4]...
    const char* SniffFtyp(std::string_view data) noexcept
    {
        if (data.size() < 12 || !HasAt(data, 4, "ftyp"))
            return nullptr;

        const std::uint32_t box_size = ReadBigEndian32(data, 0);
        if (box_size < 12 || box_size % 4 != 0)
            return nullptr;

        const std::size_t end = std::min<std::size_t>(box_size, data.size());

        std::vector<std::string_view> brands;
        brands.push_back(data.substr(8, 4));
        for (std::size_t pos = 16; pos + 4 <= end; pos += 4)
            brands.push_back(data.substr(pos, 4));

        for (const auto& brand : brands) {
            if (const char* mime = ClassifyBrand(brand))
                return mime;
        }

        return nullptr;
    }

    // MPEG transport stream, plain (188) or with the 4-byte timestamp
    // prefix used by AVCHD .mts/.m2ts (192)
    bool SniffTransportStream(std::string_view data) noexcept
    {
        constexpr char kSync = 0x47;

        if (data.size() > 188 && data[0] == kSync && data[188] == kSync)
            return true;
        if (data.size() > 196 && data[4] == kSync && data[196] == kSync)
            return true;

        return false;
    }
}

const char* MediaCategoryToString(MediaCategory category) noexcept
{
    switch (category) {
    case MediaCategory::Video: return "video";
    case MediaCategory::Photo: return "photo";
    }

    return "unknown";
}

MediaValidator::MediaValidator(MediaCategory category, std::uint64_t max_size)
    : category_(category)
    , max_size_(max_size != 0 ? max_size : MaxSizeFor(category))
{
}

std::uint64_t MediaValidator::MaxSizeFor(MediaCategory category) noexcept
{
    switch (category) {
    case MediaCategory::Video: return kMaxVideoSize;
    case MediaCategory::Photo: return kMaxPhotoSize;
    }

    return kMaxVideoSize;
}

std::tuple<bool, MediaInfo, UploadError> MediaValidator::Validate(const std::filesystem::path& path) const noexcept
{
    auto invalid = [](std::string message) {
        return UploadError{ UploadError::Kind::InvalidFile, 0, 0, std::move(message) };
    };

    FileStream stream(path);
    if (auto err = stream.Open(std::ios::binary | std::ios::in))
        return { false, MediaInfo{}, invalid("cannot open file: " + err->message) };

    auto [size_ok, size, size_err] = stream.Size();
    if (!size_ok)
        return { false, MediaInfo{}, invalid("cannot stat file: " + size_err.message) };

    if (size < kMinSize || size > max_size_)
        return { false, MediaInfo{}, invalid(fmt::format("size {} is outside allowed range {}-{}",
                                                         size, kMinSize, max_size_)) };

    std::string header(static_cast<std::size_t>(std::min<std::uint64_t>(size, kSniffLength)), '\0');
    auto [read_ok, n, read_err] = stream.Read(header);
    if (!read_ok)
        return { false, MediaInfo{}, invalid("cannot read file header: " + read_err.message) };

    header.resize(static_cast<std::size_t>(n));

    std::string content_type = DetectContentType(header);

    const char* expected_prefix = category_ == MediaCategory::Video ? "video/" : "image/";
    if (!HasPrefix(content_type, expected_prefix))
        return { false, MediaInfo{}, invalid(fmt::format("invalid MIME type {} for {} upload",
                                                         content_type, MediaCategoryToString(category_))) };

    return { true, MediaInfo{ size, std::move(content_type) }, UploadError{} };
}

std::string MediaValidator::DetectContentType(std::string_view data)
{
    if (const char* mime = SniffFtyp(data))
        return mime;

    if (HasPrefix(data, "\x1A\x45\xDF\xA3"))
        return "video/webm";

    if (HasPrefix(data, "RIFF") && HasAt(data, 8, "AVI "))
        return "video/avi";

    if (HasPrefix(data, "RIFF") && HasAt(data, 8, "WEBP"))
        return "image/webp";

    if (HasPrefix(data, std::string_view("\x00\x00\x01\xBA", 4)) || HasPrefix(data, std::string_view("\x00\x00\x01\xB3", 4)))
        return "video/mpeg";

    if (SniffTransportStream(data))
        return "video/mp2t";

    if (HasPrefix(data, "\xFF\xD8\xFF"))
        return "image/jpeg";

    if (HasPrefix(data, "\x89PNG\r\n\x1A\n"))
        return "image/png";

    if (HasPrefix(data, "GIF87a") || HasPrefix(data, "GIF89a"))
        return "image/gif";

    if (HasPrefix(data, std::string_view("II*\x00", 4)) || HasPrefix(data, std::string_view("MM\x00*", 4)))
        return "image/tiff";

    if (HasPrefix(data, "BM"))
        return "image/bmp";

    return kOctetStream;
}
