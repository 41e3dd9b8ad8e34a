#include "ResumableProtocol.hpp"

#include <charconv>
#include <limits>

#include "fmt/core.h"

namespace {
    std::optional<std::uint64_t> ParseUnsigned(std::string_view text) noexcept
    {
        if (text.empty())
            return std::nullopt;

        std::uint64_t value = 0;
        const char* first = text.data();
        const char* last = text.data() + text.size();

        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last)
            return std::nullopt;

        return value;
    }

    std::string_view Trim(std::string_view text) noexcept
    {
        const auto first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};

        const auto last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }
}

std::string FormatContentRange(std::uint64_t offset, std::uint64_t length, std::uint64_t total)
{
    return fmt::format("bytes {}-{}/{}", offset, offset + length - 1, total);
}

std::optional<std::uint64_t> ParseConfirmedBytes(std::string_view range) noexcept
{
    range = Trim(range);

    constexpr std::string_view kPrefix = "bytes=";
    if (range.substr(0, kPrefix.size()) != kPrefix)
        return std::nullopt;

    range.remove_prefix(kPrefix.size());

    const auto dash = range.find('-');
    if (dash == std::string_view::npos)
        return std::nullopt;

    const auto first = ParseUnsigned(Trim(range.substr(0, dash)));
    const auto last = ParseUnsigned(Trim(range.substr(dash + 1)));
    // The server only ever attests a prefix of the upload.
    if (!first || !last || *first != 0)
        return std::nullopt;

    if (*last == std::numeric_limits<std::uint64_t>::max())
        return std::nullopt;

    return *last + 1;
}

HttpHeaders MakeBaseHeaders(const std::string& access_token)
{
    HttpHeaders headers;

    if (!access_token.empty())
        headers["Authorization"] = "Bearer " + access_token;

    return headers;
}

std::string JoinEndpoint(const std::string& endpoint, std::string_view path)
{
    std::string base = endpoint;
    while (!base.empty() && base.back() == '/')
        base.pop_back();

    if (path.empty() || path.front() != '/')
        base += '/';

    base.append(path.data(), path.size());
    return base;
}
