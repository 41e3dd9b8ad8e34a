#include "FileIdentity.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "Hasher.hpp"

namespace fs = std::filesystem;

namespace {
    FileStream::Error ConvertHasherError(const Hasher::Error& e)
    {
        return FileStream::Error{ e.code, "hasher: " + e.message };
    }

    std::string SanitizeBasename(const fs::path& path)
    {
        std::string name = path.filename().string();
        std::replace_if(name.begin(), name.end(),
                        [](unsigned char c) { return !std::isalnum(c) && c != '.' && c != '-' && c != '_'; },
                        '_');

        if (name.empty() || name == "." || name == "..")
            name = "file";

        return name;
    }
}

std::tuple<bool, FileIdentity, FileStream::Error> MakeFileIdentityFrom(const fs::path& path) noexcept
{
    FileIdentity identity;

    std::error_code ec;
    const fs::path absolute = fs::absolute(path, ec);
    if (ec)
        return { false, identity, FileStream::Error{ ec.value(), "absolute path: " + ec.message() } };

    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec)
        return { false, identity, FileStream::Error{ ec.value(), "canonical path: " + ec.message() } };

    FileStream stream(canonical);
    if (auto err = stream.Open(std::ios::binary | std::ios::in))
        return { false, identity, *err };

    auto [size_ok, size, size_err] = stream.Size();
    if (!size_ok)
        return { false, identity, size_err };

    const std::size_t head_len = static_cast<std::size_t>(std::min<std::uint64_t>(size, kIdentitySampleSize));
    const std::uint64_t tail_offset = size > kIdentitySampleSize ? size - kIdentitySampleSize : 0;

    auto [head_ok, head, head_err] = stream.ReadAt(0, head_len);
    if (!head_ok)
        return { false, identity, head_err };

    auto [tail_ok, tail, tail_err] = stream.ReadAt(tail_offset, head_len);
    if (!tail_ok)
        return { false, identity, tail_err };


    const std::string canonical_str = canonical.string();

    Hasher hasher;
    if (auto herr = hasher.Initialize())
        return { false, identity, ConvertHasherError(*herr) };

    const std::string size_str = std::to_string(size);
    for (std::string_view part : { std::string_view(canonical_str), std::string_view(size_str),
                                   std::string_view(head), std::string_view(tail) }) {
        if (auto herr = hasher.Update(part))
            return { false, identity, ConvertHasherError(*herr) };
        if (auto herr = hasher.Update(std::string_view("\0", 1)))
            return { false, identity, ConvertHasherError(*herr) };
    }

    auto [key_ok, key_digest, key_err] = hasher.Finalize();
    if (!key_ok)
        return { false, identity, ConvertHasherError(key_err) };

    auto [path_ok, path_digest, path_err] = Hasher::Sha256(canonical_str);
    if (!path_ok)
        return { false, identity, ConvertHasherError(path_err) };

    identity.path = std::move(canonical);
    identity.size = size;
    identity.key = Hasher::ToHex(key_digest);
    identity.slot = SanitizeBasename(identity.path) + "-" + Hasher::ToHex(path_digest).substr(0, 12);

    return { true, std::move(identity), FileStream::Error{} };
}
