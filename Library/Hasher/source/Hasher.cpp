#include "Hasher.hpp"

#include "openssl/err.h"

namespace {
    Hasher::Error OpenSslError(const char* call) noexcept
    {
        const unsigned long code = ERR_get_error();

        char reason[256] = "no queued error";
        if (code != 0)
            ERR_error_string_n(code, reason, sizeof(reason));

        return Hasher::Error{ static_cast<int>(code), std::string("sha256: ") + call + ": " + reason };
    }
}

std::optional<Hasher::Error> Hasher::Initialize() noexcept
{
    if (!ctx_) {
        ctx_.reset(EVP_MD_CTX_new());
        if (!ctx_)
            return OpenSslError("EVP_MD_CTX_new");
    }

    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
        return OpenSslError("EVP_DigestInit_ex");

    return std::nullopt;
}

std::optional<Hasher::Error> Hasher::Update(std::string_view data) noexcept
{
    if (!ctx_)
        return Error{ -1, "sha256: update before initialize" };

    if (data.empty())
        return std::nullopt;

    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
        return OpenSslError("EVP_DigestUpdate");

    return std::nullopt;
}

std::tuple<bool, Hasher::Digest, Hasher::Error> Hasher::Finalize() noexcept
{
    Digest digest{};

    if (!ctx_)
        return { false, digest, Error{ -1, "sha256: finalize before initialize" } };

    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1)
        return { false, digest, OpenSslError("EVP_DigestFinal_ex") };

    if (length != digest.size())
        return { false, digest, Error{ -1, "sha256: unexpected digest length " + std::to_string(length) } };

    return { true, digest, Error{} };
}

std::tuple<bool, Hasher::Digest, Hasher::Error> Hasher::Sha256(std::string_view data) noexcept
{
    Hasher hasher;

    if (auto err = hasher.Initialize())
        return { false, Digest{}, *err };

    if (auto err = hasher.Update(data))
        return { false, Digest{}, *err };

    return hasher.Finalize();
}

std::string Hasher::ToHex(const Digest& digest)
{
    constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0xF]);
    }

    return out;
}
