#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "openssl/evp.h"

// Incremental SHA-256 over OpenSSL EVP, used for file identities.
class Hasher
{
public:
	using Digest = std::array<std::uint8_t, 32>;

	struct Error {
		int code = 0;
		std::string message;
	};

public:
	Hasher() = default;

	Hasher(const Hasher&) = delete;
	Hasher& operator=(const Hasher&) = delete;

public:
	// Starts a new digest; may be called again to reuse the context.
	std::optional<Error> Initialize() noexcept;
	std::optional<Error> Update(std::string_view data) noexcept;
	std::tuple<bool, Digest, Error> Finalize() noexcept;

public:
	static std::tuple<bool, Digest, Error> Sha256(std::string_view data) noexcept;
	static std::string ToHex(const Digest& digest);

private:
	struct ContextDeleter {
		void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
	};

	std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
};
