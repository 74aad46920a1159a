// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Digest.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"
#include "openssl/Unique.hxx"

std::size_t
DigestSize(DigestAlgorithm a) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA256:
		return 32;

	case DigestAlgorithm::SHA384:
		return 48;

	case DigestAlgorithm::SHA512:
		return 64;
	}

	return 0;
}

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest)
{
	return Digest(a, {src}, dest);
}

std::size_t
Digest(DigestAlgorithm a,
       std::initializer_list<std::span<const std::byte>> src,
       std::byte *dest)
{
	const UniqueEVP_MD_CTX ctx{EVP_MD_CTX_new()};
	if (!ctx)
		throw SslError{"EVP_MD_CTX_new() failed"};

	if (!EVP_DigestInit_ex(ctx.get(), ToEvpMD(a), nullptr))
		throw SslError{"EVP_DigestInit_ex() failed"};

	for (const auto i : src)
		if (!EVP_DigestUpdate(ctx.get(), i.data(), i.size()))
			throw SslError{"EVP_DigestUpdate() failed"};

	unsigned length;
	if (!EVP_DigestFinal_ex(ctx.get(),
				reinterpret_cast<unsigned char *>(dest),
				&length))
		throw SslError{"EVP_DigestFinal_ex() failed"};

	return length;
}
