// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sign.hxx"
#include "Error.hxx"
#include "Unique.hxx"

#include <stdexcept>

static std::vector<std::byte>
SignDigestOpenSSL(EVP_PKEY_CTX &ctx, std::span<const std::byte> digest)
{
	size_t length;
	if (EVP_PKEY_sign(&ctx, nullptr, &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	std::vector<std::byte> result(length);
	if (EVP_PKEY_sign(&ctx,
			  reinterpret_cast<unsigned char *>(result.data()), &length,
			  reinterpret_cast<const unsigned char *>(digest.data()),
			  digest.size()) <= 0)
		throw SslError{"EVP_PKEY_sign() failed"};

	result.resize(length);
	return result;
}

std::vector<std::byte>
SignDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	   std::span<const std::byte> digest)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	if (digest.size() != DigestSize(hash_alg))
		throw std::invalid_argument{"Wrong digest size"};

	const UniqueEVP_PKEY_CTX ctx(EVP_PKEY_CTX_new(&key, nullptr));
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new() failed");

	if (EVP_PKEY_sign_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_sign_init() failed");

	if (EVP_PKEY_CTX_set_signature_md(ctx.get(), md) <= 0)
		throw SslError("EVP_PKEY_CTX_set_signature_md() failed");

	return SignDigestOpenSSL(*ctx, digest);
}
