// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Verify.hxx"
#include "EcdsaSignature.hxx"
#include "DeserializeBN.hxx"
#include "Error.hxx"
#include "Unique.hxx"
#include "ssh/Deserializer.hxx"

#include <openssl/err.h>

#include <stdexcept>

static bool
VerifyDigest(EVP_PKEY &key, const EVP_MD &md,
	     std::span<const std::byte> digest,
	     std::span<const std::byte> signature)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new(&key, nullptr)};
	if (!ctx)
		throw SslError("EVP_PKEY_CTX_new() failed");

	if (EVP_PKEY_verify_init(ctx.get()) <= 0)
		throw SslError("EVP_PKEY_verify_init() failed");

	if (EVP_PKEY_CTX_set_signature_md(ctx.get(), &md) <= 0)
		throw SslError("EVP_PKEY_CTX_set_signature_md() failed");

	int result = EVP_PKEY_verify(ctx.get(),
				     reinterpret_cast<const unsigned char *>(signature.data()),
				     signature.size(),
				     reinterpret_cast<const unsigned char *>(digest.data()),
				     digest.size());
	if (result == 1)
		return true;

	/* a malformed signature is just a bad signature; discard
	   whatever OpenSSL has queued for it */
	ERR_clear_error();
	return false;
}

bool
VerifyGeneric(EVP_PKEY &key, DigestAlgorithm hash_alg,
	      std::span<const std::byte> message,
	      std::span<const std::byte> signature)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	std::byte digest_buffer[DIGEST_MAX_SIZE];
	const std::size_t digest_size = Digest(hash_alg, message, digest_buffer);

	const std::span digest{digest_buffer, digest_size};
	return VerifyDigest(key, *md, digest, signature);
}

/**
 * Parse an ECDSA signature in SSH format and convert it to an OpenSSL
 * ECDSA_SIG object.
 */
static UniqueECDSA_SIG
DeserializeECDSA_SIG(std::span<const std::byte> src)
{
	SSH::Deserializer d{src};
	auto r = DeserializeBIGNUM(d.ReadLengthEncoded());
	auto s = DeserializeBIGNUM(d.ReadLengthEncoded());
	d.ExpectEnd();

	UniqueECDSA_SIG sig{ECDSA_SIG_new()};
	if (!sig)
		throw SslError{};

	if (!ECDSA_SIG_set0(sig.get(), r.get(), s.get()))
		throw SslError{};

	r.release();
	s.release();

	return sig;
}

bool
VerifyECDSA(EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> message,
	    std::span<const std::byte> signature)
{
	const auto sig = DeserializeECDSA_SIG(signature);
	return VerifyGeneric(key, hash_alg, message, ToDer(*sig));
}
