// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

/**
 * Verify a signature in OpenSSL's native format (e.g. DER for
 * ECDSA, PKCS#1 for RSA) over the digest of the given message.
 */
bool
VerifyGeneric(EVP_PKEY &key, DigestAlgorithm hash_alg,
	      std::span<const std::byte> message,
	      std::span<const std::byte> signature);

/**
 * Verify an ECDSA signature in SSH format, i.e. the contents of
 * the signature blob after the type string: "mpint r || mpint s".
 *
 * @see https://datatracker.ietf.org/doc/html/rfc5656#section-3.1.2
 */
bool
VerifyECDSA(EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::span<const std::byte> message,
	    std::span<const std::byte> signature);
