// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>
#include <vector>

/**
 * Sign a precomputed digest with the given private key.  For ECDSA
 * keys, the result is a DER-encoded "ECDSA-Sig-Value".
 *
 * Throws SslError on error.
 */
std::vector<std::byte>
SignDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	   std::span<const std::byte> digest);
