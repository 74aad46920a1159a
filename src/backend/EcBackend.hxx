// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Backend.hxx"

#include <openssl/evp.h>

struct EcCurve;

/**
 * Base class for #SigningBackend implementations with an ECDSA key.
 * It holds the public key obtained during construction.
 */
class EcSigningBackend : public SigningBackend {
	const EcCurve &curve;
	const std::vector<std::byte> public_key_blob;

protected:
	/**
	 * Throws std::invalid_argument if the key is not an EC key on
	 * a supported curve.
	 */
	explicit EcSigningBackend(const EVP_PKEY &public_key);

public:
	const EcCurve &GetCurve() const noexcept {
		return curve;
	}

	std::span<const std::byte> GetPublicKeyBlob() const noexcept override {
		return public_key_blob;
	}

	DigestAlgorithm GetDigestAlgorithm() const noexcept override;
};
