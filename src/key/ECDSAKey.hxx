// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"
#include "openssl/Unique.hxx"

struct EcCurve;

/**
 * Determine the curve of an EC key.  Throws std::invalid_argument
 * if this is not an EC key or if the curve is not supported.
 */
const EcCurve &
GetEcCurve(const EVP_PKEY &key);

/**
 * Write the SSH public key blob of an EC key (RFC 5656 section
 * 3.1).
 */
void
SerializeECDSAPublicKey(SSH::Serializer &s, const EcCurve &curve,
			const EVP_PKEY &key);

class ECDSAKey final : public PublicKey {
	const EcCurve &curve;
	UniqueEVP_PKEY key;

public:
	ECDSAKey(const EcCurve &_curve, UniqueEVP_PKEY &&_key) noexcept
		:curve(_curve), key(std::move(_key)) {}

	/**
	 * Determine the curve from the key.  Throws
	 * std::invalid_argument if the curve is not supported.
	 */
	explicit ECDSAKey(UniqueEVP_PKEY &&_key);

	const EcCurve &GetCurve() const noexcept {
		return curve;
	}

	std::string_view GetType() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;
};
