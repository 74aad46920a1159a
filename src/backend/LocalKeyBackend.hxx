// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EcBackend.hxx"
#include "openssl/Unique.hxx"

/**
 * A #SigningBackend with an EC private key in local memory.  This
 * is meant for development and testing.
 */
class LocalKeyBackend final : public EcSigningBackend {
	const UniqueEVP_PKEY key;

public:
	explicit LocalKeyBackend(UniqueEVP_PKEY &&_key);

	/**
	 * Load the private key from a PEM file.
	 */
	static std::shared_ptr<LocalKeyBackend> LoadFile(const char *path);

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    SigningDeadline deadline) const override;
};
