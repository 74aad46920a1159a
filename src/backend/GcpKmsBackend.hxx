// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EcBackend.hxx"

#include <memory>
#include <string>

class GcpKmsClient;
struct GcpKmsPublicKey;

/**
 * A #SigningBackend using an asymmetric signing key in Google Cloud
 * KMS.
 */
class GcpKmsBackend final : public EcSigningBackend {
	const std::shared_ptr<GcpKmsClient> client;

	/**
	 * The key version name as reported by "GetPublicKey".
	 */
	std::string name;

public:
	/**
	 * Obtains the public key from Cloud KMS.
	 *
	 * Throws std::invalid_argument if the key algorithm is not
	 * supported, KeyNotFoundError or BackendUnavailableError.
	 *
	 * @param key_version_name the fully qualified key version
	 * name ("projects/.../cryptoKeyVersions/1")
	 */
	GcpKmsBackend(std::shared_ptr<GcpKmsClient> _client,
		      const std::string &key_version_name);

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    SigningDeadline deadline) const override;

private:
	GcpKmsBackend(std::shared_ptr<GcpKmsClient> &&_client,
		      const GcpKmsPublicKey &public_key);
};
