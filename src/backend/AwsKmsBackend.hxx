// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EcBackend.hxx"

#include <memory>
#include <string>

class AwsKmsClient;

struct AwsKmsBackendConfig {
	/**
	 * The key id, alias or ARN.
	 */
	std::string key_id;

	std::string region;
};

/**
 * A #SigningBackend using an asymmetric ECC key in the AWS Key
 * Management Service.
 */
class AwsKmsBackend final : public EcSigningBackend {
	const std::shared_ptr<AwsKmsClient> client;
	const std::string key_id;

public:
	/**
	 * Obtains the public key from AWS KMS.
	 *
	 * Throws std::invalid_argument if the client is bound to
	 * another region or if the key is not suitable,
	 * KeyNotFoundError or BackendUnavailableError.
	 */
	AwsKmsBackend(std::shared_ptr<AwsKmsClient> _client,
		      const AwsKmsBackendConfig &config);

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    SigningDeadline deadline) const override;
};
