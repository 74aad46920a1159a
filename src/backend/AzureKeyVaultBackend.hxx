// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EcBackend.hxx"

#include <memory>
#include <string>

class AzureKeyVaultClient;

struct AzureKeyVaultBackendConfig {
	/**
	 * e.g. "https://myvault.vault.azure.net/"
	 */
	std::string vault_url;

	std::string key_name;

	/**
	 * Empty selects the latest version.
	 */
	std::string key_version;
};

/**
 * A #SigningBackend using an EC key in Azure Key Vault.
 */
class AzureKeyVaultBackend final : public EcSigningBackend {
	const std::shared_ptr<AzureKeyVaultClient> client;
	const std::string key_name, key_version;

public:
	/**
	 * Obtains the public key from Azure Key Vault.
	 *
	 * Throws std::invalid_argument if the client belongs to
	 * another vault or if the key is not suitable,
	 * KeyNotFoundError or BackendUnavailableError.
	 */
	AzureKeyVaultBackend(std::shared_ptr<AzureKeyVaultClient> _client,
			     const AzureKeyVaultBackendConfig &config);

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    SigningDeadline deadline) const override;
};
