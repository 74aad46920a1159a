// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Backend.hxx"

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * An error reported by Azure Key Vault (the SDK's
 * "RequestFailedException").
 */
class AzureRequestFailedError : public std::runtime_error {
	unsigned status_code;

	/**
	 * The service error code, e.g. "KeyDisabled"; may be empty.
	 */
	std::string error_code;

public:
	AzureRequestFailedError(unsigned _status_code,
				std::string_view _error_code,
				const char *msg)
		:std::runtime_error(msg),
		 status_code(_status_code), error_code(_error_code) {}

	unsigned GetStatusCode() const noexcept {
		return status_code;
	}

	std::string_view GetErrorCode() const noexcept {
		return error_code;
	}
};

/**
 * A JSON Web Key (RFC 7517) as returned by "get key".  Only the EC
 * members are declared here.
 */
struct AzureJsonWebKey {
	/**
	 * "EC" or "EC-HSM".
	 */
	std::string kty;

	/**
	 * "P-256", "P-384" or "P-521".
	 */
	std::string crv;

	std::vector<std::byte> x, y;
};

enum class AzureSignatureAlgorithm {
	ES256,
	ES384,
	ES512,
};

/**
 * The subset of the Azure Key Vault keys API needed by
 * #AzureKeyVaultBackend.  The implementation owns the credential.
 *
 * All methods throw #AzureRequestFailedError on error and must be
 * thread-safe.
 */
class AzureKeyVaultClient {
public:
	virtual ~AzureKeyVaultClient() noexcept = default;

	virtual std::string_view GetVaultUrl() const noexcept = 0;

	/**
	 * @param version the key version; empty selects the latest
	 */
	virtual AzureJsonWebKey GetKey(std::string_view name,
				       std::string_view version) = 0;

	/**
	 * @param deadline the request must be abandoned (with status
	 * 408) when this point in time is reached
	 * @return the raw signature "r || s" (RFC 7518 section 3.4)
	 */
	virtual std::vector<std::byte> Sign(std::string_view name,
					    std::string_view version,
					    AzureSignatureAlgorithm algorithm,
					    std::span<const std::byte> digest,
					    SigningDeadline deadline) = 0;
};
