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
 * An error reported by the AWS Key Management Service.
 */
class AwsKmsError : public std::runtime_error {
	/**
	 * The AWS exception name, e.g. "NotFoundException".
	 */
	std::string exception_name;

public:
	AwsKmsError(std::string_view _exception_name, const char *msg)
		:std::runtime_error(msg), exception_name(_exception_name) {}

	std::string_view GetExceptionName() const noexcept {
		return exception_name;
	}
};

struct AwsKmsPublicKey {
	/**
	 * DER-encoded SubjectPublicKeyInfo.
	 */
	std::vector<std::byte> public_key;

	/**
	 * The "KeySpec", e.g. "ECC_NIST_P256".
	 */
	std::string key_spec;

	/**
	 * The "KeyUsage", e.g. "SIGN_VERIFY".
	 */
	std::string key_usage;
};

enum class AwsKmsSigningAlgorithm {
	ECDSA_SHA_256,
	ECDSA_SHA_384,
	ECDSA_SHA_512,
};

/**
 * The subset of the AWS KMS API needed by #AwsKmsBackend.  A
 * deployment implements this with the AWS SDK; the implementation
 * owns credentials and is bound to one region.
 *
 * All methods throw #AwsKmsError on error and must be thread-safe.
 */
class AwsKmsClient {
public:
	virtual ~AwsKmsClient() noexcept = default;

	virtual std::string_view GetRegion() const noexcept = 0;

	virtual AwsKmsPublicKey GetPublicKey(std::string_view key_id) = 0;

	/**
	 * Invoke "Sign" with "MessageType=DIGEST".
	 *
	 * @param deadline the request must be abandoned (with a
	 * timeout error) when this point in time is reached
	 * @return the DER-encoded signature
	 */
	virtual std::vector<std::byte> SignDigest(std::string_view key_id,
						  AwsKmsSigningAlgorithm algorithm,
						  std::span<const std::byte> digest,
						  SigningDeadline deadline) = 0;
};
