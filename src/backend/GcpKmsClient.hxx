// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Backend.hxx"
#include "Digest.hxx"

#include <grpcpp/support/status.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * The relevant fields of a Cloud KMS "PublicKey" message.
 */
struct GcpKmsPublicKey {
	/**
	 * The PEM-encoded SubjectPublicKeyInfo.
	 */
	std::string pem;

	/**
	 * The "CryptoKeyVersionAlgorithm" enum name, e.g.
	 * "EC_SIGN_P256_SHA256".
	 */
	std::string algorithm;

	/**
	 * The resource name of the key version.
	 */
	std::string name;
};

/**
 * The subset of the Google Cloud KMS API needed by #GcpKmsBackend.
 * A deployment implements this on top of the Cloud KMS gRPC stub
 * (or google-cloud-cpp).
 *
 * All methods must be thread-safe.
 */
class GcpKmsClient {
public:
	virtual ~GcpKmsClient() noexcept = default;

	virtual grpc::Status GetPublicKey(const std::string &name,
					  GcpKmsPublicKey &response) = 0;

	/**
	 * Invoke "AsymmetricSign" with a precomputed digest.
	 *
	 * @param deadline passed to grpc::ClientContext::set_deadline()
	 * @param signature receives the DER-encoded signature
	 */
	virtual grpc::Status AsymmetricSign(const std::string &name,
					    DigestAlgorithm digest_algorithm,
					    std::span<const std::byte> digest,
					    SigningDeadline deadline,
					    std::vector<std::byte> &signature) = 0;
};
