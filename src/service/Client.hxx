// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"
#include "leima.grpc.pb.h"

#include <chrono>
#include <memory>
#include <string>

/**
 * A client for the "leima.v1.CertificateSigner" service.
 */
class SigningClient {
	const std::unique_ptr<leima::v1::CertificateSigner::Stub> stub;

	const std::chrono::milliseconds timeout;

public:
	/**
	 * @param _timeout the deadline for each call
	 */
	SigningClient(const std::shared_ptr<grpc::ChannelInterface> &channel,
		      std::chrono::milliseconds _timeout);

	/**
	 * Request a certificate.  Transport errors are reported as
	 * BACKEND_UNAVAILABLE.
	 */
	SigningResponse SignCertificate(const SigningRequest &request) const noexcept;

	struct PublicKey {
		std::vector<std::byte> blob;
		std::string line;
		std::string fingerprint;
	};

	/**
	 * Obtain the CA public key.  Throws BackendUnavailableError
	 * on error.
	 */
	PublicKey GetPublicKey() const;
};
