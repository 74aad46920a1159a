// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "leima.grpc.pb.h"

class SigningHandler;

/**
 * The gRPC frontend for #SigningHandler.  Errors are reported in
 * the response message, not as gRPC status.
 */
class GrpcSigningService final : public leima::v1::CertificateSigner::Service {
	const SigningHandler &handler;

public:
	explicit GrpcSigningService(const SigningHandler &_handler) noexcept
		:handler(_handler) {}

	grpc::Status SignCertificate(grpc::ServerContext *context,
				     const leima::v1::SignCertificateRequest *request,
				     leima::v1::SignCertificateResponse *response) override;

	grpc::Status GetPublicKey(grpc::ServerContext *context,
				  const leima::v1::GetPublicKeyRequest *request,
				  leima::v1::GetPublicKeyResponse *response) override;
};
