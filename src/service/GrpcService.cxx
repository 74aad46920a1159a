// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "GrpcService.hxx"
#include "Handler.hxx"
#include "Protobuf.hxx"
#include "Error.hxx"
#include "Bytes.hxx"
#include "ca/SigningKey.hxx"

#include <spdlog/spdlog.h>

grpc::Status
GrpcSigningService::SignCertificate(grpc::ServerContext *context,
				    const leima::v1::SignCertificateRequest *request,
				    leima::v1::SignCertificateResponse *response)
{
	SigningResponse result;

	if (context->IsCancelled()) {
		/* the client has given up already; don't bother
		   the signing backend */
		spdlog::warn("Request from {} cancelled before signing",
			     context->peer());
		result = SigningError{SigningErrorCode::BACKEND_UNAVAILABLE,
				      "Request cancelled"};
	} else {
		try {
			result = handler.HandleSigningRequest(FromProto(*request),
							      context->deadline());
		} catch (const ValidationError &e) {
			spdlog::warn("Rejected request from {}: {}",
				     context->peer(), e.what());
			result = SigningError{SigningErrorCode::INVALID_REQUEST, e.what()};
		}
	}

	ToProto(*response, result);
	return grpc::Status::OK;
}

grpc::Status
GrpcSigningService::GetPublicKey(grpc::ServerContext *,
				 const leima::v1::GetPublicKeyRequest *,
				 leima::v1::GetPublicKeyResponse *response)
try {
	const auto &key = handler.GetSigningKey();

	response->set_public_key(std::string{ToStringView(key.GetPublicKeyBlob())});
	response->set_public_key_line(key.FormatPublicKeyLine());
	response->set_fingerprint(key.GetFingerprint());
	return grpc::Status::OK;
} catch (const std::exception &e) {
	spdlog::error("GetPublicKey failed: {}", e.what());
	return {grpc::StatusCode::INTERNAL, e.what()};
}
