// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Protobuf.hxx"
#include "Error.hxx"
#include "Bytes.hxx"

#include <grpcpp/client_context.h>

#include <fmt/core.h>

SigningClient::SigningClient(const std::shared_ptr<grpc::ChannelInterface> &channel,
			     std::chrono::milliseconds _timeout)
	:stub(leima::v1::CertificateSigner::NewStub(channel)),
	 timeout(_timeout)
{
}

static std::string
FormatStatus(const grpc::Status &status)
{
	return fmt::format("gRPC status {}: {}",
			   static_cast<int>(status.error_code()),
			   status.error_message());
}

SigningResponse
SigningClient::SignCertificate(const SigningRequest &request) const noexcept
try {
	leima::v1::SignCertificateRequest pb_request;
	ToProto(pb_request, request);

	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + timeout);

	leima::v1::SignCertificateResponse pb_response;
	const auto status = stub->SignCertificate(&context, pb_request, &pb_response);
	if (!status.ok())
		return SigningError{SigningErrorCode::BACKEND_UNAVAILABLE,
				    FormatStatus(status)};

	return FromProto(pb_response);
} catch (const std::exception &e) {
	return SigningError{SigningErrorCode::INTERNAL, e.what()};
}

SigningClient::PublicKey
SigningClient::GetPublicKey() const
{
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + timeout);

	leima::v1::GetPublicKeyRequest pb_request;
	leima::v1::GetPublicKeyResponse pb_response;
	const auto status = stub->GetPublicKey(&context, pb_request, &pb_response);
	if (!status.ok())
		throw BackendUnavailableError{FormatStatus(status)};

	return {
		ToVector(AsBytes(pb_response.public_key())),
		pb_response.public_key_line(),
		pb_response.fingerprint(),
	};
}
