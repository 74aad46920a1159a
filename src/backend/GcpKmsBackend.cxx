// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "GcpKmsBackend.hxx"
#include "GcpKmsClient.hxx"
#include "Error.hxx"
#include "key/ECDSAKey.hxx"
#include "key/EcCurve.hxx"
#include "openssl/Key.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

/**
 * Translate a non-OK #grpc::Status to one of our error classes.
 */
[[noreturn]]
static void
ThrowGcpError(const grpc::Status &status)
{
	const auto msg = fmt::format("Cloud KMS: status {}: {}",
				     static_cast<int>(status.error_code()),
				     status.error_message());

	switch (status.error_code()) {
	case grpc::StatusCode::NOT_FOUND:
	case grpc::StatusCode::FAILED_PRECONDITION:
		/* the key does not exist or is disabled/destroyed */
		throw KeyNotFoundError{msg};

	default:
		throw BackendUnavailableError{msg};
	}
}

/**
 * Returns the curve for the given "CryptoKeyVersionAlgorithm".
 * Only the NIST curves are supported which OpenSSH supports, too.
 */
static const EcCurve &
ParseAlgorithm(std::string_view algorithm)
{
	if (algorithm == "EC_SIGN_P256_SHA256"sv)
		return ec_curves[0];
	else if (algorithm == "EC_SIGN_P384_SHA384"sv)
		return ec_curves[1];
	else
		throw std::invalid_argument{fmt::format("Unsupported Cloud KMS algorithm '{}'", algorithm)};
}

static GcpKmsPublicKey
FetchPublicKey(GcpKmsClient &client, const std::string &name)
{
	GcpKmsPublicKey response;
	if (const auto status = client.GetPublicKey(name, response);
	    !status.ok())
		ThrowGcpError(status);

	if (response.name.empty())
		response.name = name;

	return response;
}

static UniqueEVP_PKEY
ToPublicKey(const GcpKmsPublicKey &response)
{
	const auto &curve = ParseAlgorithm(response.algorithm);

	auto key = DecodePublicKeyPEM(response.pem);
	if (&GetEcCurve(*key) != &curve)
		throw std::invalid_argument{"Cloud KMS algorithm does not match the public key"};

	return key;
}

GcpKmsBackend::GcpKmsBackend(std::shared_ptr<GcpKmsClient> &&_client,
			     const GcpKmsPublicKey &public_key)
	:EcSigningBackend(*ToPublicKey(public_key)),
	 client(std::move(_client)),
	 name(public_key.name)
{
}

GcpKmsBackend::GcpKmsBackend(std::shared_ptr<GcpKmsClient> _client,
			     const std::string &key_version_name)
	:GcpKmsBackend(std::move(_client),
		       FetchPublicKey(*_client, key_version_name))
{
}

std::vector<std::byte>
GcpKmsBackend::Sign(std::span<const std::byte> digest,
		    SigningDeadline deadline) const
{
	std::vector<std::byte> signature;
	if (const auto status = client->AsymmetricSign(name, GetDigestAlgorithm(),
						       digest, deadline, signature);
	    !status.ok())
		ThrowGcpError(status);

	return signature;
}
