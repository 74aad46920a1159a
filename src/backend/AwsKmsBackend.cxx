// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AwsKmsBackend.hxx"
#include "AwsKmsClient.hxx"
#include "Error.hxx"
#include "key/ECDSAKey.hxx"
#include "key/EcCurve.hxx"
#include "openssl/Key.hxx"

#include <fmt/core.h>

#include <array>

using std::string_view_literals::operator""sv;

/**
 * Translate an #AwsKmsError to one of our error classes.
 */
[[noreturn]]
static void
ThrowAwsKmsError(const AwsKmsError &e)
{
	static constexpr std::array key_not_found{
		"NotFoundException"sv,
		"DisabledException"sv,
		"KMSInvalidStateException"sv,
	};

	const auto name = e.GetExceptionName();
	const auto msg = fmt::format("AWS KMS: {}: {}", name, e.what());

	for (const auto i : key_not_found)
		if (name == i)
			throw KeyNotFoundError{msg};

	/* everything else (throttling, timeouts,
	   KeyUnavailableException, access denied, network
	   errors) is considered transient */
	throw BackendUnavailableError{msg};
}

static const EcCurve &
ParseKeySpec(std::string_view key_spec)
{
	if (key_spec == "ECC_NIST_P256"sv)
		return ec_curves[0];
	else if (key_spec == "ECC_NIST_P384"sv)
		return ec_curves[1];
	else if (key_spec == "ECC_NIST_P521"sv)
		return ec_curves[2];
	else
		throw std::invalid_argument{fmt::format("Unsupported AWS KMS key spec '{}'", key_spec)};
}

static AwsKmsSigningAlgorithm
ToSigningAlgorithm(DigestAlgorithm digest) noexcept
{
	switch (digest) {
	case DigestAlgorithm::SHA256:
		return AwsKmsSigningAlgorithm::ECDSA_SHA_256;

	case DigestAlgorithm::SHA384:
		return AwsKmsSigningAlgorithm::ECDSA_SHA_384;

	case DigestAlgorithm::SHA512:
		return AwsKmsSigningAlgorithm::ECDSA_SHA_512;
	}

	return AwsKmsSigningAlgorithm::ECDSA_SHA_256;
}

static UniqueEVP_PKEY
FetchPublicKey(AwsKmsClient &client, const AwsKmsBackendConfig &config)
try {
	if (client.GetRegion() != config.region)
		throw std::invalid_argument{fmt::format("AWS KMS client is bound to region '{}', not '{}'",
							client.GetRegion(), config.region)};

	const auto response = client.GetPublicKey(config.key_id);

	if (response.key_usage != "SIGN_VERIFY"sv)
		throw std::invalid_argument{"AWS KMS key is not a signing key"};

	const auto &curve = ParseKeySpec(response.key_spec);

	auto key = DecodePublicKeyDER(response.public_key);
	if (&GetEcCurve(*key) != &curve)
		throw std::invalid_argument{"AWS KMS key spec does not match the public key"};

	return key;
} catch (const AwsKmsError &e) {
	ThrowAwsKmsError(e);
}

AwsKmsBackend::AwsKmsBackend(std::shared_ptr<AwsKmsClient> _client,
			     const AwsKmsBackendConfig &config)
	:EcSigningBackend(*FetchPublicKey(*_client, config)),
	 client(std::move(_client)), key_id(config.key_id)
{
}

std::vector<std::byte>
AwsKmsBackend::Sign(std::span<const std::byte> digest,
		    SigningDeadline deadline) const
try {
	return client->SignDigest(key_id,
				  ToSigningAlgorithm(GetDigestAlgorithm()),
				  digest, deadline);
} catch (const AwsKmsError &e) {
	ThrowAwsKmsError(e);
}
