// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AzureKeyVaultBackend.hxx"
#include "AzureKeyVaultClient.hxx"
#include "Error.hxx"
#include "key/EcCurve.hxx"
#include "openssl/DeserializeEC.hxx"
#include "openssl/EcdsaSignature.hxx"
#include "ssh/Serializer.hxx"

#include <fmt/core.h>

#include <algorithm>

using std::string_view_literals::operator""sv;

/**
 * Translate an #AzureRequestFailedError to one of our error
 * classes.
 */
[[noreturn]]
static void
ThrowAzureError(const AzureRequestFailedError &e)
{
	const auto msg = fmt::format("Azure Key Vault: HTTP {} {}: {}",
				     e.GetStatusCode(), e.GetErrorCode(),
				     e.what());

	if (e.GetStatusCode() == 404 || e.GetErrorCode() == "KeyDisabled"sv)
		throw KeyNotFoundError{msg};

	throw BackendUnavailableError{msg};
}

static std::string_view
StripTrailingSlash(std::string_view url) noexcept
{
	while (url.ends_with('/'))
		url.remove_suffix(1);
	return url;
}

static const EcCurve &
ParseCurve(std::string_view crv)
{
	if (const auto *curve = FindEcCurveByGroupName(crv))
		return *curve;

	throw std::invalid_argument{fmt::format("Unsupported Azure Key Vault curve '{}'", crv)};
}

/**
 * Append a JWK coordinate, left-padded to the field width.
 */
static void
WriteCoordinate(SSH::Serializer &s, std::span<const std::byte> value,
		std::size_t width)
{
	while (!value.empty() && value.front() == std::byte{} && value.size() > width)
		value = value.subspan(1);

	if (value.size() > width)
		throw std::invalid_argument{"Malformed JSON Web Key"};

	const auto dest = s.WriteN(width);
	std::fill(dest.begin(), dest.end() - value.size(), std::byte{});
	std::copy(value.begin(), value.end(), dest.end() - value.size());
}

/**
 * Convert a JSON Web Key to an OpenSSL key.
 */
static UniqueEVP_PKEY
ToPublicKey(const AzureJsonWebKey &jwk)
{
	if (jwk.kty != "EC"sv && jwk.kty != "EC-HSM"sv)
		throw std::invalid_argument{"Azure Key Vault key is not an EC key"};

	const auto &curve = ParseCurve(jwk.crv);
	const std::size_t width = curve.component_width;

	/* uncompressed point (SEC 1 section 2.3.3) */
	SSH::Serializer q;
	q.WriteU8(0x04);
	WriteCoordinate(q, jwk.x, width);
	WriteCoordinate(q, jwk.y, width);

	return DeserializeECPublic(curve.group_name, q.Finish());
}

static UniqueEVP_PKEY
FetchPublicKey(AzureKeyVaultClient &client,
	       const AzureKeyVaultBackendConfig &config)
try {
	if (StripTrailingSlash(client.GetVaultUrl()) != StripTrailingSlash(config.vault_url))
		throw std::invalid_argument{fmt::format("Azure Key Vault client belongs to '{}', not '{}'",
							client.GetVaultUrl(), config.vault_url)};

	return ToPublicKey(client.GetKey(config.key_name, config.key_version));
} catch (const AzureRequestFailedError &e) {
	ThrowAzureError(e);
}

static AzureSignatureAlgorithm
ToSignatureAlgorithm(DigestAlgorithm digest) noexcept
{
	switch (digest) {
	case DigestAlgorithm::SHA256:
		return AzureSignatureAlgorithm::ES256;

	case DigestAlgorithm::SHA384:
		return AzureSignatureAlgorithm::ES384;

	case DigestAlgorithm::SHA512:
		return AzureSignatureAlgorithm::ES512;
	}

	return AzureSignatureAlgorithm::ES256;
}

AzureKeyVaultBackend::AzureKeyVaultBackend(std::shared_ptr<AzureKeyVaultClient> _client,
					   const AzureKeyVaultBackendConfig &config)
	:EcSigningBackend(*FetchPublicKey(*_client, config)),
	 client(std::move(_client)),
	 key_name(config.key_name), key_version(config.key_version)
{
}

std::vector<std::byte>
AzureKeyVaultBackend::Sign(std::span<const std::byte> digest,
			   SigningDeadline deadline) const
try {
	const auto raw = client->Sign(key_name, key_version,
				      ToSignatureAlgorithm(GetDigestAlgorithm()),
				      digest, deadline);

	if (raw.size() != 2 * GetCurve().component_width)
		throw MalformedSignatureError{"Azure Key Vault returned a signature of the wrong size"};

	return RawToDer(raw);
} catch (const AzureRequestFailedError &e) {
	ThrowAzureError(e);
}
