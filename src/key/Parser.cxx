// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Parser.hxx"
#include "Ed25519Key.hxx"
#include "ECDSAKey.hxx"
#include "EcCurve.hxx"
#include "RSAKey.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/DeserializeEC.hxx"
#include "openssl/DeserializeRSA.hxx"
#include "openssl/Error.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

bool
IsSupportedPublicKeyType(std::string_view type) noexcept
{
	return type == "ssh-ed25519"sv || type == "ssh-rsa"sv ||
		FindEcCurveByKeyType(type) != nullptr;
}

std::unique_ptr<PublicKey>
ParsePublicKeyParts(std::string_view type, SSH::Deserializer &d)
try {
	if (type == "ssh-ed25519"sv) {
		const auto public_key = d.ReadLengthEncoded();
		if (public_key.size() != 32)
			throw std::invalid_argument{"Malformed ed25519 key"};

		return std::make_unique<Ed25519Key>(public_key.first<32>());
	} else if (type == "ssh-rsa"sv) {
		const auto e = d.ReadLengthEncoded();
		const auto n = d.ReadLengthEncoded();

		return std::make_unique<RSAKey>(DeserializeRSAPublic(e, n));
	} else if (const auto *curve = FindEcCurveByKeyType(type)) {
		const auto ecdsa_curve_name = d.ReadString();
		if (ecdsa_curve_name != curve->ssh_name)
			throw std::invalid_argument{"ECDSA curve mismatch"};

		const auto q = d.ReadLengthEncoded();

		return std::make_unique<ECDSAKey>(*curve,
						  DeserializeECPublic(curve->group_name, q));
	} else
		throw std::invalid_argument{"Unsupported key algorithm"};
} catch (const SslError &) {
	/* OpenSSL rejected the key material (e.g. a point which
	   is not on the curve) */
	throw std::invalid_argument{"Malformed public key"};
}

std::unique_ptr<PublicKey>
ParsePublicKeyBlob(std::span<const std::byte> src)
try {
	SSH::Deserializer d{src};
	const auto type = d.ReadString();
	auto key = ParsePublicKeyParts(type, d);
	d.ExpectEnd();
	return key;
} catch (SSH::MalformedPacket) {
	throw std::invalid_argument{"Malformed public key"};
}

std::string_view
GetPublicKeyType(std::span<const std::byte> blob)
try {
	SSH::Deserializer d{blob};
	return d.ReadString();
} catch (SSH::MalformedPacket) {
	throw std::invalid_argument{"Malformed public key"};
}
