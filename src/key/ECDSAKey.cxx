// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ECDSAKey.hxx"
#include "EcCurve.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/Key.hxx"
#include "openssl/SerializeEVP.hxx"
#include "openssl/Verify.hxx"

#include <stdexcept>

const EcCurve &
GetEcCurve(const EVP_PKEY &key)
{
	if (EVP_PKEY_get_base_id(&key) != EVP_PKEY_EC)
		throw std::invalid_argument{"Not an EC key"};

	const auto *curve = FindEcCurveByGroupName(GetGroupName(key));
	if (curve == nullptr)
		throw std::invalid_argument{"Unsupported ECDSA curve"};

	return *curve;
}

ECDSAKey::ECDSAKey(UniqueEVP_PKEY &&_key)
	:curve(GetEcCurve(*_key)), key(std::move(_key))
{
}

std::string_view
ECDSAKey::GetType() const noexcept
{
	return curve.key_type;
}

void
SerializeECDSAPublicKey(SSH::Serializer &s, const EcCurve &curve,
			const EVP_PKEY &key)
{
	s.WriteString(curve.key_type);
	s.WriteString(curve.ssh_name);

	const auto key_length = s.PrepareLength();
	SerializePublicKey(s, key);
	s.CommitLength(key_length);
}

void
ECDSAKey::SerializePublic(SSH::Serializer &s) const
{
	SerializeECDSAPublicKey(s, curve, *key);
}

bool
ECDSAKey::Verify(std::span<const std::byte> message,
		 std::span<const std::byte> signature) const
{
	SSH::Deserializer d{signature};
	const auto algorithm = d.ReadString();
	if (algorithm != curve.key_type)
		throw std::invalid_argument{"Wrong algorithm"};

	signature = d.ReadLengthEncoded();
	d.ExpectEnd();

	return VerifyECDSA(*key, curve.digest, message, signature);
}
