// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RSAKey.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/EVP.hxx"
#include "openssl/SerializeBN.hxx"
#include "openssl/Verify.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*

#include <stdexcept>

using std::string_view_literals::operator""sv;

std::string_view
RSAKey::GetType() const noexcept
{
	return "ssh-rsa"sv;
}

void
RSAKey::SerializePublic(SSH::Serializer &s) const
{
	s.WriteString(GetType());

	const auto e_length = s.PrepareLength();
	Serialize(s, *GetBNParam<false>(*key, OSSL_PKEY_PARAM_RSA_E));
	s.CommitLength(e_length);

	const auto n_length = s.PrepareLength();
	Serialize(s, *GetBNParam<false>(*key, OSSL_PKEY_PARAM_RSA_N));
	s.CommitLength(n_length);
}

/* SHA-1 ("ssh-rsa") signatures are not accepted */
static DigestAlgorithm
GetDigestAlgorithmRSA(std::string_view algorithm)
{
	if (algorithm == "rsa-sha2-256"sv)
		return DigestAlgorithm::SHA256;
	else if (algorithm == "rsa-sha2-512"sv)
		return DigestAlgorithm::SHA512;
	else
		throw std::invalid_argument{"Unsupported algorithm"};
}

bool
RSAKey::Verify(std::span<const std::byte> message,
	       std::span<const std::byte> signature) const
{
	SSH::Deserializer d{signature};
	const auto algorithm = d.ReadString();
	const auto hash_alg = GetDigestAlgorithmRSA(algorithm);

	signature = d.ReadLengthEncoded();
	d.ExpectEnd();

	return VerifyGeneric(*key, hash_alg, message, signature);
}
