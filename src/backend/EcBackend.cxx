// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EcBackend.hxx"
#include "key/ECDSAKey.hxx"
#include "key/EcCurve.hxx"
#include "ssh/Serializer.hxx"

static std::vector<std::byte>
MakePublicKeyBlob(const EcCurve &curve, const EVP_PKEY &key)
{
	SSH::Serializer s;
	SerializeECDSAPublicKey(s, curve, key);
	return s.Release();
}

EcSigningBackend::EcSigningBackend(const EVP_PKEY &public_key)
	:curve(GetEcCurve(public_key)),
	 public_key_blob(MakePublicKeyBlob(curve, public_key))
{
}

DigestAlgorithm
EcSigningBackend::GetDigestAlgorithm() const noexcept
{
	return curve.digest;
}
