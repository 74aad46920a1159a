// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LocalKeyBackend.hxx"
#include "openssl/Key.hxx"
#include "openssl/Sign.hxx"

LocalKeyBackend::LocalKeyBackend(UniqueEVP_PKEY &&_key)
	:EcSigningBackend(*_key), key(std::move(_key))
{
}

std::shared_ptr<LocalKeyBackend>
LocalKeyBackend::LoadFile(const char *path)
{
	return std::make_shared<LocalKeyBackend>(LoadPrivateKeyFile(path));
}

std::vector<std::byte>
LocalKeyBackend::Sign(std::span<const std::byte> digest,
		      SigningDeadline) const
{
	return SignDigest(*key, GetDigestAlgorithm(), digest);
}
