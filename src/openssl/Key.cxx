// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Key.hxx"
#include "EVP.hxx"
#include "Error.hxx"

#include <openssl/core_names.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstring> // for strstr() used by EVP_EC_gen()

UniqueEVP_PKEY
GenerateEcKey(const char *group_name)
{
	EVP_PKEY *key = EVP_EC_gen(group_name);
	if (key == nullptr)
		throw SslError{"EVP_EC_gen() failed"};

	return UniqueEVP_PKEY{key};
}

UniqueEVP_PKEY
LoadPrivateKeyFile(const char *path)
{
	const UniqueBIO bio{BIO_new_file(path, "r")};
	if (!bio)
		throw SslError{"Failed to open key file"};

	UniqueEVP_PKEY key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
	if (!key)
		throw SslError{"Failed to load private key"};

	return key;
}

static UniqueBIO
NewMemBIO(std::string_view src)
{
	UniqueBIO bio{BIO_new_mem_buf(src.data(), src.size())};
	if (!bio)
		throw SslError{};

	return bio;
}

UniqueEVP_PKEY
DecodePublicKeyPEM(std::string_view pem)
{
	const auto bio = NewMemBIO(pem);

	UniqueEVP_PKEY key{PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)};
	if (!key)
		throw SslError{"Failed to decode public key"};

	return key;
}

UniqueEVP_PKEY
DecodePublicKeyDER(std::span<const std::byte> der)
{
	const auto *p = reinterpret_cast<const unsigned char *>(der.data());
	UniqueEVP_PKEY key{d2i_PUBKEY(nullptr, &p, der.size())};
	if (!key)
		throw SslError{"Failed to decode public key"};

	return key;
}

static std::string
ToString(BIO &bio)
{
	char *data;
	const long size = BIO_get_mem_data(&bio, &data);
	if (size < 0)
		throw SslError{};

	return {data, static_cast<std::size_t>(size)};
}

std::string
EncodePublicKeyPEM(EVP_PKEY &key)
{
	const UniqueBIO bio{BIO_new(BIO_s_mem())};
	if (!bio)
		throw SslError{};

	if (!PEM_write_bio_PUBKEY(bio.get(), &key))
		throw SslError{"PEM_write_bio_PUBKEY() failed"};

	return ToString(*bio);
}

std::vector<std::byte>
EncodePublicKeyDER(EVP_PKEY &key)
{
	const int size = i2d_PUBKEY(&key, nullptr);
	if (size <= 0)
		throw SslError{"i2d_PUBKEY() failed"};

	std::vector<std::byte> result(size);
	auto *p = reinterpret_cast<unsigned char *>(result.data());
	if (i2d_PUBKEY(&key, &p) != size)
		throw SslError{"i2d_PUBKEY() failed"};

	return result;
}

std::string
EncodePrivateKeyPEM(EVP_PKEY &key)
{
	const UniqueBIO bio{BIO_new(BIO_s_mem())};
	if (!bio)
		throw SslError{};

	if (!PEM_write_bio_PrivateKey(bio.get(), &key, nullptr, nullptr, 0,
				      nullptr, nullptr))
		throw SslError{"PEM_write_bio_PrivateKey() failed"};

	return ToString(*bio);
}

std::string
GetGroupName(const EVP_PKEY &key)
{
	return GetStringParam(key, OSSL_PKEY_PARAM_GROUP_NAME).get();
}
