// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeserializeEC.hxx"
#include "Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_*

#include <string>

static UniqueOSSL_PARAM
ToParam(std::string_view curve_name, std::span<const std::byte> q)
{
	const UniqueOSSL_PARAM_BLD bld{OSSL_PARAM_BLD_new()};
	if (!bld)
		throw SslError{};

	/* OSSL_PARAM_BLD_push_utf8_string() wants a null-terminated
	   string */
	const std::string curve_name_z{curve_name};

	if (!OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
					     curve_name_z.c_str(), 0) ||
	    !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
					      q.data(), q.size()))
		throw SslError{};

	UniqueOSSL_PARAM param{OSSL_PARAM_BLD_to_param(bld.get())};
	if (!param)
		throw SslError{};

	return param;
}

UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q)
{
	const auto param = ToParam(curve_name, q);

	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_id() failed"};

	if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata_init() failed"};

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, param.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata() failed"};

	return UniqueEVP_PKEY{pkey};
}
