// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DeserializeRSA.hxx"
#include "DeserializeBN.hxx"
#include "Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*

static UniqueOSSL_PARAM
ToParamPublic(const BIGNUM &e, const BIGNUM &n)
{
	const UniqueOSSL_PARAM_BLD bld{OSSL_PARAM_BLD_new()};
	if (!bld)
		throw SslError{};

	if (!OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, &n) ||
	    !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, &e))
		throw SslError{};

	UniqueOSSL_PARAM param{OSSL_PARAM_BLD_to_param(bld.get())};
	if (!param)
		throw SslError{};

	return param;
}

static UniqueOSSL_PARAM
ToParamPublic(std::span<const std::byte> e,
	      std::span<const std::byte> n)
{
	return ToParamPublic(*DeserializeBIGNUM(e),
			     *DeserializeBIGNUM(n));
}

UniqueEVP_PKEY
DeserializeRSAPublic(std::span<const std::byte> e,
		     std::span<const std::byte> n)
{
	const auto param = ToParamPublic(e, n);

	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_id() failed"};

	if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata_init() failed"};

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, param.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata() failed"};

	return UniqueEVP_PKEY{pkey};
}
