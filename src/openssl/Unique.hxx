// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

#include <memory>

struct OpenSSLDeleter {
	void operator()(BIO *bio) const noexcept {
		BIO_free(bio);
	}

	void operator()(ECDSA_SIG *sig) const noexcept {
		ECDSA_SIG_free(sig);
	}

	void operator()(EVP_MD_CTX *ctx) const noexcept {
		EVP_MD_CTX_free(ctx);
	}

	void operator()(EVP_PKEY *key) const noexcept {
		EVP_PKEY_free(key);
	}

	void operator()(EVP_PKEY_CTX *ctx) const noexcept {
		EVP_PKEY_CTX_free(ctx);
	}

	void operator()(OSSL_PARAM_BLD *bld) const noexcept {
		OSSL_PARAM_BLD_free(bld);
	}

	void operator()(OSSL_PARAM *param) const noexcept {
		OSSL_PARAM_free(param);
	}
};

using UniqueBIO = std::unique_ptr<BIO, OpenSSLDeleter>;
using UniqueECDSA_SIG = std::unique_ptr<ECDSA_SIG, OpenSSLDeleter>;
using UniqueEVP_MD_CTX = std::unique_ptr<EVP_MD_CTX, OpenSSLDeleter>;
using UniqueEVP_PKEY = std::unique_ptr<EVP_PKEY, OpenSSLDeleter>;
using UniqueEVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, OpenSSLDeleter>;
using UniqueOSSL_PARAM_BLD = std::unique_ptr<OSSL_PARAM_BLD, OpenSSLDeleter>;
using UniqueOSSL_PARAM = std::unique_ptr<OSSL_PARAM, OpenSSLDeleter>;

/**
 * @param clear use BN_clear_free() instead of BN_free(), for secret
 * numbers
 */
template<bool clear>
struct BIGNUMDeleter {
	void operator()(BIGNUM *bn) const noexcept {
		if constexpr (clear)
			BN_clear_free(bn);
		else
			BN_free(bn);
	}
};

template<bool clear>
using UniqueBIGNUM = std::unique_ptr<BIGNUM, BIGNUMDeleter<clear>>;
