// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <utility>

struct SigningRequest;
struct CertificateParameters;

struct SigningPolicy {
	/**
	 * The validity of certificates whose request does not
	 * specify "valid_before".
	 */
	std::chrono::seconds default_validity = std::chrono::hours{1};

	/**
	 * The maximum validity a request may ask for; zero means
	 * unlimited.
	 */
	std::chrono::seconds max_validity{};
};

/**
 * Determine the effective validity window of a request, filling in
 * defaults.
 *
 * @param now the current time in seconds since the epoch
 * @return (valid_after, valid_before)
 */
[[gnu::pure]]
std::pair<uint_least64_t, uint_least64_t>
ResolveValidity(const SigningRequest &request, const SigningPolicy &policy,
		uint_least64_t now) noexcept;

/**
 * Check whether the request can be signed.  Throws ValidationError
 * if not.
 */
void
ValidateSigningRequest(const SigningRequest &request,
		       const SigningPolicy &policy,
		       uint_least64_t now);

/**
 * Convert a (validated) request to #CertificateParameters.
 */
CertificateParameters
ToCertificateParameters(const SigningRequest &request,
			const SigningPolicy &policy,
			uint_least64_t now);
