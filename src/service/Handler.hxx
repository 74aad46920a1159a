// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"
#include "Validate.hxx"
#include "backend/Backend.hxx"

#include <memory>

class SigningKey;

/**
 * Implements the signing protocol independent of the transport:
 * validates requests, issues certificates and converts all errors
 * to #SigningError responses.
 */
class SigningHandler {
	const std::shared_ptr<const SigningKey> key;

	const SigningPolicy policy;

public:
	SigningHandler(std::shared_ptr<const SigningKey> _key,
		       const SigningPolicy &_policy) noexcept
		:key(std::move(_key)), policy(_policy) {}

	const SigningKey &GetSigningKey() const noexcept {
		return *key;
	}

	/**
	 * Handle one request.  This method never throws; all
	 * errors are reported in the response.
	 *
	 * @param deadline the caller's deadline; if it expires before
	 * the backend has signed, the response is
	 * #SigningErrorCode::BACKEND_UNAVAILABLE
	 */
	SigningResponse HandleSigningRequest(const SigningRequest &request,
					     SigningDeadline deadline=NO_SIGNING_DEADLINE) const noexcept;
};
