// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

/**
 * The point in time after which the caller is no longer interested
 * in the result.
 */
using SigningDeadline = std::chrono::system_clock::time_point;

static constexpr SigningDeadline NO_SIGNING_DEADLINE = SigningDeadline::max();

/**
 * A key which can sign a digest, but which knows nothing about
 * SSH.  This is usually a key stored in a cloud key management
 * service.
 *
 * Implementations are immutable after construction and may be
 * used by multiple threads concurrently.
 */
class SigningBackend {
public:
	SigningBackend() noexcept = default;
	virtual ~SigningBackend() noexcept = default;

	SigningBackend(const SigningBackend &) = delete;
	SigningBackend &operator=(const SigningBackend &) = delete;

	/**
	 * The public key in SSH wire format.
	 */
	virtual std::span<const std::byte> GetPublicKeyBlob() const noexcept = 0;

	/**
	 * The digest algorithm which must be used to calculate the
	 * digest passed to Sign().
	 */
	virtual DigestAlgorithm GetDigestAlgorithm() const noexcept = 0;

	/**
	 * Sign a digest.
	 *
	 * Throws BackendUnavailableError if the key service could not
	 * be reached (or did not respond before the deadline),
	 * KeyNotFoundError if the key does not exist or is disabled.
	 *
	 * @param deadline remote calls must not outlive this point
	 * in time
	 * @return a DER-encoded ECDSA signature
	 */
	virtual std::vector<std::byte> Sign(std::span<const std::byte> digest,
					    SigningDeadline deadline) const = 0;
};
