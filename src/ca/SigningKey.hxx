// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "backend/Backend.hxx"

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct Certificate;
struct CertificateParameters;
struct EcCurve;

/**
 * A certificate authority key.  The private key operation is
 * delegated to a #SigningBackend; this class implements everything
 * SSH specific on top of it.
 *
 * This object is immutable and may be used by multiple threads
 * concurrently.
 */
class SigningKey {
	const std::shared_ptr<const SigningBackend> backend;

	const EcCurve &curve;

public:
	/**
	 * Throws std::invalid_argument if the backend's key type is
	 * not supported.
	 */
	explicit SigningKey(std::shared_ptr<const SigningBackend> _backend);

	const EcCurve &GetCurve() const noexcept {
		return curve;
	}

	/**
	 * The CA public key in SSH wire format.
	 */
	std::span<const std::byte> GetPublicKeyBlob() const noexcept;

	/**
	 * Format the CA public key for an "authorized_keys" or
	 * "known_hosts" file ("@cert-authority" line).
	 *
	 * @param comment the comment; if empty, the current time is
	 * used
	 */
	std::string FormatPublicKeyLine(std::string_view comment={}) const;

	std::string GetFingerprint() const;

	/**
	 * Issue a certificate for the given subject key.  Each call
	 * obtains a new signature from the backend.
	 *
	 * Throws ValidationError if the validity window is empty,
	 * EncodingError if a field exceeds a limit,
	 * BackendUnavailableError if the deadline expires before the
	 * backend has returned a signature, and whatever the backend
	 * and the signature codec throw.
	 *
	 * @param subject_public_key the subject key in SSH wire format
	 */
	Certificate SignCertificate(std::span<const std::byte> subject_public_key,
				    const CertificateParameters &parameters,
				    SigningDeadline deadline=NO_SIGNING_DEADLINE) const;
};
