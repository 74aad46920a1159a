// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

struct Certificate;

enum class CertificateStatus {
	OK,
	BAD_SIGNATURE,
	NOT_YET_VALID,
	EXPIRED,
	PRINCIPAL_NOT_ALLOWED,
};

/**
 * Verify the CA signature with the embedded signature key.  A
 * malformed signature or signature key counts as a bad signature.
 */
bool
VerifyCertificateSignature(const Certificate &cert);

/**
 * Check the certificate the way sshd does: the signature, the
 * validity window at the given time and the principal.  A
 * certificate without principals is valid for any principal.
 *
 * @param now the current time in seconds since the epoch
 */
CertificateStatus
VerifyCertificate(const Certificate &cert, std::string_view principal,
		  uint_least64_t now);
