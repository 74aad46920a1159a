// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Verify.hxx"
#include "Certificate.hxx"
#include "Error.hxx"
#include "key/Key.hxx"
#include "key/Parser.hxx"
#include "ssh/Deserializer.hxx"

#include <algorithm>
#include <stdexcept>

bool
VerifyCertificateSignature(const Certificate &cert)
try {
	const auto ca_key = ParsePublicKeyBlob(cert.signature_key);
	return ca_key->Verify(cert.ToBeSigned(), cert.signature);
} catch (SSH::MalformedPacket) {
	return false;
} catch (const std::invalid_argument &) {
	return false;
} catch (const EncodingError &) {
	return false;
}

CertificateStatus
VerifyCertificate(const Certificate &cert, std::string_view principal,
		  uint_least64_t now)
{
	if (!VerifyCertificateSignature(cert))
		return CertificateStatus::BAD_SIGNATURE;

	if (now < cert.valid_after)
		return CertificateStatus::NOT_YET_VALID;

	if (now >= cert.valid_before)
		return CertificateStatus::EXPIRED;

	if (!cert.principals.empty() &&
	    std::find(cert.principals.begin(), cert.principals.end(),
		      principal) == cert.principals.end())
		return CertificateStatus::PRINCIPAL_NOT_ALLOWED;

	return CertificateStatus::OK;
}
