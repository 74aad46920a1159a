// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Error.hxx"
#include "ca/Parameters.hxx"
#include "ca/SigningKey.hxx"
#include "cert/Certificate.hxx"
#include "cert/Verify.hxx"
#include "key/Fingerprint.hxx"
#include "ssh/Deserializer.hxx"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

static std::string
GetSubjectFingerprint(const SigningRequest &request) noexcept
try {
	return GetFingerprint(request.public_key);
} catch (const std::exception &) {
	return "?";
}

static std::vector<std::byte>
Sign(const SigningKey &key, const SigningRequest &request,
     const SigningPolicy &policy, SigningDeadline deadline)
{
	const auto now = GetUnixTime();

	ValidateSigningRequest(request, policy, now);

	const auto cert = key.SignCertificate(request.public_key,
					      ToCertificateParameters(request, policy, now),
					      deadline);

	/* refuse to hand out a certificate which sshd would
	   reject */
	if (!VerifyCertificateSignature(cert))
		throw MalformedSignatureError{"Backend signature does not verify"};

	spdlog::info("Issued {} certificate serial={} key_id='{}' principals=[{}] subject={}",
		     ToString(cert.type), cert.serial, cert.key_id,
		     fmt::join(cert.principals, ","),
		     GetSubjectFingerprint(request));

	return cert.Encode();
}

SigningResponse
SigningHandler::HandleSigningRequest(const SigningRequest &request,
				     SigningDeadline deadline) const noexcept
try {
	return Sign(*key, request, policy, deadline);
} catch (const ValidationError &e) {
	spdlog::warn("Rejected request key_id='{}' subject={}: {}",
		     request.key_id, GetSubjectFingerprint(request), e.what());
	return SigningError{SigningErrorCode::INVALID_REQUEST, e.what()};
} catch (const EncodingError &e) {
	spdlog::warn("Failed to encode certificate key_id='{}': {}",
		     request.key_id, e.what());
	return SigningError{SigningErrorCode::ENCODING_FAILED, e.what()};
} catch (const MalformedSignatureError &e) {
	spdlog::error("Malformed signature from backend: {}", e.what());
	return SigningError{SigningErrorCode::MALFORMED_SIGNATURE, e.what()};
} catch (const BackendUnavailableError &e) {
	spdlog::error("Signing backend unavailable: {}", e.what());
	return SigningError{SigningErrorCode::BACKEND_UNAVAILABLE, e.what()};
} catch (const KeyNotFoundError &e) {
	spdlog::error("Signing key not found: {}", e.what());
	return SigningError{SigningErrorCode::KEY_NOT_FOUND, e.what()};
} catch (SSH::MalformedPacket) {
	spdlog::error("Malformed data while signing key_id='{}'", request.key_id);
	return SigningError{SigningErrorCode::INTERNAL, "Malformed data"};
} catch (const std::exception &e) {
	spdlog::error("Failed to sign key_id='{}': {}", request.key_id, e.what());
	return SigningError{SigningErrorCode::INTERNAL, e.what()};
}
