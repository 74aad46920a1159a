// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SigningKey.hxx"
#include "Parameters.hxx"
#include "Error.hxx"
#include "cert/Certificate.hxx"
#include "cert/Limits.hxx"
#include "key/EcCurve.hxx"
#include "key/Fingerprint.hxx"
#include "key/Parser.hxx"
#include "key/TextFile.hxx"
#include "openssl/EcdsaSignature.hxx"
#include "ssh/Serializer.hxx"
#include "Digest.hxx"

#include <fmt/chrono.h>

#include <sodium/randombytes.h>

#include <ctime>
#include <stdexcept>

static const EcCurve &
GetBackendCurve(const SigningBackend &backend)
{
	const auto type = GetPublicKeyType(backend.GetPublicKeyBlob());
	const auto *curve = FindEcCurveByKeyType(type);
	if (curve == nullptr)
		throw std::invalid_argument{"Unsupported CA key type"};

	if (curve->digest != backend.GetDigestAlgorithm())
		throw std::invalid_argument{"CA digest algorithm does not match the curve"};

	return *curve;
}

SigningKey::SigningKey(std::shared_ptr<const SigningBackend> _backend)
	:backend(std::move(_backend)),
	 curve(GetBackendCurve(*backend))
{
}

std::span<const std::byte>
SigningKey::GetPublicKeyBlob() const noexcept
{
	return backend->GetPublicKeyBlob();
}

std::string
SigningKey::FormatPublicKeyLine(std::string_view comment) const
{
	if (comment.empty())
		return ::FormatPublicKeyLine(curve.key_type, GetPublicKeyBlob(),
					     fmt::format("{:%FT%T}",
							 fmt::localtime(std::time(nullptr))));

	return ::FormatPublicKeyLine(curve.key_type, GetPublicKeyBlob(), comment);
}

std::string
SigningKey::GetFingerprint() const
{
	return ::GetFingerprint(GetPublicKeyBlob());
}

static void
CheckDeadline(SigningDeadline deadline)
{
	if (deadline != NO_SIGNING_DEADLINE &&
	    std::chrono::system_clock::now() >= deadline)
		throw BackendUnavailableError{"Deadline exceeded"};
}

/**
 * Sign the data with the backend and return the SSH signature blob.
 */
static std::vector<std::byte>
SignBlob(const SigningBackend &backend, const EcCurve &curve,
	 std::span<const std::byte> tbs, SigningDeadline deadline)
{
	std::byte digest_buffer[DIGEST_MAX_SIZE];
	const std::size_t digest_size = Digest(curve.digest, tbs, digest_buffer);
	const std::span digest{digest_buffer, digest_size};

	CheckDeadline(deadline);

	const auto der = backend.Sign(digest, deadline);

	/* the caller has given up while the backend was busy; the
	   signature is useless now */
	CheckDeadline(deadline);

	SSH::Serializer s;
	SerializeEcdsaSignature(s, curve.key_type,
				DerToRaw(der, curve.component_width));
	return s.Release();
}

Certificate
SigningKey::SignCertificate(std::span<const std::byte> subject_public_key,
			    const CertificateParameters &parameters,
			    SigningDeadline deadline) const
{
	Certificate cert;

	cert.nonce.resize(NONCE_SIZE);
	randombytes_buf(cert.nonce.data(), cert.nonce.size());

	cert.public_key = ToVector(subject_public_key);
	cert.serial = parameters.serial;
	cert.type = parameters.type;
	cert.key_id = parameters.key_id;
	cert.principals = parameters.principals;
	cert.valid_after = parameters.valid_after;
	cert.valid_before = parameters.valid_before;
	cert.critical_options = parameters.critical_options;
	cert.extensions = parameters.extensions;
	cert.signature_key = ToVector(GetPublicKeyBlob());

	cert.CheckValidity();

	cert.signature = SignBlob(*backend, curve, cert.ToBeSigned(), deadline);
	return cert;
}
