// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Type.hxx"
#include "Options.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace SSH { class Serializer; }

/**
 * An OpenSSH certificate.
 *
 * @see https://cvsweb.openbsd.org/src/usr.bin/ssh/PROTOCOL.certkeys
 */
struct Certificate {
	static constexpr uint_least64_t VALID_ALWAYS = 0;
	static constexpr uint_least64_t VALID_FOREVER = ~uint_least64_t{};

	std::vector<std::byte> nonce;

	/**
	 * The subject's public key blob (including the type
	 * string).  Only the type specific parts are embedded in
	 * the certificate.
	 */
	std::vector<std::byte> public_key;

	uint_least64_t serial = 0;

	CertificateType type = CertificateType::USER;

	std::string key_id;

	/**
	 * An empty list means the certificate is valid for any
	 * principal.
	 */
	std::vector<std::string> principals;

	uint_least64_t valid_after = VALID_ALWAYS;
	uint_least64_t valid_before = VALID_FOREVER;

	OptionMap critical_options, extensions;

	std::vector<std::byte> reserved;

	/**
	 * The CA public key blob.
	 */
	std::vector<std::byte> signature_key;

	/**
	 * The CA signature blob ("string algorithm || string
	 * signature").
	 */
	std::vector<std::byte> signature;

	bool operator==(const Certificate &) const noexcept = default;

	/**
	 * Returns the certificate key type, e.g.
	 * "ssh-ed25519-cert-v01@openssh.com".  Throws EncodingError
	 * if the subject key is missing or not supported.
	 */
	std::string GetKeyType() const;

	/**
	 * Throws ValidationError unless #valid_after is before
	 * #valid_before.
	 */
	void CheckValidity() const;

	/**
	 * Serialize the whole certificate.  Throws EncodingError if
	 * a required field is missing or a field exceeds its limit.
	 */
	std::vector<std::byte> Encode() const;

	/**
	 * Serialize everything up to (but excluding) the signature
	 * field.  This is the data covered by the signature.
	 */
	std::vector<std::byte> ToBeSigned() const;

	/**
	 * Parse a certificate blob.  Throws DecodingError.
	 */
	static Certificate Parse(std::span<const std::byte> src);

private:
	void Serialize(SSH::Serializer &s, bool with_signature) const;
};
