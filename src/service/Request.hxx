// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "cert/Type.hxx"
#include "cert/Options.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * A request to issue a certificate, as submitted by a client.
 */
struct SigningRequest {
	/**
	 * The subject public key in SSH wire format.
	 */
	std::vector<std::byte> public_key;

	std::vector<std::string> principals;

	CertificateType type = CertificateType::USER;

	std::string key_id;

	/**
	 * If not set, a random serial is generated.
	 */
	std::optional<uint_least64_t> serial;

	/**
	 * If not set, the certificate is valid from now (and for
	 * the default validity).
	 */
	std::optional<uint_least64_t> valid_after, valid_before;

	OptionMap critical_options;

	/**
	 * If not set, user certificates get all extensions and host
	 * certificates none.
	 */
	std::optional<OptionMap> extensions;
};

enum class SigningErrorCode {
	INVALID_REQUEST,
	ENCODING_FAILED,
	MALFORMED_SIGNATURE,
	BACKEND_UNAVAILABLE,
	KEY_NOT_FOUND,
	INTERNAL,
};

struct SigningError {
	SigningErrorCode code;
	std::string message;
};

/**
 * Either the encoded certificate or an error.
 */
using SigningResponse = std::variant<std::vector<std::byte>, SigningError>;
