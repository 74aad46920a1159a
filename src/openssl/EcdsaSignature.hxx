// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/ec.h>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace SSH { class Serializer; }

/**
 * The two components of an ECDSA signature as fixed-width unsigned
 * big-endian numbers.
 */
struct EcdsaSignature {
	std::vector<std::byte> r, s;

	bool operator==(const EcdsaSignature &) const noexcept = default;
};

/**
 * Parse a DER-encoded "ECDSA-Sig-Value" (RFC 3279 section 2.2.3),
 * which is what most key management services return.
 *
 * Throws MalformedSignatureError if the input is not exactly one
 * SEQUENCE of two non-negative INTEGERs or if a component does not
 * fit in #component_width bytes.
 *
 * @param component_width the size of the curve's order in bytes
 */
EcdsaSignature
DerToRaw(std::span<const std::byte> der, std::size_t component_width);

/**
 * Encode the two unsigned big-endian components as DER.
 */
std::vector<std::byte>
RawToDer(std::span<const std::byte> r, std::span<const std::byte> s);

/**
 * Convert the JOSE signature format "r || s" (RFC 7518 section
 * 3.4) to DER.  Throws MalformedSignatureError if the size is odd.
 */
std::vector<std::byte>
RawToDer(std::span<const std::byte> raw);

std::vector<std::byte>
ToDer(const ECDSA_SIG &sig);

/**
 * Write an SSH signature blob: "string type || string(mpint r ||
 * mpint s)".
 *
 * @see https://datatracker.ietf.org/doc/html/rfc5656#section-3.1.2
 */
void
SerializeEcdsaSignature(SSH::Serializer &s, std::string_view type,
			const EcdsaSignature &signature);
