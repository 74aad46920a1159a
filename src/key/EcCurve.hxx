// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <array>
#include <cstddef>
#include <string_view>

/**
 * Describes one of the NIST curves supported by the
 * "ecdsa-sha2-*" key types (RFC 5656).
 */
struct EcCurve {
	/**
	 * The SSH curve identifier, e.g. "nistp256".
	 */
	std::string_view ssh_name;

	/**
	 * The SSH key type (which is also the signature algorithm).
	 */
	std::string_view key_type;

	/**
	 * The OpenSSL group name.
	 */
	const char *group_name;

	/**
	 * The name OpenSSL reports for keys loaded from files.
	 */
	std::string_view alt_group_name;

	DigestAlgorithm digest;

	/**
	 * The size of r and s in bytes.
	 */
	std::size_t component_width;
};

inline constexpr std::array ec_curves{
	EcCurve{
		"nistp256", "ecdsa-sha2-nistp256",
		"P-256", "prime256v1",
		DigestAlgorithm::SHA256, 32,
	},
	EcCurve{
		"nistp384", "ecdsa-sha2-nistp384",
		"P-384", "secp384r1",
		DigestAlgorithm::SHA384, 48,
	},
	EcCurve{
		"nistp521", "ecdsa-sha2-nistp521",
		"P-521", "secp521r1",
		DigestAlgorithm::SHA512, 66,
	},
};

[[gnu::pure]]
const EcCurve *
FindEcCurveByKeyType(std::string_view key_type) noexcept;

/**
 * Look up a curve by its OpenSSL group name; both the NIST name
 * ("P-256") and the SECG/X9.62 name ("prime256v1") are accepted.
 */
[[gnu::pure]]
const EcCurve *
FindEcCurveByGroupName(std::string_view group_name) noexcept;
