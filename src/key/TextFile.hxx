// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * One line of an OpenSSH public key file ("id_*.pub",
 * "id_*-cert.pub" or "authorized_keys" without options).
 */
struct PublicKeyLine {
	std::string type;
	std::vector<std::byte> blob;
	std::string comment;
};

/**
 * Parse a line in the format "TYPE BASE64 [COMMENT]".  The type
 * must match the type string inside the blob.
 *
 * Throws std::invalid_argument on error.
 */
PublicKeyLine
ParsePublicKeyLine(std::string_view line);

/**
 * Format a line in the format "TYPE BASE64 [COMMENT]" (the inverse
 * of ParsePublicKeyLine()).
 */
std::string
FormatPublicKeyLine(std::string_view type, std::span<const std::byte> blob,
		    std::string_view comment);
