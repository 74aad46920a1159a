// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace SSH { class Serializer; }

/**
 * Critical options or extensions of a certificate.  An empty value
 * denotes a flag option.  The map is sorted by name, which is the
 * order required on the wire.
 */
using OptionMap = std::map<std::string, std::string, std::less<>>;

/**
 * All extensions defined by OpenSSH; this is the default for user
 * certificates.
 */
OptionMap
PermitAllExtensions();

/**
 * Is this a critical option understood by OpenSSH?  Unknown
 * critical options make sshd reject the certificate.
 */
[[gnu::pure]]
bool
IsKnownCriticalOption(std::string_view name) noexcept;

/**
 * Write the option list (without the outer length prefix).  Each
 * entry is "string name || string data", where "data" is empty for
 * flags and "string value" otherwise.
 *
 * Throws EncodingError if a name or value exceeds its limit.
 */
void
SerializeOptions(SSH::Serializer &s, const OptionMap &options);

/**
 * The inverse of SerializeOptions().  Throws DecodingError if the
 * encoding is malformed or if names are not strictly sorted.
 */
OptionMap
DeserializeOptions(std::span<const std::byte> src);
