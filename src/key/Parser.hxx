// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

namespace SSH { class Deserializer; }
class PublicKey;

/**
 * Parse an SSH public key blob.  Throws std::invalid_argument if the
 * blob is malformed or the key type is not supported.
 */
std::unique_ptr<PublicKey>
ParsePublicKeyBlob(std::span<const std::byte> src);

/**
 * Parse the type specific parts of a public key (i.e. the blob
 * without the leading type string), leaving the #Deserializer
 * positioned after them.  Throws std::invalid_argument or
 * SSH::MalformedPacket.
 */
std::unique_ptr<PublicKey>
ParsePublicKeyParts(std::string_view type, SSH::Deserializer &d);

/**
 * Returns the type string of a public key blob without
 * validating the rest.  Throws std::invalid_argument if the blob is
 * malformed.
 */
std::string_view
GetPublicKeyType(std::span<const std::byte> blob);

/**
 * Is this a key type which can be parsed by ParsePublicKeyBlob()?
 */
[[gnu::pure]]
bool
IsSupportedPublicKeyType(std::string_view type) noexcept;
