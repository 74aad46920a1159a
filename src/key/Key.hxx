// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace SSH { class Serializer; }

/**
 * A public key which can be written in SSH wire format and which can
 * verify SSH signature blobs.
 */
class PublicKey {
public:
	PublicKey() noexcept = default;
	virtual ~PublicKey() noexcept = default;

	PublicKey(const PublicKey &) = delete;
	PublicKey &operator=(const PublicKey &) = delete;

	/**
	 * The SSH key type, e.g. "ssh-ed25519".
	 */
	virtual std::string_view GetType() const noexcept = 0;

	/**
	 * Write the public key blob ("string type" followed by the
	 * type specific parts).
	 */
	virtual void SerializePublic(SSH::Serializer &s) const = 0;

	/**
	 * Verify an SSH signature blob ("string algorithm || string
	 * signature").  Throws std::invalid_argument or
	 * SSH::MalformedPacket if the blob is malformed or the
	 * algorithm does not match this key.
	 */
	virtual bool Verify(std::span<const std::byte> message,
			    std::span<const std::byte> signature) const = 0;
};
