// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"

#include <array>

class Ed25519Key final : public PublicKey {
	std::array<std::byte, 32> public_key;

public:
	explicit Ed25519Key(std::span<const std::byte, 32> _public_key) noexcept;

	std::string_view GetType() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;
};
