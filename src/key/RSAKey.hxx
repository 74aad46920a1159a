// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Key.hxx"
#include "openssl/Unique.hxx"

class RSAKey final : public PublicKey {
	UniqueEVP_PKEY key;

public:
	explicit RSAKey(UniqueEVP_PKEY &&_key) noexcept
		:key(std::move(_key)) {}

	std::string_view GetType() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;
};
