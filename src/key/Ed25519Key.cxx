// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Ed25519Key.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"

#include <sodium/crypto_sign_ed25519.h>

#include <algorithm>
#include <stdexcept>

using std::string_view_literals::operator""sv;

Ed25519Key::Ed25519Key(std::span<const std::byte, 32> _public_key) noexcept
{
	static_assert(sizeof(public_key) == crypto_sign_ed25519_PUBLICKEYBYTES);

	std::copy(_public_key.begin(), _public_key.end(), public_key.begin());
}

std::string_view
Ed25519Key::GetType() const noexcept
{
	return "ssh-ed25519"sv;
}

void
Ed25519Key::SerializePublic(SSH::Serializer &s) const
{
	s.WriteString(GetType());

	const auto key_length = s.PrepareLength();
	s.WriteN(public_key);
	s.CommitLength(key_length);
}

bool
Ed25519Key::Verify(std::span<const std::byte> message,
		   std::span<const std::byte> signature) const
{
	SSH::Deserializer d{signature};
	const auto algorithm = d.ReadString();
	if (algorithm != GetType())
		throw std::invalid_argument{"Wrong algorithm"};

	signature = d.ReadLengthEncoded();
	d.ExpectEnd();
	if (signature.size() != crypto_sign_ed25519_BYTES)
		throw std::invalid_argument{"Malformed Ed25519 signature"};

	return crypto_sign_ed25519_verify_detached(reinterpret_cast<const unsigned char *>(signature.data()),
						   reinterpret_cast<const unsigned char *>(message.data()),
						   message.size(),
						   reinterpret_cast<const unsigned char *>(public_key.data())) == 0;
}
