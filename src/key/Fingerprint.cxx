// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fingerprint.hxx"
#include "Base64.hxx"
#include "Digest.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

std::string
GetFingerprint(std::span<const std::byte> public_key_blob)
{
	std::byte digest[DIGEST_MAX_SIZE];
	const std::size_t length = Digest(DigestAlgorithm::SHA256,
					  public_key_blob, digest);

	/* OpenSSH omits the base64 padding here */
	return fmt::format("SHA256:{}"sv,
			   EncodeBase64(std::span{digest, length}, false));
}
