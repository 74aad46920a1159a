// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"

#include <sodium/utils.h>

std::string
EncodeBase64(std::span<const std::byte> src, bool padding)
{
	const int variant = padding
		? sodium_base64_VARIANT_ORIGINAL
		: sodium_base64_VARIANT_ORIGINAL_NO_PADDING;

	/* sodium_base64_ENCODED_LEN() includes the null terminator */
	std::string result(sodium_base64_ENCODED_LEN(src.size(), variant), '\0');
	sodium_bin2base64(result.data(), result.size(),
			  reinterpret_cast<const unsigned char *>(src.data()),
			  src.size(), variant);
	result.resize(result.size() - 1);

	return result;
}

std::optional<std::vector<std::byte>>
DecodeBase64(std::string_view src)
{
	/* accept both padded and unpadded input */
	while (src.ends_with('='))
		src.remove_suffix(1);

	std::vector<std::byte> result(src.size() * 3 / 4 + 1);
	std::size_t length;
	if (sodium_base642bin(reinterpret_cast<unsigned char *>(result.data()),
			      result.size(),
			      src.data(), src.size(),
			      nullptr, &length, nullptr,
			      sodium_base64_VARIANT_ORIGINAL_NO_PADDING) != 0)
		return std::nullopt;

	result.resize(length);
	return result;
}
