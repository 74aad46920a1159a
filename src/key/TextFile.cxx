// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TextFile.hxx"
#include "Parser.hxx"
#include "Base64.hxx"

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

using std::string_view_literals::operator""sv;

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

static constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.front()))
		s.remove_prefix(1);
	return s;
}

static constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespace(s.back()))
		s.remove_suffix(1);
	return s;
}

/**
 * Split the string at the first whitespace character.
 */
static constexpr std::pair<std::string_view, std::string_view>
SplitWhitespace(std::string_view s) noexcept
{
	for (std::size_t i = 0; i < s.size(); ++i)
		if (IsWhitespace(s[i]))
			return {s.substr(0, i), StripLeft(s.substr(i + 1))};

	return {s, {}};
}

PublicKeyLine
ParsePublicKeyLine(std::string_view line)
{
	line = StripRight(StripLeft(line));
	if (line.empty() || line.front() == '#')
		throw std::invalid_argument{"No public key"};

	const auto [type, rest] = SplitWhitespace(line);
	const auto [blob_b64, comment] = SplitWhitespace(rest);

	if (blob_b64.empty())
		throw std::invalid_argument{"No public key"};

	auto blob = DecodeBase64(blob_b64);
	if (!blob)
		throw std::invalid_argument{"base64 decoding failed"};

	if (GetPublicKeyType(*blob) != type)
		throw std::invalid_argument{"Key type mismatch"};

	return {
		std::string{type},
		std::move(*blob),
		std::string{comment},
	};
}

std::string
FormatPublicKeyLine(std::string_view type, std::span<const std::byte> blob,
		    std::string_view comment)
{
	if (comment.empty())
		return fmt::format("{} {}"sv, type, EncodeBase64(blob));

	return fmt::format("{} {} {}"sv, type, EncodeBase64(blob), comment);
}
