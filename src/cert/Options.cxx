// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Options.hxx"
#include "Limits.hxx"
#include "Error.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"

#include <array>

using std::string_view_literals::operator""sv;

OptionMap
PermitAllExtensions()
{
	return {
		{"no-touch-required", {}},
		{"permit-X11-forwarding", {}},
		{"permit-agent-forwarding", {}},
		{"permit-port-forwarding", {}},
		{"permit-pty", {}},
		{"permit-user-rc", {}},
	};
}

bool
IsKnownCriticalOption(std::string_view name) noexcept
{
	static constexpr std::array known{
		"force-command"sv,
		"source-address"sv,
		"verify-required"sv,
	};

	for (const auto i : known)
		if (name == i)
			return true;

	return false;
}

void
SerializeOptions(SSH::Serializer &s, const OptionMap &options)
{
	for (const auto &[name, value] : options) {
		if (name.empty() || name.size() > MAX_OPTION_NAME_LENGTH)
			throw EncodingError{"Bad option name"};

		if (value.size() > MAX_OPTION_VALUE_LENGTH)
			throw EncodingError{"Option value too long"};

		s.WriteString(name);

		const auto data_length = s.PrepareLength();
		if (!value.empty())
			s.WriteString(value);
		s.CommitLength(data_length);
	}
}

OptionMap
DeserializeOptions(std::span<const std::byte> src)
try {
	OptionMap options;

	SSH::Deserializer d{src};
	while (!d.empty()) {
		const auto name = d.ReadString();
		if (name.empty())
			throw DecodingError{"Empty option name"};

		if (!options.empty() && name <= options.rbegin()->first)
			throw DecodingError{"Options not sorted"};

		std::string value;
		if (const auto data = d.ReadLengthEncoded(); !data.empty()) {
			SSH::Deserializer dd{data};
			value = dd.ReadString();
			dd.ExpectEnd();
		}

		options.emplace_hint(options.end(), name, std::move(value));
	}

	return options;
} catch (SSH::MalformedPacket) {
	throw DecodingError{"Malformed option list"};
}
