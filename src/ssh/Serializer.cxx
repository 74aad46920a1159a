// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Serializer.hxx"

namespace SSH {

static constexpr std::span<const std::byte>
StripLeadingZeroes(std::span<const std::byte> s) noexcept
{
	while (!s.empty() && s.front() == std::byte{})
		s = s.subspan(1);
	return s;
}

void
Serializer::WriteBignum2(std::span<const std::byte> src)
{
	src = StripLeadingZeroes(src);
	if (src.empty())
		/* zero is represented by an empty string */
		return;

	if ((src.front() & std::byte{0x80}) != std::byte{})
		/* keep the number positive */
		WriteU8(0);

	WriteN(src);
}

void
Serializer::CommitBignum2(std::size_t size)
{
	assert(position + size <= buffer.size());

	/* copy, because WriteBignum2() may need to shift the data by
	   one byte */
	const std::vector<std::byte> number{
		buffer.begin() + position,
		buffer.begin() + position + size,
	};

	WriteBignum2(number);
}

} // namespace SSH
