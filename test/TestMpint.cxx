// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ssh/Serializer.hxx"

#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

static std::vector<std::byte>
MakeBytes(std::initializer_list<unsigned> values)
{
	std::vector<std::byte> result;
	for (const unsigned i : values)
		result.push_back(static_cast<std::byte>(i));
	return result;
}

struct MpintCase {
	std::vector<std::byte> input, expected;
};

static const MpintCase mpint_cases[] = {
	{{}, {}},
	{MakeBytes({0}), {}},
	{MakeBytes({0, 0, 0, 0}), {}},
	{MakeBytes({42}), MakeBytes({42})},
	{MakeBytes({0, 0, 42}), MakeBytes({42})},
	{MakeBytes({42, 0xff}), MakeBytes({42, 0xff})},
	{MakeBytes({0x7f, 0xff}), MakeBytes({0x7f, 0xff})},

	/* the most significant bit is set: a null byte must be
	   inserted */
	{MakeBytes({0x80, 42}), MakeBytes({0, 0x80, 42})},
	{MakeBytes({0, 0, 0x80, 42}), MakeBytes({0, 0x80, 42})},
	{MakeBytes({0xff}), MakeBytes({0, 0xff})},
};

TEST(Mpint, WriteBignum2)
{
	for (const auto &i : mpint_cases) {
		SSH::Serializer s;
		s.WriteBignum2(i.input);

		const auto result = s.Finish();
		EXPECT_EQ(std::vector<std::byte>(result.begin(), result.end()),
			  i.expected);
	}
}

TEST(Mpint, CommitBignum2)
{
	for (const auto &i : mpint_cases) {
		SSH::Serializer s;
		auto dest = s.BeginWriteN(i.input.size());
		std::copy(i.input.begin(), i.input.end(), dest.begin());
		s.CommitBignum2(dest.size());

		const auto result = s.Finish();
		EXPECT_EQ(std::vector<std::byte>(result.begin(), result.end()),
			  i.expected);
	}
}

/**
 * CommitBignum2() must not clobber data written before it.
 */
TEST(Mpint, CommitBignum2AfterPrefix)
{
	SSH::Serializer s;
	s.WriteU8(0xaa);
	const auto m = s.PrepareLength();
	auto dest = s.BeginWriteN(2);
	dest[0] = std::byte{0x80};
	dest[1] = std::byte{0x01};
	s.CommitBignum2(dest.size());
	s.CommitLength(m);

	const auto result = s.Finish();
	EXPECT_EQ(std::vector<std::byte>(result.begin(), result.end()),
		  MakeBytes({0xaa, 0, 0, 0, 3, 0, 0x80, 0x01}));
}
